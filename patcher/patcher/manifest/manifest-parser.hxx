#pragma once

#include <string>

#include <patcher/manifest/manifest-types.hxx>

namespace patcher
{
  // Parse the plain text file list.
  //
  // Each line is `<path>,<sha256>,<size>` with either slash flavor in the
  // path. Backslashes are normalized to forward slashes first; the path
  // token then serves both as the URL suffix (as is) and, with its leading
  // separators stripped, as the relative local path.
  //
  // Lines that do not split into exactly three fields are skipped. A line
  // that does but has a non-integer size, an empty path, or a path that
  // would escape the output root throws manifest_error naming the line. So
  // does a file list without a single usable entry.
  //
  manifest_entries
  parse_manifest (const std::string& text);

  // Parse a single line. Return nullopt if the line is to be skipped.
  //
  std::optional<manifest_entry>
  parse_manifest_line (const std::string& line, std::size_t line_number = 0);
}
