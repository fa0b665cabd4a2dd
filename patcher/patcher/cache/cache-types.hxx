#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include <functional>

#include <patcher/hash/hash-types.hxx>
#include <patcher/manifest/manifest-types.hxx>

namespace patcher
{
  // Why an entry needs to be downloaded.
  //
  enum class stale_reason
  {
    missing, // No file on disk.
    size,    // File size differs from the listed one.
    hash     // Known hash differs from the listed one.
  };

  inline std::ostream&
  operator<< (std::ostream& os, stale_reason r)
  {
    switch (r)
    {
      case stale_reason::missing: return os << "missing";
      case stale_reason::size:    return os << "size mismatch";
      case stale_reason::hash:    return os << "hash mismatch";
    }
    return os;
  }

  // Outcome of a staleness check.
  //
  struct staleness_result
  {
    // Entries to download, in file list order, each path at most once.
    //
    manifest_entries stale;

    // The hash cache after seeding (or recomputation in validate mode).
    //
    hash_map hashes;
  };

  // Operator confirmation: (question, default answer) -> answer.
  //
  using confirm_callback =
    std::function<bool (const std::string& question, bool def)>;

  // Paths targeted by a reconciliation, empty optional if nothing was done.
  //
  using removed_paths = std::optional<std::vector<std::string>>;
}
