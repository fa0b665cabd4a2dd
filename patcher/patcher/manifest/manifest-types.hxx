#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

namespace patcher
{
  namespace fs = std::filesystem;

  // Remote file list could not be used.
  //
  class manifest_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // One record of the remote file list.
  //
  // The required fields come straight from the manifest line. The resolved
  // ones are only known once the output root and the URL root are, and are
  // filled by resolve_entries().
  //
  struct manifest_entry
  {
    fs::path      relative_path;  // Under the output root, never absolute.
    std::string   url_suffix;     // Appended to the URL root, starts with '/'.
    std::string   expected_hash;  // Hex digest as listed.
    std::uint64_t expected_size;

    std::optional<fs::path>    local_path;
    std::optional<std::string> remote_url;

    manifest_entry () = default;

    manifest_entry (fs::path p, std::string u, std::string h, std::uint64_t s)
      : relative_path (std::move (p)),
        url_suffix (std::move (u)),
        expected_hash (std::move (h)),
        expected_size (s) {}

    bool
    resolved () const noexcept
    {
      return local_path.has_value () && remote_url.has_value ();
    }

    // Cache key of the resolved local path.
    //
    // Throws std::logic_error if the entry has not been resolved yet.
    //
    std::string
    key () const;
  };

  inline bool
  operator== (const manifest_entry& x, const manifest_entry& y)
  {
    return x.relative_path == y.relative_path &&
           x.url_suffix == y.url_suffix &&
           x.expected_hash == y.expected_hash &&
           x.expected_size == y.expected_size &&
           x.local_path == y.local_path &&
           x.remote_url == y.remote_url;
  }

  inline bool
  operator!= (const manifest_entry& x, const manifest_entry& y)
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& o, const manifest_entry& e)
  {
    return o << e.relative_path.generic_string () << " ("
             << e.expected_size << " bytes, " << e.expected_hash << ")";
  }

  using manifest_entries = std::vector<manifest_entry>;

  // Return a copy of the entries with the local path resolved against the
  // output root and the remote URL against the URL root. A relative output
  // root is made absolute against the current directory. The URL suffix is
  // percent-encoded.
  //
  manifest_entries
  resolve_entries (const manifest_entries&,
                   const fs::path& output_root,
                   const std::string& url_root);

  // Sum of the expected sizes.
  //
  std::uint64_t
  total_size (const manifest_entries&);
}
