#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <filesystem>

#include <patcher/download/download-types.hxx>

namespace patcher
{
  namespace fs = std::filesystem;

  // A single file to fetch.
  //
  template <typename S = std::string>
  struct basic_download_request
  {
    using string_type = S;

    string_type url;
    fs::path target;

    // Size announced by the file list. Only used for progress reporting.
    //
    std::uint64_t expected_size {0};

    string_type name; // Human-readable name (relative path).

    basic_download_request () = default;

    basic_download_request (string_type u,
                            fs::path t,
                            std::uint64_t s = 0,
                            string_type n = string_type ())
      : url (std::move (u)),
        target (std::move (t)),
        expected_size (s),
        name (std::move (n))
    {
    }

    bool
    valid () const
    {
      return !url.empty () && !target.empty ();
    }
  };

  template <typename S>
  inline bool
  operator== (const basic_download_request<S>& x,
              const basic_download_request<S>& y)
  {
    return x.url == y.url && x.target == y.target;
  }

  template <typename S>
  inline bool
  operator!= (const basic_download_request<S>& x,
              const basic_download_request<S>& y)
  {
    return !(x == y);
  }

  using download_request = basic_download_request<>;
}
