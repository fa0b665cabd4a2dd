#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <functional>
#include <filesystem>

namespace patcher
{
  namespace fs = std::filesystem;

  // Download state.
  //
  enum class download_state
  {
    pending,     // Not started yet.
    downloading, // Transfer in progress.
    completed,   // Body written to the target.
    failed       // Gave up, see the task error.
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_state s)
  {
    switch (s)
    {
    case download_state::pending:     return os << "pending";
    case download_state::downloading: return os << "downloading";
    case download_state::completed:   return os << "completed";
    case download_state::failed:      return os << "failed";
    }
    return os;
  }

  // Transfer progress as reported by a transport: (bytes_transferred,
  // total_bytes), cumulative for one file. The total is 0 if unknown.
  //
  using transfer_callback =
    std::function<void (std::uint64_t, std::uint64_t)>;

  // Download error information.
  //
  struct download_error
  {
    std::string message;
    std::string url;

    download_error () = default;

    download_error (std::string m, std::string u = "")
      : message (std::move (m)), url (std::move (u))
    {
    }

    bool
    empty () const
    {
      return message.empty ();
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_error& e)
  {
    os << e.message;
    if (!e.url.empty ())
      os << " [url: " << e.url << "]";
    return os;
  }
}
