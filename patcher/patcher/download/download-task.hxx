#pragma once

#include <atomic>
#include <memory>
#include <cstdint>
#include <utility>

#include <patcher/download/download-types.hxx>
#include <patcher/download/download-request.hxx>

namespace patcher
{
  template <typename S = std::string>
  struct download_task_traits
  {
    using string_type  = S;
    using request_type = basic_download_request<string_type>;
  };

  // One scheduled download. The state and byte counter are touched from
  // the transfer while the manager polls them.
  //
  template <typename T = download_task_traits<>>
  class basic_download_task
  {
  public:
    using traits_type  = T;
    using string_type  = typename traits_type::string_type;
    using request_type = typename traits_type::request_type;

    basic_download_task () = default;

    explicit
    basic_download_task (request_type r)
      : request (std::move (r))
    {
    }

    request_type request;
    download_error error;

    std::atomic<download_state> state {download_state::pending};
    std::atomic<std::uint64_t> downloaded_bytes {0};

    void
    set_state (download_state s)
    {
      state.store (s);
    }

    // Record the new cumulative byte count and return how much it grew.
    //
    std::uint64_t
    update_progress (std::uint64_t n)
    {
      std::uint64_t o (downloaded_bytes.exchange (n));
      return n > o ? n - o : 0;
    }

    void
    set_error (download_error e)
    {
      error = std::move (e);
      set_state (download_state::failed);
    }

    bool
    completed () const
    {
      return state.load () == download_state::completed;
    }

    bool
    failed () const
    {
      return state.load () == download_state::failed;
    }

    bool
    active () const
    {
      return state.load () == download_state::downloading;
    }

    bool
    done () const
    {
      return completed () || failed ();
    }
  };

  using download_task = basic_download_task<>;

  template <typename T>
  inline std::shared_ptr<basic_download_task<T>>
  make_download_task (typename basic_download_task<T>::request_type r)
  {
    return std::make_shared<basic_download_task<T>> (std::move (r));
  }
}
