#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include <boost/asio.hpp>

#include <patcher/event/event-types.hxx>
#include <patcher/progress/progress-types.hxx>
#include <patcher/download/download-task.hxx>
#include <patcher/download/download-types.hxx>

namespace patcher
{
  namespace asio = boost::asio;

  // Download manager traits.
  //
  // The transport C must provide:
  //
  //   asio::awaitable<std::uint64_t>
  //   download_file (const string_type& url,
  //                  const fs::path& target,
  //                  transfer_callback progress);
  //
  // which streams the body to the target and throws on failure.
  //
  template <typename C, typename S = std::string>
  struct download_manager_traits
  {
    using transport_type = C;
    using string_type    = S;

    using task_traits  = download_task_traits<string_type>;
    using task_type    = basic_download_task<task_traits>;
    using request_type = typename task_type::request_type;

    using completion_callback =
      std::function<void (std::shared_ptr<task_type>)>;

    static constexpr std::size_t default_parallel = 4;

    // How often the scheduler looks for finished transfers.
    //
    static constexpr int poll_interval_ms = 50;
  };

  // Runs a batch of downloads with at most max_parallel transfers in
  // flight. A failed transfer marks its own task as failed and leaves the
  // others alone.
  //
  template <typename T>
  class basic_download_manager
  {
  public:
    using traits_type         = T;
    using transport_type      = typename traits_type::transport_type;
    using string_type         = typename traits_type::string_type;
    using task_type           = typename traits_type::task_type;
    using request_type        = typename traits_type::request_type;
    using completion_callback = typename traits_type::completion_callback;

    basic_download_manager (asio::io_context& ioc,
                            transport_type& transport,
                            std::size_t max_parallel =
                              traits_type::default_parallel,
                            event_sink sink = nullptr)
      : ioc_ (ioc),
        transport_ (transport),
        max_parallel_ (max_parallel != 0 ? max_parallel : 1),
        sink_ (std::move (sink))
    {
    }

    basic_download_manager (const basic_download_manager&) = delete;
    basic_download_manager& operator= (const basic_download_manager&) = delete;

    std::size_t
    max_parallel () const
    {
      return max_parallel_;
    }

    // Shared batch progress. If set, download_all() resets it to the sum of
    // the expected sizes and every transfer adds its deltas to it.
    //
    void
    set_metrics (progress_metrics* m)
    {
      metrics_ = m;
    }

    std::shared_ptr<task_type>
    add_task (request_type r)
    {
      auto t (std::make_shared<task_type> (std::move (r)));
      tasks_.push_back (t);
      return t;
    }

    const std::vector<std::shared_ptr<task_type>>&
    tasks () const
    {
      return tasks_;
    }

    std::size_t
    completed_count () const;

    std::size_t
    failed_count () const;

    std::size_t
    active_count () const;

    // Sum of the announced sizes.
    //
    std::uint64_t
    total_bytes () const;

    std::uint64_t
    downloaded_bytes () const;

    // Highest number of transfers observed in flight at once.
    //
    std::size_t
    peak_parallel () const
    {
      return peak_parallel_;
    }

    void
    set_task_completion_callback (completion_callback cb)
    {
      on_task_complete_ = std::move (cb);
    }

    // Run every pending task and return once all of them have completed or
    // failed.
    //
    asio::awaitable<void>
    download_all ();

    asio::awaitable<void>
    download_task (std::shared_ptr<task_type>);

    void
    clear ()
    {
      tasks_.clear ();
    }

  private:
    void
    launch (std::shared_ptr<task_type>);

    asio::io_context& ioc_;
    transport_type& transport_;
    std::size_t max_parallel_;
    event_sink sink_;

    progress_metrics* metrics_ = nullptr;

    std::vector<std::shared_ptr<task_type>> tasks_;
    std::size_t in_flight_ = 0;
    std::size_t peak_parallel_ = 0;

    completion_callback on_task_complete_;
  };
}

#include <patcher/download/download-manager.ixx>
#include <patcher/download/download-manager.txx>
