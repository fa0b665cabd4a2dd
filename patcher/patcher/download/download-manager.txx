#include <chrono>
#include <algorithm>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace patcher
{
  template <typename T>
  asio::awaitable<void> basic_download_manager<T>::
  download_all ()
  {
    if (tasks_.empty ())
      co_return;

    if (metrics_ != nullptr)
      metrics_->reset (total_bytes (), tasks_.size ());

    std::vector<std::shared_ptr<task_type>> active;
    std::size_t next (0);

    while (next < tasks_.size () || !active.empty ())
    {
      // Retire finished transfers.
      //
      active.erase (std::remove_if (active.begin (),
                                    active.end (),
                                    [this] (const auto& t)
      {
        bool d (t->done ());

        if (d && on_task_complete_)
          on_task_complete_ (t);

        return d;
      }), active.end ());

      // Refill up to the limit. Tasks that are already terminal (say, from
      // an earlier call) are not run again.
      //
      while (next < tasks_.size () && active.size () < max_parallel_)
      {
        auto t (tasks_[next++]);

        if (t->done ())
          continue;

        active.push_back (t);
        launch (std::move (t));
      }

      if (active.empty ())
        continue;

      // There is no "wait for any" over detached coroutines so poll.
      //
      asio::steady_timer timer (
        ioc_, std::chrono::milliseconds (traits_type::poll_interval_ms));
      co_await timer.async_wait (asio::use_awaitable);
    }

    if (metrics_ != nullptr)
      metrics_->state.store (failed_count () != 0
                             ? progress_state::failed
                             : progress_state::completed);
  }

  template <typename T>
  void basic_download_manager<T>::
  launch (std::shared_ptr<task_type> t)
  {
    asio::co_spawn (ioc_, download_task (std::move (t)), asio::detached);
  }

  template <typename T>
  asio::awaitable<void> basic_download_manager<T>::
  download_task (std::shared_ptr<task_type> t)
  {
    const auto& r (t->request);

    if (!r.valid ())
    {
      t->set_error (download_error ("invalid download request", r.url));

      if (metrics_ != nullptr)
        metrics_->failed_items.fetch_add (1, std::memory_order_relaxed);

      emit (sink_,
            event_kind::download_failed,
            event_level::error,
            "invalid download request for '" + r.name + "'",
            r.target.string ());
      co_return;
    }

    peak_parallel_ = std::max (peak_parallel_, ++in_flight_);

    t->set_state (download_state::downloading);

    emit (sink_,
          event_kind::download_started,
          event_level::trace,
          "downloading " + r.url,
          r.target.string ());

    try
    {
      fs::path d (r.target.parent_path ());
      if (!d.empty ())
        fs::create_directories (d);

      // Transports report cumulative bytes for their own file; turn that
      // into deltas on the batch counter.
      //
      auto progress ([t, this] (std::uint64_t n, std::uint64_t)
      {
        std::uint64_t k (t->update_progress (n));

        if (metrics_ != nullptr && k != 0)
          metrics_->current_bytes.fetch_add (k, std::memory_order_relaxed);
      });

      std::uint64_t n (
        co_await transport_.download_file (r.url, r.target, progress));

      progress (n, n);

      t->set_state (download_state::completed);

      if (metrics_ != nullptr)
        metrics_->completed_items.fetch_add (1, std::memory_order_relaxed);

      emit (sink_,
            event_kind::download_finished,
            event_level::trace,
            "downloaded " + r.target.string () + " (" +
            std::to_string (n) + " bytes)",
            r.target.string ());
    }
    catch (const std::exception& e)
    {
      t->set_error (download_error (e.what (), r.url));

      if (metrics_ != nullptr)
        metrics_->failed_items.fetch_add (1, std::memory_order_relaxed);

      emit (sink_,
            event_kind::download_failed,
            event_level::error,
            "unable to download " + r.target.string () + ": " + e.what (),
            r.target.string ());
    }

    --in_flight_;
  }
}
