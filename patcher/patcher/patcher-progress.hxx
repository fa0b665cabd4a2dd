#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <iosfwd>

#include <boost/asio.hpp>

#include <patcher/progress/progress-types.hxx>
#include <patcher/progress/progress-tracker.hxx>
#include <patcher/progress/progress-renderer.hxx>

namespace patcher
{
  namespace asio = boost::asio;

  // Terminal progress for the download batch.
  //
  // Downloads add to metrics() from the same io_context; a render loop
  // running alongside them samples the counters, updates the speed
  // estimate, and redraws the line.
  //
  class progress_coordinator
  {
  public:
    using tracker_type  = progress_tracker;
    using renderer_type = progress_renderer;

    // If not enabled the metrics are still maintained but nothing is drawn.
    //
    progress_coordinator (asio::io_context&, bool enabled, std::ostream&);

    progress_coordinator (const progress_coordinator&) = delete;
    progress_coordinator& operator= (const progress_coordinator&) = delete;

    // Begin drawing with the given label.
    //
    void
    start (std::string label);

    // Draw the final state and release the line.
    //
    void
    stop ();

    bool
    running () const noexcept;

    bool
    enabled () const noexcept
    {
      return enabled_;
    }

    progress_metrics&
    metrics () noexcept
    {
      return metrics_;
    }

    progress_snapshot
    snapshot () const
    {
      return progress_snapshot (metrics_);
    }

    // Print a line of text without tearing the progress line.
    //
    void
    print (const std::string&);

  private:
    asio::awaitable<void>
    render_loop ();

    void
    draw ();

    asio::io_context& ioc_;
    bool enabled_;
    std::ostream& os_;

    std::string label_;
    progress_metrics metrics_;
    tracker_type tracker_;
    std::unique_ptr<renderer_type> renderer_;

    asio::steady_timer timer_;
    std::atomic<bool> running_ {false};
  };
}
