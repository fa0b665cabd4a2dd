#pragma once

#include <string>
#include <iosfwd>
#include <optional>

#include <boost/asio.hpp>

#include <patcher/hash/hasher.hxx>
#include <patcher/hash/hash-types.hxx>
#include <patcher/sync/sync-types.hxx>
#include <patcher/sync/synchronizer.hxx>
#include <patcher/cache/cache-types.hxx>
#include <patcher/event/event-types.hxx>

#include <patcher/patcher-http.hxx>
#include <patcher/patcher-progress.hxx>

namespace patcher
{
  namespace asio = boost::asio;

  // Wires the synchronizer to the real transport, hasher, and terminal.
  //
  // Diagnostics at or above the threshold go to the diagnostics stream as
  // "<level>: <message>" lines, interleaved with the progress line which is
  // shown for the duration of the download step.
  //
  class sync_coordinator
  {
  public:
    using synchronizer_type =
      basic_synchronizer<synchronizer_traits<http_coordinator>>;

    sync_coordinator (asio::io_context&,
                      event_level threshold,
                      confirm_callback,
                      bool progress,
                      std::ostream& diag);

    sync_coordinator (const sync_coordinator&) = delete;
    sync_coordinator& operator= (const sync_coordinator&) = delete;

    asio::awaitable<sync_outcome>
    run (const sync_options&, const std::optional<hash_map>& cached);

    // Sink that reports through this coordinator. Valid for its lifetime.
    //
    event_sink
    sink ();

    void
    log (const sync_event&);

    progress_coordinator&
    progress () noexcept
    {
      return progress_;
    }

  private:
    void
    on_state (sync_state);

    event_level threshold_;

    progress_coordinator progress_;
    http_coordinator http_;
    hasher hasher_;
    synchronizer_type sync_;
  };
}
