#include <patcher/patcher-sync.hxx>

#include <ostream>
#include <exception>

using namespace std;

namespace patcher
{
  sync_coordinator::
  sync_coordinator (asio::io_context& ioc,
                    event_level t,
                    confirm_callback c,
                    bool p,
                    ostream& o)
    : threshold_ (t),
      progress_ (ioc, p, o),
      http_ (ioc),
      hasher_ (hasher_traits<> (), sink ()),
      sync_ (ioc, http_, hasher_, sink (), move (c))
  {
    sync_.set_metrics (&progress_.metrics ());
    sync_.set_state_callback ([this] (sync_state s) {on_state (s);});
  }

  event_sink sync_coordinator::
  sink ()
  {
    return [this] (const sync_event& e) {log (e);};
  }

  void sync_coordinator::
  log (const sync_event& e)
  {
    if (e.level < threshold_)
      return;

    progress_.print (to_string (e.level) + ": " + e.message);
  }

  void sync_coordinator::
  on_state (sync_state s)
  {
    // The progress line covers the transfers only. Whatever comes after the
    // download step (verification, reconciliation) prints plain lines.
    //
    if (s == sync_state::download)
      progress_.start ("downloading");
    else if (progress_.running ())
      progress_.stop ();
  }

  asio::awaitable<sync_outcome> sync_coordinator::
  run (const sync_options& o, const optional<hash_map>& cached)
  {
    try
    {
      sync_outcome r (co_await sync_.sync (o, cached));
      progress_.stop ();
      co_return r;
    }
    catch (const exception&)
    {
      progress_.stop ();
      throw;
    }
  }
}
