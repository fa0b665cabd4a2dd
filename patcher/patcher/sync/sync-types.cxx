#include <patcher/sync/sync-types.hxx>

using namespace std;

namespace patcher
{
  string
  to_string (sync_state s)
  {
    switch (s)
    {
    case sync_state::check_maintenance: return "maintenance";
    case sync_state::fetch_manifest:    return "manifest";
    case sync_state::detect_staleness:  return "staleness";
    case sync_state::download:          return "download";
    case sync_state::verify_downloaded: return "verify";
    case sync_state::reconcile:         return "reconcile";
    case sync_state::done:              return "done";
    case sync_state::deferred:          return "deferred";
    }
    return "unknown";
  }

  sync_error::
  sync_error (sync_state s, const string& w)
    : runtime_error (to_string (s) + " step failed: " + w), step_ (s)
  {
  }
}
