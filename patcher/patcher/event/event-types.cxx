#include <patcher/event/event-types.hxx>

#include <cctype>
#include <algorithm>

using namespace std;

namespace patcher
{
  string
  to_string (event_level l)
  {
    switch (l)
    {
      case event_level::trace:   return "trace";
      case event_level::info:    return "info";
      case event_level::warning: return "warning";
      case event_level::error:   return "error";
    }
    return "info";
  }

  optional<event_level>
  to_event_level (const string& s)
  {
    string l;
    l.reserve (s.size ());
    transform (s.begin (), s.end (), back_inserter (l),
               [] (unsigned char c) { return tolower (c); });

    if (l == "trace" || l == "debug")  return event_level::trace;
    if (l == "info")                   return event_level::info;
    if (l == "warning" || l == "warn") return event_level::warning;
    if (l == "error")                  return event_level::error;

    return nullopt;
  }

  string
  to_string (event_kind k)
  {
    switch (k)
    {
      case event_kind::maintenance:       return "maintenance";
      case event_kind::manifest_loaded:   return "manifest-loaded";
      case event_kind::file_missing:      return "file-missing";
      case event_kind::size_mismatch:     return "size-mismatch";
      case event_kind::hash_mismatch:     return "hash-mismatch";
      case event_kind::cache_seeded:      return "cache-seeded";
      case event_kind::hash_fallback:     return "hash-fallback";
      case event_kind::download_started:  return "download-started";
      case event_kind::download_finished: return "download-finished";
      case event_kind::download_failed:   return "download-failed";
      case event_kind::verify_mismatch:   return "verify-mismatch";
      case event_kind::deletion_declined: return "deletion-declined";
      case event_kind::file_deleted:      return "file-deleted";
      case event_kind::delete_missing:    return "delete-missing";
      case event_kind::state_changed:     return "state-changed";
      case event_kind::config_changed:    return "config-changed";
    }
    return "unknown";
  }
}
