#pragma once

#include <string>
#include <ostream>
#include <optional>
#include <functional>

namespace patcher
{
  // Diagnostics level.
  //
  // Ordered by severity so that a sink can filter with a simple comparison.
  //
  enum class event_level
  {
    trace,
    info,
    warning,
    error
  };

  std::string
  to_string (event_level);

  // Parse a level name (case-insensitive). Return nullopt if unrecognized.
  //
  std::optional<event_level>
  to_event_level (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, event_level l)
  {
    return o << to_string (l);
  }

  // What happened.
  //
  // Every significant decision taken by the engine is reported with one of
  // these so that callers (and tests) can react without parsing messages.
  //
  enum class event_kind
  {
    maintenance,       // Remote is under maintenance, run deferred.
    manifest_loaded,   // File list fetched and parsed.
    file_missing,      // Stale: no local file.
    size_mismatch,     // Stale: local size differs from the expected one.
    hash_mismatch,     // Stale: cached hash differs from the expected one.
    cache_seeded,      // Cache entry created from the expected hash.
    hash_fallback,     // Native hashing failed, using the portable hasher.
    download_started,
    download_finished,
    download_failed,
    verify_mismatch,   // Downloaded content hashes differently than listed.
    deletion_declined, // Operator declined a bulk deletion.
    file_deleted,
    delete_missing,    // Deletion target was already gone.
    state_changed,     // Synchronizer moved to another state.
    config_changed     // Stored configuration value was replaced.
  };

  std::string
  to_string (event_kind);

  inline std::ostream&
  operator<< (std::ostream& o, event_kind k)
  {
    return o << to_string (k);
  }

  // A single diagnostics record.
  //
  struct sync_event
  {
    event_kind  kind;
    event_level level;
    std::string path;    // Affected file, if any.
    std::string message; // Human-readable description.

    sync_event (event_kind k,
                event_level l,
                std::string m,
                std::string p = std::string ())
      : kind (k), level (l), path (std::move (p)), message (std::move (m)) {}
  };

  inline std::ostream&
  operator<< (std::ostream& o, const sync_event& e)
  {
    return o << e.level << ": " << e.message;
  }

  // Injected diagnostics receiver. May be empty in which case events are
  // dropped.
  //
  using event_sink = std::function<void (const sync_event&)>;

  inline void
  emit (const event_sink& s,
        event_kind k,
        event_level l,
        std::string m,
        std::string p = std::string ())
  {
    if (s)
      s (sync_event (k, l, std::move (m), std::move (p)));
  }
}
