#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include <stdexcept>

#include <patcher/hash/hash-types.hxx>

namespace patcher
{
  // Synchronization steps in the order they are taken. A run ends in either
  // done or deferred.
  //
  enum class sync_state
  {
    check_maintenance,
    fetch_manifest,
    detect_staleness,
    download,
    verify_downloaded,
    reconcile,
    done,
    deferred
  };

  // Short step name ("maintenance", "manifest", etc).
  //
  std::string
  to_string (sync_state);

  inline std::ostream&
  operator<< (std::ostream& o, sync_state s)
  {
    return o << to_string (s);
  }

  // Failure of a whole step. The run cannot continue.
  //
  class sync_error: public std::runtime_error
  {
  public:
    sync_error (sync_state step, const std::string& what);

    sync_state
    step () const noexcept
    {
      return step_;
    }

  private:
    sync_state step_;
  };

  // Result of a run.
  //
  // The optional maps distinguish "nothing happened" (absent) from an empty
  // result and whoever persists the cache must leave a category alone if it
  // is absent.
  //
  struct sync_outcome
  {
    sync_state state {sync_state::done};

    // Cache after staleness detection (seeded or re-validated entries).
    //
    std::optional<hash_map> hashes;

    // Freshly written files and their computed hashes.
    //
    std::optional<hash_map> downloaded;

    // Removed files and their last cached hashes.
    //
    std::optional<hash_map> deleted;

    // Files that could not be downloaded.
    //
    std::vector<std::string> failed;

    bool
    deferred () const noexcept
    {
      return state == sync_state::deferred;
    }

    bool
    succeeded () const noexcept
    {
      return failed.empty ();
    }
  };
}
