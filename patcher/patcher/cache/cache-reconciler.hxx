#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include <patcher/cache/cache-types.hxx>
#include <patcher/event/event-types.hxx>

namespace patcher
{
  template <typename S = std::string>
  struct reconciler_traits
  {
    using string_type = S;

    // Deleting more files than this requires operator confirmation.
    //
    static constexpr std::size_t confirm_threshold = 10;

    // Answer assumed for the confirmation question.
    //
    static constexpr bool confirm_default = false;
  };

  // Remove local files that we know about (they are in the hash cache) but
  // that are no longer on the file list.
  //
  template <typename T = reconciler_traits<>>
  class basic_reconciler
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_reconciler (event_sink s = nullptr, confirm_callback c = nullptr)
      : sink_ (std::move (s)), confirm_ (std::move (c)) {}

    basic_reconciler (const basic_reconciler&) = delete;
    basic_reconciler& operator= (const basic_reconciler&) = delete;

    // Paths in the cache that none of the (resolved) entries map to.
    //
    std::vector<string_type>
    orphans (const hash_map& cache, const manifest_entries&) const;

    // Delete the orphans.
    //
    // Return nullopt if there was nothing to delete or if the operator
    // declined. Otherwise return every targeted path, including those that
    // were already gone from disk.
    //
    removed_paths
    reconcile (const hash_map& cache, const manifest_entries&);

  private:
    event_sink sink_;
    confirm_callback confirm_;
  };

  using reconciler = basic_reconciler<>;
}

#include <patcher/cache/cache-reconciler.txx>
