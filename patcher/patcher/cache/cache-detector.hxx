#pragma once

#include <patcher/hash/hasher.hxx>
#include <patcher/cache/cache-types.hxx>
#include <patcher/event/event-types.hxx>

namespace patcher
{
  template <typename H = hasher>
  struct detector_traits
  {
    using hasher_type = H;
  };

  // Decide which file list entries need to be downloaded.
  //
  // The policy is a compromise between trust and verification. Files that
  // are missing or have the wrong size are always stale and are never
  // hashed. For the rest we normally believe the hash cache, seeding it from
  // the listed hash for paths we have never seen before (trust on first
  // sight), and only compare hashes. In validate mode the cache is thrown
  // away and every surviving file is re-hashed.
  //
  template <typename T = detector_traits<>>
  class basic_detector
  {
  public:
    using traits_type = T;
    using hasher_type = typename traits_type::hasher_type;

    // We borrow the hasher, so it must outlive us.
    //
    explicit
    basic_detector (hasher_type& h, event_sink s = nullptr)
      : hasher_ (h), sink_ (std::move (s)) {}

    basic_detector (const basic_detector&) = delete;
    basic_detector& operator= (const basic_detector&) = delete;

    // The entries must be resolved.
    //
    staleness_result
    check (const manifest_entries&, const hash_map& cached, bool validate);

  private:
    void
    report (const manifest_entry&, stale_reason, const std::string&) const;

  private:
    hasher_type& hasher_;
    event_sink sink_;
  };

  using detector = basic_detector<>;
}

#include <patcher/cache/cache-detector.txx>
