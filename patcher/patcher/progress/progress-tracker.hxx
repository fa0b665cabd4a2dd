#pragma once

#include <string>
#include <atomic>
#include <cstddef>
#include <cstdint>

#include <patcher/progress/progress-types.hxx>

namespace patcher
{
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // EWMA weight of the newest sample. Low values keep the displayed speed
    // from jumping around.
    //
    static constexpr float ewma_alpha = 0.2f;

    // Samples closer together than this are dropped.
    //
    static constexpr int min_update_interval_ms = 500;

    static string_type
    format_bytes (std::uint64_t bytes);

    static string_type
    format_speed (float bytes_per_sec);

    static string_type
    format_duration (int seconds);

    // [====>     ] or, for an unknown total, a fixed marker.
    //
    static string_type
    format_bar (float ratio, bool indeterminate, int width);
  };

  // Lock-free transfer speed estimate.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_progress_tracker () = default;

    basic_progress_tracker (const basic_progress_tracker&) = delete;
    basic_progress_tracker& operator= (const basic_progress_tracker&) = delete;

    // Feed the current cumulative byte count.
    //
    void
    update (std::uint64_t current_bytes) noexcept;

    // As above but at an explicit time (microseconds on a monotonic clock).
    //
    void
    update (std::uint64_t current_bytes, std::uint64_t time_us) noexcept;

    float
    speed () const noexcept
    {
      return speed_.load (std::memory_order_relaxed);
    }

    void
    reset () noexcept;

    string_type
    speed_string () const
    {
      return traits_type::format_speed (speed ());
    }

  private:
    std::atomic<std::uint64_t> last_bytes_ {0};
    std::atomic<std::uint64_t> last_update_time_ {0};
    std::atomic<float> speed_ {0.0f};
  };

  // Single line summary of a batch:
  //
  // [=====>    ]  45% 450.0 KiB / 1.0 MiB @ 100.0 KiB/s ETA 00m05s
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_formatter
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_progress_formatter (int bar_width = 20)
      : bar_width_ (bar_width)
    {
    }

    string_type
    format (const progress_snapshot&) const;

    // Everything but the bar.
    //
    string_type
    format_stats (const progress_snapshot&) const;

  private:
    int bar_width_;
  };

  using progress_tracker   = basic_progress_tracker<>;
  using progress_formatter = basic_progress_formatter<>;
}

#include <patcher/progress/progress-tracker.ixx>
#include <patcher/progress/progress-tracker.txx>
