#pragma once

#include <chrono>
#include <atomic>
#include <cstdint>
#include <ostream>

namespace patcher
{
  enum class progress_state
  {
    idle,
    active,
    completed,
    failed
  };

  inline std::ostream&
  operator<< (std::ostream& os, progress_state s)
  {
    switch (s)
    {
    case progress_state::idle:      return os << "idle";
    case progress_state::active:    return os << "active";
    case progress_state::completed: return os << "completed";
    case progress_state::failed:    return os << "failed";
    }
    return os;
  }

  using time_point = std::chrono::steady_clock::time_point;

  // Progress of a whole batch (lock-free, all atomic).
  //
  // Every transfer adds its own deltas so the counters are the sum across
  // all concurrent downloads.
  //
  struct progress_metrics
  {
    std::atomic<std::uint64_t> total_bytes {0};
    std::atomic<std::uint64_t> current_bytes {0};
    std::atomic<std::uint64_t> completed_items {0};
    std::atomic<std::uint64_t> failed_items {0};
    std::atomic<std::uint64_t> total_items {0};
    std::atomic<float> speed {0.0f}; // Bytes per second.
    std::atomic<progress_state> state {progress_state::idle};

    progress_metrics () = default;

    progress_metrics (const progress_metrics&) = delete;
    progress_metrics& operator= (const progress_metrics&) = delete;

    void
    reset (std::uint64_t bytes, std::uint64_t items) noexcept
    {
      total_bytes.store (bytes, std::memory_order_relaxed);
      current_bytes.store (0, std::memory_order_relaxed);
      completed_items.store (0, std::memory_order_relaxed);
      failed_items.store (0, std::memory_order_relaxed);
      total_items.store (items, std::memory_order_relaxed);
      speed.store (0.0f, std::memory_order_relaxed);
      state.store (progress_state::active, std::memory_order_relaxed);
    }
  };

  // Point-in-time copy of the metrics, for rendering.
  //
  struct progress_snapshot
  {
    std::uint64_t total_bytes {0};
    std::uint64_t current_bytes {0};
    std::uint64_t completed_items {0};
    std::uint64_t failed_items {0};
    std::uint64_t total_items {0};
    float speed {0.0f};
    progress_state state {progress_state::idle};
    time_point timestamp;

    progress_snapshot () = default;

    explicit
    progress_snapshot (const progress_metrics& m)
      : total_bytes (m.total_bytes.load (std::memory_order_relaxed)),
        current_bytes (m.current_bytes.load (std::memory_order_relaxed)),
        completed_items (m.completed_items.load (std::memory_order_relaxed)),
        failed_items (m.failed_items.load (std::memory_order_relaxed)),
        total_items (m.total_items.load (std::memory_order_relaxed)),
        speed (m.speed.load (std::memory_order_relaxed)),
        state (m.state.load (std::memory_order_relaxed)),
        timestamp (std::chrono::steady_clock::now ())
    {
    }

    // Ratio in [0, 1]. Servers may send more than the file list announced
    // so clamp.
    //
    float
    progress_ratio () const noexcept
    {
      if (total_bytes == 0)
        return 0.0f;

      if (current_bytes >= total_bytes)
        return 1.0f;

      return static_cast<float> (current_bytes) /
             static_cast<float> (total_bytes);
    }

    // Seconds left at the current speed, 0 if unknown.
    //
    int
    eta_seconds () const noexcept
    {
      if (speed <= 0.0f || total_bytes <= current_bytes)
        return 0;

      return static_cast<int> ((total_bytes - current_bytes) / speed);
    }
  };
}
