#include <sstream>
#include <iomanip>

namespace patcher
{
  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t n)
  {
    // IEC binary prefixes since these are file sizes.
    //
    static const char* u[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    static const std::size_t k (sizeof (u) / sizeof (*u));

    std::ostringstream o;

    if (n < 1024)
    {
      o << n << ' ' << u[0];
      return o.str ();
    }

    double v (static_cast<double> (n));
    std::size_t i (0);

    while (v >= 1024.0 && i < k - 1)
    {
      v /= 1024.0;
      ++i;
    }

    o << std::fixed << std::setprecision (1) << v << ' ' << u[i];
    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (float bps)
  {
    if (bps < 0.0f)
      bps = 0.0f;

    return format_bytes (static_cast<std::uint64_t> (bps)) + "/s";
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int s)
  {
    std::ostringstream o;

    if (s < 0)
      s = 0;

    int h (s / 3600);
    int m ((s % 3600) / 60);
    int sec (s % 60);

    if (h > 0)
      o << h << 'h' << std::setfill ('0') << std::setw (2) << m << 'm'
        << std::setw (2) << sec << 's';
    else
      o << std::setfill ('0') << std::setw (2) << m << 'm'
        << std::setw (2) << sec << 's';

    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float p, bool ind, int w)
  {
    std::ostringstream o;
    o << '[';

    if (ind)
    {
      for (int i (0); i < w; ++i)
        o << (i == w / 2 ? '>' : ' ');
    }
    else
    {
      if (p < 0.0f) p = 0.0f;
      if (p > 1.0f) p = 1.0f;

      int f (static_cast<int> (p * w));

      for (int i (0); i < w; ++i)
      {
        if      (i <  f - 1) o << '=';
        else if (i == f - 1) o << '>';
        else                 o << ' ';
      }
    }

    o << ']';
    return o.str ();
  }

  template <typename T>
  void basic_progress_tracker<T>::
  update (std::uint64_t n, std::uint64_t t) noexcept
  {
    std::uint64_t t0 (last_update_time_.load (std::memory_order_relaxed));

    // The first sample only sets the baseline.
    //
    if (t0 == 0)
    {
      last_bytes_.store (n, std::memory_order_relaxed);
      last_update_time_.store (t, std::memory_order_relaxed);
      return;
    }

    if (t <= t0 ||
        t - t0 < static_cast<std::uint64_t> (
                   traits_type::min_update_interval_ms) * 1000)
      return;

    std::uint64_t n0 (last_bytes_.load (std::memory_order_relaxed));
    std::uint64_t dn (n > n0 ? n - n0 : 0);

    float inst (static_cast<float> (dn) /
                (static_cast<float> (t - t0) / 1000000.0f));

    float s0 (speed_.load (std::memory_order_relaxed));
    float s (s0 == 0.0f
             ? inst
             : traits_type::ewma_alpha * inst +
               (1.0f - traits_type::ewma_alpha) * s0);

    last_bytes_.store (n, std::memory_order_relaxed);
    last_update_time_.store (t, std::memory_order_relaxed);
    speed_.store (s, std::memory_order_relaxed);
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset () noexcept
  {
    last_bytes_.store (0, std::memory_order_relaxed);
    last_update_time_.store (0, std::memory_order_relaxed);
    speed_.store (0.0f, std::memory_order_relaxed);
  }

  template <typename T>
  typename T::string_type basic_progress_formatter<T>::
  format (const progress_snapshot& s) const
  {
    return traits_type::format_bar (s.progress_ratio (),
                                    s.total_bytes == 0,
                                    bar_width_) +
      ' ' + format_stats (s);
  }

  template <typename T>
  typename T::string_type basic_progress_formatter<T>::
  format_stats (const progress_snapshot& s) const
  {
    std::ostringstream o;

    int pct (static_cast<int> (s.progress_ratio () * 100));

    o << std::setw (3) << pct << "% "
      << traits_type::format_bytes (s.current_bytes) << " / "
      << traits_type::format_bytes (s.total_bytes);

    if (s.speed > 0.0f)
      o << " @ " << traits_type::format_speed (s.speed);

    int eta (s.eta_seconds ());
    if (eta > 0)
      o << " ETA " << traits_type::format_duration (eta);

    return o.str ();
  }
}
