#include <chrono>

namespace patcher
{
  inline std::uint64_t
  current_time_us () noexcept
  {
    using namespace std::chrono;
    auto us (duration_cast<microseconds> (
               steady_clock::now ().time_since_epoch ()));
    return static_cast<std::uint64_t> (us.count ());
  }

  template <typename T>
  inline void basic_progress_tracker<T>::
  update (std::uint64_t n) noexcept
  {
    update (n, current_time_us ());
  }
}
