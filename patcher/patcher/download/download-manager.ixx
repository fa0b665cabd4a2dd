namespace patcher
{
  template <typename T>
  inline std::size_t basic_download_manager<T>::
  completed_count () const
  {
    std::size_t n (0);
    for (const auto& t: tasks_)
      if (t->completed ())
        ++n;
    return n;
  }

  template <typename T>
  inline std::size_t basic_download_manager<T>::
  failed_count () const
  {
    std::size_t n (0);
    for (const auto& t: tasks_)
      if (t->failed ())
        ++n;
    return n;
  }

  template <typename T>
  inline std::size_t basic_download_manager<T>::
  active_count () const
  {
    std::size_t n (0);
    for (const auto& t: tasks_)
      if (t->active ())
        ++n;
    return n;
  }

  template <typename T>
  inline std::uint64_t basic_download_manager<T>::
  total_bytes () const
  {
    std::uint64_t n (0);
    for (const auto& t: tasks_)
      n += t->request.expected_size;
    return n;
  }

  template <typename T>
  inline std::uint64_t basic_download_manager<T>::
  downloaded_bytes () const
  {
    std::uint64_t n (0);
    for (const auto& t: tasks_)
      n += t->downloaded_bytes.load ();
    return n;
  }
}
