#include <set>
#include <exception>
#include <system_error>

namespace patcher
{
  template <typename T>
  std::vector<typename basic_reconciler<T>::string_type> basic_reconciler<T>::
  orphans (const hash_map& cache, const manifest_entries& es) const
  {
    std::set<std::string> keep;
    for (const auto& e : es)
      keep.insert (e.key ());

    std::vector<string_type> r;
    for (const auto& [k, h] : cache)
    {
      if (keep.find (k) == keep.end ())
        r.push_back (k);
    }

    return r;
  }

  template <typename T>
  removed_paths basic_reconciler<T>::
  reconcile (const hash_map& cache, const manifest_entries& es)
  {
    std::vector<string_type> ts (orphans (cache, es));

    if (ts.empty ())
      return std::nullopt;

    // A large number of deletions usually means the file list or the output
    // directory is not what the operator thinks it is.
    //
    if (ts.size () > traits_type::confirm_threshold)
    {
      std::string q ("Found " + std::to_string (ts.size ()) +
                     " files to delete when updating, are you sure this is "
                     "correct?");

      // If the question cannot be answered (stdin closed, say) we keep the
      // files.
      //
      bool a (traits_type::confirm_default);

      if (confirm_)
      {
        try
        {
          a = confirm_ (q, traits_type::confirm_default);
        }
        catch (const std::exception& e)
        {
          emit (sink_,
                event_kind::deletion_declined,
                event_level::error,
                std::string ("unable to confirm deletion: ") + e.what ());
          a = false;
        }
      }

      if (!a)
      {
        emit (sink_,
              event_kind::deletion_declined,
              event_level::info,
              "not deleting " + std::to_string (ts.size ()) +
              " files that are no longer on the file list");
        return std::nullopt;
      }
    }

    std::size_t n (0);
    for (const auto& t : ts)
    {
      std::error_code ec;
      bool r (fs::remove (fs::path (t), ec));

      if (ec)
      {
        emit (sink_,
              event_kind::delete_missing,
              event_level::error,
              "unable to delete " + t + ": " + ec.message (),
              t);
      }
      else if (!r)
      {
        emit (sink_,
              event_kind::delete_missing,
              event_level::warning,
              "asked to delete " + t + " but it does not exist",
              t);
      }
      else
      {
        ++n;
        emit (sink_,
              event_kind::file_deleted,
              event_level::trace,
              "deleted " + t,
              t);
      }
    }

    emit (sink_,
          event_kind::file_deleted,
          event_level::info,
          "deleted " + std::to_string (n) + " files that are no longer on "
          "the file list");

    return ts;
  }
}
