#include <set>
#include <sstream>
#include <system_error>

namespace patcher
{
  template <typename T>
  void basic_detector<T>::
  report (const manifest_entry& e, stale_reason r, const std::string& d) const
  {
    event_kind k (r == stale_reason::missing ? event_kind::file_missing :
                  r == stale_reason::size    ? event_kind::size_mismatch :
                                               event_kind::hash_mismatch);

    std::ostringstream o;
    o << e.local_path->string () << ": " << r;
    if (!d.empty ())
      o << " (" << d << ")";

    emit (sink_, k, event_level::trace, o.str (), e.key ());
  }

  template <typename T>
  staleness_result basic_detector<T>::
  check (const manifest_entries& es, const hash_map& cached, bool validate)
  {
    staleness_result r;

    // First the cheap pre-filter: existence and size. Whatever fails here is
    // stale unconditionally and takes no further part in the check.
    //
    std::vector<bool> stale (es.size (), false);

    for (std::size_t i (0); i != es.size (); ++i)
    {
      const manifest_entry& e (es[i]);
      const fs::path& p (*e.local_path);

      std::error_code ec;
      if (!fs::exists (p, ec))
      {
        stale[i] = true;
        report (e, stale_reason::missing, std::string ());
        continue;
      }

      std::uintmax_t s (fs::file_size (p, ec));
      if (ec || s != e.expected_size)
      {
        stale[i] = true;
        report (e,
                stale_reason::size,
                ec ? ec.message ()
                   : std::to_string (s) + " instead of " +
                     std::to_string (e.expected_size) + " bytes");
      }
    }

    if (validate)
    {
      // Don't trust anything we have on record.
      //
      std::vector<fs::path> ps;
      for (std::size_t i (0); i != es.size (); ++i)
        if (!stale[i])
          ps.push_back (*es[i].local_path);

      r.hashes = hasher_.hash (ps);
    }
    else
    {
      r.hashes = cached;

      for (const auto& e : es)
      {
        auto k (e.key ());

        if (r.hashes.find (k) == r.hashes.end ())
        {
          r.hashes.emplace (k, e.expected_hash);

          emit (sink_,
                event_kind::cache_seeded,
                event_level::trace,
                "no hash on record for " + k + ", assuming listed " +
                e.expected_hash,
                k);
        }
      }
    }

    for (std::size_t i (0); i != es.size (); ++i)
    {
      if (stale[i])
        continue;

      const manifest_entry& e (es[i]);
      auto j (r.hashes.find (e.key ()));

      if (j == r.hashes.end () || !compare_hashes (j->second, e.expected_hash))
      {
        stale[i] = true;
        report (e,
                stale_reason::hash,
                j != r.hashes.end ()
                ? j->second + " instead of " + e.expected_hash
                : std::string ());
      }
    }

    // Collect in file list order. The same path listed twice is only
    // downloaded once.
    //
    std::set<std::string> seen;
    for (std::size_t i (0); i != es.size (); ++i)
    {
      if (stale[i] && seen.insert (es[i].key ()).second)
        r.stale.push_back (es[i]);
    }

    return r;
  }
}
