#include <vector>
#include <utility>
#include <exception>

#include <patcher/manifest/manifest-parser.hxx>
#include <patcher/progress/progress-tracker.hxx>

namespace patcher
{
  template <typename T>
  void basic_synchronizer<T>::
  transition (sync_state s)
  {
    state_ = s;

    emit (sink_,
          event_kind::state_changed,
          event_level::trace,
          "entering " + to_string (s) + " step");

    if (on_state_)
      on_state_ (s);
  }

  template <typename T>
  asio::awaitable<bool> basic_synchronizer<T>::
  under_maintenance (const std::string& root)
  {
    std::uint16_t s (
      co_await transport_.status (root + traits_type::maintenance_path));

    co_return s == traits_type::maintenance_status;
  }

  template <typename T>
  asio::awaitable<manifest_entries> basic_synchronizer<T>::
  fetch_manifest (const std::string& root, const fs::path& out)
  {
    std::string t (co_await transport_.get (root + traits_type::manifest_path));

    co_return resolve_entries (parse_manifest (t),
                               out,
                               root + traits_type::patch_path);
  }

  template <typename T>
  hash_map basic_synchronizer<T>::
  verify (const manifest_entries& es)
  {
    std::vector<fs::path> ps;
    ps.reserve (es.size ());

    for (const auto& e: es)
      ps.push_back (*e.local_path);

    hash_map hs (hasher_.hash (ps));
    hash_map r;

    for (const auto& e: es)
    {
      std::string k (e.key ());
      auto i (hs.find (k));

      if (i == hs.end ())
        throw std::runtime_error ("no hash computed for " + k);

      // The server is the authority on content. A mismatch is most likely a
      // stale file list so we keep what we got and say so.
      //
      if (!compare_hashes (i->second, e.expected_hash))
        emit (sink_,
              event_kind::verify_mismatch,
              event_level::warning,
              "hash of downloaded file " + k + " does not match the file " +
              "list (expected " + e.expected_hash + ", got " + i->second +
              "), continuing anyway",
              k);

      r[k] = i->second;
    }

    return r;
  }

  template <typename T>
  asio::awaitable<sync_outcome> basic_synchronizer<T>::
  sync (const sync_options& o, const std::optional<hash_map>& cached)
  {
    using fmt = progress_tracker_traits<>;

    sync_outcome r;

    std::string root (o.root_domain);
    while (!root.empty () && root.back () == '/')
      root.pop_back ();

    // Maintenance.
    //
    transition (sync_state::check_maintenance);

    bool maint (false);
    try
    {
      maint = co_await under_maintenance (root);
    }
    catch (const std::exception& e)
    {
      throw sync_error (sync_state::check_maintenance, e.what ());
    }

    if (maint)
    {
      emit (sink_,
            event_kind::maintenance,
            event_level::info,
            "servers are currently under maintenance, try again later");

      transition (sync_state::deferred);
      r.state = sync_state::deferred;
      co_return r;
    }

    // File list.
    //
    transition (sync_state::fetch_manifest);

    manifest_entries es;
    try
    {
      es = co_await fetch_manifest (root, o.output_dir);
    }
    catch (const std::exception& e)
    {
      throw sync_error (sync_state::fetch_manifest, e.what ());
    }

    emit (sink_,
          event_kind::manifest_loaded,
          event_level::info,
          "file list has " + std::to_string (es.size ()) + " entries (" +
          fmt::format_bytes (total_size (es)) + ")");

    // Staleness.
    //
    transition (sync_state::detect_staleness);

    staleness_result sr;
    try
    {
      detector_type d (hasher_, sink_);
      sr = d.check (es, cached ? *cached : hash_map (), o.validate);
    }
    catch (const std::exception& e)
    {
      throw sync_error (sync_state::detect_staleness, e.what ());
    }

    r.hashes = sr.hashes;

    if (sr.stale.empty ())
      emit (sink_,
            event_kind::state_changed,
            event_level::info,
            "all files are up to date");
    else
    {
      // Download.
      //
      transition (sync_state::download);

      emit (sink_,
            event_kind::download_started,
            event_level::info,
            "downloading " + std::to_string (sr.stale.size ()) + " files (" +
            fmt::format_bytes (total_size (sr.stale)) + ")");

      manager_type m (ioc_, transport_, o.jobs, sink_);
      m.set_metrics (metrics_);

      for (const auto& e: sr.stale)
        m.add_task (request_type (*e.remote_url,
                                  *e.local_path,
                                  e.expected_size,
                                  e.relative_path.generic_string ()));

      co_await m.download_all ();

      // Tasks are kept in the order they were added.
      //
      manifest_entries got;
      const auto& ts (m.tasks ());

      for (std::size_t i (0); i != ts.size (); ++i)
      {
        if (ts[i]->completed ())
          got.push_back (sr.stale[i]);
        else
          r.failed.push_back (sr.stale[i].key ());
      }

      if (!r.failed.empty ())
        emit (sink_,
              event_kind::download_failed,
              event_level::error,
              std::to_string (r.failed.size ()) + " of " +
              std::to_string (ts.size ()) + " files failed to download");

      // Verify.
      //
      transition (sync_state::verify_downloaded);

      if (!got.empty ())
      {
        try
        {
          r.downloaded = verify (got);
        }
        catch (const std::exception& e)
        {
          throw sync_error (sync_state::verify_downloaded, e.what ());
        }
      }
    }

    // Reconcile.
    //
    // Consider every path this run knows about: what we were given and what
    // the staleness check produced (which in validate mode may have dropped
    // entries from the former).
    //
    if (o.remove_stale)
    {
      transition (sync_state::reconcile);

      hash_map known (cached ? *cached : hash_map ());
      for (const auto& p: sr.hashes)
        known[p.first] = p.second;

      reconciler_type rc (sink_, confirm_);

      if (removed_paths ps = rc.reconcile (known, es))
      {
        hash_map d;
        for (const auto& p: *ps)
          d[p] = known[p];

        r.deleted = std::move (d);
      }
    }

    transition (sync_state::done);
    r.state = sync_state::done;

    co_return r;
  }
}
