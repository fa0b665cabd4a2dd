#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <functional>
#include <filesystem>
#include <utility>

#include <boost/asio.hpp>

#include <patcher/hash/hasher.hxx>
#include <patcher/hash/hash-types.hxx>
#include <patcher/sync/sync-types.hxx>
#include <patcher/cache/cache-types.hxx>
#include <patcher/cache/cache-detector.hxx>
#include <patcher/cache/cache-reconciler.hxx>
#include <patcher/event/event-types.hxx>
#include <patcher/manifest/manifest-types.hxx>
#include <patcher/progress/progress-types.hxx>
#include <patcher/download/download-manager.hxx>

namespace patcher
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  // Synchronizer traits.
  //
  // Besides download_file() (see download_manager_traits) the transport C
  // must provide:
  //
  //   asio::awaitable<std::uint16_t> status (const std::string& url);
  //   asio::awaitable<std::string>   get (const std::string& url);
  //
  // where status() returns the final HTTP status of a GET and get() returns
  // the body of a successful one, throwing otherwise.
  //
  template <typename C, typename H = hasher>
  struct synchronizer_traits
  {
    using transport_type  = C;
    using hasher_type     = H;
    using detector_type   = basic_detector<detector_traits<hasher_type>>;
    using reconciler_type = reconciler;
    using manager_type    =
      basic_download_manager<download_manager_traits<transport_type>>;
    using request_type    = typename manager_type::request_type;

    // Well-known locations under the root domain.
    //
    static constexpr const char* maintenance_path = "/MaintenanceLock.lck";
    static constexpr const char* manifest_path    = "/PatchFileList.txt";
    static constexpr const char* patch_path       = "/Patch";

    // Status of the maintenance marker that means "come back later".
    //
    static constexpr std::uint16_t maintenance_status = 200;
  };

  struct sync_options
  {
    std::string root_domain;
    fs::path output_dir;

    bool validate = false;     // Re-hash every local file.
    bool remove_stale = false; // Delete files no longer on the list.

    std::size_t jobs = 4;      // Concurrent downloads.
  };

  // Bring the output directory in line with the remote file list:
  //
  // maintenance -> manifest -> staleness -> [download -> verify]
  //             -> [reconcile] -> done
  //
  // A maintenance marker ends the run early in the deferred state. Failures
  // of a whole step throw sync_error while per-file problems are reported to
  // the sink and recorded in the outcome.
  //
  template <typename T>
  class basic_synchronizer
  {
  public:
    using traits_type     = T;
    using transport_type  = typename traits_type::transport_type;
    using hasher_type     = typename traits_type::hasher_type;
    using detector_type   = typename traits_type::detector_type;
    using reconciler_type = typename traits_type::reconciler_type;
    using manager_type    = typename traits_type::manager_type;
    using request_type    = typename traits_type::request_type;

    using state_callback = std::function<void (sync_state)>;

    // The transport and hasher are borrowed.
    //
    basic_synchronizer (asio::io_context& ioc,
                        transport_type& transport,
                        hasher_type& hasher,
                        event_sink sink = nullptr,
                        confirm_callback confirm = nullptr)
      : ioc_ (ioc),
        transport_ (transport),
        hasher_ (hasher),
        sink_ (std::move (sink)),
        confirm_ (std::move (confirm))
    {
    }

    basic_synchronizer (const basic_synchronizer&) = delete;
    basic_synchronizer& operator= (const basic_synchronizer&) = delete;

    // Shared download progress (optional).
    //
    void
    set_metrics (progress_metrics* m)
    {
      metrics_ = m;
    }

    // Called on every state change, before the step runs.
    //
    void
    set_state_callback (state_callback cb)
    {
      on_state_ = std::move (cb);
    }

    sync_state
    state () const noexcept
    {
      return state_;
    }

    asio::awaitable<sync_outcome>
    sync (const sync_options&, const std::optional<hash_map>& cached);

    // Individual steps.
    //
    asio::awaitable<bool>
    under_maintenance (const std::string& root);

    // Fetch, parse, and resolve the file list.
    //
    asio::awaitable<manifest_entries>
    fetch_manifest (const std::string& root, const fs::path& output_dir);

    // Re-hash the downloaded files, warning about any that do not match
    // the file list.
    //
    hash_map
    verify (const manifest_entries& downloaded);

  private:
    void
    transition (sync_state);

    asio::io_context& ioc_;
    transport_type& transport_;
    hasher_type& hasher_;
    event_sink sink_;
    confirm_callback confirm_;

    progress_metrics* metrics_ = nullptr;
    state_callback on_state_;
    sync_state state_ {sync_state::check_maintenance};
  };
}

#include <patcher/sync/synchronizer.txx>
