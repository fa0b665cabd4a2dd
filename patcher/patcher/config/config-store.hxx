#pragma once

#include <string>
#include <optional>
#include <stdexcept>
#include <functional>
#include <filesystem>

#include <patcher/hash/hash-types.hxx>
#include <patcher/sync/sync-types.hxx>
#include <patcher/event/event-types.hxx>

namespace patcher
{
  namespace fs = std::filesystem;

  // Unreadable or unwritable configuration.
  //
  class config_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Persistent settings: where to sync from, where to, and the hash cache
  // from the previous runs.
  //
  struct patcher_config
  {
    std::string root_domain;
    std::string output_dir;
    std::optional<hash_map> hashes;
  };

  inline bool
  operator== (const patcher_config& x, const patcher_config& y)
  {
    return x.root_domain == y.root_domain &&
           x.output_dir == y.output_dir &&
           x.hashes == y.hashes;
  }

  // Ask the operator for a value: question in, answer out.
  //
  using prompt_callback = std::function<std::string (const std::string&)>;

  // Per-user data directory for patcher (XDG_DATA_HOME and friends). Falls
  // back to .patcher in the current directory if the home directory is
  // unknown.
  //
  fs::path
  user_data_dir ();

  // config.json in the current directory if there is one, otherwise
  // config.json in user_data_dir().
  //
  fs::path
  default_config_path ();

  // JSON configuration file:
  //
  // {
  //   "root_domain": "https://...",
  //   "output_dir": "/path/to/game",
  //   "hashes": {"/path/to/game/file": "<sha256>", ...}
  // }
  //
  // The hashes member is optional.
  //
  class config_store
  {
  public:
    explicit
    config_store (fs::path file,
                  event_sink sink = nullptr,
                  prompt_callback prompt = nullptr)
      : file_ (std::move (file)),
        sink_ (std::move (sink)),
        prompt_ (std::move (prompt))
    {
    }

    const fs::path&
    path () const noexcept
    {
      return file_;
    }

    // Load the configuration, creating it if there is none and recreating
    // it if it is invalid. Values not stored anywhere are asked for. Values
    // passed here replace the stored ones and the file is updated if that
    // changed anything.
    //
    patcher_config
    load (const std::optional<std::string>& root_domain,
          const std::optional<std::string>& output_dir);

    void
    save (const patcher_config&) const;

    // Fold the result of a run into the hash cache: merge the updated and
    // downloaded hashes, forget the deleted ones. Return true if anything
    // changed.
    //
    bool
    update_hashes (patcher_config&, const sync_outcome&) const;

    // Throw config_error if the text is not a valid configuration.
    //
    static patcher_config
    parse (const std::string& text);

    static std::string
    serialize (const patcher_config&);

  private:
    patcher_config
    generate (const std::optional<std::string>& root_domain,
              const std::optional<std::string>& output_dir);

    std::string
    ask (const std::string& what, const std::string& question);

  private:
    fs::path file_;
    event_sink sink_;
    prompt_callback prompt_;
  };
}
