#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <optional>
#include <filesystem>

#include <patcher/hash/hash-types.hxx>
#include <patcher/event/event-types.hxx>

namespace patcher
{
  namespace fs = std::filesystem;

  // Strategy that produced the last batch.
  //
  enum class hash_strategy
  {
    native,  // External digest tool, one process per file.
    portable // In-process OpenSSL digest.
  };

  inline std::ostream&
  operator<< (std::ostream& os, hash_strategy s)
  {
    switch (s)
    {
      case hash_strategy::native:   return os << "native";
      case hash_strategy::portable: return os << "portable";
    }
    return os;
  }

  // Hasher configuration.
  //
  template <typename S = std::string>
  struct hasher_traits
  {
    using string_type = S;

    // Native digest tool and the arguments that precede the file name. An
    // empty tool disables the native strategy.
    //
#if defined(__linux__)
    string_type native_tool = string_type ("sha256sum");
    std::vector<string_type> native_args;
#elif defined(__APPLE__)
    string_type native_tool = string_type ("shasum");
    std::vector<string_type> native_args {string_type ("-a"),
                                          string_type ("256")};
#else
    string_type native_tool;
    std::vector<string_type> native_args;
#endif

    // Number of worker threads (0 = one per hardware thread).
    //
    std::size_t threads = 0;
  };

  // Batch SHA-256 hasher.
  //
  // Tries the platform digest tool first and, if anything about it goes
  // wrong, re-hashes the whole batch in-process. Either way the result is the
  // same lowercase hex digest keyed by cache_key() of each path.
  //
  template <typename T = hasher_traits<>>
  class basic_hasher
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_hasher (traits_type t = traits_type (), event_sink s = nullptr)
      : traits_ (std::move (t)), sink_ (std::move (s)) {}

    // Hash every path. The paths are expected to exist.
    //
    // Throws std::runtime_error if the portable strategy cannot read one of
    // the files.
    //
    hash_map
    hash (const std::vector<fs::path>&);

    // Strategy used for the most recent non-empty batch.
    //
    std::optional<hash_strategy>
    last_strategy () const noexcept
    {
      return last_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    // Parse one line of `sha256sum`/`shasum` output and return the digest in
    // lowercase or nullopt if the line is malformed.
    //
    static std::optional<string_type>
    parse_digest_line (const string_type&);

  private:
    std::optional<hash_map>
    hash_native (const std::vector<fs::path>&) const;

    hash_map
    hash_portable (const std::vector<fs::path>&) const;

    string_type
    run_tool (const fs::path&) const;

    std::size_t
    thread_count (std::size_t jobs) const noexcept;

  private:
    traits_type traits_;
    event_sink sink_;
    std::optional<hash_strategy> last_;
  };

  using hasher = basic_hasher<>;
}

#include <patcher/hash/hasher.txx>
