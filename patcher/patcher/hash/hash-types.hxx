#pragma once

#include <map>
#include <string>
#include <filesystem>

namespace patcher
{
  namespace fs = std::filesystem;

  // Path to lowercase hex SHA-256 digest.
  //
  // Keys are local file paths as produced by cache_key(). The map doubles as
  // the persisted hash cache and as the result of a hashing batch.
  //
  using hash_map = std::map<std::string, std::string>;

  // Length of a hex-encoded SHA-256 digest.
  //
  constexpr std::size_t hash_hex_size = 64;

  // Compute the SHA-256 digest of a file, streaming it in 8 KiB chunks.
  //
  // Throws std::runtime_error if the file cannot be opened or read.
  //
  std::string
  compute_file_hash (const fs::path&);

  // Compare two hex digests ignoring case.
  //
  bool
  compare_hashes (const std::string&, const std::string&);

  // Return true if the string is a well-formed hex SHA-256 digest.
  //
  bool
  valid_hash (const std::string&);

  // Cache key for a local path.
  //
  // This is a purely lexical normalization. We don't resolve symlinks since
  // the key must stay stable whether or not the file currently exists.
  //
  std::string
  cache_key (const fs::path&);
}
