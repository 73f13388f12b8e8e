#ifndef BYTECACHE_PATH_H
#define BYTECACHE_PATH_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/// @brief Mapping of cache keys to relative paths, for caches storing their values on disk.
namespace bytecache::path {

/// @brief Default maximum number of shard directories generated for a key.
/// @details With the default shard length, the key `FSHFJKDS` is stored under `FS/HF/JK/`.
constexpr size_t DEFAULT_SHARDS = 3;

/// @brief Default length of a shard directory name.
constexpr size_t DEFAULT_SHARD_LENGTH = 2;

/// @brief Suffix appended to the file name of a value to get the file name of its metadata.
constexpr std::string_view META_SUFFIX = ".meta";

/// @brief Replace the characters that cannot appear in a file name.
/// @details Path separators become underscores.
/// @param key The key to sanitize.
/// @return The sanitized key.
[[nodiscard]] std::string replace_invalid_path_chars(std::string_view key);

/// @brief Build the relative path of the file holding the value of a key.
/// @details The sanitized key is split into at most `max_shards` consecutive directory names of `shard_length`
///          characters. Sharding stops early when the key is too short to fill the next directory name. The full
///          sanitized key is always used as the file name.
/// @param key The key to build a path for.
/// @param max_shards The maximum number of directories to generate.
/// @param shard_length The length of each directory name.
/// @return The relative path, or `std::nullopt` if the key is empty.
[[nodiscard]] std::optional<std::filesystem::path> construct(std::string_view key,
                                                             size_t           max_shards   = DEFAULT_SHARDS,
                                                             size_t           shard_length = DEFAULT_SHARD_LENGTH);

/// @brief Builds the paths of the value file and of the metadata file of a key.
class PathGen
{
public:
    explicit PathGen(std::string_view key, size_t max_shards = DEFAULT_SHARDS, size_t shard_length = DEFAULT_SHARD_LENGTH);

    /// @brief Get the path of the file holding the value.
    /// @return The path, or `std::nullopt` if the key is empty.
    [[nodiscard]] std::optional<std::filesystem::path> file_path() const;

    /// @brief Get the path of the file holding the value metadata.
    /// @details Same as `file_path()`, with `.meta` appended to the file name.
    /// @return The path, or `std::nullopt` if the key is empty.
    [[nodiscard]] std::optional<std::filesystem::path> meta_path() const;

private:
    std::optional<std::filesystem::path> m_base;
};

}  // namespace bytecache::path

#include "path.hpp"

#endif
