namespace bytecache::path {

inline std::string replace_invalid_path_chars(std::string_view key)
{
    std::string sanitized{key};
    for (auto& c : sanitized) {
        if (c == '/') {
            c = '_';
        }
    }
    return sanitized;
}

inline std::optional<std::filesystem::path> construct(std::string_view key, size_t max_shards, size_t shard_length)
{
    if (key.empty()) {
        return std::nullopt;
    }

    const std::string sanitized = replace_invalid_path_chars(key);

    std::filesystem::path path;
    if (shard_length > 0) {
        size_t offset = 0;
        for (size_t shard = 0; shard < max_shards && offset + shard_length <= sanitized.size(); ++shard) {
            path /= sanitized.substr(offset, shard_length);
            offset += shard_length;
        }
    }

    path /= sanitized;
    return path;
}

inline PathGen::PathGen(std::string_view key, size_t max_shards, size_t shard_length) : m_base{construct(key, max_shards, shard_length)}
{
}

inline std::optional<std::filesystem::path> PathGen::file_path() const
{
    return m_base;
}

inline std::optional<std::filesystem::path> PathGen::meta_path() const
{
    if (!m_base) {
        return std::nullopt;
    }

    std::filesystem::path meta = *m_base;
    meta.replace_filename(meta.filename().string() + std::string{META_SUFFIX});
    return meta;
}

}  // namespace bytecache::path
