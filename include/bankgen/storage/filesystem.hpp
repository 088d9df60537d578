#pragma once

#include <bankgen/config/config.hpp>

#include <arrow/filesystem/api.h>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace bankgen::storage {

/// A filesystem handle plus the path of `base_path` inside it.
struct ResolvedPath {
    std::shared_ptr<arrow::fs::FileSystem> fs;
    std::string root;
};

/// Rewrite Hadoop-style scheme aliases (`s3a://`, `s3n://`) to `s3://`.
[[nodiscard]] auto normalize_uri(std::string_view uri) -> std::string;

/// Resolve the storage target's base path to an Arrow filesystem.
///
/// URIs go through Arrow's filesystem registry; LOCAL targets also accept
/// relative paths, which are made absolute first.
[[nodiscard]] auto resolve_base_path(const StorageTarget& target)
    -> std::expected<ResolvedPath, std::string>;

}  // namespace bankgen::storage
