#include <bankgen/storage/filesystem.hpp>

#include <filesystem>

namespace bankgen::storage {

namespace {

auto has_scheme(std::string_view path) -> bool {
    return path.find("://") != std::string_view::npos;
}

auto strip_trailing_slashes(std::string path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

auto normalize_uri(std::string_view uri) -> std::string {
    for (std::string_view alias : {"s3a://", "s3n://"}) {
        if (uri.starts_with(alias)) {
            return "s3://" + std::string(uri.substr(alias.size()));
        }
    }
    return std::string(uri);
}

auto resolve_base_path(const StorageTarget& target) -> std::expected<ResolvedPath, std::string> {
    auto uri = normalize_uri(target.base_path);
    if (target.storage == StorageKind::Local && !has_scheme(uri)) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(uri, ec);
        if (ec) {
            return std::unexpected("cannot resolve " + uri + ": " + ec.message());
        }
        uri = absolute.lexically_normal().generic_string();
    }

    std::string root;
    auto fs = arrow::fs::FileSystemFromUriOrPath(uri, &root);
    if (!fs.ok()) {
        return std::unexpected("cannot open storage at " + uri + ": " + fs.status().ToString());
    }
    return ResolvedPath{.fs = *std::move(fs), .root = strip_trailing_slashes(std::move(root))};
}

}  // namespace bankgen::storage
