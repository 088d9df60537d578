#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bankgen::storage {

enum class FileFormat : std::uint8_t {
    Parquet,
    Csv,
};

/// Parse a configured format name ("parquet", "csv"; case-insensitive).
[[nodiscard]] auto parse_file_format(std::string_view name) -> std::optional<FileFormat>;

[[nodiscard]] auto to_string(FileFormat format) -> std::string_view;

/// File extension including the dot (".parquet", ".csv").
[[nodiscard]] auto file_extension(FileFormat format) -> std::string_view;

}  // namespace bankgen::storage
