#include <bankgen/storage/format.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace bankgen::storage {

auto parse_file_format(std::string_view name) -> std::optional<FileFormat> {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "parquet") {
        return FileFormat::Parquet;
    }
    if (lowered == "csv") {
        return FileFormat::Csv;
    }
    return std::nullopt;
}

auto to_string(FileFormat format) -> std::string_view {
    switch (format) {
        case FileFormat::Parquet:
            return "parquet";
        case FileFormat::Csv:
            return "csv";
    }
    return "unknown";
}

auto file_extension(FileFormat format) -> std::string_view {
    switch (format) {
        case FileFormat::Parquet:
            return ".parquet";
        case FileFormat::Csv:
            return ".csv";
    }
    return "";
}

}  // namespace bankgen::storage
