#include <bankgen/config/config.hpp>
#include <bankgen/core/error.hpp>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>

namespace bankgen {

namespace {

namespace pt = boost::property_tree;

constexpr std::string_view kDefaultSection = "DEFAULT";
constexpr std::string_view kStorageSection = "storage";

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto find_section(const pt::ptree& tree, std::string_view name) -> const pt::ptree* {
    for (const auto& [key, child] : tree) {
        if (key == name) {
            return &child;
        }
    }
    return nullptr;
}

/// INI option lookup: option names are case-insensitive and fall back to the
/// DEFAULT section.
class IniView {
   public:
    explicit IniView(const pt::ptree& tree)
        : tree_(tree), defaults_(find_section(tree, kDefaultSection)) {}

    [[nodiscard]] auto has_section(std::string_view name) const -> bool {
        return name != kDefaultSection && find_section(tree_, name) != nullptr;
    }

    [[nodiscard]] auto get(std::string_view section, std::string_view option) const
        -> std::optional<std::string> {
        if (const auto* sec = find_section(tree_, section)) {
            if (auto value = find_option(*sec, option)) {
                return value;
            }
        }
        if (defaults_ != nullptr) {
            return find_option(*defaults_, option);
        }
        return std::nullopt;
    }

    [[nodiscard]] auto require(std::string_view section, std::string_view option) const
        -> std::string {
        auto value = get(section, option);
        if (!value) {
            throw ConfigurationError("missing option '" + std::string(option) + "' in section [" +
                                     std::string(section) + "]");
        }
        return *value;
    }

    [[nodiscard]] auto get_bool(std::string_view section, std::string_view option,
                                bool fallback) const -> bool {
        auto value = get(section, option);
        if (!value) {
            return fallback;
        }
        auto text = lower(trim(*value));
        if (text == "1" || text == "yes" || text == "true" || text == "on") {
            return true;
        }
        if (text == "0" || text == "no" || text == "false" || text == "off") {
            return false;
        }
        throw ConfigurationError("option '" + std::string(option) + "' in section [" +
                                 std::string(section) + "] is not a boolean: '" + *value + "'");
    }

    [[nodiscard]] auto get_count(std::string_view section, std::string_view option) const
        -> std::optional<std::size_t> {
        auto value = get(section, option);
        if (!value) {
            return std::nullopt;
        }
        auto text = trim(*value);
        std::size_t out = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), out);
        if (text.empty() || result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            throw ConfigurationError("option '" + std::string(option) + "' in section [" +
                                     std::string(section) +
                                     "] is not a non-negative integer: '" + *value + "'");
        }
        return out;
    }

   private:
    static auto find_option(const pt::ptree& section, std::string_view option)
        -> std::optional<std::string> {
        auto wanted = lower(option);
        for (const auto& [key, child] : section) {
            if (lower(key) == wanted) {
                return std::string(trim(child.data()));
            }
        }
        return std::nullopt;
    }

    const pt::ptree& tree_;
    const pt::ptree* defaults_;
};

auto split_table_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        auto name = trim(text.substr(pos, comma - pos));
        if (!name.empty()) {
            out.emplace_back(name);
        }
        pos = comma + 1;
    }
    return out;
}

auto parse_storage(const IniView& ini) -> StorageTarget {
    if (!ini.has_section(kStorageSection)) {
        throw ConfigurationError("missing section [storage]");
    }

    StorageTarget target;
    target.kind = ini.get_bool(kDefaultSection, "apenas_arquivos", false) ? TargetKind::FlatFile
                                                                          : TargetKind::Catalog;

    auto storage_type = ini.get(kStorageSection, "storage_type").value_or("S3");
    auto storage = parse_storage_kind(storage_type);
    // Rejected at load so an unsupported backend fails the run before any table is written.
    if (!storage) {
        throw ConfigurationError("unsupported storage type: " + storage_type);
    }
    target.storage = *storage;

    target.base_path = ini.require(kStorageSection, "base_path");
    if (target.base_path.empty()) {
        throw ConfigurationError("option 'base_path' in section [storage] is empty");
    }

    auto format_name = ini.get(kDefaultSection, "formato_arquivo").value_or("parquet");
    auto format = storage::parse_file_format(format_name);
    if (!format) {
        throw ConfigurationError("unsupported file format: " + format_name);
    }
    target.file_format = *format;

    target.database_name = ini.get(kDefaultSection, "dbname").value_or("bancodemo");
    if (target.kind == TargetKind::Catalog && target.database_name.empty()) {
        throw ConfigurationError("option 'dbname' is empty");
    }
    return target;
}

auto parse_table_spec(const IniView& ini, const std::string& table) -> TableSpec {
    TableSpec spec;
    spec.name = table;
    auto records = ini.get_count(table, "num_records");
    if (!records) {
        throw ConfigurationError("missing option 'num_records' in section [" + table + "]");
    }
    spec.num_records = *records;
    spec.partitioned = ini.get_bool(table, "particionamento", false);
    spec.bucketed = ini.get_bool(table, "bucketing", false);
    spec.num_buckets = ini.get_count(table, "num_buckets").value_or(0);
    if (spec.bucketed && spec.num_buckets == 0) {
        throw ConfigurationError("table '" + table + "' enables bucketing with num_buckets = 0");
    }
    return spec;
}

}  // namespace

auto parse_storage_kind(std::string_view name) -> std::optional<StorageKind> {
    auto text = lower(trim(name));
    if (text == "s3") {
        return StorageKind::S3;
    }
    if (text == "adls") {
        return StorageKind::ADLS;
    }
    if (text == "local") {
        return StorageKind::Local;
    }
    return std::nullopt;
}

auto to_string(StorageKind kind) -> std::string_view {
    switch (kind) {
        case StorageKind::S3:
            return "S3";
        case StorageKind::ADLS:
            return "ADLS";
        case StorageKind::Local:
            return "LOCAL";
    }
    return "unknown";
}

auto to_string(TargetKind kind) -> std::string_view {
    return kind == TargetKind::Catalog ? "catalog" : "files";
}

auto ConfigModel::find_spec(const std::string& table) const -> const TableSpec* {
    if (auto it = specs.find(table); it != specs.end()) {
        return &it->second;
    }
    return nullptr;
}

auto parse_config(std::istream& input) -> ConfigModel {
    pt::ptree tree;
    try {
        pt::read_ini(input, tree);
    } catch (const pt::ini_parser_error& e) {
        throw ConfigurationError(std::string("malformed configuration: ") + e.what());
    }

    IniView ini(tree);
    ConfigModel config;
    config.storage = parse_storage(ini);
    config.tables = split_table_list(ini.get(kDefaultSection, "tabelas").value_or(""));
    for (const auto& table : config.tables) {
        if (ini.has_section(table) && !config.specs.contains(table)) {
            config.specs.emplace(table, parse_table_spec(ini, table));
        }
    }
    return config;
}

auto load_config(const std::filesystem::path& path) -> ConfigModel {
    std::ifstream input(path);
    if (!input) {
        throw ConfigurationError("configuration file not found: " + path.string());
    }
    auto config = parse_config(input);
    spdlog::info("configuration loaded from {} ({} tables, target: {})", path.string(),
                 config.tables.size(), to_string(config.storage.kind));
    return config;
}

}  // namespace bankgen
