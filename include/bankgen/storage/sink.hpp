#pragma once

#include <bankgen/storage/format.hpp>
#include <bankgen/storage/layout.hpp>
#include <bankgen/table/table.hpp>

#include <string>

namespace bankgen::storage {

/// Managed, queryable tables kept in a metadata catalog.
///
/// Table names resolve against the active database. Failures are reported as
/// WriteError (writes) or DataError (reads of missing tables).
class CatalogSink {
   public:
    virtual ~CatalogSink() = default;

    virtual void create_database(const std::string& name) = 0;
    virtual void use_database(const std::string& name) = 0;
    [[nodiscard]] virtual auto current_database() const -> const std::string& = 0;

    [[nodiscard]] virtual auto table_exists(const std::string& name) -> bool = 0;

    /// Drop cached metadata for `name` and reload it from storage.
    virtual void refresh_metadata(const std::string& name) = 0;

    virtual void write(const Table& rows, const std::string& name, WriteMode mode,
                       FileFormat format, const Layout& layout) = 0;

    [[nodiscard]] virtual auto read_table(const std::string& name) -> Table = 0;
};

/// Bare files under a storage path, with no catalog registration.
class FileSink {
   public:
    virtual ~FileSink() = default;

    /// `path` is relative to the sink's root.
    virtual void write(const Table& rows, const std::string& path, WriteMode mode,
                       FileFormat format, const Layout& layout) = 0;

    [[nodiscard]] virtual auto read(const std::string& path, FileFormat format) -> Table = 0;
};

}  // namespace bankgen::storage
