#pragma once

#include <bankgen/schema/schema.hpp>
#include <bankgen/table/table.hpp>

#include <cstddef>
#include <string>

namespace bankgen {

/// Produces batches of rows for a table.
///
/// Implementations must return exactly the schema's columns, in order and with
/// matching kinds; the values themselves are free.
class RowSource {
   public:
    virtual ~RowSource() = default;

    [[nodiscard]] virtual auto generate(const std::string& table, const Schema& schema,
                                        std::size_t count) -> Table = 0;
};

}  // namespace bankgen
