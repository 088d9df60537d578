#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace bankgen {

enum class ErrorKind : std::uint8_t {
    Configuration,
    Schema,
    Data,
    Write,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Base of the bankgen exception taxonomy.
class Error : public std::runtime_error {
   public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

   private:
    ErrorKind kind_;
};

/// Missing file, section or key; unsupported storage kind or file format.
class ConfigurationError : public Error {
   public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::Configuration, message) {}
};

/// Missing or malformed schema definition.
class SchemaError : public Error {
   public:
    explicit SchemaError(const std::string& message) : Error(ErrorKind::Schema, message) {}
};

/// Generated or loaded data violates a contract (row counts, empty dimension).
class DataError : public Error {
   public:
    explicit DataError(const std::string& message) : Error(ErrorKind::Data, message) {}
};

/// The storage layer rejected a write.
class WriteError : public Error {
   public:
    explicit WriteError(const std::string& message) : Error(ErrorKind::Write, message) {}
};

/// A table-scoped failure raised by the materializer, carrying the table name
/// and the kind of the underlying cause.
class MaterializationError : public Error {
   public:
    MaterializationError(std::string table, const Error& cause)
        : Error(cause.kind(), cause.what()), table_(std::move(table)) {}

    [[nodiscard]] auto table() const noexcept -> const std::string& { return table_; }

   private:
    std::string table_;
};

}  // namespace bankgen
