#include <bankgen/core/error.hpp>

namespace bankgen {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Configuration:
            return "configuration error";
        case ErrorKind::Schema:
            return "schema error";
        case ErrorKind::Data:
            return "data error";
        case ErrorKind::Write:
            return "write error";
    }
    return "error";
}

}  // namespace bankgen
