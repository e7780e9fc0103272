#include <core/errors.hpp>
#include <utility>

namespace Omnidb {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unavailable:          return "unavailable";
        case ErrorKind::UnsupportedOperation: return "unsupported operation";
        case ErrorKind::MalformedFilter:      return "malformed filter";
        case ErrorKind::MalformedInput:       return "malformed input";
        case ErrorKind::ExecutionFailure:     return "execution failure";
        case ErrorKind::UnsupportedType:      return "unsupported type";
    }
    return "unknown";
}

static std::string render(ErrorKind kind, const std::string& engine,
                          const std::string& operation, const std::string& detail) {
    std::string out;
    if (!engine.empty()) out += engine;
    if (!operation.empty()) {
        if (!out.empty()) out += ' ';
        out += operation;
    }
    if (!out.empty()) out += ": ";
    out += to_string(kind);
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

DbError::DbError(ErrorKind kind, std::string engine, std::string operation, std::string detail)
    : std::runtime_error(render(kind, engine, operation, detail)),
      kind_(kind),
      engine_(std::move(engine)),
      operation_(std::move(operation)),
      detail_(std::move(detail)) {}

DbError DbError::with_context(const std::string& engine, const std::string& operation) const {
    return DbError(kind_,
                   engine_.empty() ? engine : engine_,
                   operation_.empty() ? operation : operation_,
                   detail_);
}

DbError unsupported_operation(const std::string& engine, const std::string& operation) {
    return DbError(ErrorKind::UnsupportedOperation, engine, operation, "not supported by this engine");
}

DbError malformed_filter(const std::string& detail) {
    return DbError(ErrorKind::MalformedFilter, "", "", detail);
}

DbError malformed_input(const std::string& detail) {
    return DbError(ErrorKind::MalformedInput, "", "", detail);
}

} // namespace Omnidb
