/**
 * @file value_coercion.hpp
 * @brief String-to-native coercion against a column's declared type
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace Omnidb {

enum class TypeCategory {
    Integer,
    Decimal,
    Float,
    Boolean,
    Timestamp,
    Date,
    Time,
    Uuid,
    Json,
    Binary,
    Text
};

const char* to_string(TypeCategory category);

/**
 * @brief Classify an engine type name.
 *
 * Case-insensitive; strips "(...)" parameters, array suffixes and the
 * ClickHouse Nullable()/LowCardinality() wrappers. Unknown names are Text.
 */
TypeCategory classify_column_type(const std::string& declared_type);

/**
 * @brief Whether values of this category can appear in ORDER BY on every engine.
 */
bool is_orderable(TypeCategory category);

/**
 * @brief A coerced value ready for binding.
 *
 * text holds the canonical spelling (e.g. "true" for any accepted boolean)
 * and is what text-protocol drivers send; native holds the parsed payload
 * for drivers that bind by type.
 */
struct Value {
    TypeCategory category = TypeCategory::Text;
    std::string declared_type;
    std::variant<std::monostate, int64_t, double, bool, std::string> native;
    std::string text;

    bool is_null() const { return std::holds_alternative<std::monostate>(native); }

    static Value null(const std::string& declared_type);
    static Value of_text(std::string text, const std::string& declared_type = "text");
};

/**
 * @brief Coerce raw into the declared type.
 * @throws CoercionError when raw is not a valid spelling for the type.
 */
Value coerce_value(const std::string& raw, const std::string& declared_type);

/**
 * @brief Like coerce_value, but an empty string for a non-text type is NULL.
 */
Value coerce_for_write(const std::string& raw, const std::string& declared_type);

// Validators exposed for the in-memory filter and the document translators.
bool parse_integer(const std::string& raw, int64_t& out);
bool parse_float(const std::string& raw, double& out);
bool parse_boolean(const std::string& raw, bool& out);
bool is_valid_date(const std::string& raw);
bool is_valid_time(const std::string& raw);
bool is_valid_timestamp(const std::string& raw);
bool is_valid_uuid(const std::string& raw);

} // namespace Omnidb
