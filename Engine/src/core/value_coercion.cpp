/**
 * @file value_coercion.cpp
 * @brief Type classification and string coercion
 */

#include <core/value_coercion.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace Omnidb {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Peel one "wrapper(inner)" layer, e.g. Nullable(String) -> String.
bool unwrap(std::string& type, const std::string& wrapper) {
    const std::string prefix = wrapper + "(";
    if (type.size() > prefix.size() && type.compare(0, prefix.size(), prefix) == 0 && type.back() == ')') {
        type = trim(type.substr(prefix.size(), type.size() - prefix.size() - 1));
        return true;
    }
    return false;
}

std::string strip_parameters(const std::string& type) {
    std::string out;
    int depth = 0;
    for (char c : type) {
        if (c == '(') { ++depth; continue; }
        if (c == ')') { if (depth > 0) --depth; continue; }
        if (depth == 0) out.push_back(c);
    }
    // collapse whitespace runs left behind by removed parameters
    std::string collapsed;
    bool space = false;
    for (char c : trim(out)) {
        if (std::isspace(static_cast<unsigned char>(c))) { space = true; continue; }
        if (space) collapsed.push_back(' ');
        space = false;
        collapsed.push_back(c);
    }
    return collapsed;
}

bool one_of(const std::string& name, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        if (name == n) return true;
    }
    return false;
}

TypeCategory classify_base(const std::string& base) {
    if (one_of(base, {"int", "integer", "int2", "int4", "int8", "smallint", "bigint", "mediumint",
                      "tinyint", "serial", "smallserial", "bigserial", "serial4", "serial8",
                      "int16", "int32", "int64", "int128", "int256",
                      "uint8", "uint16", "uint32", "uint64", "uint128", "uint256", "year"})) {
        return TypeCategory::Integer;
    }
    if (one_of(base, {"numeric", "decimal", "dec", "decimal32", "decimal64", "decimal128", "decimal256"})) {
        return TypeCategory::Decimal;
    }
    if (one_of(base, {"real", "float", "double", "double precision", "float4", "float8",
                      "float32", "float64"})) {
        return TypeCategory::Float;
    }
    if (one_of(base, {"bool", "boolean"})) return TypeCategory::Boolean;
    if (one_of(base, {"timestamp", "timestamptz", "datetime", "datetime64",
                      "timestamp without time zone", "timestamp with time zone"})) {
        return TypeCategory::Timestamp;
    }
    if (one_of(base, {"date", "date32"})) return TypeCategory::Date;
    if (one_of(base, {"time", "timetz", "time without time zone", "time with time zone"})) {
        return TypeCategory::Time;
    }
    if (base == "uuid") return TypeCategory::Uuid;
    if (one_of(base, {"json", "jsonb", "object"})) return TypeCategory::Json;
    if (one_of(base, {"bytea", "blob", "binary", "varbinary", "tinyblob", "mediumblob", "longblob"})) {
        return TypeCategory::Binary;
    }
    return TypeCategory::Text;
}

bool all_digits(const std::string& s, size_t from, size_t to) {
    if (from >= to || to > s.size()) return false;
    for (size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

int to_int(const std::string& s, size_t from, size_t len) {
    return std::atoi(s.substr(from, len).c_str());
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool valid_date_at(const std::string& s, size_t pos) {
    if (s.size() < pos + 10) return false;
    if (!all_digits(s, pos, pos + 4) || s[pos + 4] != '-' ||
        !all_digits(s, pos + 5, pos + 7) || s[pos + 7] != '-' ||
        !all_digits(s, pos + 8, pos + 10)) {
        return false;
    }
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int year = to_int(s, pos, 4);
    int month = to_int(s, pos + 5, 2);
    int day = to_int(s, pos + 8, 2);
    if (month < 1 || month > 12 || day < 1) return false;
    int limit = days[month - 1] + ((month == 2 && is_leap(year)) ? 1 : 0);
    return day <= limit;
}

// Parses HH:MM[:SS[.fff]] starting at pos; returns the index after it or npos.
size_t valid_time_at(const std::string& s, size_t pos) {
    if (s.size() < pos + 5) return std::string::npos;
    if (!all_digits(s, pos, pos + 2) || s[pos + 2] != ':' || !all_digits(s, pos + 3, pos + 5)) {
        return std::string::npos;
    }
    if (to_int(s, pos, 2) > 23 || to_int(s, pos + 3, 2) > 59) return std::string::npos;
    size_t i = pos + 5;
    if (i < s.size() && s[i] == ':') {
        if (!all_digits(s, i + 1, i + 3) || to_int(s, i + 1, 2) > 60) return std::string::npos;
        i += 3;
        if (i < s.size() && s[i] == '.') {
            size_t start = ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == start) return std::string::npos;
        }
    }
    return i;
}

bool valid_zone_at(const std::string& s, size_t pos) {
    if (pos == s.size()) return true;
    if (s[pos] == 'Z' || s[pos] == 'z') return pos + 1 == s.size();
    if (s[pos] != '+' && s[pos] != '-') return false;
    std::string zone = s.substr(pos + 1);
    if (zone.size() == 2) return all_digits(zone, 0, 2);
    if (zone.size() == 4) return all_digits(zone, 0, 4);
    if (zone.size() == 5) return all_digits(zone, 0, 2) && zone[2] == ':' && all_digits(zone, 3, 5);
    return false;
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool valid_decimal(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    size_t int_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++int_digits; }
    size_t frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        size_t exp_digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == s.size();
}

std::string describe(const std::string& raw, const std::string& declared_type) {
    return "'" + raw + "' is not a valid " + (declared_type.empty() ? std::string("value") : declared_type);
}

} // namespace

const char* to_string(TypeCategory category) {
    switch (category) {
        case TypeCategory::Integer:   return "integer";
        case TypeCategory::Decimal:   return "decimal";
        case TypeCategory::Float:     return "float";
        case TypeCategory::Boolean:   return "boolean";
        case TypeCategory::Timestamp: return "timestamp";
        case TypeCategory::Date:      return "date";
        case TypeCategory::Time:      return "time";
        case TypeCategory::Uuid:      return "uuid";
        case TypeCategory::Json:      return "json";
        case TypeCategory::Binary:    return "binary";
        case TypeCategory::Text:      return "text";
    }
    return "text";
}

TypeCategory classify_column_type(const std::string& declared_type) {
    std::string type = lower(trim(declared_type));
    if (type.empty()) return TypeCategory::Text;

    // Arrays are transported as text; the engine parses the literal.
    if (type.size() > 2 && type.compare(type.size() - 2, 2, "[]") == 0) return TypeCategory::Text;
    if (unwrap(type, "array")) return TypeCategory::Text;

    while (unwrap(type, "nullable") || unwrap(type, "lowcardinality")) {}

    std::string base = strip_parameters(type);
    TypeCategory category = classify_base(base);
    if (category != TypeCategory::Text) return category;

    // "bigint unsigned", "character varying", "int4 not null", ...
    auto space = base.find(' ');
    if (space != std::string::npos) {
        return classify_base(base.substr(0, space));
    }
    return TypeCategory::Text;
}

bool is_orderable(TypeCategory category) {
    return category != TypeCategory::Json && category != TypeCategory::Binary;
}

Value Value::null(const std::string& declared_type) {
    Value v;
    v.category = classify_column_type(declared_type);
    v.declared_type = declared_type;
    v.native = std::monostate{};
    return v;
}

Value Value::of_text(std::string text, const std::string& declared_type) {
    Value v;
    v.category = TypeCategory::Text;
    v.declared_type = declared_type;
    v.native = text;
    v.text = std::move(text);
    return v;
}

bool parse_integer(const std::string& raw, int64_t& out) {
    std::string s = trim(raw);
    if (!s.empty() && s[0] == '+') s.erase(0, 1);
    if (s.empty()) return false;
    auto result = std::from_chars(s.data(), s.data() + s.size(), out);
    return result.ec == std::errc() && result.ptr == s.data() + s.size();
}

bool parse_float(const std::string& raw, double& out) {
    std::string s = trim(raw);
    if (!valid_decimal(s)) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size() && std::isfinite(out);
}

bool parse_boolean(const std::string& raw, bool& out) {
    std::string s = lower(trim(raw));
    if (s == "true" || s == "t" || s == "1" || s == "yes" || s == "y" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "f" || s == "0" || s == "no" || s == "n" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool is_valid_date(const std::string& raw) {
    std::string s = trim(raw);
    return s.size() == 10 && valid_date_at(s, 0);
}

bool is_valid_time(const std::string& raw) {
    std::string s = trim(raw);
    size_t end = valid_time_at(s, 0);
    return end != std::string::npos && valid_zone_at(s, end);
}

bool is_valid_timestamp(const std::string& raw) {
    std::string s = trim(raw);
    if (!valid_date_at(s, 0)) return false;
    if (s.size() == 10) return true;
    if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') return false;
    size_t end = valid_time_at(s, 11);
    if (end == std::string::npos) return false;
    if (end < s.size() && s[end] == ' ') ++end;
    return valid_zone_at(s, end);
}

bool is_valid_uuid(const std::string& raw) {
    std::string s = trim(raw);
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!is_hex(s[i])) {
            return false;
        }
    }
    return true;
}

Value coerce_value(const std::string& raw, const std::string& declared_type) {
    Value v;
    v.declared_type = declared_type;
    v.category = classify_column_type(declared_type);

    switch (v.category) {
        case TypeCategory::Integer: {
            int64_t n = 0;
            if (parse_integer(raw, n)) {
                v.native = n;
                v.text = std::to_string(n);
                return v;
            }
            // UInt64 values above INT64_MAX stay textual.
            std::string s = trim(raw);
            uint64_t u = 0;
            auto result = std::from_chars(s.data(), s.data() + s.size(), u);
            if (!s.empty() && result.ec == std::errc() && result.ptr == s.data() + s.size()) {
                v.native = s;
                v.text = s;
                return v;
            }
            throw CoercionError(describe(raw, declared_type));
        }
        case TypeCategory::Float: {
            double d = 0.0;
            if (!parse_float(raw, d)) throw CoercionError(describe(raw, declared_type));
            v.native = d;
            v.text = trim(raw);
            return v;
        }
        case TypeCategory::Decimal: {
            std::string s = trim(raw);
            if (!valid_decimal(s)) throw CoercionError(describe(raw, declared_type));
            v.native = s;
            v.text = s;
            return v;
        }
        case TypeCategory::Boolean: {
            bool b = false;
            if (!parse_boolean(raw, b)) throw CoercionError(describe(raw, declared_type));
            v.native = b;
            v.text = b ? "true" : "false";
            return v;
        }
        case TypeCategory::Timestamp:
            if (!is_valid_timestamp(raw)) throw CoercionError(describe(raw, declared_type));
            break;
        case TypeCategory::Date:
            if (!is_valid_date(raw)) throw CoercionError(describe(raw, declared_type));
            break;
        case TypeCategory::Time:
            if (!is_valid_time(raw)) throw CoercionError(describe(raw, declared_type));
            break;
        case TypeCategory::Uuid: {
            if (!is_valid_uuid(raw)) throw CoercionError(describe(raw, declared_type));
            v.text = lower(trim(raw));
            v.native = v.text;
            return v;
        }
        case TypeCategory::Json: {
            try {
                v.text = nlohmann::json::parse(raw).dump();
            } catch (const nlohmann::json::parse_error&) {
                throw CoercionError(describe(raw, declared_type));
            }
            v.native = v.text;
            return v;
        }
        case TypeCategory::Binary:
        case TypeCategory::Text:
            v.native = raw;
            v.text = raw;
            return v;
    }

    v.text = trim(raw);
    v.native = v.text;
    return v;
}

Value coerce_for_write(const std::string& raw, const std::string& declared_type) {
    TypeCategory category = classify_column_type(declared_type);
    if (raw.empty() && category != TypeCategory::Text && category != TypeCategory::Binary) {
        return Value::null(declared_type);
    }
    return coerce_value(raw, declared_type);
}

} // namespace Omnidb
