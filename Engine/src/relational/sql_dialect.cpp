#include <relational/sql_dialect.hpp>
#include <core/chat.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

namespace Omnidb {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::string SqlDialect::quote_with(const std::string& identifier, char quote) const {
    std::string out;
    out.reserve(identifier.size() + 2);
    out.push_back(quote);
    for (char c : identifier) {
        if (c == quote) out.push_back(quote);
        out.push_back(c);
    }
    out.push_back(quote);
    return out;
}

std::string SqlDialect::quote_identifier(const std::string& identifier) const {
    return quote_with(identifier, '"');
}

std::string SqlDialect::qualified_name(const std::string& schema, const std::string& unit) const {
    if (schema.empty()) return quote_identifier(unit);
    return quote_identifier(schema) + "." + quote_identifier(unit);
}

std::vector<std::string> SqlDialect::supported_operators() const {
    return {"=", "!=", "<>", ">", ">=", "<", "<=",
            "LIKE", "NOT LIKE", "IN", "NOT IN", "IS NULL", "IS NOT NULL"};
}

bool SqlDialect::is_supported_column_type(const std::string& type) const {
    static const std::regex shape(R"(^\s*([A-Za-z][A-Za-z0-9_ ]*?)\s*(\(\s*\d+\s*(,\s*\d+\s*)?\))?\s*$)");
    std::smatch m;
    if (!std::regex_match(type, m, shape)) return false;

    const std::string base = upper(m[1].str());
    for (const auto& candidate : supported_column_types()) {
        if (upper(candidate) == base) return true;
    }
    return false;
}

std::string SqlDialect::pagination_clause(std::size_t limit, std::size_t offset) const {
    return " LIMIT " + std::to_string(limit) + " OFFSET " + std::to_string(offset);
}

std::string SqlDialect::create_table_suffix(const std::vector<std::string>&) const {
    return "";
}

bool SqlDialect::is_read_statement(const std::string& sql) const {
    const std::string verb = statement_verb(sql);
    return verb == "select" || verb == "with" || verb == "show" || verb == "describe" ||
           verb == "desc" || verb == "explain" || verb == "pragma" || verb == "values";
}

bool is_valid_identifier(const std::string& identifier) {
    static const std::regex pattern(R"(^[A-Za-z_][A-Za-z0-9_$]*$)");
    return identifier.size() <= 63 && std::regex_match(identifier, pattern);
}

} // namespace Omnidb
