#include <plugins/elasticsearch_query.hpp>
#include <core/errors.hpp>
#include <core/value_coercion.hpp>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace Omnidb {

using nlohmann::json;

namespace {

bool is_integer_field(const std::string& type) {
    return type == "long" || type == "integer" || type == "short" || type == "byte" ||
           type == "unsigned_long";
}

bool is_float_field(const std::string& type) {
    return type == "double" || type == "float" || type == "half_float" || type == "scaled_float";
}

// Default date format is strict_date_optional_time||epoch_millis.
bool is_valid_es_date(const std::string& raw) {
    int64_t millis = 0;
    return is_valid_timestamp(raw) || parse_integer(raw, millis);
}

// Addresses or CIDR blocks, v4 or v6.
bool is_valid_ip(const std::string& raw) {
    std::string address = raw;
    auto slash = raw.find('/');
    if (slash != std::string::npos) {
        int64_t prefix = 0;
        if (!parse_integer(raw.substr(slash + 1), prefix) || prefix < 0 || prefix > 128) return false;
        address = raw.substr(0, slash);
    }
    unsigned char buffer[16];
    return inet_pton(AF_INET, address.c_str(), buffer) == 1 || inet_pton(AF_INET6, address.c_str(), buffer) == 1;
}

void flatten_into(const json& properties, const std::string& prefix, FieldTypes& out) {
    for (const auto& [name, definition] : properties.items()) {
        const std::string path = prefix.empty() ? name : prefix + "." + name;
        if (definition.contains("properties")) {
            out[path] = definition.value("type", "object");
            flatten_into(definition.at("properties"), path, out);
        } else {
            out[path] = definition.value("type", "object");
        }
    }
}

class QueryTranslator {
public:
    explicit QueryTranslator(const FieldTypes& fields) : fields_(fields) {}

    json translate(const WhereCondition& node) const {
        if (node.is_atomic()) return atom(node.atom());

        json clauses = json::array();
        for (const auto& child : node.children()) clauses.push_back(translate(child));
        if (node.kind() == WhereCondition::Kind::And) {
            return {{"bool", {{"must", clauses}}}};
        }
        return {{"bool", {{"should", clauses}, {"minimum_should_match", 1}}}};
    }

private:
    std::string field_type(const AtomicWhereCondition& a) const {
        if (!a.column_type.empty()) return a.column_type;
        auto it = fields_.find(a.key);
        return it == fields_.end() ? "" : it->second;
    }

    json typed(const std::string& raw, const std::string& type, const std::string& key) const {
        if (is_integer_field(type)) {
            int64_t v = 0;
            if (!parse_integer(raw, v)) throw malformed_filter("value '" + raw + "' is not an integer for '" + key + "'");
            return v;
        }
        if (is_float_field(type)) {
            double v = 0;
            if (!parse_float(raw, v)) throw malformed_filter("value '" + raw + "' is not a number for '" + key + "'");
            return v;
        }
        if (type == "boolean") {
            bool v = false;
            if (!parse_boolean(raw, v)) throw malformed_filter("value '" + raw + "' is not a boolean for '" + key + "'");
            return v;
        }
        if (type == "date" || type == "date_nanos") {
            if (!is_valid_es_date(raw)) throw malformed_filter("value '" + raw + "' is not a date for '" + key + "'");
        } else if (type == "ip") {
            if (!is_valid_ip(raw)) throw malformed_filter("value '" + raw + "' is not an IP address for '" + key + "'");
        }
        return raw;
    }

    json atom(const AtomicWhereCondition& a) const {
        if (!fields_.empty() && a.key != "_id" && fields_.find(a.key) == fields_.end()) {
            throw malformed_filter("unknown field '" + a.key + "'");
        }

        const std::string op = normalize_operator(a.op);
        const auto& ops = elasticsearch_operators();
        if (std::find(ops.begin(), ops.end(), op) == ops.end()) {
            throw malformed_filter("operator '" + a.op + "' is not supported on '" + a.key + "'");
        }

        const std::string type = field_type(a);

        if (op == "=" || op == "!=") {
            json clause = type == "text"
                ? json{{"match_phrase", {{a.key, a.value}}}}
                : json{{"term", {{a.key, typed(a.value, type, a.key)}}}};
            if (op == "=") return clause;
            return {{"bool", {{"must_not", json::array({clause})}}}};
        }
        if (op == ">" || op == ">=" || op == "<" || op == "<=") {
            static const std::map<std::string, std::string> bounds = {
                {">", "gt"}, {">=", "gte"}, {"<", "lt"}, {"<=", "lte"}
            };
            return {{"range", {{a.key, {{bounds.at(op), typed(a.value, type, a.key)}}}}}};
        }
        if (op == "IN" || op == "NOT IN") {
            json values = json::array();
            for (const auto& item : split_value_list(a.value)) values.push_back(typed(item, type, a.key));
            json clause{{"terms", {{a.key, values}}}};
            if (op == "IN") return clause;
            return {{"bool", {{"must_not", json::array({clause})}}}};
        }
        if (op == "LIKE" || op == "CONTAINS") {
            std::string pattern = op == "LIKE" ? like_to_wildcard(a.value) : "*" + like_to_wildcard(a.value) + "*";
            return {{"wildcard", {{a.key, {{"value", pattern}}}}}};
        }
        if (op == "EXISTS" || op == "IS NOT NULL") {
            return {{"exists", {{"field", a.key}}}};
        }
        // IS NULL
        return {{"bool", {{"must_not", json::array({json{{"exists", {{"field", a.key}}}}})}}}};
    }

    const FieldTypes& fields_;
};

} // namespace

FieldTypes flatten_mapping(const json& mapping) {
    FieldTypes out;
    const json* properties = nullptr;
    if (mapping.contains("mappings") && mapping.at("mappings").contains("properties")) {
        properties = &mapping.at("mappings").at("properties");
    } else if (mapping.contains("properties")) {
        properties = &mapping.at("properties");
    }
    if (properties) flatten_into(*properties, "", out);
    return out;
}

const std::vector<std::string>& elasticsearch_operators() {
    static const std::vector<std::string> ops = {
        "=", "!=", ">", ">=", "<", "<=", "IN", "NOT IN",
        "LIKE", "CONTAINS", "EXISTS", "IS NULL", "IS NOT NULL"
    };
    return ops;
}

const std::vector<std::string>& elasticsearch_field_types() {
    static const std::vector<std::string> types = {
        "text", "keyword", "long", "integer", "short", "byte", "double", "float",
        "half_float", "scaled_float", "unsigned_long", "boolean", "date", "binary",
        "ip", "object", "nested", "geo_point"
    };
    return types;
}

json to_elasticsearch_query(const WhereCondition* where, const FieldTypes& fields) {
    if (!where) return {{"match_all", json::object()}};
    return QueryTranslator(fields).translate(*where);
}

std::string like_to_wildcard(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size());
    for (char c : pattern) {
        switch (c) {
            case '%': out.push_back('*'); break;
            case '_': out.push_back('?'); break;
            case '*':
            case '?':
            case '\\':
                out.push_back('\\');
                out.push_back(c);
                break;
            default: out.push_back(c);
        }
    }
    return out;
}

json search_page_body(const json& query, std::size_t from, std::size_t size) {
    return {
        {"query", query},
        {"from", from},
        {"size", size},
        {"sort", json::array({"_doc"})}
    };
}

json pit_search_body(const json& query, const std::string& pit_id, std::size_t size, const json& search_after) {
    json body{
        {"query", query},
        {"size", size},
        {"pit", {{"id", pit_id}, {"keep_alive", "1m"}}},
        {"sort", json::array({json{{"_shard_doc", "asc"}}})},
        {"track_total_hits", false}
    };
    if (!search_after.is_null()) body["search_after"] = search_after;
    return body;
}

bool fits_result_window(std::size_t page_offset, std::size_t page_size, std::size_t max_result_window) {
    return page_size <= max_result_window && page_offset <= max_result_window - page_size;
}

std::vector<std::string> collect_after_skip(std::size_t page_size,
                                            std::size_t page_offset,
                                            std::size_t max_batch,
                                            const HitBatchFetcher& fetch) {
    if (max_batch == 0) throw std::invalid_argument("search batch size must be positive");

    std::vector<std::string> docs;
    std::size_t to_skip = page_offset;
    json search_after;

    while (docs.size() < page_size) {
        std::size_t wanted = to_skip > 0 ? to_skip : page_size - docs.size();
        std::size_t batch = std::min(wanted, max_batch);

        json hits = fetch(batch, search_after);
        if (!hits.is_array() || hits.empty()) break;

        for (const auto& hit : hits) {
            if (to_skip > 0) {
                --to_skip;
            } else if (docs.size() < page_size) {
                docs.push_back(hit_document(hit));
            }
        }
        search_after = hits.back().value("sort", json());
        if (hits.size() < batch || search_after.is_null()) break;
    }
    return docs;
}

std::string hit_document(const json& hit) {
    json doc = json::object();
    doc["_id"] = hit.value("_id", "");
    if (hit.contains("_source") && hit.at("_source").is_object()) {
        for (const auto& [key, value] : hit.at("_source").items()) doc[key] = value;
    }
    return doc.dump();
}

} // namespace Omnidb
