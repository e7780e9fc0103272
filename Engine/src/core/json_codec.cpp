#include <core/json_codec.hpp>
#include <core/errors.hpp>
#include <utility>
#include <vector>

namespace Omnidb {

using nlohmann::json;

void to_json(json& j, const Record& record) {
    j = json{{"key", record.key}, {"value", record.value}};
    if (!record.extra.empty()) j["extra"] = record.extra;
}

void to_json(json& j, const Column& column) {
    j = json{{"name", column.name}, {"type", column.type}};
}

void to_json(json& j, const StorageUnit& unit) {
    j = json{{"name", unit.name}, {"attributes", unit.attributes}};
}

void to_json(json& j, const RowsResult& result) {
    j = json{
        {"columns", result.columns},
        {"rows", result.rows},
        {"disableUpdate", result.disable_update},
        {"truncated", result.truncated}
    };
}

void to_json(json& j, const GraphUnitRelationship& relation) {
    j = json{{"name", relation.name}, {"relationship", to_string(relation.relationship)}};
}

void to_json(json& j, const GraphUnit& unit) {
    j = json{{"unit", unit.unit}, {"relations", unit.relations}};
}

void to_json(json& j, const ChatMessage& message) {
    j = json{{"type", message.type}, {"text", message.text}};
    if (message.result) j["result"] = *message.result;
}

void from_json(const json& j, Record& record) {
    record.key = j.at("key").get<std::string>();
    record.value = j.contains("value") && !j.at("value").is_null()
        ? (j.at("value").is_string() ? j.at("value").get<std::string>() : j.at("value").dump())
        : std::string();
    record.extra.clear();
    if (j.contains("extra")) {
        for (const auto& [k, v] : j.at("extra").items()) {
            record.extra[k] = v.is_string() ? v.get<std::string>() : v.dump();
        }
    }
}

json document_from_records(const std::vector<Record>& values) {
    if (values.size() == 1 && values.front().key == "document") {
        json doc;
        try {
            doc = json::parse(values.front().value);
        } catch (const json::parse_error& e) {
            throw malformed_input(std::string("document is not valid JSON: ") + e.what());
        }
        if (!doc.is_object()) throw malformed_input("document must be a JSON object");
        return doc;
    }

    json doc = json::object();
    for (const auto& record : values) {
        if (record.key.empty()) throw malformed_input("field name must not be empty");
        doc[record.key] = record.value;
    }
    return doc;
}

json where_to_json(const WhereCondition& where) {
    switch (where.kind()) {
        case WhereCondition::Kind::Atomic: {
            const auto& a = where.atom();
            json atom{{"key", a.key}, {"operator", a.op}, {"value", a.value}};
            if (!a.column_type.empty()) atom["columnType"] = a.column_type;
            return json{{"atomic", atom}};
        }
        case WhereCondition::Kind::And:
        case WhereCondition::Kind::Or: {
            json children = json::array();
            for (const auto& child : where.children()) children.push_back(where_to_json(child));
            return json{{where.kind() == WhereCondition::Kind::And ? "and" : "or", children}};
        }
    }
    return json();
}

namespace {

std::string scalar_text(const json& v, const char* field) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number() || v.is_boolean()) return v.dump();
    if (v.is_null()) return "";
    throw malformed_filter(std::string("field '") + field + "' must be a scalar");
}

} // namespace

WhereCondition where_from_json(const json& j) {
    if (!j.is_object() || j.size() != 1) {
        throw malformed_filter("filter node must be an object with exactly one of atomic/and/or");
    }

    if (j.contains("atomic")) {
        const json& a = j.at("atomic");
        if (!a.is_object() || !a.contains("key") || !a.contains("operator")) {
            throw malformed_filter("atomic node needs key and operator");
        }
        std::string value = a.contains("value") ? scalar_text(a.at("value"), "value") : "";
        std::string column_type = a.contains("columnType") ? scalar_text(a.at("columnType"), "columnType") : "";
        return WhereCondition::atomic(scalar_text(a.at("key"), "key"),
                                      scalar_text(a.at("operator"), "operator"),
                                      std::move(value), std::move(column_type));
    }

    const bool is_and = j.contains("and");
    if (!is_and && !j.contains("or")) {
        throw malformed_filter("unknown filter node '" + j.begin().key() + "'");
    }
    const json& list = j.at(is_and ? "and" : "or");
    if (!list.is_array()) throw malformed_filter(std::string(is_and ? "and" : "or") + " must hold an array");

    std::vector<WhereCondition> children;
    children.reserve(list.size());
    for (const auto& child : list) children.push_back(where_from_json(child));
    return is_and ? WhereCondition::all_of(std::move(children)) : WhereCondition::any_of(std::move(children));
}

WhereCondition parse_where(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw malformed_filter(std::string("invalid filter JSON: ") + e.what());
    }
    return where_from_json(j);
}

} // namespace Omnidb
