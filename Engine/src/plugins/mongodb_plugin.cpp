/**
 * @file mongodb_plugin.cpp
 * @brief MongoDB adapter implementation
 */

#include <plugins/mongodb_plugin.hpp>
#include <core/json_codec.hpp>
#include <plugins/mongodb_references.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <set>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find.hpp>

namespace Omnidb {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using nlohmann::json;

namespace {

std::string number_text(const bsoncxx::document::element& element) {
    switch (element.type()) {
        case bsoncxx::type::k_int32: return std::to_string(element.get_int32().value);
        case bsoncxx::type::k_int64: return std::to_string(element.get_int64().value);
        case bsoncxx::type::k_double: return std::to_string(static_cast<int64_t>(element.get_double().value));
        default: return "";
    }
}

bsoncxx::document::value to_bson(const json& doc) {
    return bsoncxx::from_json(doc.dump());
}

// _id as stored: extended JSON objects ({"$oid": ...}) pass through, strings
// that look like ObjectIds are converted.
json id_filter(json& doc) {
    if (!doc.contains("_id")) throw malformed_input("document has no _id");
    json id = doc.at("_id");
    doc.erase("_id");
    if (id.is_string()) id = mongodb_id(id.get<std::string>());
    return json{{"_id", id}};
}

bool is_valid_collection_name(const std::string& name) {
    return !name.empty() && name.size() < 255 && name.find('$') == std::string::npos &&
           name.find('\0') == std::string::npos && name.rfind("system.", 0) != 0;
}

// Field names of sampled documents, in first-seen order.
struct FieldScan {
    std::vector<std::string> names;
    std::vector<std::string> types;
    std::set<std::string> arrays;

    void add(const bsoncxx::document::view& doc) {
        for (const auto& element : doc) {
            std::string key(element.key());
            if (element.type() == bsoncxx::type::k_array) arrays.insert(key);
            if (std::find(names.begin(), names.end(), key) != names.end()) continue;
            names.push_back(key);
            types.push_back(bsoncxx::to_string(element.type()));
        }
    }
};

FieldScan sample_fields(mongocxx::collection& collection, std::size_t sample_size) {
    mongocxx::options::find opts;
    opts.limit(static_cast<int64_t>(sample_size));
    FieldScan scan;
    for (const auto& doc : collection.find({}, opts)) scan.add(doc);
    return scan;
}

std::set<std::string> unique_fields(mongocxx::collection& collection) {
    std::set<std::string> out;
    for (const auto& index : collection.list_indexes()) {
        auto unique = index["unique"];
        if (!unique || unique.type() != bsoncxx::type::k_bool || !unique.get_bool().value) continue;
        auto key = index["key"];
        if (!key || key.type() != bsoncxx::type::k_document) continue;
        auto fields = key.get_document().view();
        if (std::distance(fields.begin(), fields.end()) == 1) out.insert(std::string(fields.begin()->key()));
    }
    return out;
}

} // namespace

MongoPlugin::MongoPlugin(std::size_t sample_size)
    : Plugin(DatabaseType::MongoDB), sample_size_(sample_size == 0 ? 1 : sample_size) {}

std::unique_ptr<MongoConnection> MongoPlugin::connect(const PluginConfig& config) const {
    return std::make_unique<MongoConnection>(config.credentials, config.context);
}

bool MongoPlugin::is_available(const PluginConfig& config) {
    try {
        return run(config, "is_available", [](MongoConnection& conn) { return conn.ping(); });
    } catch (const std::exception& e) {
        Logger::debug(engine_name() + " is not available: " + e.what());
        return false;
    }
}

std::vector<std::string> MongoPlugin::get_databases(const PluginConfig& config) {
    return run(config, "get_databases", [](MongoConnection& conn) {
        return conn.client().list_database_names();
    });
}

std::vector<std::string> MongoPlugin::get_all_schemas(const PluginConfig& config) {
    return run(config, "get_all_schemas", [](MongoConnection& conn) {
        return conn.client().list_database_names();
    });
}

std::vector<StorageUnit> MongoPlugin::load_collections(MongoConnection& conn, const std::string& schema) const {
    mongocxx::database db = conn.database(schema);

    std::vector<StorageUnit> out;
    for (const auto& info : db.list_collections()) {
        StorageUnit unit;
        unit.name = std::string(info["name"].get_string().value);
        std::string type = info["type"] ? std::string(info["type"].get_string().value) : "collection";

        std::string storage_size;
        if (type == "collection") {
            try {
                auto stats = db.run_command(make_document(kvp("collStats", unit.name)));
                if (auto size = stats.view()["storageSize"]) storage_size = number_text(size);
            } catch (const mongocxx::operation_exception& e) {
                Logger::debug("collStats on " + unit.name + " refused: " + e.what());
            }
        }

        unit.attributes.emplace_back("Type", type);
        unit.attributes.emplace_back("Count", type == "collection"
            ? std::to_string(db[unit.name].estimated_document_count())
            : "");
        unit.attributes.emplace_back("Storage Size", storage_size);
        out.push_back(std::move(unit));
    }
    std::sort(out.begin(), out.end(), [](const StorageUnit& a, const StorageUnit& b) { return a.name < b.name; });
    return out;
}

std::vector<StorageUnit> MongoPlugin::get_storage_units(const PluginConfig& config, const std::string& schema) {
    return run(config, "get_storage_units",
               [&](MongoConnection& conn) { return load_collections(conn, schema); });
}

std::vector<Column> MongoPlugin::get_columns(const PluginConfig& config,
                                             const std::string& schema,
                                             const std::string& storage_unit) {
    return run(config, "get_columns", [&](MongoConnection& conn) {
        auto collection = conn.database(schema)[storage_unit];
        FieldScan scan = sample_fields(collection, sample_size_);
        std::vector<Column> out;
        for (size_t i = 0; i < scan.names.size(); ++i) out.push_back({scan.names[i], scan.types[i]});
        return out;
    });
}

RowsResult MongoPlugin::get_rows(const PluginConfig& config,
                                 const std::string& schema,
                                 const std::string& storage_unit,
                                 const WhereCondition* where,
                                 std::size_t page_size,
                                 std::size_t page_offset) {
    check_page_size(page_size, "get_rows");

    return run(config, "get_rows", [&](MongoConnection& conn) {
        auto collection = conn.database(schema)[storage_unit];

        json filter = json::object();
        if (where) {
            FieldScan scan = sample_fields(collection, sample_size_);
            std::map<std::string, std::string> field_types;
            for (size_t i = 0; i < scan.names.size(); ++i) field_types.emplace(scan.names[i], scan.types[i]);
            filter = to_mongodb_filter(where, field_types);
        }

        mongocxx::options::find opts;
        opts.skip(static_cast<int64_t>(page_offset));
        opts.limit(static_cast<int64_t>(page_size));
        opts.sort(make_document(kvp("_id", 1)));

        RowsResult result;
        result.columns.push_back({"document", "Document"});
        for (const auto& doc : collection.find(to_bson(filter), opts)) {
            result.rows.push_back({bsoncxx::to_json(doc, bsoncxx::ExtendedJsonMode::k_relaxed)});
        }
        return result;
    });
}

bool MongoPlugin::add_storage_unit(const PluginConfig& config,
                                   const std::string& schema,
                                   const std::string& storage_unit,
                                   const std::vector<Record>&) {
    if (!is_valid_collection_name(storage_unit)) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "add_storage_unit",
                      "invalid collection name '" + storage_unit + "'");
    }
    return run(config, "add_storage_unit", [&](MongoConnection& conn) {
        conn.database(schema).create_collection(storage_unit);
        return true;
    });
}

bool MongoPlugin::update_storage_unit(const PluginConfig& config,
                                      const std::string& schema,
                                      const std::string& storage_unit,
                                      const std::vector<Record>& values,
                                      const std::vector<std::string>& updated_columns) {
    if (updated_columns.empty()) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "update_storage_unit", "no updated columns given");
    }
    json doc;
    json filter;
    try {
        doc = document_from_records(values);
        filter = id_filter(doc);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "update_storage_unit");
    }
    if (doc.empty()) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "update_storage_unit", "document has no fields to set");
    }

    return run(config, "update_storage_unit", [&](MongoConnection& conn) {
        auto collection = conn.database(schema)[storage_unit];
        auto result = collection.update_one(to_bson(filter), to_bson(json{{"$set", doc}}));
        if (result && result->matched_count() == 0) {
            throw DbError(ErrorKind::ExecutionFailure, "", "", "no document matched " + filter.dump());
        }
        return true;
    });
}

bool MongoPlugin::add_row(const PluginConfig& config,
                          const std::string& schema,
                          const std::string& storage_unit,
                          const std::vector<Record>& values) {
    json doc;
    try {
        doc = document_from_records(values);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "add_row");
    }

    return run(config, "add_row", [&](MongoConnection& conn) {
        auto collection = conn.database(schema)[storage_unit];
        collection.insert_one(to_bson(doc));
        return true;
    });
}

bool MongoPlugin::delete_row(const PluginConfig& config,
                             const std::string& schema,
                             const std::string& storage_unit,
                             const std::vector<Record>& values) {
    json filter;
    try {
        json doc = document_from_records(values);
        filter = id_filter(doc);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "delete_row");
    }

    return run(config, "delete_row", [&](MongoConnection& conn) {
        auto collection = conn.database(schema)[storage_unit];
        auto result = collection.delete_one(to_bson(filter));
        return result && result->deleted_count() > 0;
    });
}

std::vector<GraphUnit> MongoPlugin::get_graph(const PluginConfig& config, const std::string& schema) {
    return run(config, "get_graph", [&](MongoConnection& conn) {
        mongocxx::database db = conn.database(schema);

        std::vector<CollectionSample> samples;
        for (auto& unit : load_collections(conn, schema)) {
            CollectionSample sample;
            if (unit.attributes.front().value == "collection") {
                auto collection = db[unit.name];
                FieldScan scan = sample_fields(collection, sample_size_);
                sample.fields = std::move(scan.names);
                sample.array_fields = std::move(scan.arrays);
                sample.unique_fields = unique_fields(collection);
            }
            sample.unit = std::move(unit);
            samples.push_back(std::move(sample));
        }
        return infer_references(samples);
    });
}

} // namespace Omnidb
