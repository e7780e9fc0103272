/**
 * @file elasticsearch_plugin.cpp
 * @brief Elasticsearch adapter implementation
 */

#include <plugins/elasticsearch_plugin.hpp>
#include <core/json_codec.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Omnidb {

using nlohmann::json;

namespace {

std::string error_reason(const HttpResponse& response) {
    try {
        json body = json::parse(response.body);
        if (body.contains("error")) {
            const json& error = body.at("error");
            if (error.is_object()) return error.value("reason", error.value("type", response.body));
            if (error.is_string()) return error.get<std::string>();
        }
    } catch (const json::parse_error&) {
        // not JSON; report the raw body below
    }
    return response.body;
}

json read_json(const HttpResponse& response, const std::string& what) {
    if (response.status == 401 || response.status == 403) {
        throw ConnectionError("Elasticsearch " + what + " rejected credentials: " + error_reason(response));
    }
    if (!response.ok()) {
        throw DriverError("Elasticsearch " + what + " failed (" + std::to_string(response.status) + "): " +
                          error_reason(response));
    }
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw DriverError("Elasticsearch " + what + " returned invalid JSON: " + e.what());
    }
}

/**
 * @brief Open point in time, closed again when the walk ends.
 */
class PointInTime {
public:
    PointInTime(HttpClient& http, const std::string& index_path) : http_(http) {
        json opened = read_json(http_.post(index_path + "/_pit?keep_alive=1m", ""), "open point in time");
        id_ = opened.value("id", "");
        if (id_.empty()) throw DriverError("Elasticsearch returned no point-in-time id");
    }

    ~PointInTime() {
        try {
            http_.del("/_pit", json{{"id", id_}}.dump());
        } catch (const std::exception& e) {
            Logger::warn(std::string("Closing Elasticsearch point in time failed: ") + e.what());
        }
    }

    PointInTime(const PointInTime&) = delete;
    PointInTime& operator=(const PointInTime&) = delete;

    const std::string& id() const { return id_; }

    // Each search may hand back a newer id for the same point in time.
    void advance(const json& response) {
        std::string next = response.value("pit_id", "");
        if (!next.empty()) id_ = next;
    }

private:
    HttpClient& http_;
    std::string id_;
};

std::string document_id(json& doc) {
    if (!doc.contains("_id")) throw malformed_input("document has no _id");
    const json& id = doc.at("_id");
    std::string out = id.is_string() ? id.get<std::string>() : id.dump();
    if (out.empty()) throw malformed_input("document has an empty _id");
    doc.erase("_id");
    return out;
}

} // namespace

ElasticsearchPlugin::ElasticsearchPlugin(std::size_t max_result_window)
    : Plugin(DatabaseType::ElasticSearch), max_result_window_(max_result_window) {}

std::unique_ptr<HttpClient> ElasticsearchPlugin::connect(const PluginConfig& config) const {
    const Credentials& creds = config.credentials;
    auto http = std::make_unique<HttpClient>(
        make_base_url(creds.hostname, creds.port, "9200", creds.advanced_value("HTTP Protocol") == "https"),
        config.context);
    if (!creds.username.empty()) http->set_basic_auth(creds.username, creds.password);
    http->set_verify_tls(creds.advanced_value("SSL Verify", "true") != "false");
    return http;
}

bool ElasticsearchPlugin::is_valid_index_name(const std::string& name) {
    if (name.empty() || name.size() > 255 || name == "." || name == "..") return false;
    if (name[0] == '_' || name[0] == '-' || name[0] == '+') return false;
    for (char c : name) {
        if (c >= 'A' && c <= 'Z') return false;
        if (std::string(" \\/*?\"<>|,#:").find(c) != std::string::npos) return false;
    }
    return true;
}

FieldTypes ElasticsearchPlugin::load_fields(HttpClient& http, const std::string& index) const {
    json mapping = read_json(http.get("/" + http.escape(index) + "/_mapping"), "mapping lookup");
    // The response is keyed by the concrete index name, which differs for aliases.
    FieldTypes out;
    for (const auto& [name, definition] : mapping.items()) {
        FieldTypes fields = flatten_mapping(definition);
        out.insert(fields.begin(), fields.end());
    }
    return out;
}

bool ElasticsearchPlugin::is_available(const PluginConfig& config) {
    try {
        return run(config, "is_available", [](HttpClient& http) { return http.get("/").ok(); });
    } catch (const std::exception& e) {
        Logger::debug(engine_name() + " is not available: " + e.what());
        return false;
    }
}

std::vector<std::string> ElasticsearchPlugin::get_databases(const PluginConfig&) {
    return {};
}

std::vector<std::string> ElasticsearchPlugin::get_all_schemas(const PluginConfig&) {
    return {};
}

std::vector<StorageUnit> ElasticsearchPlugin::get_storage_units(const PluginConfig& config, const std::string&) {
    return run(config, "get_storage_units", [](HttpClient& http) {
        json indices = read_json(http.get("/_cat/indices?format=json&bytes=b"), "index listing");

        std::vector<StorageUnit> out;
        for (const auto& entry : indices) {
            std::string name = entry.value("index", "");
            if (name.empty() || name[0] == '.') continue;

            StorageUnit unit;
            unit.name = name;
            unit.attributes.emplace_back("Type", entry.value("health", ""));
            unit.attributes.emplace_back("Count", entry.value("docs.count", ""));
            unit.attributes.emplace_back("Total Size", entry.value("store.size", ""));
            out.push_back(std::move(unit));
        }
        std::sort(out.begin(), out.end(),
                  [](const StorageUnit& a, const StorageUnit& b) { return a.name < b.name; });
        return out;
    });
}

std::vector<Column> ElasticsearchPlugin::get_columns(const PluginConfig& config,
                                                     const std::string&,
                                                     const std::string& storage_unit) {
    return run(config, "get_columns", [&](HttpClient& http) {
        std::vector<Column> out;
        for (const auto& [name, type] : load_fields(http, storage_unit)) out.push_back({name, type});
        return out;
    });
}

std::vector<std::string> ElasticsearchPlugin::search_page(HttpClient& http, const std::string& index,
                                                          const json& query,
                                                          std::size_t page_size, std::size_t page_offset) const {
    json response = read_json(http.post("/" + http.escape(index) + "/_search",
                                         search_page_body(query, page_offset, page_size).dump()),
                              "search");
    std::vector<std::string> docs;
    for (const auto& hit : response["hits"]["hits"]) docs.push_back(hit_document(hit));
    return docs;
}

std::vector<std::string> ElasticsearchPlugin::search_deep(HttpClient& http, const std::string& index,
                                                          const json& query,
                                                          std::size_t page_size, std::size_t page_offset) const {
    PointInTime pit(http, "/" + http.escape(index));

    return collect_after_skip(page_size, page_offset, max_result_window_,
        [&](std::size_t batch, const json& search_after) {
            json response = read_json(
                http.post("/_search", pit_search_body(query, pit.id(), batch, search_after).dump()),
                "point-in-time search");
            pit.advance(response);
            return response["hits"]["hits"];
        });
}

RowsResult ElasticsearchPlugin::get_rows(const PluginConfig& config,
                                         const std::string&,
                                         const std::string& storage_unit,
                                         const WhereCondition* where,
                                         std::size_t page_size,
                                         std::size_t page_offset) {
    check_page_size(page_size, "get_rows");
    return run(config, "get_rows", [&](HttpClient& http) {
        json query = to_elasticsearch_query(where, load_fields(http, storage_unit));

        RowsResult result;
        result.columns.push_back({"document", "Document"});

        std::vector<std::string> docs = fits_result_window(page_offset, page_size, max_result_window_)
            ? search_page(http, storage_unit, query, page_size, page_offset)
            : search_deep(http, storage_unit, query, page_size, page_offset);
        for (auto& doc : docs) result.rows.push_back({std::move(doc)});
        return result;
    });
}

bool ElasticsearchPlugin::add_storage_unit(const PluginConfig& config,
                                           const std::string&,
                                           const std::string& storage_unit,
                                           const std::vector<Record>& fields) {
    if (!is_valid_index_name(storage_unit)) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "add_storage_unit",
                      "invalid index name '" + storage_unit + "'");
    }

    json properties = json::object();
    const auto& types = elasticsearch_field_types();
    for (const auto& field : fields) {
        if (field.key.empty() || properties.contains(field.key)) {
            throw DbError(ErrorKind::MalformedInput, engine_name(), "add_storage_unit",
                          "empty or duplicate field name '" + field.key + "'");
        }
        if (std::find(types.begin(), types.end(), field.value) == types.end()) {
            throw DbError(ErrorKind::MalformedInput, engine_name(), "add_storage_unit",
                          "unsupported field type '" + field.value + "' for '" + field.key + "'");
        }
        properties[field.key] = {{"type", field.value}};
    }

    return run(config, "add_storage_unit", [&](HttpClient& http) {
        json body{{"mappings", {{"properties", properties}}}};
        read_json(http.put("/" + http.escape(storage_unit), body.dump()), "index creation");
        return true;
    });
}

bool ElasticsearchPlugin::update_storage_unit(const PluginConfig& config,
                                              const std::string&,
                                              const std::string& storage_unit,
                                              const std::vector<Record>& values,
                                              const std::vector<std::string>& updated_columns) {
    if (updated_columns.empty()) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "update_storage_unit", "no updated columns given");
    }
    json doc;
    std::string id;
    try {
        doc = document_from_records(values);
        id = document_id(doc);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "update_storage_unit");
    }

    return run(config, "update_storage_unit", [&](HttpClient& http) {
        HttpResponse response = http.post("/" + http.escape(storage_unit) + "/_update/" + http.escape(id) +
                                          "?refresh=true",
                                          json{{"doc", doc}}.dump());
        if (response.status == 404) throw DbError(ErrorKind::ExecutionFailure, "", "", "no document matched _id " + id);
        read_json(response, "update");
        return true;
    });
}

bool ElasticsearchPlugin::add_row(const PluginConfig& config,
                                  const std::string&,
                                  const std::string& storage_unit,
                                  const std::vector<Record>& values) {
    json doc;
    try {
        doc = document_from_records(values);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "add_row");
    }

    return run(config, "add_row", [&](HttpClient& http) {
        const std::string index = "/" + http.escape(storage_unit);
        if (doc.contains("_id")) {
            std::string id = document_id(doc);
            read_json(http.put(index + "/_doc/" + http.escape(id) + "?refresh=true", doc.dump()), "index document");
        } else {
            read_json(http.post(index + "/_doc?refresh=true", doc.dump()), "index document");
        }
        return true;
    });
}

bool ElasticsearchPlugin::delete_row(const PluginConfig& config,
                                     const std::string&,
                                     const std::string& storage_unit,
                                     const std::vector<Record>& values) {
    std::string id;
    try {
        json doc = document_from_records(values);
        id = document_id(doc);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "delete_row");
    }

    return run(config, "delete_row", [&](HttpClient& http) {
        HttpResponse response = http.del("/" + http.escape(storage_unit) + "/_doc/" + http.escape(id) + "?refresh=true");
        if (response.status == 404) return false;
        return read_json(response, "delete").value("result", "") == "deleted";
    });
}

} // namespace Omnidb
