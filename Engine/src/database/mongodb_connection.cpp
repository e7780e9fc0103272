/**
 * @file mongodb_connection.cpp
 * @brief MongoDB client implementation
 */

#include <database/mongodb_connection.hpp>
#include <core/errors.hpp>
#include <cctype>
#include <cstdio>
#include <memory>
#include <mutex>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/uri.hpp>

namespace Omnidb {

namespace {

void ensure_driver() {
    static std::once_flag once;
    static std::unique_ptr<mongocxx::instance> instance;
    std::call_once(once, [] { instance = std::make_unique<mongocxx::instance>(); });
}

std::string percent_encode(const std::string& text) {
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

mongocxx::client open_client(const Credentials& credentials, const CallContext& context) {
    ensure_driver();
    try {
        return mongocxx::client(mongocxx::uri(MongoConnection::build_uri(credentials, context)));
    } catch (const mongocxx::exception& e) {
        throw ConnectionError(std::string("MongoDB connection failed: ") + e.what());
    }
}

} // namespace

std::string MongoConnection::build_uri(const Credentials& credentials, const CallContext& context) {
    std::string uri;
    const std::string& host = credentials.hostname;
    if (host.rfind("mongodb://", 0) == 0 || host.rfind("mongodb+srv://", 0) == 0) {
        uri = host;
        if (uri.find('?') == std::string::npos) {
            uri += uri.find('/', uri.find("//") + 2) == std::string::npos ? "/?" : "?";
        } else {
            uri += "&";
        }
    } else {
        uri = "mongodb://";
        if (!credentials.username.empty()) {
            uri += percent_encode(credentials.username) + ":" + percent_encode(credentials.password) + "@";
        }
        uri += (host.empty() ? "localhost" : host) + ":" + std::to_string(credentials.port_number(27017));
        uri += "/?";
        if (!credentials.username.empty()) {
            uri += "authSource=" + percent_encode(credentials.advanced_value("Auth Source", "admin")) + "&";
        }
    }

    std::string params = credentials.advanced_value("URL Params");
    if (!params.empty()) {
        if (params[0] == '?' || params[0] == '&') params.erase(0, 1);
        uri += params + "&";
    }

    long long remaining = context.remaining_ms();
    if (remaining > 0) {
        const std::string ms = std::to_string(remaining);
        uri += "connectTimeoutMS=" + ms + "&socketTimeoutMS=" + ms + "&serverSelectionTimeoutMS=" + ms;
    } else {
        uri.pop_back();
    }
    return uri;
}

MongoConnection::MongoConnection(const Credentials& credentials, const CallContext& context)
    : client_(open_client(credentials, context)) {
    if (!ping()) throw ConnectionError("MongoDB did not answer ping");
}

bool MongoConnection::ping() {
    using bsoncxx::builder::basic::kvp;
    using bsoncxx::builder::basic::make_document;
    try {
        auto reply = client_["admin"].run_command(make_document(kvp("ping", 1)));
        return reply.view()["ok"] ? true : false;
    } catch (const mongocxx::exception& e) {
        throw ConnectionError(std::string("MongoDB ping failed: ") + e.what());
    }
}

} // namespace Omnidb
