/**
 * @file mongodb_connection.hpp
 * @brief mongocxx client bound to one call
 */

#pragma once

#include <core/call_context.hpp>
#include <core/types.hpp>
#include <string>
#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>

namespace Omnidb {

/**
 * @brief One client per call. Construction pings the server so an
 * unreachable deployment surfaces as ConnectionError before any operation.
 */
class MongoConnection {
public:
    MongoConnection(const Credentials& credentials, const CallContext& context);

    MongoConnection(const MongoConnection&) = delete;
    MongoConnection& operator=(const MongoConnection&) = delete;

    /**
     * @brief mongodb:// URI with connect, socket and server-selection
     * timeouts from the context. A hostname that already is a URI is kept
     * and only gets the timeouts appended.
     */
    static std::string build_uri(const Credentials& credentials, const CallContext& context);

    mongocxx::client& client() { return client_; }
    mongocxx::database database(const std::string& name) { return client_[name]; }

    bool ping();

private:
    mongocxx::client client_;
};

} // namespace Omnidb
