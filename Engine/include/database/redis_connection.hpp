/**
 * @file redis_connection.hpp
 * @brief hiredis connection returning owned reply values
 */

#pragma once

#include <core/call_context.hpp>
#include <core/types.hpp>
#include <plugins/redis_rows.hpp>
#include <string>
#include <vector>
#include <hiredis/hiredis.h>

namespace Omnidb {

/**
 * @brief Synchronous hiredis context for one call.
 *
 * Connect and command timeouts come from the CallContext, which is also
 * checked before every command. Authenticates and selects the database
 * index from the credentials.
 */
class RedisConnection {
public:
    RedisConnection(const Credentials& credentials, CallContext context);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    /**
     * @brief Run one command.
     * @throws DriverError on an error reply, ConnectionError on I/O failure
     */
    RedisValue command(const std::vector<std::string>& argv);

    /**
     * @brief Like command(), but error replies are returned, not thrown.
     */
    RedisValue try_command(const std::vector<std::string>& argv);

    bool ping();

private:
    static RedisValue convert(const redisReply* reply);

    redisContext* ctx_ = nullptr;
    CallContext context_;
};

} // namespace Omnidb
