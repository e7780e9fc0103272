/**
 * @file redis_connection.cpp
 * @brief hiredis connection implementation
 */

#include <database/redis_connection.hpp>
#include <core/errors.hpp>
#include <core/value_coercion.hpp>
#include <cstdint>
#include <cstdlib>
#include <utility>
#include <sys/time.h>

namespace Omnidb {

namespace {

constexpr long long kDefaultTimeoutMs = 5000;

timeval to_timeval(long long ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    return tv;
}

} // namespace

RedisConnection::RedisConnection(const Credentials& credentials, CallContext context)
    : context_(std::move(context)) {
    const std::string host = credentials.hostname.empty() ? "localhost" : credentials.hostname;
    const int port = credentials.port_number(6379);

    long long remaining = context_.remaining_ms();
    timeval timeout = to_timeval(remaining > 0 ? remaining : kDefaultTimeoutMs);

    ctx_ = redisConnectWithTimeout(host.c_str(), port, timeout);
    if (!ctx_ || ctx_->err) {
        std::string message = ctx_ ? ctx_->errstr : "cannot allocate context";
        if (ctx_) redisFree(ctx_);
        ctx_ = nullptr;
        throw ConnectionError("Redis connection failed: " + message);
    }
    redisSetTimeout(ctx_, timeout);

    try {
        if (!credentials.password.empty()) {
            if (credentials.username.empty()) {
                command({"AUTH", credentials.password});
            } else {
                command({"AUTH", credentials.username, credentials.password});
            }
        }
        if (!credentials.database.empty() && credentials.database != "0") {
            int64_t index = 0;
            if (!parse_integer(credentials.database, index) || index < 0) {
                throw ConnectionError("Redis database must be a numeric index, got '" + credentials.database + "'");
            }
            command({"SELECT", credentials.database});
        }
    } catch (const DriverError& e) {
        redisFree(ctx_);
        ctx_ = nullptr;
        throw ConnectionError(std::string("Redis handshake failed: ") + e.what());
    } catch (...) {
        redisFree(ctx_);
        ctx_ = nullptr;
        throw;
    }
}

RedisConnection::~RedisConnection() {
    if (ctx_) redisFree(ctx_);
}

RedisValue RedisConnection::convert(const redisReply* reply) {
    RedisValue value;
    switch (reply->type) {
        case REDIS_REPLY_STRING:
            value.type = RedisValue::Type::String;
            value.text.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_STATUS:
            value.type = RedisValue::Type::Status;
            value.text.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_ERROR:
            value.type = RedisValue::Type::Error;
            value.text.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_INTEGER:
            value.type = RedisValue::Type::Integer;
            value.integer = reply->integer;
            break;
        case REDIS_REPLY_ARRAY:
            value.type = RedisValue::Type::Array;
            value.elements.reserve(reply->elements);
            for (size_t i = 0; i < reply->elements; ++i) value.elements.push_back(convert(reply->element[i]));
            break;
        default:
            value.type = RedisValue::Type::Nil;
            break;
    }
    return value;
}

RedisValue RedisConnection::try_command(const std::vector<std::string>& argv) {
    if (context_.should_stop()) {
        throw ConnectionError(context_.cancelled() ? "cancelled" : "deadline exceeded");
    }

    std::vector<const char*> args;
    std::vector<size_t> lengths;
    args.reserve(argv.size());
    lengths.reserve(argv.size());
    for (const auto& arg : argv) {
        args.push_back(arg.data());
        lengths.push_back(arg.size());
    }

    auto* reply = static_cast<redisReply*>(
        redisCommandArgv(ctx_, static_cast<int>(args.size()), args.data(), lengths.data()));
    if (!reply) {
        throw ConnectionError(std::string("Redis command failed: ") + (ctx_->err ? ctx_->errstr : "no reply"));
    }
    RedisValue value = convert(reply);
    freeReplyObject(reply);
    return value;
}

RedisValue RedisConnection::command(const std::vector<std::string>& argv) {
    RedisValue value = try_command(argv);
    if (value.type == RedisValue::Type::Error) {
        throw DriverError("Redis " + (argv.empty() ? std::string() : argv.front()) + " failed: " + value.text);
    }
    return value;
}

bool RedisConnection::ping() {
    RedisValue reply = command({"PING"});
    return reply.text == "PONG";
}

} // namespace Omnidb
