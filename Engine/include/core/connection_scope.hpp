/**
 * @file connection_scope.hpp
 * @brief Acquire-connection, run operation, release-connection wrapper
 */

#pragma once

#include <core/errors.hpp>
#include <core/types.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace Omnidb {

namespace detail {

inline void log_scope_done(const std::string& engine, const std::string& operation, const Timer& timer) {
    if (!Logger::enabled(Logger::Level::Debug)) return;
    std::ostringstream msg;
    msg << "[" << engine << "] " << operation << " completed in " << timer.elapsed_ms() << " ms";
    Logger::debug(msg.str());
}

inline void log_scope_failed(const DbError& error) {
    Logger::warn("[" + error.engine() + "] " + error.operation() + " failed: " + error.what());
}

} // namespace detail

/**
 * @brief Open a connection, run op on it, and always release it.
 *
 * connector(config) must return a std::unique_ptr to the connection; it
 * receives a copy of config whose CallContext deadline starts now. The
 * unique_ptr owns the connection, so it is closed on success, on error and
 * while an exception unwinds.
 *
 * Failures come out as DbError: connector failures and cancellation map to
 * Unavailable, anything thrown by op that is not already a DbError maps to
 * ExecutionFailure. Nothing is retried.
 */
template <typename Connector, typename Operation>
auto with_connection(const PluginConfig& config,
                     const std::string& engine,
                     const std::string& operation,
                     Connector&& connector,
                     Operation&& op) -> decltype(op(*connector(config))) {
    using Result = decltype(op(*connector(config)));

    Timer timer;
    const PluginConfig scoped(config.credentials, config.context.armed());

    if (scoped.context.cancelled()) {
        DbError error(ErrorKind::Unavailable, engine, operation, "cancelled before start");
        detail::log_scope_failed(error);
        throw error;
    }

    decltype(connector(scoped)) conn;
    try {
        conn = connector(scoped);
    } catch (const DbError& e) {
        DbError error = e.with_context(engine, operation);
        detail::log_scope_failed(error);
        throw error;
    } catch (const std::exception& e) {
        DbError error(ErrorKind::Unavailable, engine, operation, e.what());
        detail::log_scope_failed(error);
        throw error;
    }
    if (!conn) {
        DbError error(ErrorKind::Unavailable, engine, operation, "connector returned no connection");
        detail::log_scope_failed(error);
        throw error;
    }

    if (scoped.context.should_stop()) {
        DbError error(ErrorKind::Unavailable, engine, operation,
                      scoped.context.cancelled() ? "cancelled" : "deadline exceeded");
        detail::log_scope_failed(error);
        throw error;
    }

    try {
        if constexpr (std::is_void_v<Result>) {
            op(*conn);
            detail::log_scope_done(engine, operation, timer);
        } else {
            Result result = op(*conn);
            detail::log_scope_done(engine, operation, timer);
            return result;
        }
    } catch (const DbError& e) {
        DbError error = e.with_context(engine, operation);
        detail::log_scope_failed(error);
        throw error;
    } catch (const ConnectionError& e) {
        DbError error(ErrorKind::Unavailable, engine, operation, e.what());
        detail::log_scope_failed(error);
        throw error;
    } catch (const std::exception& e) {
        DbError error(ErrorKind::ExecutionFailure, engine, operation, e.what());
        detail::log_scope_failed(error);
        throw error;
    }
}

} // namespace Omnidb
