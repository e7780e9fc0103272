/**
 * @file settings.hpp
 * @brief Process-wide engine settings loaded once from the environment
 */

#pragma once

#include <utils/logger.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace Omnidb {

struct EngineSettings {
    Logger::Level log_level = Logger::Level::Info;
    std::chrono::milliseconds default_timeout{30000};
    std::size_t redis_scan_limit = 10000;
    std::size_t es_max_result_window = 10000;
    std::size_t mongo_sample_size = 1;

    /**
     * @brief Read OMNIDB_* variables; unset ones keep their defaults.
     *
     * OMNIDB_LOG_LEVEL, OMNIDB_TIMEOUT_MS, OMNIDB_REDIS_SCAN_LIMIT,
     * OMNIDB_ES_MAX_RESULT_WINDOW, OMNIDB_MONGO_SAMPLE_SIZE
     *
     * @throws std::invalid_argument on a malformed number
     */
    static EngineSettings load_from_env();

    /**
     * @brief Apply the process-level parts (log level).
     */
    void apply() const;
};

} // namespace Omnidb
