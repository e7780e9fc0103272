#include <config/settings.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace Omnidb {

namespace {

std::size_t read_size(const char* name, std::size_t fallback, std::size_t minimum) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return fallback;

    std::string value(raw);
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a number, got '" + value + "'");
    }
    if (consumed != value.size() || value[0] == '-') {
        throw std::invalid_argument(std::string(name) + " must be a number, got '" + value + "'");
    }
    if (parsed < minimum) {
        throw std::invalid_argument(std::string(name) + " must be at least " + std::to_string(minimum));
    }
    return static_cast<std::size_t>(parsed);
}

} // namespace

EngineSettings EngineSettings::load_from_env() {
    EngineSettings settings;

    if (const char* level = std::getenv("OMNIDB_LOG_LEVEL")) {
        settings.log_level = Logger::parse_level(level);
    }

    settings.default_timeout = std::chrono::milliseconds(
        read_size("OMNIDB_TIMEOUT_MS", static_cast<std::size_t>(settings.default_timeout.count()), 0));
    settings.redis_scan_limit = read_size("OMNIDB_REDIS_SCAN_LIMIT", settings.redis_scan_limit, 1);
    settings.es_max_result_window = read_size("OMNIDB_ES_MAX_RESULT_WINDOW", settings.es_max_result_window, 1);
    settings.mongo_sample_size = read_size("OMNIDB_MONGO_SAMPLE_SIZE", settings.mongo_sample_size, 1);

    return settings;
}

void EngineSettings::apply() const {
    Logger::set_level(log_level);
}

} // namespace Omnidb
