#include <plugins/redis_rows.hpp>
#include <core/errors.hpp>
#include <core/row_filter.hpp>
#include <core/value_coercion.hpp>
#include <utils/logger.hpp>
#include <cstdint>

namespace Omnidb {

namespace {

constexpr int64_t kDefaultDatabaseCount = 16;

} // namespace

std::string RedisValue::as_text() const {
    if (type == Type::Integer) return std::to_string(integer);
    return text;
}

void append_scan_batch(const std::vector<RedisValue>& batch,
                       std::size_t step,
                       std::unordered_set<std::string>& seen,
                       std::vector<std::string>& items) {
    for (std::size_t i = 0; step > 0 && i + step <= batch.size(); i += step) {
        if (!seen.insert(batch[i].as_text()).second) continue;
        for (std::size_t j = i; j < i + step; ++j) items.push_back(batch[j].as_text());
    }
}

std::vector<Column> redis_columns(const std::string& key_type) {
    if (key_type == "string") return {{"value", "string"}};
    if (key_type == "hash") return {{"field", "string"}, {"value", "string"}};
    if (key_type == "list") return {{"index", "integer"}, {"value", "string"}};
    if (key_type == "set") return {{"value", "string"}};
    if (key_type == "zset") return {{"member", "string"}, {"score", "float"}};
    throw unsupported_operation("Redis", "rows of type " + key_type);
}

std::vector<std::vector<std::string>> redis_rows(const std::string& key_type,
                                                 const std::vector<std::string>& items,
                                                 long long first_index) {
    std::vector<std::vector<std::string>> rows;

    if (key_type == "hash" || key_type == "zset") {
        rows.reserve(items.size() / 2);
        for (size_t i = 0; i + 1 < items.size(); i += 2) rows.push_back({items[i], items[i + 1]});
    } else if (key_type == "list") {
        rows.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            rows.push_back({std::to_string(first_index + static_cast<long long>(i)), items[i]});
        }
    } else if (key_type == "string" || key_type == "set") {
        rows.reserve(items.size());
        for (const auto& item : items) rows.push_back({item});
    } else {
        throw unsupported_operation("Redis", "rows of type " + key_type);
    }
    return rows;
}

RowsResult filter_redis_rows(const std::string& key,
                             const std::vector<Column>& columns,
                             const std::vector<std::vector<std::string>>& rows,
                             const WhereCondition* where,
                             std::size_t page_size,
                             std::size_t page_offset,
                             bool truncated) {
    RowsResult result;
    result.columns = columns;
    result.truncated = truncated;

    if (truncated) {
        Logger::warn("Redis key '" + key + "' was scanned up to its bound; rows and filter results are partial");
    }

    if (where) {
        RowFilter filter(*where, columns);
        std::size_t matched = 0;
        for (const auto& row : rows) {
            if (!filter.matches(row)) continue;
            if (matched++ < page_offset) continue;
            result.rows.push_back(row);
            if (result.rows.size() == page_size) break;
        }
        return result;
    }

    for (std::size_t i = page_offset; i < rows.size() && result.rows.size() < page_size; ++i) {
        result.rows.push_back(rows[i]);
    }
    return result;
}

std::vector<std::string> redis_database_names(const RedisValue& config_reply) {
    int64_t count = kDefaultDatabaseCount;
    if (config_reply.type == RedisValue::Type::Array && config_reply.elements.size() >= 2) {
        int64_t parsed = 0;
        if (parse_integer(config_reply.elements[1].as_text(), parsed) && parsed > 0) count = parsed;
    }

    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) names.push_back(std::to_string(i));
    return names;
}

} // namespace Omnidb
