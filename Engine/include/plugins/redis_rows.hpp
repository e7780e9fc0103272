/**
 * @file redis_rows.hpp
 * @brief Reply values, per-type row shapes and the client-side filter path
 *
 * Redis has no server-side predicates. Rows are read with a bounded scan,
 * filtered in memory with RowFilter, then sliced; when the scan stopped at
 * its bound the result is flagged truncated.
 */

#pragma once

#include <core/types.hpp>
#include <core/where_condition.hpp>
#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Omnidb {

/**
 * @brief Owned copy of one hiredis reply.
 */
struct RedisValue {
    enum class Type { Nil, Status, Error, Integer, String, Array };

    Type type = Type::Nil;
    std::string text;
    long long integer = 0;
    std::vector<RedisValue> elements;

    static RedisValue string(std::string s) {
        RedisValue v;
        v.type = Type::String;
        v.text = std::move(s);
        return v;
    }
    static RedisValue array(std::vector<RedisValue> items) {
        RedisValue v;
        v.type = Type::Array;
        v.elements = std::move(items);
        return v;
    }
    static RedisValue number(long long n) {
        RedisValue v;
        v.type = Type::Integer;
        v.integer = n;
        return v;
    }

    /**
     * @brief Text of a string/status reply, or the decimal integer.
     */
    std::string as_text() const;
};

/**
 * @brief Column layout for a key type: string, hash, list, set or zset.
 * @throws DbError(UnsupportedOperation) for other types (streams, modules)
 */
std::vector<Column> redis_columns(const std::string& key_type);

/**
 * @brief Rows for a key from the reply of GET, HGETALL/HSCAN, LRANGE,
 * SMEMBERS/SSCAN or ZRANGE WITHSCORES. List indexes start at first_index.
 */
std::vector<std::vector<std::string>> redis_rows(const std::string& key_type,
                                                 const std::vector<std::string>& items,
                                                 long long first_index = 0);

/**
 * @brief Append one SCAN/HSCAN/SSCAN/ZSCAN batch to items.
 *
 * Entries are step items wide (field and value for HSCAN, member and score
 * for ZSCAN) and keyed by their first item. A cursor walk may return an
 * entry more than once while the server rehashes; repeats already in seen
 * are dropped, as is a trailing partial entry.
 */
void append_scan_batch(const std::vector<RedisValue>& batch,
                       std::size_t step,
                       std::unordered_set<std::string>& seen,
                       std::vector<std::string>& items);

/**
 * @brief Filter then slice scanned rows.
 *
 * truncated marks that the scan stopped at its bound, in which case a
 * warning is logged naming the key.
 * @throws DbError(MalformedFilter)
 */
RowsResult filter_redis_rows(const std::string& key,
                             const std::vector<Column>& columns,
                             const std::vector<std::vector<std::string>>& rows,
                             const WhereCondition* where,
                             std::size_t page_size,
                             std::size_t page_offset,
                             bool truncated);

/**
 * @brief Database indexes "0".."n-1" from a CONFIG GET databases reply;
 * 16 when the reply is empty or unusable.
 */
std::vector<std::string> redis_database_names(const RedisValue& config_reply);

} // namespace Omnidb
