/**
 * @file elasticsearch_query.hpp
 * @brief WhereCondition to Query DSL translation and search request bodies
 */

#pragma once

#include <core/types.hpp>
#include <core/where_condition.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Omnidb {

/**
 * @brief Field name to mapping type ("keyword", "text", "long", ...).
 *
 * Nested object properties are flattened with dots ("address.city").
 */
using FieldTypes = std::map<std::string, std::string>;

/**
 * @brief Flatten the "properties" of one index mapping.
 */
FieldTypes flatten_mapping(const nlohmann::json& mapping);

const std::vector<std::string>& elasticsearch_operators();
const std::vector<std::string>& elasticsearch_field_types();

/**
 * @brief Translate a filter tree into a Query DSL query.
 *
 * A null tree is match_all. Values are typed from the atom's column_type,
 * falling back to the field's mapping type. When fields is not empty, keys
 * must be mapped fields (or _id).
 * @throws DbError(MalformedFilter)
 */
nlohmann::json to_elasticsearch_query(const WhereCondition* where, const FieldTypes& fields);

/**
 * @brief LIKE pattern to wildcard pattern: % to *, _ to ?, and the wildcard
 * metacharacters escaped.
 */
std::string like_to_wildcard(const std::string& pattern);

/**
 * @brief from/size search body, usable while from + size stays inside the
 * result window.
 */
nlohmann::json search_page_body(const nlohmann::json& query, std::size_t from, std::size_t size);

/**
 * @brief One step of a point-in-time walk ordered by _shard_doc.
 *
 * search_after is omitted when null (first step).
 */
nlohmann::json pit_search_body(const nlohmann::json& query,
                               const std::string& pit_id,
                               std::size_t size,
                               const nlohmann::json& search_after);

/**
 * @brief Whether from + size stays inside the result window.
 */
bool fits_result_window(std::size_t page_offset, std::size_t page_size, std::size_t max_result_window);

/**
 * @brief Fetches the next hits array: fetch(batch_size, search_after).
 * search_after is null for the first batch.
 */
using HitBatchFetcher = std::function<nlohmann::json(std::size_t, const nlohmann::json&)>;

/**
 * @brief Walk a sorted hit stream, dropping page_offset hits and keeping the
 * next page_size as document rows.
 *
 * No batch asks for more than max_batch hits. The walk stops early on an
 * empty or short batch, or a hit without sort values.
 */
std::vector<std::string> collect_after_skip(std::size_t page_size,
                                            std::size_t page_offset,
                                            std::size_t max_batch,
                                            const HitBatchFetcher& fetch);

/**
 * @brief Hit to the single-cell document row: {"_id": ..., ...source}.
 */
std::string hit_document(const nlohmann::json& hit);

} // namespace Omnidb
