/**
 * @file json_codec.hpp
 * @brief nlohmann/json encoding of the public result shapes and filter trees
 */

#pragma once

#include <core/types.hpp>
#include <core/where_condition.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Omnidb {

void to_json(nlohmann::json& j, const Record& record);
void to_json(nlohmann::json& j, const Column& column);
void to_json(nlohmann::json& j, const StorageUnit& unit);
void to_json(nlohmann::json& j, const RowsResult& result);
void to_json(nlohmann::json& j, const GraphUnitRelationship& relation);
void to_json(nlohmann::json& j, const GraphUnit& unit);
void to_json(nlohmann::json& j, const ChatMessage& message);

void from_json(const nlohmann::json& j, Record& record);

/**
 * @brief Document body from mutation records.
 *
 * A single "document" record holds a JSON object; any other records are
 * taken as top-level string fields.
 * @throws DbError(MalformedInput) when the document is not a JSON object
 */
nlohmann::json document_from_records(const std::vector<Record>& values);

/**
 * @brief {"atomic": {...}} | {"and": [...]} | {"or": [...]}
 */
nlohmann::json where_to_json(const WhereCondition& where);

/**
 * @throws DbError(MalformedFilter) on any structural problem
 */
WhereCondition where_from_json(const nlohmann::json& j);

/**
 * @brief Parse text first; invalid JSON is also MalformedFilter.
 */
WhereCondition parse_where(const std::string& text);

} // namespace Omnidb
