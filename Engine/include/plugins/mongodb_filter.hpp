/**
 * @file mongodb_filter.hpp
 * @brief WhereCondition to MongoDB query document (canonical extended JSON)
 */

#pragma once

#include <core/where_condition.hpp>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Omnidb {

const std::vector<std::string>& mongodb_operators();

/**
 * @brief True for 24 hex digits, the textual form of an ObjectId.
 */
bool is_object_id(const std::string& text);

/**
 * @brief {"$oid": text} for ObjectId-shaped _id values, text otherwise.
 */
nlohmann::json mongodb_id(const std::string& text);

/**
 * @brief Translate a filter tree into a query document.
 *
 * A null tree is {}. Values are typed (integer, float, boolean) from the
 * atom's column_type, falling back to the field's type in field_types
 * (BSON type names such as "int32" or "double", as sampled from the
 * collection); untyped values are compared as strings. _id values that look
 * like ObjectIds become {"$oid": ...}.
 * @throws DbError(MalformedFilter)
 */
nlohmann::json to_mongodb_filter(const WhereCondition* where,
                                 const std::map<std::string, std::string>& field_types = {});

/**
 * @brief Anchored regular expression for a LIKE pattern.
 */
std::string like_to_regex(const std::string& pattern);

} // namespace Omnidb
