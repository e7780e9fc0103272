/**
 * @file mongodb_references.hpp
 * @brief Relationship inference for collections from sampled field names
 */

#pragma once

#include <core/types.hpp>
#include <set>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief What one collection looked like in its sample documents.
 */
struct CollectionSample {
    StorageUnit unit;
    std::vector<std::string> fields;
    std::set<std::string> array_fields;    // fields holding arrays
    std::set<std::string> unique_fields;   // single-field unique indexes
};

/**
 * @brief Referenced name for a field, or empty when the field does not look
 * like a reference. many is set for the _ids/Ids forms.
 *
 * Recognised: customer_id, customerId, customer_ids, customerIds.
 * The bare _id field is never a reference.
 */
std::string reference_base(const std::string& field, bool& many);

/**
 * @brief Collection a reference base names, matching singular or plural
 * case-insensitively; empty when none does.
 */
std::string match_collection(const std::string& base, const std::vector<std::string>& collections);

/**
 * @brief Graph from reference fields.
 *
 * _ids arrays give ManyToMany both ways; other references give OneToOne
 * both ways when the field has a unique index, else ManyToOne with an
 * inverse OneToMany. Units keep sample order; relations are deduplicated.
 */
std::vector<GraphUnit> infer_references(const std::vector<CollectionSample>& samples);

} // namespace Omnidb
