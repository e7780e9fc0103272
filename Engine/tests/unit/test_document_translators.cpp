/**
 * @file test_document_translators.cpp
 * @brief Filter translation and result decoding for the document and HTTP engines
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/json_codec.hpp>
#include <database/clickhouse_connection.hpp>
#include <plugins/elasticsearch_query.hpp>
#include <plugins/mongodb_filter.hpp>
#include <plugins/mongodb_references.hpp>
#include <map>
#include <string>

using namespace Omnidb;
using nlohmann::json;

// =============================================================================
// Elasticsearch
// =============================================================================

TEST(ElasticsearchQueryTest, NoFilterMatchesAll) {
    EXPECT_EQ(to_elasticsearch_query(nullptr, {}), json::parse(R"({"match_all":{}})"));
}

TEST(ElasticsearchQueryTest, EqualityUsesMappingType) {
    FieldTypes fields = {{"title", "text"}, {"status", "keyword"}, {"views", "long"}};

    auto phrase = WhereCondition::atomic("title", "=", "hello world");
    EXPECT_EQ(to_elasticsearch_query(&phrase, fields),
              json::parse(R"({"match_phrase":{"title":"hello world"}})"));

    auto term = WhereCondition::atomic("views", "=", "42");
    EXPECT_EQ(to_elasticsearch_query(&term, fields), json::parse(R"({"term":{"views":42}})"));

    auto negated = WhereCondition::atomic("status", "!=", "draft");
    EXPECT_EQ(to_elasticsearch_query(&negated, fields),
              json::parse(R"({"bool":{"must_not":[{"term":{"status":"draft"}}]}})"));
}

TEST(ElasticsearchQueryTest, CompoundAndRangeClauses) {
    FieldTypes fields = {{"price", "double"}, {"tag", "keyword"}};
    auto where = WhereCondition::any_of({
        WhereCondition::atomic("price", ">=", "9.5"),
        WhereCondition::all_of({
            WhereCondition::atomic("tag", "IN", "a,b"),
            WhereCondition::atomic("tag", "IS NULL", ""),
        }),
    });

    json expected = json::parse(R"({
        "bool": {
            "should": [
                {"range": {"price": {"gte": 9.5}}},
                {"bool": {"must": [
                    {"terms": {"tag": ["a", "b"]}},
                    {"bool": {"must_not": [{"exists": {"field": "tag"}}]}}
                ]}}
            ],
            "minimum_should_match": 1
        }
    })");
    EXPECT_EQ(to_elasticsearch_query(&where, fields), expected);
}

TEST(ElasticsearchQueryTest, LikeBecomesWildcard) {
    auto like = WhereCondition::atomic("name", "LIKE", "Bo_%");
    EXPECT_EQ(to_elasticsearch_query(&like, {}), json::parse(R"({"wildcard":{"name":{"value":"Bo?*"}}})"));

    auto contains = WhereCondition::atomic("name", "CONTAINS", "o*b");
    EXPECT_EQ(to_elasticsearch_query(&contains, {}),
              json::parse(R"({"wildcard":{"name":{"value":"*o\\*b*"}}})"));
}

TEST(ElasticsearchQueryTest, RejectsUnknownFieldsOperatorsAndValues) {
    FieldTypes fields = {{"views", "long"}};

    auto unknown = WhereCondition::atomic("nope", "=", "1");
    EXPECT_THROW(to_elasticsearch_query(&unknown, fields), DbError);

    auto op = WhereCondition::atomic("views", "GLOB", "1");
    EXPECT_THROW(to_elasticsearch_query(&op, fields), DbError);

    auto value = WhereCondition::atomic("views", ">", "many");
    EXPECT_THROW(to_elasticsearch_query(&value, fields), DbError);

    auto id = WhereCondition::atomic("_id", "=", "abc");
    EXPECT_NO_THROW(to_elasticsearch_query(&id, fields));
}

TEST(ElasticsearchQueryTest, ValidatesDateAndIpValues) {
    FieldTypes fields = {{"created", "date"}, {"client", "ip"}};

    auto bad_date = WhereCondition::atomic("created", ">", "not-a-date");
    try {
        to_elasticsearch_query(&bad_date, fields);
        FAIL() << "expected DbError";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedFilter);
    }

    auto date = WhereCondition::atomic("created", ">=", "2024-03-01T10:00:00Z");
    EXPECT_EQ(to_elasticsearch_query(&date, fields),
              json::parse(R"({"range":{"created":{"gte":"2024-03-01T10:00:00Z"}}})"));
    auto millis = WhereCondition::atomic("created", "<", "1709287200000");
    EXPECT_NO_THROW(to_elasticsearch_query(&millis, fields));

    auto cidr = WhereCondition::atomic("client", "=", "10.0.0.0/8");
    EXPECT_EQ(to_elasticsearch_query(&cidr, fields), json::parse(R"({"term":{"client":"10.0.0.0/8"}})"));
    auto v6 = WhereCondition::atomic("client", "=", "::1");
    EXPECT_NO_THROW(to_elasticsearch_query(&v6, fields));
    auto bad_ip = WhereCondition::atomic("client", "IN", "10.0.0.1,10.0.0.300");
    EXPECT_THROW(to_elasticsearch_query(&bad_ip, fields), DbError);
}

TEST(ElasticsearchQueryTest, FlattensNestedMappings) {
    json mapping = json::parse(R"({
        "mappings": {"properties": {
            "name": {"type": "text"},
            "address": {"properties": {"city": {"type": "keyword"}}}
        }}
    })");

    FieldTypes fields = flatten_mapping(mapping);
    EXPECT_EQ(fields.at("name"), "text");
    EXPECT_EQ(fields.at("address"), "object");
    EXPECT_EQ(fields.at("address.city"), "keyword");
    EXPECT_TRUE(flatten_mapping(json::object()).empty());
}

TEST(ElasticsearchQueryTest, SearchBodies) {
    json query = {{"match_all", json::object()}};

    json page = search_page_body(query, 20, 10);
    EXPECT_EQ(page["from"], 20);
    EXPECT_EQ(page["size"], 10);
    EXPECT_EQ(page["sort"], json::array({"_doc"}));

    json first = pit_search_body(query, "pit-1", 500, nullptr);
    EXPECT_EQ(first["pit"]["id"], "pit-1");
    EXPECT_FALSE(first.contains("search_after"));

    json next = pit_search_body(query, "pit-2", 500, json::array({7}));
    EXPECT_EQ(next["search_after"], json::array({7}));
    EXPECT_EQ(next["track_total_hits"], false);
}

namespace {

// Sorted hit stream of n documents "d0".."d<n-1>", served search_after style.
class HitStream {
public:
    explicit HitStream(std::size_t n) : n_(n) {}

    json fetch(std::size_t batch, const json& search_after) {
        batches.push_back(batch);
        std::size_t next = search_after.is_null() ? 0 : search_after.at(0).get<std::size_t>() + 1;
        json hits = json::array();
        for (std::size_t i = next; i < n_ && hits.size() < batch; ++i) {
            hits.push_back({{"_id", "d" + std::to_string(i)}, {"_source", json::object()}, {"sort", json::array({i})}});
        }
        return hits;
    }

    // from/size page, as a plain search serves it.
    std::vector<std::string> page(std::size_t from, std::size_t size) const {
        std::vector<std::string> out;
        for (std::size_t i = from; i < n_ && out.size() < size; ++i) out.push_back(id_row(i));
        return out;
    }

    static std::string id_row(std::size_t i) { return json{{"_id", "d" + std::to_string(i)}}.dump(); }

    std::vector<std::size_t> batches;

private:
    std::size_t n_;
};

std::vector<std::string> read_page(HitStream& stream, std::size_t size, std::size_t offset, std::size_t window) {
    if (fits_result_window(offset, size, window)) return stream.page(offset, size);
    return collect_after_skip(size, offset, window,
                              [&](std::size_t batch, const json& after) { return stream.fetch(batch, after); });
}

} // namespace

TEST(ElasticsearchQueryTest, ResultWindowBoundary) {
    EXPECT_TRUE(fits_result_window(0, 10, 10));
    EXPECT_TRUE(fits_result_window(7, 3, 10));
    EXPECT_FALSE(fits_result_window(8, 3, 10));
    EXPECT_FALSE(fits_result_window(0, 11, 10));
    EXPECT_FALSE(fits_result_window(static_cast<std::size_t>(-1), 5, 10));
}

TEST(ElasticsearchQueryTest, DeepWalkSkipsThenCollects) {
    const std::size_t window = 4;

    HitStream below(10);
    EXPECT_EQ(collect_after_skip(2, 1, window, [&](std::size_t b, const json& a) { return below.fetch(b, a); }),
              (std::vector<std::string>{HitStream::id_row(1), HitStream::id_row(2)}));

    HitStream at(10);
    EXPECT_EQ(collect_after_skip(3, 4, window, [&](std::size_t b, const json& a) { return at.fetch(b, a); }),
              (std::vector<std::string>{HitStream::id_row(4), HitStream::id_row(5), HitStream::id_row(6)}));
    EXPECT_EQ(at.batches, (std::vector<std::size_t>{4, 3}));

    HitStream above(10);
    EXPECT_EQ(collect_after_skip(3, 9, window, [&](std::size_t b, const json& a) { return above.fetch(b, a); }),
              (std::vector<std::string>{HitStream::id_row(9)}));
    for (std::size_t batch : above.batches) EXPECT_LE(batch, window);

    HitStream past_end(10);
    EXPECT_TRUE(collect_after_skip(3, 12, window,
                                   [&](std::size_t b, const json& a) { return past_end.fetch(b, a); }).empty());
}

TEST(ElasticsearchQueryTest, PagesCoverEveryDocumentOnce) {
    const std::size_t total = 10;
    const std::size_t window = 4;
    for (std::size_t page_size : {1u, 3u, 4u, 6u}) {
        HitStream stream(total);
        std::vector<std::string> all;
        for (std::size_t offset = 0; offset < total + page_size; offset += page_size) {
            auto page = read_page(stream, page_size, offset, window);
            EXPECT_LE(page.size(), page_size);
            all.insert(all.end(), page.begin(), page.end());
        }
        EXPECT_EQ(all, stream.page(0, total)) << "page size " << page_size;
    }
}

TEST(ElasticsearchQueryTest, HitDocumentPutsIdFirst) {
    json hit = json::parse(R"({"_id":"a1","_index":"users","_source":{"name":"Bob","age":3}})");
    EXPECT_EQ(json::parse(hit_document(hit)), json::parse(R"({"_id":"a1","name":"Bob","age":3})"));
}

// =============================================================================
// MongoDB
// =============================================================================

TEST(MongoFilterTest, EmptyAndSimpleFilters) {
    EXPECT_EQ(to_mongodb_filter(nullptr), json::object());

    auto eq = WhereCondition::atomic("name", "=", "Bob");
    EXPECT_EQ(to_mongodb_filter(&eq), json::parse(R"({"name":{"$eq":"Bob"}})"));

    auto typed = WhereCondition::atomic("age", ">", "30", "int");
    EXPECT_EQ(to_mongodb_filter(&typed), json::parse(R"({"age":{"$gt":30}})"));
}

TEST(MongoFilterTest, ObjectIdsAndLists) {
    auto id = WhereCondition::atomic("_id", "=", "507f1f77bcf86cd799439011");
    EXPECT_EQ(to_mongodb_filter(&id), json::parse(R"({"_id":{"$eq":{"$oid":"507f1f77bcf86cd799439011"}}})"));

    auto plain_id = WhereCondition::atomic("_id", "=", "user-7");
    EXPECT_EQ(to_mongodb_filter(&plain_id), json::parse(R"({"_id":{"$eq":"user-7"}})"));

    auto in = WhereCondition::atomic("score", "NOT IN", "1,2", "double");
    EXPECT_EQ(to_mongodb_filter(&in), json::parse(R"({"score":{"$nin":[1.0,2.0]}})"));
}

TEST(MongoFilterTest, CompoundAndNullChecks) {
    auto where = WhereCondition::all_of({
        WhereCondition::atomic("email", "IS NOT NULL", ""),
        WhereCondition::any_of({
            WhereCondition::atomic("name", "NOT LIKE", "a%"),
            WhereCondition::atomic("deleted", "NOT EXISTS", ""),
        }),
    });
    json expected = json::parse(R"({"$and":[
        {"email":{"$ne":null}},
        {"$or":[{"name":{"$not":{"$regex":"^a.*$"}}},{"deleted":{"$exists":false}}]}
    ]})");
    EXPECT_EQ(to_mongodb_filter(&where), expected);
}

TEST(MongoFilterTest, RejectsBadOperatorsAndValues) {
    auto op = WhereCondition::atomic("name", "ILIKE", "a");
    EXPECT_THROW(to_mongodb_filter(&op), DbError);

    auto value = WhereCondition::atomic("age", "=", "old", "integer");
    EXPECT_THROW(to_mongodb_filter(&value), DbError);
}

TEST(MongoFilterTest, TypesValuesFromSampledFields) {
    std::map<std::string, std::string> sampled = {{"age", "int32"}, {"score", "double"},
                                                  {"active", "bool"}, {"name", "string"}};

    auto age = WhereCondition::atomic("age", "=", "30");
    EXPECT_EQ(to_mongodb_filter(&age, sampled), json::parse(R"({"age":{"$eq":30}})"));
    EXPECT_EQ(to_mongodb_filter(&age), json::parse(R"({"age":{"$eq":"30"}})"));

    auto where = WhereCondition::all_of({
        WhereCondition::atomic("score", ">=", "2.5"),
        WhereCondition::atomic("active", "=", "true"),
        WhereCondition::atomic("name", "=", "42"),
    });
    EXPECT_EQ(to_mongodb_filter(&where, sampled),
              json::parse(R"({"$and":[{"score":{"$gte":2.5}},{"active":{"$eq":true}},{"name":{"$eq":"42"}}]})"));

    auto explicit_type = WhereCondition::atomic("age", "=", "30", "string");
    EXPECT_EQ(to_mongodb_filter(&explicit_type, sampled), json::parse(R"({"age":{"$eq":"30"}})"));

    auto bad = WhereCondition::atomic("age", ">", "thirty");
    EXPECT_THROW(to_mongodb_filter(&bad, sampled), DbError);
}

TEST(MongoFilterTest, LikeToRegexEscapesMetacharacters) {
    EXPECT_EQ(like_to_regex("a.b_%"), "^a\\.b..*$");
    EXPECT_EQ(like_to_regex("(x)"), "^\\(x\\)$");
    EXPECT_TRUE(is_object_id("507F1F77BCF86CD799439011"));
    EXPECT_FALSE(is_object_id("507f1f77bcf86cd79943901z"));
}

TEST(MongoReferencesTest, ReferenceFieldNames) {
    bool many = false;
    EXPECT_EQ(reference_base("customer_id", many), "customer");
    EXPECT_FALSE(many);
    EXPECT_EQ(reference_base("tagIds", many), "tag");
    EXPECT_TRUE(many);
    EXPECT_EQ(reference_base("_id", many), "");
    EXPECT_EQ(reference_base("UID", many), "");
    EXPECT_EQ(reference_base("name", many), "");

    std::vector<std::string> collections = {"Customers", "categories", "boxes"};
    EXPECT_EQ(match_collection("customer", collections), "Customers");
    EXPECT_EQ(match_collection("category", collections), "categories");
    EXPECT_EQ(match_collection("box", collections), "boxes");
    EXPECT_EQ(match_collection("order", collections), "");
}

TEST(MongoReferencesTest, InfersRelationshipKinds) {
    auto sample = [](const std::string& name, std::vector<std::string> fields) {
        CollectionSample s;
        s.unit.name = name;
        s.fields = std::move(fields);
        return s;
    };

    CollectionSample orders = sample("orders", {"_id", "customer_id", "tag_ids"});
    CollectionSample profiles = sample("profiles", {"_id", "customerId"});
    profiles.unique_fields.insert("customerId");
    std::vector<CollectionSample> samples = {sample("customers", {"_id", "name"}), orders, profiles,
                                             sample("tags", {"_id"})};

    auto graph = infer_references(samples);
    ASSERT_EQ(graph.size(), 4u);

    EXPECT_EQ(graph[0].unit.name, "customers");
    EXPECT_EQ(graph[0].relations, (std::vector<GraphUnitRelationship>{
                                      {"orders", RelationshipType::OneToMany},
                                      {"profiles", RelationshipType::OneToOne}}));
    EXPECT_EQ(graph[1].relations, (std::vector<GraphUnitRelationship>{
                                      {"customers", RelationshipType::ManyToOne},
                                      {"tags", RelationshipType::ManyToMany}}));
    EXPECT_EQ(graph[3].relations, (std::vector<GraphUnitRelationship>{{"orders", RelationshipType::ManyToMany}}));
}

// =============================================================================
// ClickHouse and shared codecs
// =============================================================================

TEST(ClickHouseDecodeTest, ParsesJsonCompact) {
    ResultSet rs = ClickHouseConnection::parse_json_compact(R"json({
        "meta": [{"name":"id","type":"UInt64"},{"name":"name","type":"Nullable(String)"},{"name":"ok","type":"Bool"}],
        "data": [["1","Ann",true],["2",null,false]],
        "rows": 2
    })json");

    ASSERT_EQ(rs.columns.size(), 3u);
    EXPECT_EQ(rs.columns[1].type, "Nullable(String)");
    ASSERT_EQ(rs.rows.size(), 2u);
    EXPECT_EQ(rs.rows[0], (std::vector<std::string>{"1", "Ann", "true"}));
    EXPECT_EQ(rs.rows[1], (std::vector<std::string>{"2", "", "false"}));

    EXPECT_THROW(ClickHouseConnection::parse_json_compact("not json"), DriverError);
}

TEST(DocumentCodecTest, DocumentFromRecords) {
    EXPECT_EQ(document_from_records({Record("document", R"({"a":1,"b":[true]})")}),
              json::parse(R"({"a":1,"b":[true]})"));
    EXPECT_EQ(document_from_records({Record("name", "Bob"), Record("age", "3")}),
              json::parse(R"({"name":"Bob","age":"3"})"));

    EXPECT_THROW(document_from_records({Record("document", "[1,2]")}), DbError);
    EXPECT_THROW(document_from_records({Record("document", "{oops")}), DbError);
    EXPECT_THROW(document_from_records({Record("", "x")}), DbError);
}
