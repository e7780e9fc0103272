/**
 * @file chat.hpp
 * @brief Passthrough hook for AI-assisted querying
 *
 * The core never talks to a model provider itself; callers hand in a
 * ChatModel and the relational adapters turn its replies into messages and
 * executed read queries.
 */

#pragma once

#include <core/types.hpp>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief Completion seam implemented outside the core.
 */
class ChatModel {
public:
    virtual ~ChatModel() = default;
    virtual std::string complete(const std::string& prompt) = 0;
};

/**
 * @brief A piece of a model reply: prose, or one fenced SQL statement.
 */
struct ChatSegment {
    bool is_sql = false;
    std::string text;
};

/**
 * @brief Build the prompt sent to the model.
 *
 * Lists every storage unit with its columns so the model writes SQL
 * against the real schema.
 */
std::string build_chat_prompt(const std::string& dialect,
                              const std::string& schema,
                              const std::vector<StorageUnit>& units,
                              const std::vector<ChatMessage>& previous,
                              const std::string& query);

/**
 * @brief Split a reply on ``` fences. Fences tagged sql (or untagged) are SQL.
 */
std::vector<ChatSegment> split_chat_reply(const std::string& reply);

/**
 * @brief Lower-case leading keyword of a statement, skipping "--" comments.
 */
std::string statement_verb(const std::string& sql);

/**
 * @brief "sql:get" for read statements, "sql:insert" etc. for mutations,
 * plain "sql" when the verb is not recognised.
 */
std::string classify_sql_statement(const std::string& sql);

} // namespace Omnidb
