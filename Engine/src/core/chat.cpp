#include <core/chat.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Omnidb {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // namespace

std::string build_chat_prompt(const std::string& dialect,
                              const std::string& schema,
                              const std::vector<StorageUnit>& units,
                              const std::vector<ChatMessage>& previous,
                              const std::string& query) {
    std::ostringstream out;
    out << "You are a " << dialect << " database assistant.\n"
        << "Answer with plain text, and put every SQL statement in its own ```sql fenced block.\n"
        << "Only reference the tables and columns listed below.\n\n";

    if (!schema.empty()) out << "Schema: " << schema << "\n";
    out << "Tables:\n";
    for (const auto& unit : units) {
        out << "- " << unit.name << " (";
        bool first = true;
        for (const auto& col : unit.columns()) {
            if (!first) out << ", ";
            out << col.name << " " << col.type;
            first = false;
        }
        out << ")\n";
    }

    if (!previous.empty()) {
        out << "\nConversation so far:\n";
        for (const auto& msg : previous) {
            out << "[" << msg.type << "] " << msg.text << "\n";
        }
    }

    out << "\nUser: " << query << "\n";
    return out.str();
}

std::vector<ChatSegment> split_chat_reply(const std::string& reply) {
    std::vector<ChatSegment> segments;
    size_t pos = 0;

    auto push_text = [&](const std::string& text) {
        std::string t = trim(text);
        if (!t.empty()) segments.push_back({false, t});
    };

    while (pos < reply.size()) {
        size_t open = reply.find("```", pos);
        if (open == std::string::npos) {
            push_text(reply.substr(pos));
            break;
        }
        push_text(reply.substr(pos, open - pos));

        size_t line_end = reply.find('\n', open + 3);
        if (line_end == std::string::npos) {
            push_text(reply.substr(open + 3));
            break;
        }
        std::string tag = trim(reply.substr(open + 3, line_end - open - 3));
        std::transform(tag.begin(), tag.end(), tag.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        size_t close = reply.find("```", line_end + 1);
        std::string body = reply.substr(line_end + 1,
                                        close == std::string::npos ? std::string::npos : close - line_end - 1);
        bool is_sql = tag.empty() || tag == "sql";
        std::string t = trim(body);
        if (!t.empty()) segments.push_back({is_sql, t});

        if (close == std::string::npos) break;
        pos = close + 3;
    }
    return segments;
}

std::string statement_verb(const std::string& sql) {
    std::string s = trim(sql);
    // skip leading line comments
    while (s.compare(0, 2, "--") == 0) {
        auto nl = s.find('\n');
        s = nl == std::string::npos ? std::string() : trim(s.substr(nl + 1));
    }
    std::string word;
    for (char c : s) {
        if (!std::isalpha(static_cast<unsigned char>(c))) break;
        word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return word;
}

std::string classify_sql_statement(const std::string& sql) {
    const std::string verb = statement_verb(sql);
    if (verb == "select" || verb == "with" || verb == "show" || verb == "describe" ||
        verb == "explain" || verb == "values" || verb == "pragma") {
        return "sql:get";
    }
    if (verb == "insert" || verb == "update" || verb == "delete" || verb == "create" ||
        verb == "drop" || verb == "alter") {
        return "sql:" + verb;
    }
    return "sql";
}

} // namespace Omnidb
