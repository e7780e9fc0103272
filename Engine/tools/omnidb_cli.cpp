/**
 * @file omnidb_cli.cpp
 * @brief Command-line front end: one adapter operation per invocation, JSON on stdout
 *
 * Usage: omnidb <engine> <command> [args] [--where JSON] [--page-size N] [--offset N]
 *
 * Connection parameters come from OMNIDB_HOST, OMNIDB_PORT, OMNIDB_USER,
 * OMNIDB_PASSWORD and OMNIDB_DATABASE.
 */

#include <config/settings.hpp>
#include <core/json_codec.hpp>
#include <plugins/default_registry.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace Omnidb;
using nlohmann::json;

namespace {

void usage(const char* program) {
    std::cerr << "Usage: " << program << " <engine> <command> [args] [options]\n"
              << "\nCommands:\n"
              << "  ping\n"
              << "  databases\n"
              << "  schemas\n"
              << "  units <schema>\n"
              << "  columns <schema> <unit>\n"
              << "  rows <schema> <unit> [--where JSON] [--page-size N] [--offset N]\n"
              << "  graph <schema>\n"
              << "  raw <statement>\n"
              << "\nEngines: Postgres, MySQL, MariaDB, Sqlite3, ClickHouse, MongoDB, Redis, ElasticSearch\n";
}

std::size_t parse_count(const std::string& name, const std::string& text) {
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || text[0] == '-') {
        throw std::invalid_argument(name + " must be a non-negative integer, got '" + text + "'");
    }
    return static_cast<std::size_t>(value);
}

struct Invocation {
    std::vector<std::string> args;
    std::map<std::string, std::string> options;

    const std::string& arg(size_t i, const char* what) const {
        if (i >= args.size()) throw std::invalid_argument(std::string("missing ") + what);
        return args[i];
    }
};

Invocation parse_args(int argc, char** argv) {
    Invocation inv;
    for (int i = 3; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) == 0) {
            if (i + 1 >= argc) throw std::invalid_argument("option " + token + " needs a value");
            inv.options[token.substr(2)] = argv[++i];
        } else {
            inv.args.push_back(token);
        }
    }
    return inv;
}

json run_command(Plugin& plugin, const PluginConfig& config, const std::string& command, const Invocation& inv) {
    if (command == "ping") return plugin.is_available(config);
    if (command == "databases") return plugin.get_databases(config);
    if (command == "schemas") return plugin.get_all_schemas(config);
    if (command == "units") return plugin.get_storage_units(config, inv.arg(0, "schema"));
    if (command == "columns") {
        return plugin.get_columns(config, inv.arg(0, "schema"), inv.arg(1, "storage unit"));
    }
    if (command == "rows") {
        std::optional<WhereCondition> where;
        auto w = inv.options.find("where");
        if (w != inv.options.end()) where = parse_where(w->second);

        auto size = inv.options.find("page-size");
        auto offset = inv.options.find("offset");
        return plugin.get_rows(config, inv.arg(0, "schema"), inv.arg(1, "storage unit"),
                               where ? &*where : nullptr,
                               size == inv.options.end() ? 50 : parse_count("page size", size->second),
                               offset == inv.options.end() ? 0 : parse_count("offset", offset->second));
    }
    if (command == "graph") return plugin.get_graph(config, inv.arg(0, "schema"));
    if (command == "raw") return plugin.raw_execute(config, inv.arg(0, "statement"));

    throw std::invalid_argument("unknown command '" + command + "'");
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    try {
        EngineSettings settings = EngineSettings::load_from_env();
        settings.apply();

        PluginRegistry registry = make_default_registry(settings);
        Plugin& plugin = registry.choose(argv[1]);

        PluginConfig config(Credentials::from_env(plugin.type()), CallContext(settings.default_timeout));
        json out = run_command(plugin, config, argv[2], parse_args(argc, argv));

        std::cout << out.dump(2) << "\n";
        return 0;
    } catch (const DbError& e) {
        std::cerr << "Error [" << to_string(e.kind()) << "] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }
}
