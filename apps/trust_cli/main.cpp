/// mcpguard-trust: manage the servers the proxies treat as trusted.
///
///   mcpguard-trust [--store PATH] add NAME (--url URL | --command CMD [ARGS...])
///                                  [--notes TEXT] [--config-path PATH]
///   mcpguard-trust [--store PATH] remove NAME (--url URL | --command CMD [ARGS...] | --id IDENTIFIER)
///   mcpguard-trust [--store PATH] check NAME (--url URL | --command CMD [ARGS...])
///   mcpguard-trust [--store PATH] list [--type url|npx|docker|local] [--json]
///   mcpguard-trust [--store PATH] export [FILE]
///   mcpguard-trust [--store PATH] import FILE

#include <mcpguard/mcpguard.hpp>

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace mcpguard;

int usage() {
    std::fprintf(stderr,
        "usage: mcpguard-trust [--store PATH] <command> ...\n"
        "  add NAME (--url URL | --command CMD [ARGS...]) [--notes TEXT] [--config-path PATH]\n"
        "  remove NAME (--url URL | --command CMD [ARGS...] | --id IDENTIFIER)\n"
        "  check NAME (--url URL | --command CMD [ARGS...])\n"
        "  list [--type url|npx|docker|local] [--json]\n"
        "  export [FILE]\n"
        "  import FILE\n");
    return 2;
}

struct Target {
    std::string name;
    std::optional<ServerIdentity> identity;
    std::optional<std::string> identifier;
    std::optional<std::string> notes;
    std::optional<std::string> config_path;
};

// NAME followed by options. --command swallows the rest of the line.
Target parse_target(const std::vector<std::string>& args) {
    if (args.empty()) throw ConfigError("missing server name");
    Target t;
    t.name = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw ConfigError(a + " needs a value");
            return args[++i];
        };
        if (a == "--url") {
            t.identity = ServerIdentity::for_url(t.name, value());
        } else if (a == "--command") {
            std::string command = value();
            std::vector<std::string> rest(args.begin() + static_cast<long>(i) + 1, args.end());
            t.identity = ServerIdentity::for_command(t.name, command, rest);
            break;
        } else if (a == "--id") {
            t.identifier = value();
        } else if (a == "--notes") {
            t.notes = value();
        } else if (a == "--config-path") {
            t.config_path = value();
        } else {
            throw ConfigError("unknown option " + a);
        }
    }
    if (!t.identity && !t.identifier) {
        throw ConfigError("give --url or --command to identify the server");
    }
    return t;
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

int cmd_add(TrustStore& store, const std::vector<std::string>& args) {
    Target t = parse_target(args);
    if (!t.identity) throw ConfigError("add needs --url or --command");
    TrustEntry entry = TrustEntry::for_identity(*t.identity, t.notes);
    entry.config_path = t.config_path;
    store.add(entry);
    std::printf("Trusted %s (%s: %s)\n", entry.name.c_str(), to_string(entry.type).c_str(),
                entry.identifier.c_str());
    return 0;
}

int cmd_remove(TrustStore& store, const std::vector<std::string>& args) {
    Target t = parse_target(args);
    std::string identifier = t.identifier ? *t.identifier : t.identity->trust_key().identifier;
    if (!store.remove(t.name, identifier)) {
        std::fprintf(stderr, "No trusted server %s with identifier %s\n",
                     t.name.c_str(), identifier.c_str());
        return 1;
    }
    std::printf("Removed %s\n", t.name.c_str());
    return 0;
}

int cmd_check(TrustStore& store, const std::vector<std::string>& args) {
    Target t = parse_target(args);
    std::string identifier = t.identifier ? *t.identifier : t.identity->trust_key().identifier;
    bool trusted = store.is_trusted(t.name, identifier);
    std::printf("%s: %s\n", t.name.c_str(), trusted ? "trusted" : "not trusted");
    return trusted ? 0 : 1;
}

int cmd_list(TrustStore& store, const std::vector<std::string>& args) {
    std::optional<ServerType> type;
    bool as_json = false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--json") {
            as_json = true;
        } else if (args[i] == "--type" && i + 1 < args.size()) {
            type = server_type_from_string(args[++i]);
        } else {
            throw ConfigError("unknown option " + args[i]);
        }
    }

    std::vector<TrustEntry> entries = type ? store.list_by_type(*type) : store.list_all();
    if (as_json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& e : entries) arr.push_back(e);
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (entries.empty()) {
        std::printf("No trusted servers\n");
        return 0;
    }
    for (const auto& e : entries) {
        std::printf("%-24s %-7s %s  (%s)\n", e.name.c_str(), to_string(e.type).c_str(),
                    e.identifier.c_str(), format_time(e.trusted_at).c_str());
        if (e.notes) std::printf("    %s\n", e.notes->c_str());
    }
    return 0;
}

int cmd_export(TrustStore& store, const std::vector<std::string>& args) {
    std::string text = store.export_json().dump(2);
    if (args.empty()) {
        std::cout << text << "\n";
        return 0;
    }
    std::ofstream out(args[0], std::ios::trunc);
    if (!out) throw ConfigError("cannot write " + args[0]);
    out << text << "\n";
    std::printf("Exported to %s\n", args[0].c_str());
    return 0;
}

int cmd_import(TrustStore& store, const std::vector<std::string>& args) {
    if (args.empty()) throw ConfigError("import needs a file");
    std::ifstream in(args[0]);
    if (!in) throw ConfigError("cannot read " + args[0]);
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(args[0] + " is not valid JSON: " + e.what());
    }
    size_t n = store.import_json(doc);
    std::printf("Imported %zu servers\n", n);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        std::filesystem::path store_path;
        if (args.size() >= 2 && args[0] == "--store") {
            store_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        } else {
            store_path = ProxyConfig::load_default().trust_store_path;
        }
        if (args.empty()) return usage();

        std::string command = args[0];
        std::vector<std::string> rest(args.begin() + 1, args.end());
        TrustStore store(store_path);

        if (command == "add") return cmd_add(store, rest);
        if (command == "remove") return cmd_remove(store, rest);
        if (command == "check") return cmd_check(store, rest);
        if (command == "list") return cmd_list(store, rest);
        if (command == "export") return cmd_export(store, rest);
        if (command == "import") return cmd_import(store, rest);
        return usage();
    } catch (const GuardError& e) {
        std::fprintf(stderr, "mcpguard-trust: %s\n", e.what());
        return 1;
    }
}
