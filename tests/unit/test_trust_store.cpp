#include <gtest/gtest.h>
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"
#include "mcpguard/trust_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

using namespace mcpguard;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("mcpguard-trust-" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

TrustEntry entry(const std::string& name, const std::string& identifier,
                 ServerType type = ServerType::Local) {
    TrustEntry e;
    e.name = name;
    e.identifier = identifier;
    e.type = type;
    return e;
}

} // anonymous namespace

// ---- In-memory behaviour ----

TEST(TrustStore, EmptyStoreTrustsNothing) {
    TrustStore store;
    EXPECT_FALSE(store.is_trusted("echo", "/usr/bin/echo-server"));
    EXPECT_TRUE(store.list_all().empty());
}

TEST(TrustStore, AddThenTrusted) {
    TrustStore store;
    store.add(entry("echo", "/usr/bin/echo-server"));
    EXPECT_TRUE(store.is_trusted("echo", "/usr/bin/echo-server"));
    EXPECT_FALSE(store.is_trusted("echo", "/usr/bin/other"));
    EXPECT_FALSE(store.is_trusted("other", "/usr/bin/echo-server"));
}

TEST(TrustStore, TrustCheckLogsOnlyAtDebugLevel) {
    TrustStore store;
    const auto saved = log::level();

    log::set_level(log::Level::Info);
    testing::internal::CaptureStderr();
    (void)store.is_trusted("echo", "/usr/bin/echo-server");
    EXPECT_EQ(testing::internal::GetCapturedStderr().find("Trust check"), std::string::npos);

    log::set_level(log::Level::Debug);
    testing::internal::CaptureStderr();
    (void)store.is_trusted("echo", "/usr/bin/echo-server");
    EXPECT_NE(testing::internal::GetCapturedStderr().find("Trust check: name='echo'"),
              std::string::npos);

    log::set_level(saved);
}

TEST(TrustStore, UpsertKeepsPairUnique) {
    TrustStore store;
    auto first = entry("fs", "npx -y @mcp/fs", ServerType::Npx);
    first.notes = "first";
    store.add(first);

    auto second = first;
    second.notes = "second";
    store.add(second);

    auto all = store.list_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].notes, "second");

    // Same name, different identifier is a separate entry.
    store.add(entry("fs", "npx -y @mcp/fs@2", ServerType::Npx));
    EXPECT_EQ(store.list_all().size(), 2u);
}

TEST(TrustStore, RemoveReportsWhetherAnythingMatched) {
    TrustStore store;
    store.add(entry("a", "cmd-a"));
    EXPECT_FALSE(store.remove("a", "cmd-b"));
    EXPECT_FALSE(store.remove("b", "cmd-a"));
    EXPECT_TRUE(store.remove("a", "cmd-a"));
    EXPECT_FALSE(store.is_trusted("a", "cmd-a"));
    EXPECT_FALSE(store.remove("a", "cmd-a"));
}

TEST(TrustStore, ListNewestFirst) {
    TrustStore store;
    auto now = std::chrono::system_clock::now();
    auto old_entry = entry("old", "x");
    old_entry.trusted_at = now - std::chrono::hours(2);
    auto new_entry = entry("new", "y");
    new_entry.trusted_at = now;
    auto mid_entry = entry("mid", "z");
    mid_entry.trusted_at = now - std::chrono::hours(1);

    store.add(old_entry);
    store.add(new_entry);
    store.add(mid_entry);

    auto all = store.list_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "new");
    EXPECT_EQ(all[1].name, "mid");
    EXPECT_EQ(all[2].name, "old");
}

TEST(TrustStore, ListByTypeSortedByName) {
    TrustStore store;
    store.add(entry("zeta", "img/z:1", ServerType::Docker));
    store.add(entry("local", "/bin/srv"));
    store.add(entry("alpha", "img/a:1", ServerType::Docker));

    auto docker = store.list_by_type(ServerType::Docker);
    ASSERT_EQ(docker.size(), 2u);
    EXPECT_EQ(docker[0].name, "alpha");
    EXPECT_EQ(docker[1].name, "zeta");
    EXPECT_TRUE(store.list_by_type(ServerType::Url).empty());
}

TEST(TrustStore, IdentityLookupUsesDerivedKey) {
    TrustStore store;
    auto id = ServerIdentity::for_command("fs", "npx", {"-y", "@modelcontextprotocol/server-filesystem"});
    store.add(TrustEntry::for_identity(id));
    EXPECT_TRUE(store.is_trusted(id));
    EXPECT_TRUE(store.is_trusted("fs", "npx -y @modelcontextprotocol/server-filesystem"));

    auto moved = ServerIdentity::for_command("fs", "npx", {"-y", "@evil/server-filesystem"});
    EXPECT_FALSE(store.is_trusted(moved));
}

// ---- JSON mapping ----

TEST(TrustEntryJson, FieldNames) {
    auto e = entry("remote", "https://mcp.example.com/mcp", ServerType::Url);
    e.notes = "prod";
    nlohmann::json j = e;
    EXPECT_EQ(j["name"], "remote");
    EXPECT_EQ(j["type"], "url");
    EXPECT_EQ(j["identifier"], "https://mcp.example.com/mcp");
    EXPECT_TRUE(j["trustedAt"].is_number());
    EXPECT_EQ(j["notes"], "prod");
    EXPECT_FALSE(j.contains("configPath"));
}

TEST(TrustEntryJson, UnknownTypeRejected) {
    auto j = nlohmann::json{{"name", "x"}, {"type", "ftp"}, {"identifier", "y"}};
    EXPECT_THROW(j.get<TrustEntry>(), ConfigError);
}

// ---- Persistence ----

TEST(TrustStorePersistence, SurvivesReopen) {
    TempDir dir;
    auto path = dir.path() / "nested" / "trusted_servers.json";
    {
        TrustStore store(path);
        store.add(entry("echo", "/opt/echo"));
    }
    ASSERT_TRUE(fs::exists(path));

    TrustStore reopened(path);
    EXPECT_TRUE(reopened.is_trusted("echo", "/opt/echo"));

    std::ifstream in(path);
    auto doc = nlohmann::json::parse(in);
    EXPECT_EQ(doc["version"], 1);
    ASSERT_TRUE(doc["servers"].is_array());
    EXPECT_EQ(doc["servers"].size(), 1u);
}

TEST(TrustStorePersistence, SeesWritesFromAnotherInstance) {
    TempDir dir;
    auto path = dir.path() / "trusted_servers.json";
    TrustStore proxy_view(path);
    EXPECT_FALSE(proxy_view.is_trusted("echo", "/opt/echo"));

    TrustStore cli_view(path);
    cli_view.add(entry("echo", "/opt/echo"));
    EXPECT_TRUE(proxy_view.is_trusted("echo", "/opt/echo"));

    cli_view.remove("echo", "/opt/echo");
    EXPECT_FALSE(proxy_view.is_trusted("echo", "/opt/echo"));
}

TEST(TrustStorePersistence, FailedSaveLeavesEntriesUnchanged) {
    TempDir dir;
    auto path = dir.path() / "trusted_servers.json";
    TrustStore store(path);
    store.add(entry("echo", "/opt/echo"));

    // A directory where the temp file goes makes every save fail.
    fs::path tmp = path;
    tmp += ".tmp";
    fs::create_directories(tmp);

    EXPECT_THROW(store.add(entry("other", "/opt/other")), GuardError);
    EXPECT_FALSE(store.is_trusted("other", "/opt/other"));
    EXPECT_THROW(store.remove("echo", "/opt/echo"), GuardError);
    EXPECT_TRUE(store.is_trusted("echo", "/opt/echo"));
    EXPECT_EQ(store.list_all().size(), 1u);

    TrustStore reopened(path);
    EXPECT_TRUE(reopened.is_trusted("echo", "/opt/echo"));
    EXPECT_FALSE(reopened.is_trusted("other", "/opt/other"));
}

TEST(TrustStorePersistence, AcceptsBareArrayFile) {
    TempDir dir;
    auto path = dir.path() / "legacy.json";
    {
        std::ofstream out(path);
        out << R"([{"name":"a","type":"local","identifier":"/bin/a","trustedAt":1700000000},
                  {"name":"broken"}])";
    }
    TrustStore store(path);
    EXPECT_TRUE(store.is_trusted("a", "/bin/a"));
    EXPECT_EQ(store.list_all().size(), 1u);
}

TEST(TrustStorePersistence, CorruptFileLoadsEmpty) {
    TempDir dir;
    auto path = dir.path() / "bad.json";
    {
        std::ofstream out(path);
        out << "{not json";
    }
    TrustStore store(path);
    EXPECT_TRUE(store.list_all().empty());
}

// ---- Export / import ----

TEST(TrustStoreTransfer, ExportThenImport) {
    TrustStore source;
    source.add(entry("a", "/bin/a"));
    source.add(entry("b", "img/b:2", ServerType::Docker));
    auto exported = source.export_json();
    ASSERT_TRUE(exported.is_array());
    EXPECT_EQ(exported.size(), 2u);

    TrustStore target;
    EXPECT_EQ(target.import_json(exported), 2u);
    EXPECT_TRUE(target.is_trusted("a", "/bin/a"));
    EXPECT_TRUE(target.is_trusted("b", "img/b:2"));

    // Importing again upserts rather than duplicating.
    EXPECT_EQ(target.import_json(exported), 2u);
    EXPECT_EQ(target.list_all().size(), 2u);
}

TEST(TrustStoreTransfer, ImportSkipsMalformedEntries) {
    TrustStore store;
    auto doc = nlohmann::json{
        {"servers", nlohmann::json::array({
            {{"name", "ok"}, {"type", "npx"}, {"identifier", "npx pkg"}},
            {{"name", "missing-identifier"}, {"type", "local"}},
            42
        })}
    };
    EXPECT_EQ(store.import_json(doc), 1u);
    EXPECT_TRUE(store.is_trusted("ok", "npx pkg"));
}

TEST(TrustStoreTransfer, ImportRejectsWrongShape) {
    TrustStore store;
    EXPECT_THROW(store.import_json(nlohmann::json{{"name", "x"}}), ConfigError);
    EXPECT_THROW(store.import_json(nlohmann::json("text")), ConfigError);
}
