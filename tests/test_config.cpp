#include <catch2/catch.hpp>
#include <folio/config.hpp>
#include "test_support.hpp"

#include <cstdlib>

using namespace folio;
using folio::test::TempDir;
namespace fs = std::filesystem;

// ===== Parsing =====

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const Config& c = r.value();
    REQUIRE(c.explicit_keys.empty());
    REQUIRE(c.git.timeout == 60);
    REQUIRE(c.git.staging_attempts == 3);
    REQUIRE(c.git.system_name == "Folio System");
    REQUIRE(c.compile.engines.size() == 4);
    REQUIRE(c.compile.workers == 2);
    REQUIRE(c.compile.timeout == 0);
    REQUIRE(c.log.level == "info");
    REQUIRE(c.concurrency.serialize_writes == SerializeScope::None);
    REQUIRE(c.concurrency.io_workers == 4);
}

TEST_CASE("parse full config", "[config]") {
    auto r = Config::parse(R"(
[storage]
root = "/srv/folio"
database = "/var/lib/folio/index.db"

[git]
timeout = 30
staging-attempts = 5
system-name = "Robot"
system-email = "robot@example.org"

[compile]
engines = ["xelatex"]
formats = ["pdf"]
workers = 4
timeout = 120

[log]
level = "debug"
color = false

[concurrency]
serialize-writes = "branch"
io-workers = 8
)");
    REQUIRE(r.is_ok());
    const Config& c = r.value();
    REQUIRE(c.storage.root == "/srv/folio");
    REQUIRE(c.database_path() == "/var/lib/folio/index.db");
    REQUIRE(c.git.timeout == 30);
    REQUIRE(c.git.staging_attempts == 5);
    REQUIRE(c.git.system_email == "robot@example.org");
    REQUIRE(c.compile.engines == std::vector<std::string>{"xelatex"});
    REQUIRE(c.compile.workers == 4);
    REQUIRE(c.log.level == "debug");
    REQUIRE_FALSE(c.log.color);
    REQUIRE(c.concurrency.serialize_writes == SerializeScope::Branch);
    REQUIRE(c.concurrency.io_workers == 8);
    REQUIRE(c.is_set("git.staging-attempts"));
    REQUIRE(c.is_set("concurrency.serialize-writes"));
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FolioError::Parse);
}

TEST_CASE("unknown enumerated values are Config errors", "[config]") {
    auto scope = Config::parse("[concurrency]\nserialize-writes = \"project\"\n");
    REQUIRE(scope.is_err());
    REQUIRE(scope.error().code == FolioError::Config);

    auto level = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == FolioError::Config);

    auto format = Config::parse("[compile]\nformats = [\"pdf\", \"html\"]\n");
    REQUIRE(format.is_err());
    REQUIRE(format.error().code == FolioError::Config);
    REQUIRE(format.error().message.find("html") != std::string::npos);
}

TEST_CASE("wrong types and out-of-range values are Config errors", "[config]") {
    auto t = Config::parse("[git]\ntimeout = \"soon\"\n");
    REQUIRE(t.is_err());
    REQUIRE(t.error().code == FolioError::Config);

    auto zero = Config::parse("[git]\nstaging-attempts = 0\n");
    REQUIRE(zero.is_err());
    REQUIRE(zero.error().message.find(">= 1") != std::string::npos);

    auto color = Config::parse("[log]\ncolor = \"yes\"\n");
    REQUIRE(color.is_err());

    auto engines = Config::parse("[compile]\nengines = \"pdflatex\"\n");
    REQUIRE(engines.is_err());

    // An engine guard of 0 switches it off; negative is out of range
    auto off = Config::parse("[compile]\ntimeout = 0\n");
    REQUIRE(off.is_ok());
    REQUIRE(off.value().compile.timeout == 0);
    REQUIRE(Config::parse("[compile]\ntimeout = -5\n").is_err());
}

// ===== Layering =====

TEST_CASE("merge overrides only explicit keys", "[config]") {
    Config base = Config::parse("[git]\ntimeout = 10\nsystem-name = \"Base\"\n").value();
    Config over = Config::parse("[git]\ntimeout = 20\n").value();
    base.merge(over);
    REQUIRE(base.git.timeout == 20);
    REQUIRE(base.git.system_name == "Base");
}

TEST_CASE("effective layers global then local", "[config]") {
    unsetenv("FOLIO_STORAGE_ROOT");
    auto global = Config::parse(R"(
[storage]
root = "/global"
[compile]
workers = 3
)").value();
    auto local = Config::parse(R"(
[compile]
workers = 6
)").value();

    Config c = Config::effective(global, local);
    REQUIRE(c.storage_root() == "/global");
    REQUIRE(c.database_path() == "/global/folio_index.db");
    REQUIRE(c.compile.workers == 6);
    REQUIRE(c.compile.timeout == 0);

    Config none = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(none.storage_root() == default_storage_root());
}

TEST_CASE("FOLIO_STORAGE_ROOT overrides storage.root", "[config]") {
    auto local = Config::parse("[storage]\nroot = \"/local\"\n").value();
    setenv("FOLIO_STORAGE_ROOT", "/from-env", 1);
    Config c = Config::effective(std::nullopt, local);
    unsetenv("FOLIO_STORAGE_ROOT");
    REQUIRE(c.storage_root() == "/from-env");
    REQUIRE(c.is_set("storage.root"));
}

// ===== Loading =====

TEST_CASE("load reads a file and prefixes errors with its path", "[config]") {
    TempDir td;
    td.write_file("good.toml", "[git]\ntimeout = 15\n");
    td.write_file("bad.toml", "[log]\nlevel = \"chatty\"\n");

    auto good = Config::load((td.path / "good.toml").string());
    REQUIRE(good.is_ok());
    REQUIRE(good.value().git.timeout == 15);

    std::string bad_path = (td.path / "bad.toml").string();
    auto bad = Config::load(bad_path);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().message.rfind(bad_path, 0) == 0);

    auto missing = Config::load((td.path / "missing.toml").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == FolioError::IO);
}

TEST_CASE("serialize_scope_name", "[config]") {
    REQUIRE(std::string(serialize_scope_name(SerializeScope::None)) == "none");
    REQUIRE(std::string(serialize_scope_name(SerializeScope::Branch)) == "branch");
    REQUIRE(std::string(serialize_scope_name(SerializeScope::Repository)) == "repository");
}
