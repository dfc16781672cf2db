#pragma once

#include <folio/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace folio {

enum class SerializeScope { None, Branch, Repository };

const char* serialize_scope_name(SerializeScope s);

struct StorageConfig {
    std::string root;       // repositories live directly under this
    std::string database;   // empty means <root>/folio_index.db
};

struct GitConfig {
    int timeout = 60;
    int staging_attempts = 3;
    std::string system_name = "Folio System";
    std::string system_email = "system@folio.local";
};

struct CompileConfig {
    std::vector<std::string> engines = {"pdflatex", "xelatex", "lualatex", "latex"};
    std::vector<std::string> formats = {"pdf", "dvi", "ps"};
    int workers = 2;
    // Optional guard in seconds on one engine run; 0 leaves it unbounded
    int timeout = 0;
};

struct LogConfig {
    std::string level = "info";
    bool color = true;
};

struct ConcurrencyConfig {
    SerializeScope serialize_writes = SerializeScope::None;
    int io_workers = 4;
};

// Layered configuration: global < local.
// A layer only overrides the keys it sets explicitly.
struct Config {
    StorageConfig storage;
    GitConfig git;
    CompileConfig compile;
    LogConfig log;
    ConcurrencyConfig concurrency;

    // Names of the keys explicitly present in the source TOML ("git.timeout")
    std::vector<std::string> explicit_keys;

    // Load from a TOML file
    static Result<Config> load(const std::string& path);

    // Parse from a TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Overlay another config (only its explicitly set keys)
    void merge(const Config& other);

    // Defaults, then global, then local; FOLIO_STORAGE_ROOT is applied last
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    bool is_set(const std::string& key) const;

    // storage.root with the default applied
    std::string storage_root() const;

    // storage.database with the default applied
    std::string database_path() const;
};

// ~/.folio/config.toml
std::string global_config_path();

// ~/.folio/repositories
std::string default_storage_root();

} // namespace folio
