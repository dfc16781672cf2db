#include <folio/config.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace folio {

const char* serialize_scope_name(SerializeScope s) {
    switch (s) {
        case SerializeScope::None:       return "none";
        case SerializeScope::Branch:     return "branch";
        case SerializeScope::Repository: return "repository";
    }
    return "none";
}

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    return home ? std::string(home) : std::string();
}

static Status read_int(const toml::table& tbl, const char* section, const char* key,
                       int min_value, int& out, std::vector<std::string>& seen) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<int64_t>();
    if (!v) {
        return FolioError{FolioError::Config,
            std::string(section) + "." + key + " must be an integer"};
    }
    if (*v < min_value) {
        return FolioError{FolioError::Config,
            std::string(section) + "." + key + " must be >= " + std::to_string(min_value)};
    }
    out = static_cast<int>(*v);
    seen.push_back(std::string(section) + "." + key);
    return ok_status();
}

static Status read_string(const toml::table& tbl, const char* section, const char* key,
                          std::string& out, std::vector<std::string>& seen) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<std::string>();
    if (!v) {
        return FolioError{FolioError::Config,
            std::string(section) + "." + key + " must be a string"};
    }
    out = *v;
    seen.push_back(std::string(section) + "." + key);
    return ok_status();
}

static Status read_string_list(const toml::table& tbl, const char* section,
                               const char* key, std::vector<std::string>& out,
                               std::vector<std::string>& seen) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto arr = node.as_array();
    if (!arr) {
        return FolioError{FolioError::Config,
            std::string(section) + "." + key + " must be an array of strings"};
    }
    std::vector<std::string> values;
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) {
            return FolioError{FolioError::Config,
                std::string(section) + "." + key + " must be an array of strings"};
        }
        values.push_back(*s);
    }
    out = std::move(values);
    seen.push_back(std::string(section) + "." + key);
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FolioError{FolioError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;
    auto& seen = cfg.explicit_keys;

    // [storage]
    if (auto storage = doc["storage"].as_table()) {
        FOLIO_TRY(read_string(*storage, "storage", "root", cfg.storage.root, seen));
        FOLIO_TRY(read_string(*storage, "storage", "database", cfg.storage.database, seen));
    }

    // [git]
    if (auto git = doc["git"].as_table()) {
        FOLIO_TRY(read_int(*git, "git", "timeout", 1, cfg.git.timeout, seen));
        FOLIO_TRY(read_int(*git, "git", "staging-attempts", 1,
                           cfg.git.staging_attempts, seen));
        FOLIO_TRY(read_string(*git, "git", "system-name", cfg.git.system_name, seen));
        FOLIO_TRY(read_string(*git, "git", "system-email", cfg.git.system_email, seen));
    }

    // [compile]
    if (auto compile = doc["compile"].as_table()) {
        FOLIO_TRY(read_string_list(*compile, "compile", "engines",
                                   cfg.compile.engines, seen));
        FOLIO_TRY(read_string_list(*compile, "compile", "formats",
                                   cfg.compile.formats, seen));
        for (const auto& f : cfg.compile.formats) {
            if (f != "pdf" && f != "dvi" && f != "ps") {
                return FolioError{FolioError::Config,
                    "compile.formats: unknown output format '" + f + "'",
                    "allowed: pdf, dvi, ps"};
            }
        }
        FOLIO_TRY(read_int(*compile, "compile", "workers", 1, cfg.compile.workers, seen));
        FOLIO_TRY(read_int(*compile, "compile", "timeout", 0, cfg.compile.timeout, seen));
    }

    // [log]
    if (auto log = doc["log"].as_table()) {
        FOLIO_TRY(read_string(*log, "log", "level", cfg.log.level, seen));
        static const char* levels[] = {"trace", "debug", "info", "warn", "warning", "error"};
        if (std::find(std::begin(levels), std::end(levels), cfg.log.level) ==
            std::end(levels)) {
            return FolioError{FolioError::Config,
                "log.level: unknown level '" + cfg.log.level + "'",
                "allowed: trace, debug, info, warn, error"};
        }
        if (auto node = (*log)["color"]) {
            auto v = node.value<bool>();
            if (!v) {
                return FolioError{FolioError::Config, "log.color must be a boolean"};
            }
            cfg.log.color = *v;
            seen.push_back("log.color");
        }
    }

    // [concurrency]
    if (auto conc = doc["concurrency"].as_table()) {
        std::string scope;
        FOLIO_TRY(read_string(*conc, "concurrency", "serialize-writes", scope, seen));
        if (cfg.is_set("concurrency.serialize-writes")) {
            if (scope == "none") {
                cfg.concurrency.serialize_writes = SerializeScope::None;
            } else if (scope == "branch") {
                cfg.concurrency.serialize_writes = SerializeScope::Branch;
            } else if (scope == "repository") {
                cfg.concurrency.serialize_writes = SerializeScope::Repository;
            } else {
                return FolioError{FolioError::Config,
                    "concurrency.serialize-writes: unknown scope '" + scope + "'",
                    "allowed: none, branch, repository"};
            }
        }
        FOLIO_TRY(read_int(*conc, "concurrency", "io-workers", 1,
                           cfg.concurrency.io_workers, seen));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FolioError{FolioError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).with_context(path);
}

bool Config::is_set(const std::string& key) const {
    return std::find(explicit_keys.begin(), explicit_keys.end(), key) !=
           explicit_keys.end();
}

void Config::merge(const Config& other) {
    for (const auto& key : other.explicit_keys) {
        if (key == "storage.root") storage.root = other.storage.root;
        else if (key == "storage.database") storage.database = other.storage.database;
        else if (key == "git.timeout") git.timeout = other.git.timeout;
        else if (key == "git.staging-attempts") git.staging_attempts = other.git.staging_attempts;
        else if (key == "git.system-name") git.system_name = other.git.system_name;
        else if (key == "git.system-email") git.system_email = other.git.system_email;
        else if (key == "compile.engines") compile.engines = other.compile.engines;
        else if (key == "compile.formats") compile.formats = other.compile.formats;
        else if (key == "compile.workers") compile.workers = other.compile.workers;
        else if (key == "compile.timeout") compile.timeout = other.compile.timeout;
        else if (key == "log.level") log.level = other.log.level;
        else if (key == "log.color") log.color = other.log.color;
        else if (key == "concurrency.serialize-writes")
            concurrency.serialize_writes = other.concurrency.serialize_writes;
        else if (key == "concurrency.io-workers")
            concurrency.io_workers = other.concurrency.io_workers;
        else continue;

        if (!is_set(key)) explicit_keys.push_back(key);
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());

    const char* env_root = std::getenv("FOLIO_STORAGE_ROOT");
    if (env_root && *env_root) {
        result.storage.root = env_root;
        if (!result.is_set("storage.root")) result.explicit_keys.push_back("storage.root");
    }
    return result;
}

std::string Config::storage_root() const {
    if (!storage.root.empty()) return storage.root;
    return default_storage_root();
}

std::string Config::database_path() const {
    if (!storage.database.empty()) return storage.database;
    return storage_root() + "/folio_index.db";
}

std::string global_config_path() {
    std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.folio/config.toml";
}

std::string default_storage_root() {
    std::string home = home_dir();
    if (home.empty()) return ".folio/repositories";
    return home + "/.folio/repositories";
}

} // namespace folio
