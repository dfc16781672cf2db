#pragma once

#include <folio/branch_manager.hpp>
#include <folio/file_store.hpp>
#include <folio/git.hpp>
#include <folio/index_store.hpp>
#include <folio/permission_index.hpp>
#include <folio/repository_manager.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace folio::test {

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        const char* src = std::getenv("FOLIO_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("folio_test_" + std::to_string(getpid()) + "_" +
                       std::to_string(counter++) + "_" +
                       std::to_string(std::chrono::steady_clock::now()
                                          .time_since_epoch().count() % 100000));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }

    // Shell script marked executable
    std::string write_script(const std::string& rel, const std::string& body) {
        write_file(rel, "#!/bin/sh\n" + body);
        fs::path full = path / rel;
        chmod(full.c_str(), 0755);
        return full.string();
    }
};

inline std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline Actor actor(const std::string& id) {
    return Actor{id, id + " Tester", id + "@example.org"};
}

// Index, git and managers wired together over an in-memory database
struct Stack {
    TempDir dir;
    IndexStore store;
    GitCli git;
    PermissionIndex perms{store};
    RepositoryManager repos{store, perms, git, dir.str(),
                            GitIdentity{"Folio System", "system@folio.local"}};
    BranchManager branches{store, perms, repos, git};
    FileStore files{store, perms, repos, branches, git};

    Stack() {
        auto r = store.open(":memory:");
        if (r.is_err()) throw std::runtime_error(r.error().format());
    }

    // Initialized project owned by `owner`
    RepositoryInit init(const std::string& project_id, const std::string& name,
                        const Actor& owner) {
        auto r = repos.initialize(project_id, name, owner);
        if (r.is_err()) throw std::runtime_error(r.error().format());
        return std::move(r).value();
    }

    Branch branch(const std::string& project_id, const std::string& name,
                  const Actor& owner) {
        BranchCreateRequest req;
        req.project_id = project_id;
        req.name = name;
        auto r = branches.create(req, owner);
        if (r.is_err()) throw std::runtime_error(r.error().format());
        return std::move(r).value();
    }
};

} // namespace folio::test
