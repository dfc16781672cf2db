#pragma once

#include <folio/git.hpp>
#include <folio/index_store.hpp>
#include <folio/permission_index.hpp>
#include <folio/result.hpp>
#include <folio/types.hpp>
#include <string>

namespace folio {

constexpr const char* MAIN_BRANCH = "main";

struct RepositoryInit {
    std::string repo_path;
    std::string main_branch_id;
    Repository repository;
};

// One Git working directory per project.
//
// Git is written before the index. A crash in between leaves a working tree
// with no row; the next initialize() adopts it instead of destroying it.
class RepositoryManager {
public:
    RepositoryManager(IndexStore& store, PermissionIndex& perms, GitCli& git,
                      std::string storage_root, GitIdentity system_identity);

    // Idempotent. First call creates the working tree, the initial commit,
    // the Repository and main Branch rows and grants the actor full access.
    Result<RepositoryInit> initialize(const std::string& project_id,
                                      const std::string& project_name,
                                      const Actor& actor);

    // Repository row, NotFound when the project has none
    Result<Repository> get(const std::string& project_id);

    // Self-heal: when the directory or its .git is missing, repeat the Git
    // setup in place keeping the row ids and refresh the main branch head.
    // A failed re-init is ExternalTool. A present tree that git cannot open
    // is ExternalTool too and is left as it is.
    Result<Repository> ensure_ready(const std::string& project_id);

    const std::string& storage_root() const { return storage_root_; }
    const GitIdentity& system_identity() const { return system_identity_; }

private:
    // git init, initial files, initial commit, main branch. Returns main's head.
    Result<std::string> setup_working_tree(const std::string& path,
                                           const std::string& project_name);

    Result<RepositoryInit> insert_rows(const std::string& project_id,
                                       const std::string& path,
                                       const std::string& head,
                                       const Actor& actor);

    IndexStore& store_;
    PermissionIndex& perms_;
    GitCli& git_;
    std::string storage_root_;
    GitIdentity system_identity_;
};

} // namespace folio
