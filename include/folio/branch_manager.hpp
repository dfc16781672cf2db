#pragma once

#include <folio/git.hpp>
#include <folio/index_store.hpp>
#include <folio/permission_index.hpp>
#include <folio/repository_manager.hpp>
#include <folio/result.hpp>
#include <folio/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace folio {

struct BranchCreateRequest {
    std::string project_id;
    std::string name;
    std::string source_branch = MAIN_BRANCH;   // by name
    std::string description;
    bool is_protected = false;
};

struct BranchUpdate {
    std::optional<std::string> description;
    std::optional<bool> is_protected;
    std::optional<BranchStatus> status;
};

struct BranchSummary {
    Branch branch;
    int64_t file_count = 0;
    PermissionFlags permissions;   // the caller's own flags
};

struct BranchPage {
    std::vector<BranchSummary> branches;
    int64_t total = 0;
    int page = 1;
    int size = 20;
    bool has_next = false;
    bool has_previous = false;
};

// Git branches mirrored as index rows with a cached head hash
class BranchManager {
public:
    BranchManager(IndexStore& store, PermissionIndex& perms,
                  RepositoryManager& repos, GitCli& git);

    // 1-100 characters of [A-Za-z0-9_-], not HEAD, master or origin
    static Status validate_name(const std::string& name);

    Result<Branch> create(const BranchCreateRequest& req, const Actor& actor);

    // page is 1-based
    Result<BranchPage> list(const std::string& project_id, const Actor& actor,
                            int page = 1, int size = 20);

    // Live (non-deleted) branch row; NotFound otherwise
    Result<Branch> get(const std::string& branch_id);

    // Requires admin
    Result<Branch> update(const std::string& branch_id, const BranchUpdate& update,
                          const Actor& actor);

    // Requires admin; the default branch cannot be deleted. Removes the Git
    // ref and soft-deletes the row, freeing the name.
    Status remove(const std::string& branch_id, const Actor& actor);

    // Read-repair: refresh the cached head from refs/heads/<name>
    Result<Branch> reconcile_head(const Branch& branch);

    // Recreate a missing branch ref from main (after self-heal)
    Status ensure_ref(const Repository& repo, Branch& branch);

private:
    IndexStore& store_;
    PermissionIndex& perms_;
    RepositoryManager& repos_;
    GitCli& git_;
};

} // namespace folio
