#pragma once

#include <folio/branch_manager.hpp>
#include <folio/git.hpp>
#include <folio/index_store.hpp>
#include <folio/permission_index.hpp>
#include <folio/repository_manager.hpp>
#include <folio/result.hpp>
#include <folio/types.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace folio {

struct WriteResult {
    std::string commit_hash;
    std::string path;
    int64_t size = 0;
    // Commit landed but the index update failed; the next read repairs it
    bool index_stale = false;
};

struct ReadResult {
    std::string content;
    int64_t size = 0;
    std::string path;
};

struct FileEntry {
    std::string path;
    std::string name;
    std::string type;
    int64_t size = 0;
    bool tracked = false;
    // Ownership and audit fields; empty for tracked files the index never saw
    std::optional<FileRecord> record;
};

// A first-level directory holding one LaTeX document
struct Subproject {
    std::string id;                 // "<projectId>_<name>"
    std::string name;
    std::string template_name;      // only known to the call that created it
    std::string created_by;         // earliest file record, if any
    std::string created_at;
    std::vector<FileEntry> files;   // repository-relative paths
    // Set by create; empty when the sub-project already existed
    std::string commit_hash;
    bool index_stale = false;
};

// One way of getting a written path into the Git index
struct StagingStrategy {
    std::string name;
    std::function<Status(GitCli& git, const std::string& repo_dir,
                         const std::string& rel_path)> stage;
};

// Relative add, absolute add, forced add
std::vector<StagingStrategy> default_staging_strategies();

// Content written for an empty or whitespace-only file
std::string placeholder_content(const std::string& path);

// Starter files (name -> content) for a new sub-project: "article" (also the
// default for an empty name), "report" or "beamer"; Validation otherwise
Result<std::map<std::string, std::string>> subproject_scaffold(
    const std::string& name, const std::string& template_name);

// File contents live in Git commits; the index keeps metadata rows
class FileStore {
public:
    FileStore(IndexStore& store, PermissionIndex& perms, RepositoryManager& repos,
              BranchManager& branches, GitCli& git, int staging_attempts = 3);

    Result<WriteResult> write(const std::string& branch_id, const std::string& path,
                              const std::string& content,
                              const std::optional<std::string>& message,
                              const Actor& actor);

    Result<ReadResult> read(const std::string& branch_id, const std::string& path,
                            const Actor& actor);

    // Union of tracked files and live file records that exist on disk
    Result<std::vector<FileEntry>> list(const std::string& branch_id, const Actor& actor);

    // Returns the commit hash of the deletion
    Result<std::string> remove(const std::string& branch_id, const std::string& path,
                               const std::optional<std::string>& message,
                               const Actor& actor);

    // Writes the files (or the template's scaffold when files is empty) under
    // <name>/ in one commit. Idempotent once live records exist under it.
    Result<Subproject> create_subproject(const std::string& branch_id,
                                         const std::string& id_or_name,
                                         const std::string& template_name,
                                         const std::map<std::string, std::string>& files,
                                         const Actor& actor);

    // Listed files grouped by first-level directory (legacy file/<name>/
    // included), sorted by name
    Result<std::vector<Subproject>> list_subprojects(const std::string& branch_id,
                                                     const Actor& actor);

    Result<Subproject> get_subproject(const std::string& branch_id,
                                      const std::string& id_or_name, const Actor& actor);

    // Returns the commit hash of the deletion
    Result<std::string> delete_subproject(const std::string& branch_id,
                                          const std::string& id_or_name,
                                          const std::optional<std::string>& message,
                                          const Actor& actor);

    void set_staging_strategies(std::vector<StagingStrategy> strategies) {
        strategies_ = std::move(strategies);
    }
    void set_staging_attempts(int attempts) { staging_attempts_ = attempts; }

private:
    struct Target {
        Repository repo;
        Branch branch;
    };

    // Live branch, ready working tree, access check, branch checked out
    Result<Target> prepare(const std::string& branch_id, const Actor& actor,
                           bool for_write);

    // Stage rel_path within the attempt budget; Conflict when exhausted
    Status stage(const std::string& repo_dir, const std::string& rel_path);

    // Sub-project name from an id or name, validated
    Result<std::string> resolve_subproject(const std::string& branch_id,
                                           const std::string& id_or_name);

    IndexStore& store_;
    PermissionIndex& perms_;
    RepositoryManager& repos_;
    BranchManager& branches_;
    GitCli& git_;
    int staging_attempts_;
    std::vector<StagingStrategy> strategies_;
};

// Author identity for commits made on behalf of an actor
GitIdentity identity_of(const Actor& actor);

} // namespace folio
