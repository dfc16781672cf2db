#pragma once

#include <folio/result.hpp>
#include <folio/process.hpp>
#include <string>
#include <vector>

namespace folio {

// Commit identity; applied per command with `git -c`, never written to config
struct GitIdentity {
    std::string name;
    std::string email;
};

// Wrapper around git CLI operations on a working tree.
// Every call is a blocking subprocess; nothing here locks the tree.
class GitCli {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // `git init` in an existing directory
    Status init(const std::string& repo_dir);

    // `git config <key> <value>` (repository-local)
    Status config(const std::string& repo_dir,
                  const std::string& key, const std::string& value);

    // `git checkout <branch>`
    Status checkout(const std::string& repo_dir, const std::string& branch);

    // `git checkout -b <name>` from the current HEAD
    Status checkout_new_branch(const std::string& repo_dir, const std::string& name);

    // `git branch <name> <start_point>` without switching to it
    Status create_branch(const std::string& repo_dir, const std::string& name,
                         const std::string& start_point);

    // `git branch -m <from> <to>`
    Status rename_branch(const std::string& repo_dir,
                         const std::string& from, const std::string& to);

    // `git branch -D <name>`
    Status delete_branch(const std::string& repo_dir, const std::string& name);

    // `git branch --show-current`
    Result<std::string> current_branch(const std::string& repo_dir);

    // True if refs/heads/<name> exists
    Result<bool> branch_exists(const std::string& repo_dir, const std::string& name);

    // `git add [-f] -- <pathspec>`; pathspec may be relative or absolute
    Status add(const std::string& repo_dir, const std::string& pathspec,
               bool force = false);

    // `git add -A`
    Status add_all(const std::string& repo_dir);

    // `git rm -f [-r] -- <path>`
    Status rm(const std::string& repo_dir, const std::string& path, bool recursive = false);

    // Paths staged for the next commit: `git diff --cached --name-only -z`
    Result<std::vector<std::string>> staged_paths(const std::string& repo_dir);

    // `git status --porcelain --ignored -- <path>`. Empty output means the
    // path is tracked and matches HEAD; ignored paths show up as "!! <path>".
    Result<std::string> status_porcelain(const std::string& repo_dir,
                                         const std::string& path = "");

    // Tracked files at the checked-out branch: `git ls-files -z`
    Result<std::vector<std::string>> ls_files(const std::string& repo_dir);

    // Commit as the given identity (author and committer)
    Status commit(const std::string& repo_dir, const std::string& message,
                  const GitIdentity& identity, bool allow_empty = false);

    // Resolve a ref (branch, HEAD, SHA) to a full commit hash
    Result<std::string> resolve_ref(const std::string& repo_dir,
                                    const std::string& ref);

    // True if repo_dir is the top of a git working tree
    bool is_repository(const std::string& repo_dir);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    // Runs `git <args>` in repo_dir; non-zero exit becomes ExternalTool
    Result<CommandResult> run_git(const std::string& repo_dir,
                                  const std::vector<std::string>& args);

    // Same, but returns the raw result whatever the exit code
    Result<CommandResult> run_git_raw(const std::string& repo_dir,
                                      const std::vector<std::string>& args);

    int timeout_seconds_ = 60;
};

// Split NUL-separated git output (from -z flags)
std::vector<std::string> split_nul(const std::string& s);

} // namespace folio
