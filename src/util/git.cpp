#include <folio/git.hpp>
#include <folio/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace folio {

static std::string trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

static std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ' ';
        out += args[i];
    }
    return out;
}

std::vector<std::string> split_nul(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < s.size()) {
        size_t pos = s.find('\0', start);
        if (pos == std::string::npos) pos = s.size();
        if (pos > start) out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Command plumbing
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::run_git_raw(const std::string& repo_dir,
                                          const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("git");
    argv.insert(argv.end(), args.begin(), args.end());

    folio::log::debug("git %s (in %s)", join_args(args).c_str(), repo_dir.c_str());
    auto r = run_command(argv, repo_dir, timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code == 127) {
        return FolioError{FolioError::ExternalTool,
            "git could not be executed in " + repo_dir,
            "install git >= 2.20 and make sure it is on PATH"};
    }
    return r;
}

Result<CommandResult> GitCli::run_git(const std::string& repo_dir,
                                      const std::vector<std::string>& args) {
    auto r = run_git_raw(repo_dir, args);
    if (r.is_err()) return r;

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string detail = trim_newlines(
            cmd.stderr_str.empty() ? cmd.stdout_str : cmd.stderr_str);
        folio::log::error("git %s failed (exit %d) in %s: %s",
                          join_args(args).c_str(), cmd.exit_code,
                          repo_dir.c_str(), detail.c_str());

        std::string hint;
        if (detail.find("not a git repository") != std::string::npos) {
            hint = "repository directory is not initialized";
        } else if (detail.find("Author identity unknown") != std::string::npos) {
            hint = "commit identity missing";
        } else if (detail.find("would be overwritten") != std::string::npos) {
            hint = "working tree has uncommitted changes; inspect the branch manually";
        }
        return FolioError{FolioError::ExternalTool,
            "git " + join_args(args) + " failed: " + detail, hint};
    }
    return r;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return FolioError{FolioError::ExternalTool,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_newlines(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return FolioError{FolioError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return FolioError{FolioError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return FolioError{FolioError::ExternalTool,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Status GitCli::init(const std::string& repo_dir) {
    FOLIO_TRY(run_git(repo_dir, {"init"}));
    return ok_status();
}

Status GitCli::config(const std::string& repo_dir,
                      const std::string& key, const std::string& value) {
    FOLIO_TRY(run_git(repo_dir, {"config", key, value}));
    return ok_status();
}

Status GitCli::checkout(const std::string& repo_dir, const std::string& branch) {
    // Trailing "--" so a branch named like a file is never read as a pathspec
    FOLIO_TRY(run_git(repo_dir, {"checkout", branch, "--"}));
    return ok_status();
}

Status GitCli::checkout_new_branch(const std::string& repo_dir,
                                   const std::string& name) {
    FOLIO_TRY(run_git(repo_dir, {"checkout", "-b", name}));
    return ok_status();
}

Status GitCli::create_branch(const std::string& repo_dir, const std::string& name,
                             const std::string& start_point) {
    FOLIO_TRY(run_git(repo_dir, {"branch", name, start_point}));
    return ok_status();
}

Status GitCli::rename_branch(const std::string& repo_dir,
                             const std::string& from, const std::string& to) {
    FOLIO_TRY(run_git(repo_dir, {"branch", "-m", from, to}));
    return ok_status();
}

Status GitCli::delete_branch(const std::string& repo_dir, const std::string& name) {
    FOLIO_TRY(run_git(repo_dir, {"branch", "-D", name}));
    return ok_status();
}

Result<std::string> GitCli::current_branch(const std::string& repo_dir) {
    auto r = run_git(repo_dir, {"branch", "--show-current"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_newlines(r.value().stdout_str));
}

Result<bool> GitCli::branch_exists(const std::string& repo_dir,
                                   const std::string& name) {
    auto r = run_git_raw(repo_dir,
        {"rev-parse", "--verify", "--quiet", "refs/heads/" + name});
    if (r.is_err()) return std::move(r).error();
    return Result<bool>::ok(r.value().exit_code == 0);
}

Status GitCli::add(const std::string& repo_dir, const std::string& pathspec,
                   bool force) {
    std::vector<std::string> args = {"add"};
    if (force) args.push_back("-f");
    args.push_back("--");
    args.push_back(pathspec);
    FOLIO_TRY(run_git(repo_dir, args));
    return ok_status();
}

Status GitCli::add_all(const std::string& repo_dir) {
    FOLIO_TRY(run_git(repo_dir, {"add", "-A"}));
    return ok_status();
}

Status GitCli::rm(const std::string& repo_dir, const std::string& path, bool recursive) {
    std::vector<std::string> args = {"rm", "-f"};
    if (recursive) args.push_back("-r");
    args.push_back("--");
    args.push_back(path);
    FOLIO_TRY(run_git(repo_dir, args));
    return ok_status();
}

Result<std::vector<std::string>> GitCli::staged_paths(const std::string& repo_dir) {
    auto r = run_git(repo_dir, {"diff", "--cached", "--name-only", "-z"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::vector<std::string>>::ok(split_nul(r.value().stdout_str));
}

Result<std::string> GitCli::status_porcelain(const std::string& repo_dir,
                                             const std::string& path) {
    std::vector<std::string> args = {"status", "--porcelain", "--ignored"};
    if (!path.empty()) {
        args.push_back("--");
        args.push_back(path);
    }
    auto r = run_git(repo_dir, args);
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

Result<std::vector<std::string>> GitCli::ls_files(const std::string& repo_dir) {
    auto r = run_git(repo_dir, {"ls-files", "-z"});
    if (r.is_err()) return std::move(r).error();
    auto files = split_nul(r.value().stdout_str);
    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Status GitCli::commit(const std::string& repo_dir, const std::string& message,
                      const GitIdentity& identity, bool allow_empty) {
    std::vector<std::string> args = {
        "-c", "user.name=" + identity.name,
        "-c", "user.email=" + identity.email,
        "commit", "-m", message,
        "--author", identity.name + " <" + identity.email + ">",
    };
    if (allow_empty) args.push_back("--allow-empty");
    FOLIO_TRY(run_git(repo_dir, args));
    return ok_status();
}

Result<std::string> GitCli::resolve_ref(const std::string& repo_dir,
                                        const std::string& ref) {
    auto r = run_git_raw(repo_dir, {"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return FolioError{FolioError::NotFound,
            "cannot resolve ref '" + ref + "' in " + repo_dir};
    }

    return Result<std::string>::ok(trim_newlines(cmd.stdout_str));
}

bool GitCli::is_repository(const std::string& repo_dir) {
    std::error_code ec;
    if (!fs::is_directory(repo_dir, ec)) return false;
    auto r = run_git_raw(repo_dir, {"rev-parse", "--show-toplevel"});
    if (r.is_err() || r.value().exit_code != 0) return false;

    fs::path top = fs::weakly_canonical(trim_newlines(r.value().stdout_str), ec);
    fs::path dir = fs::weakly_canonical(repo_dir, ec);
    return top == dir;
}

} // namespace folio
