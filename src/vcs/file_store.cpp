#include <folio/file_store.hpp>
#include <folio/layout.hpp>
#include <folio/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace folio {

GitIdentity identity_of(const Actor& actor) {
    GitIdentity id;
    id.name = actor.name.empty() ? actor.id : actor.name;
    id.email = actor.email.empty() ? actor.id + "@users.folio.local" : actor.email;
    return id;
}

std::vector<StagingStrategy> default_staging_strategies() {
    std::vector<StagingStrategy> out;
    out.push_back({"relative add",
        [](GitCli& git, const std::string& repo, const std::string& rel) {
            return git.add(repo, rel);
        }});
    out.push_back({"absolute add",
        [](GitCli& git, const std::string& repo, const std::string& rel) {
            return git.add(repo, (fs::path(repo) / rel).string());
        }});
    out.push_back({"forced add",
        [](GitCli& git, const std::string& repo, const std::string& rel) {
            return git.add(repo, rel, true);
        }});
    return out;
}

std::string placeholder_content(const std::string& path) {
    std::string ext = layout::extension_of(path);
    if (ext.empty() || ext == "tex") {
        return "% Empty LaTeX file\n% Add your content here\n";
    }
    return "% Empty " + ext + "\n";
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

static Result<std::string> read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return FolioError{FolioError::IO, "cannot read " + path};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

// Conflict when an ancestor of rel is a file, or rel itself is a directory
static Status check_path_conflict(const std::string& repo_dir, const std::string& rel) {
    fs::path root(repo_dir);
    fs::path cur = root;
    fs::path relp(rel);
    std::error_code ec;

    auto it = relp.begin();
    auto last = std::prev(relp.end());
    for (; it != last; ++it) {
        cur /= *it;
        if (fs::exists(cur, ec) && !fs::is_directory(cur, ec)) {
            return FolioError{FolioError::Conflict,
                "cannot write '" + rel + "': '" +
                fs::relative(cur, root, ec).generic_string() + "' is a file"};
        }
    }
    if (fs::is_directory(root / relp, ec)) {
        return FolioError{FolioError::Conflict,
            "cannot write '" + rel + "': a directory with that name exists"};
    }
    return ok_status();
}

static Status write_bytes(const fs::path& full, const std::string& rel_path,
                          const std::string& bytes) {
    std::error_code ec;
    fs::create_directories(full.parent_path(), ec);
    if (ec) {
        return FolioError{FolioError::IO,
            "cannot create directory for '" + rel_path + "': " + ec.message()};
    }
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    if (!out) {
        return FolioError{FolioError::IO, "cannot open '" + rel_path + "' for writing"};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return FolioError{FolioError::IO, "write failed for '" + rel_path + "'"};
    }
    return ok_status();
}

static FileRecord make_record(const Branch& branch, const std::string& rel_path,
                              int64_t size, const Actor& actor) {
    FileRecord record;
    record.project_id = branch.project_id;
    record.branch_id = branch.id;
    record.path = rel_path;
    record.name = layout::file_name_of(rel_path);
    std::string ext = layout::extension_of(rel_path);
    record.type = ext.empty() ? "tex" : ext;
    record.size = size;
    record.created_by = actor.id;
    record.last_modified_by = actor.id;
    return record;
}

FileStore::FileStore(IndexStore& store, PermissionIndex& perms, RepositoryManager& repos,
                     BranchManager& branches, GitCli& git, int staging_attempts)
    : store_(store), perms_(perms), repos_(repos), branches_(branches), git_(git),
      staging_attempts_(staging_attempts),
      strategies_(default_staging_strategies()) {}

Result<FileStore::Target> FileStore::prepare(const std::string& branch_id,
                                             const Actor& actor, bool for_write) {
    auto branch = branches_.get(branch_id);
    if (branch.is_err()) return std::move(branch).error();

    Access needed = Access::Read;
    if (for_write) {
        needed = branch.value().is_protected ? Access::Admin : Access::Write;
    }
    FOLIO_TRY(perms_.require(branch_id, actor.id, needed));

    auto repo = repos_.ensure_ready(branch.value().project_id);
    if (repo.is_err()) return std::move(repo).error();

    FOLIO_TRY(branches_.ensure_ref(repo.value(), branch.value()));
    FOLIO_TRY(git_.checkout(repo.value().path, branch.value().name));

    Target t;
    t.repo = std::move(repo).value();
    t.branch = std::move(branch).value();
    return Result<Target>::ok(std::move(t));
}

Status FileStore::stage(const std::string& repo_dir, const std::string& rel_path) {
    if (strategies_.empty()) {
        return FolioError{FolioError::InvalidArg, "no staging strategies configured"};
    }

    for (int attempt = 0; attempt < staging_attempts_; ++attempt) {
        const auto& strategy =
            strategies_[std::min<size_t>(static_cast<size_t>(attempt), strategies_.size() - 1)];

        auto r = strategy.stage(git_, repo_dir, rel_path);
        if (r.is_err()) {
            log::debug("staging '%s' via %s failed: %s", rel_path.c_str(),
                       strategy.name.c_str(), r.error().message.c_str());
        }

        auto staged = git_.staged_paths(repo_dir);
        if (staged.is_ok()) {
            const auto& paths = staged.value();
            if (std::find(paths.begin(), paths.end(), rel_path) != paths.end()) {
                return ok_status();
            }
        }
        // Unchanged content: tracked and identical to HEAD
        auto status = git_.status_porcelain(repo_dir, rel_path);
        if (status.is_ok() && status.value().empty()) {
            auto tracked = git_.ls_files(repo_dir);
            if (tracked.is_ok() &&
                std::find(tracked.value().begin(), tracked.value().end(), rel_path) !=
                    tracked.value().end()) {
                return ok_status();
            }
        }
        log::debug("staging '%s' not verified after %s (attempt %d/%d)",
                   rel_path.c_str(), strategy.name.c_str(), attempt + 1, staging_attempts_);
    }

    return FolioError{FolioError::Conflict,
        "could not stage '" + rel_path + "' after " +
        std::to_string(staging_attempts_) + " attempts",
        "check the working tree for conflicting changes"};
}

Result<WriteResult> FileStore::write(const std::string& branch_id, const std::string& path,
                                     const std::string& content,
                                     const std::optional<std::string>& message,
                                     const Actor& actor) {
    auto rel = layout::validate_file_path(path);
    if (rel.is_err()) return std::move(rel).error();
    const std::string& rel_path = rel.value();

    auto target = prepare(branch_id, actor, true);
    if (target.is_err()) return std::move(target).error();
    const std::string& repo_dir = target.value().repo.path;
    Branch& branch = target.value().branch;

    FOLIO_TRY(check_path_conflict(repo_dir, rel_path));

    std::string bytes = is_blank(content) ? placeholder_content(rel_path) : content;
    FOLIO_TRY(write_bytes(fs::path(repo_dir) / rel_path, rel_path, bytes));
    FOLIO_TRY(stage(repo_dir, rel_path));

    auto staged = git_.staged_paths(repo_dir);
    if (staged.is_err()) return std::move(staged).error();
    bool nothing_staged = staged.value().empty();

    std::string msg = message && !message->empty() ? *message : "Update " + rel_path;
    FOLIO_TRY(git_.commit(repo_dir, msg, identity_of(actor), nothing_staged));

    auto head = git_.resolve_ref(repo_dir, "refs/heads/" + branch.name);
    if (head.is_err()) return std::move(head).error();

    WriteResult result;
    result.commit_hash = head.value();
    result.path = rel_path;
    result.size = static_cast<int64_t>(bytes.size());

    FileRecord record = make_record(branch, rel_path, result.size, actor);

    auto index_update = [&]() -> Status {
        auto tx = store_.begin();
        if (tx.is_err()) return std::move(tx).error();
        FOLIO_TRY(store_.update_branch_head(branch.id, result.commit_hash));
        auto up = store_.upsert_file(record);
        if (up.is_err()) return std::move(up).error();
        FOLIO_TRY(tx.value().commit());
        return ok_status();
    };
    auto indexed = index_update();
    if (indexed.is_err()) {
        log::warn("commit %.8s on '%s' landed but the index update failed: %s",
                  result.commit_hash.c_str(), branch.name.c_str(),
                  indexed.error().message.c_str());
        result.index_stale = true;
    }

    log::debug("wrote %s on '%s' (%lld bytes) at %.8s", rel_path.c_str(),
               branch.name.c_str(), static_cast<long long>(result.size),
               result.commit_hash.c_str());
    return Result<WriteResult>::ok(std::move(result));
}

Result<ReadResult> FileStore::read(const std::string& branch_id, const std::string& path,
                                   const Actor& actor) {
    auto rel = layout::validate_file_path(path);
    if (rel.is_err()) return std::move(rel).error();

    auto target = prepare(branch_id, actor, false);
    if (target.is_err()) return std::move(target).error();

    auto found = layout::resolve_existing(target.value().repo.path, rel.value(), true);
    if (!found) {
        return FolioError{FolioError::NotFound,
            "file '" + rel.value() + "' not found on branch '" +
            target.value().branch.name + "'"};
    }

    auto content = read_all(*found);
    if (content.is_err()) return std::move(content).error();

    ReadResult out;
    out.size = static_cast<int64_t>(content.value().size());
    out.content = std::move(content).value();
    out.path = rel.value();
    return Result<ReadResult>::ok(std::move(out));
}

Result<std::vector<FileEntry>> FileStore::list(const std::string& branch_id,
                                               const Actor& actor) {
    auto target = prepare(branch_id, actor, false);
    if (target.is_err()) return std::move(target).error();
    const std::string& repo_dir = target.value().repo.path;

    auto repaired = branches_.reconcile_head(target.value().branch);
    if (repaired.is_err()) {
        log::warn("head reconciliation for '%s' failed: %s",
                  target.value().branch.name.c_str(), repaired.error().message.c_str());
    }

    auto tracked = git_.ls_files(repo_dir);
    if (tracked.is_err()) return std::move(tracked).error();
    auto records = store_.list_files(branch_id);
    if (records.is_err()) return std::move(records).error();

    std::map<std::string, FileRecord> by_path;
    for (auto& r : records.value()) {
        by_path.emplace(r.path, std::move(r));
    }

    std::map<std::string, FileEntry> entries;
    for (const auto& p : tracked.value()) {
        FileEntry e;
        e.path = p;
        e.name = layout::file_name_of(p);
        std::string ext = layout::extension_of(p);
        e.type = ext.empty() ? "tex" : ext;
        e.tracked = true;

        std::error_code ec;
        auto sz = fs::file_size(fs::path(repo_dir) / p, ec);
        e.size = ec ? 0 : static_cast<int64_t>(sz);

        auto rec = by_path.find(p);
        if (rec != by_path.end()) {
            if (!ec && rec->second.size != e.size) {
                log::warn("file record %s size %lld differs from disk %lld, repairing",
                          p.c_str(), static_cast<long long>(rec->second.size),
                          static_cast<long long>(e.size));
                auto fixed = store_.update_file_size(rec->second.id, e.size);
                if (fixed.is_ok()) rec->second.size = e.size;
            }
            e.type = rec->second.type;
            e.record = rec->second;
        }
        entries.emplace(p, std::move(e));
    }

    // Live records that git does not track but that exist on disk
    for (const auto& [p, rec] : by_path) {
        if (entries.count(p)) continue;
        std::error_code ec;
        fs::path full = fs::path(repo_dir) / p;
        if (!fs::is_regular_file(full, ec)) continue;

        FileEntry e;
        e.path = p;
        e.name = rec.name;
        e.type = rec.type;
        auto sz = fs::file_size(full, ec);
        e.size = ec ? rec.size : static_cast<int64_t>(sz);
        e.tracked = false;
        e.record = rec;
        entries.emplace(p, std::move(e));
    }

    std::vector<FileEntry> out;
    out.reserve(entries.size());
    for (auto& [p, e] : entries) out.push_back(std::move(e));
    return Result<std::vector<FileEntry>>::ok(std::move(out));
}

Result<std::string> FileStore::remove(const std::string& branch_id, const std::string& path,
                                      const std::optional<std::string>& message,
                                      const Actor& actor) {
    auto rel = layout::validate_file_path(path);
    if (rel.is_err()) return std::move(rel).error();
    const std::string& rel_path = rel.value();

    auto target = prepare(branch_id, actor, true);
    if (target.is_err()) return std::move(target).error();
    const std::string& repo_dir = target.value().repo.path;
    const Branch& branch = target.value().branch;

    auto tracked = git_.ls_files(repo_dir);
    if (tracked.is_err()) return std::move(tracked).error();
    bool is_tracked = std::binary_search(tracked.value().begin(), tracked.value().end(),
                                         rel_path);

    fs::path full = fs::path(repo_dir) / rel_path;
    std::error_code ec;
    if (is_tracked) {
        FOLIO_TRY(git_.rm(repo_dir, rel_path));
    } else if (fs::is_regular_file(full, ec)) {
        fs::remove(full, ec);
        if (ec) {
            return FolioError{FolioError::IO,
                "cannot remove '" + rel_path + "': " + ec.message()};
        }
    } else {
        return FolioError{FolioError::NotFound,
            "file '" + rel_path + "' not found on branch '" + branch.name + "'"};
    }

    std::string msg = message && !message->empty() ? *message : "Delete " + rel_path;
    FOLIO_TRY(git_.commit(repo_dir, msg, identity_of(actor), !is_tracked));

    auto head = git_.resolve_ref(repo_dir, "refs/heads/" + branch.name);
    if (head.is_err()) return std::move(head).error();

    auto index_update = [&]() -> Status {
        auto tx = store_.begin();
        if (tx.is_err()) return std::move(tx).error();
        FOLIO_TRY(store_.update_branch_head(branch.id, head.value()));
        auto gone = store_.soft_delete_file(branch.id, rel_path, actor.id);
        if (gone.is_err()) return std::move(gone).error();
        FOLIO_TRY(tx.value().commit());
        return ok_status();
    };
    auto indexed = index_update();
    if (indexed.is_err()) {
        log::warn("deletion of %s committed but the index update failed: %s",
                  rel_path.c_str(), indexed.error().message.c_str());
    }

    log::debug("deleted %s on '%s' at %.8s", rel_path.c_str(), branch.name.c_str(),
               head.value().c_str());
    return head;
}

// ---------------------------------------------------------------------------
// Sub-projects
// ---------------------------------------------------------------------------

Result<std::map<std::string, std::string>> subproject_scaffold(
    const std::string& name, const std::string& template_name) {
    std::string tmpl = template_name.empty() ? "article" : template_name;
    std::map<std::string, std::string> files;
    if (tmpl == "article") {
        files["main.tex"] =
            "\\documentclass{article}\n"
            "\\usepackage[utf8]{inputenc}\n"
            "\n"
            "\\title{" + name + "}\n"
            "\\author{}\n"
            "\\date{\\today}\n"
            "\n"
            "\\begin{document}\n"
            "\\maketitle\n"
            "\n"
            "\\section{Introduction}\n"
            "\n"
            "\\end{document}\n";
    } else if (tmpl == "report") {
        files["main.tex"] =
            "\\documentclass{report}\n"
            "\\usepackage[utf8]{inputenc}\n"
            "\n"
            "\\title{" + name + "}\n"
            "\\author{}\n"
            "\n"
            "\\begin{document}\n"
            "\\maketitle\n"
            "\\tableofcontents\n"
            "\n"
            "\\chapter{Introduction}\n"
            "\n"
            "\\end{document}\n";
    } else if (tmpl == "beamer") {
        files["main.tex"] =
            "\\documentclass{beamer}\n"
            "\n"
            "\\title{" + name + "}\n"
            "\\author{}\n"
            "\n"
            "\\begin{document}\n"
            "\\frame{\\titlepage}\n"
            "\n"
            "\\begin{frame}{Introduction}\n"
            "\\end{frame}\n"
            "\n"
            "\\end{document}\n";
    } else {
        return FolioError{FolioError::Validation,
            "unknown LaTeX template '" + tmpl + "'", "use article, report or beamer"};
    }
    return Result<std::map<std::string, std::string>>::ok(std::move(files));
}

// Sub-project a repository-relative path belongs to; "" for root-level files
static std::string subproject_of(const std::string& path) {
    size_t slash = path.find('/');
    if (slash == std::string::npos) return "";
    std::string top = path.substr(0, slash);
    if (top == layout::LEGACY_FILE_DIR) {
        std::string rest = path.substr(slash + 1);
        size_t next = rest.find('/');
        return next == std::string::npos ? "" : rest.substr(0, next);
    }
    if (top == layout::COMPILATIONS_DIR) return "";
    return top;
}

static std::vector<Subproject> group_subprojects(const std::string& project_id,
                                                 std::vector<FileEntry> entries) {
    std::map<std::string, Subproject> groups;
    for (auto& e : entries) {
        std::string name = subproject_of(e.path);
        if (name.empty()) continue;

        Subproject& sp = groups[name];
        if (sp.name.empty()) {
            sp.name = name;
            sp.id = layout::subproject_id(project_id, name);
        }
        if (e.record && !e.record->created_at.empty() &&
            (sp.created_at.empty() || e.record->created_at < sp.created_at)) {
            sp.created_at = e.record->created_at;
            sp.created_by = e.record->created_by;
        }
        sp.files.push_back(std::move(e));
    }

    std::vector<Subproject> out;
    out.reserve(groups.size());
    for (auto& [name, sp] : groups) out.push_back(std::move(sp));
    return out;
}

Result<std::string> FileStore::resolve_subproject(const std::string& branch_id,
                                                  const std::string& id_or_name) {
    auto branch = branches_.get(branch_id);
    if (branch.is_err()) return std::move(branch).error();
    return layout::validate_subproject_name(
        layout::subproject_name(branch.value().project_id, id_or_name));
}

Result<Subproject> FileStore::create_subproject(const std::string& branch_id,
                                                const std::string& id_or_name,
                                                const std::string& template_name,
                                                const std::map<std::string, std::string>& files,
                                                const Actor& actor) {
    auto resolved = resolve_subproject(branch_id, id_or_name);
    if (resolved.is_err()) return std::move(resolved).error();
    const std::string& name = resolved.value();
    std::string tmpl = template_name.empty() ? "article" : template_name;

    std::map<std::string, std::string> contents = files;
    if (contents.empty()) {
        auto scaffold = subproject_scaffold(name, tmpl);
        if (scaffold.is_err()) return std::move(scaffold).error();
        contents = std::move(scaffold).value();
    }

    std::vector<std::pair<std::string, std::string>> planned;
    for (const auto& [file, content] : contents) {
        auto rel = layout::validate_file_path(name + "/" + file);
        if (rel.is_err()) return std::move(rel).error();
        std::string bytes = is_blank(content) ? placeholder_content(rel.value()) : content;
        planned.emplace_back(std::move(rel).value(), std::move(bytes));
    }

    auto target = prepare(branch_id, actor, true);
    if (target.is_err()) return std::move(target).error();
    const std::string& repo_dir = target.value().repo.path;
    Branch& branch = target.value().branch;

    auto records = store_.list_files(branch_id);
    if (records.is_err()) return std::move(records).error();
    bool exists = std::any_of(records.value().begin(), records.value().end(),
                              [&](const FileRecord& r) { return subproject_of(r.path) == name; });
    if (exists) {
        auto existing = get_subproject(branch_id, name, actor);
        if (existing.is_ok()) {
            existing.value().template_name = tmpl;
            log::debug("LaTeX project '%s' already exists on '%s'", name.c_str(),
                       branch.name.c_str());
        }
        return existing;
    }

    // Check every path before anything lands on disk
    for (const auto& [rel_path, bytes] : planned) {
        FOLIO_TRY(check_path_conflict(repo_dir, rel_path));
    }
    for (const auto& [rel_path, bytes] : planned) {
        FOLIO_TRY(write_bytes(fs::path(repo_dir) / rel_path, rel_path, bytes));
        FOLIO_TRY(stage(repo_dir, rel_path));
    }

    auto staged = git_.staged_paths(repo_dir);
    if (staged.is_err()) return std::move(staged).error();
    FOLIO_TRY(git_.commit(repo_dir, "Create LaTeX project: " + name, identity_of(actor),
                          staged.value().empty()));

    auto head = git_.resolve_ref(repo_dir, "refs/heads/" + branch.name);
    if (head.is_err()) return std::move(head).error();

    Subproject sp;
    sp.id = layout::subproject_id(branch.project_id, name);
    sp.name = name;
    sp.template_name = tmpl;
    sp.created_by = actor.id;
    sp.commit_hash = head.value();

    auto index_update = [&]() -> Status {
        auto tx = store_.begin();
        if (tx.is_err()) return std::move(tx).error();
        FOLIO_TRY(store_.update_branch_head(branch.id, sp.commit_hash));
        for (const auto& [rel_path, bytes] : planned) {
            auto up = store_.upsert_file(make_record(
                branch, rel_path, static_cast<int64_t>(bytes.size()), actor));
            if (up.is_err()) return std::move(up).error();
            if (sp.created_at.empty()) sp.created_at = up.value().created_at;
        }
        FOLIO_TRY(tx.value().commit());
        return ok_status();
    };
    auto indexed = index_update();
    if (indexed.is_err()) {
        log::warn("LaTeX project %s committed at %.8s but the index update failed: %s",
                  name.c_str(), sp.commit_hash.c_str(), indexed.error().message.c_str());
        sp.index_stale = true;
    }

    for (const auto& [rel_path, bytes] : planned) {
        FileEntry e;
        e.path = rel_path;
        e.name = layout::file_name_of(rel_path);
        std::string ext = layout::extension_of(rel_path);
        e.type = ext.empty() ? "tex" : ext;
        e.size = static_cast<int64_t>(bytes.size());
        e.tracked = true;
        sp.files.push_back(std::move(e));
    }

    log::info("created LaTeX project %s on '%s' (%zu files) at %.8s", name.c_str(),
              branch.name.c_str(), planned.size(), sp.commit_hash.c_str());
    return Result<Subproject>::ok(std::move(sp));
}

Result<std::vector<Subproject>> FileStore::list_subprojects(const std::string& branch_id,
                                                            const Actor& actor) {
    auto branch = branches_.get(branch_id);
    if (branch.is_err()) return std::move(branch).error();
    auto entries = list(branch_id, actor);
    if (entries.is_err()) return std::move(entries).error();
    return Result<std::vector<Subproject>>::ok(
        group_subprojects(branch.value().project_id, std::move(entries).value()));
}

Result<Subproject> FileStore::get_subproject(const std::string& branch_id,
                                             const std::string& id_or_name,
                                             const Actor& actor) {
    auto name = resolve_subproject(branch_id, id_or_name);
    if (name.is_err()) return std::move(name).error();

    auto all = list_subprojects(branch_id, actor);
    if (all.is_err()) return std::move(all).error();
    for (auto& sp : all.value()) {
        if (sp.name == name.value()) return Result<Subproject>::ok(std::move(sp));
    }
    return FolioError{FolioError::NotFound,
        "LaTeX project '" + name.value() + "' not found"};
}

Result<std::string> FileStore::delete_subproject(const std::string& branch_id,
                                                 const std::string& id_or_name,
                                                 const std::optional<std::string>& message,
                                                 const Actor& actor) {
    auto resolved = resolve_subproject(branch_id, id_or_name);
    if (resolved.is_err()) return std::move(resolved).error();
    const std::string& name = resolved.value();

    auto target = prepare(branch_id, actor, true);
    if (target.is_err()) return std::move(target).error();
    const std::string& repo_dir = target.value().repo.path;
    const Branch& branch = target.value().branch;

    auto records = store_.list_files(branch_id);
    if (records.is_err()) return std::move(records).error();
    std::vector<std::string> live;
    for (const auto& r : records.value()) {
        if (subproject_of(r.path) == name) live.push_back(r.path);
    }

    auto dir = layout::resolve_existing(repo_dir, name, false);
    if (!dir && live.empty()) {
        return FolioError{FolioError::NotFound,
            "LaTeX project '" + name + "' not found on branch '" + branch.name + "'"};
    }

    bool removed_tracked = false;
    if (dir) {
        std::error_code ec;
        std::string rel_dir = fs::relative(*dir, repo_dir, ec).generic_string();
        if (ec) {
            return FolioError{FolioError::IO,
                "cannot locate '" + name + "' in " + repo_dir + ": " + ec.message()};
        }
        auto tracked = git_.ls_files(repo_dir);
        if (tracked.is_err()) return std::move(tracked).error();
        std::string prefix = rel_dir + "/";
        removed_tracked = std::any_of(tracked.value().begin(), tracked.value().end(),
            [&](const std::string& p) { return p.compare(0, prefix.size(), prefix) == 0; });
        if (removed_tracked) {
            FOLIO_TRY(git_.rm(repo_dir, rel_dir, true));
        }
        // Untracked leftovers
        fs::remove_all(*dir, ec);
        if (ec) {
            return FolioError{FolioError::IO,
                "cannot remove '" + rel_dir + "': " + ec.message()};
        }
    }

    std::string msg = message && !message->empty() ? *message
                                                   : "Delete LaTeX project: " + name;
    FOLIO_TRY(git_.commit(repo_dir, msg, identity_of(actor), !removed_tracked));

    auto head = git_.resolve_ref(repo_dir, "refs/heads/" + branch.name);
    if (head.is_err()) return std::move(head).error();

    auto index_update = [&]() -> Status {
        auto tx = store_.begin();
        if (tx.is_err()) return std::move(tx).error();
        FOLIO_TRY(store_.update_branch_head(branch.id, head.value()));
        for (const auto& path : live) {
            auto gone = store_.soft_delete_file(branch.id, path, actor.id);
            if (gone.is_err()) return std::move(gone).error();
        }
        FOLIO_TRY(tx.value().commit());
        return ok_status();
    };
    auto indexed = index_update();
    if (indexed.is_err()) {
        log::warn("deletion of LaTeX project %s committed but the index update failed: %s",
                  name.c_str(), indexed.error().message.c_str());
    }

    log::info("deleted LaTeX project %s on '%s' at %.8s", name.c_str(), branch.name.c_str(),
              head.value().c_str());
    return head;
}

} // namespace folio
