#include <folio/repository_manager.hpp>
#include <folio/layout.hpp>
#include <folio/log.hpp>
#include <folio/uuid.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace folio {

static const char* GITIGNORE_CONTENT =
    "# LaTeX auxiliary files\n"
    "*.aux\n"
    "*.log\n"
    "*.out\n"
    "*.toc\n"
    "*.fdb_latexmk\n"
    "*.fls\n"
    "*.synctex.gz\n"
    "\n"
    "# OS files\n"
    ".DS_Store\n"
    "Thumbs.db\n"
    "\n"
    "# Build jobs\n"
    "compilations/\n";

static Status write_text_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return FolioError{FolioError::IO, "cannot write " + path.string()};
    }
    out << content;
    if (!out) {
        return FolioError{FolioError::IO, "write failed: " + path.string()};
    }
    return ok_status();
}

static void remove_tree(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        log::warn("could not remove %s: %s", path.c_str(), ec.message().c_str());
    }
}

RepositoryManager::RepositoryManager(IndexStore& store, PermissionIndex& perms,
                                     GitCli& git, std::string storage_root,
                                     GitIdentity system_identity)
    : store_(store), perms_(perms), git_(git),
      storage_root_(std::move(storage_root)),
      system_identity_(std::move(system_identity)) {}

Result<std::string> RepositoryManager::setup_working_tree(const std::string& path,
                                                          const std::string& project_name) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return FolioError{FolioError::IO,
            "cannot create repository directory " + path + ": " + ec.message()};
    }

    FOLIO_TRY(git_.init(path));
    FOLIO_TRY(git_.config(path, "init.defaultBranch", MAIN_BRANCH));

    std::string readme =
        "# " + project_name + "\n"
        "\n"
        "LaTeX project repository managed by Folio.\n"
        "\n"
        "Each branch is a separate line of work on the documents.\n"
        "\n"
        "- `main` - the default branch\n";
    FOLIO_TRY(write_text_file(fs::path(path) / ".gitignore", GITIGNORE_CONTENT));
    FOLIO_TRY(write_text_file(fs::path(path) / "README.md", readme));

    FOLIO_TRY(git_.add_all(path));
    FOLIO_TRY(git_.commit(path, "Initial commit", system_identity_));

    // init.defaultBranch only applies to new repositories; older templates
    // still start on master
    auto current = git_.current_branch(path);
    if (current.is_err()) return std::move(current).error();
    if (current.value() != MAIN_BRANCH) {
        FOLIO_TRY(git_.rename_branch(path, current.value(), MAIN_BRANCH));
    }

    return git_.resolve_ref(path, std::string("refs/heads/") + MAIN_BRANCH);
}

Result<RepositoryInit> RepositoryManager::insert_rows(const std::string& project_id,
                                                      const std::string& path,
                                                      const std::string& head,
                                                      const Actor& actor) {
    auto tx = store_.begin();
    if (tx.is_err()) return std::move(tx).error();

    std::string now = utc_timestamp();

    Branch main;
    main.id = new_id();
    main.project_id = project_id;
    main.name = MAIN_BRANCH;
    main.description = "Main branch";
    main.head_commit = head;
    main.is_default = true;
    main.created_by = actor.id;
    main.created_at = now;
    main.updated_at = now;

    Repository repo;
    repo.id = new_id();
    repo.project_id = project_id;
    repo.path = path;
    repo.default_branch_id = main.id;
    repo.initialized = true;
    repo.created_at = now;

    FOLIO_TRY(store_.insert_repository(repo));
    FOLIO_TRY(store_.insert_branch(main));
    FOLIO_TRY(perms_.grant(main.id, actor.id, PermissionFlags::full(), actor.id));
    FOLIO_TRY(tx.value().commit());

    RepositoryInit out;
    out.repo_path = path;
    out.main_branch_id = main.id;
    out.repository = std::move(repo);
    return Result<RepositoryInit>::ok(std::move(out));
}

Result<RepositoryInit> RepositoryManager::initialize(const std::string& project_id,
                                                     const std::string& project_name,
                                                     const Actor& actor) {
    if (project_id.empty()) {
        return FolioError{FolioError::Validation, "project id must not be empty"};
    }

    auto existing = store_.get_repository(project_id);
    if (existing.is_ok()) {
        auto ready = ensure_ready(project_id);
        if (ready.is_err()) return std::move(ready).error();
        RepositoryInit out;
        out.repo_path = ready.value().path;
        out.main_branch_id = ready.value().default_branch_id;
        out.repository = std::move(ready).value();
        log::debug("repository for project %s already initialized", project_id.c_str());
        return Result<RepositoryInit>::ok(std::move(out));
    }
    if (!existing.has_code(FolioError::NotFound)) {
        return std::move(existing).error();
    }

    std::string path = layout::repo_path(storage_root_, project_name, project_id);

    // Leftover from an interrupted initialize()
    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (git_.is_repository(path)) {
            auto has_main = git_.branch_exists(path, MAIN_BRANCH);
            if (has_main.is_err()) return std::move(has_main).error();
            if (has_main.value()) {
                auto head = git_.resolve_ref(path, std::string("refs/heads/") + MAIN_BRANCH);
                if (head.is_err()) return std::move(head).error();
                log::warn("adopting existing working tree %s for project %s",
                          path.c_str(), project_id.c_str());
                return insert_rows(project_id, path, head.value(), actor);
            }
        }
        log::warn("removing leftover directory %s", path.c_str());
        remove_tree(path);
    }

    auto head = setup_working_tree(path, project_name);
    if (head.is_err()) {
        remove_tree(path);
        return std::move(head).error();
    }

    auto rows = insert_rows(project_id, path, head.value(), actor);
    if (rows.is_err()) {
        remove_tree(path);
        return rows;
    }

    log::info("initialized repository %s for project %s",
              path.c_str(), project_id.c_str());
    return rows;
}

Result<Repository> RepositoryManager::get(const std::string& project_id) {
    return store_.get_repository(project_id);
}

Result<Repository> RepositoryManager::ensure_ready(const std::string& project_id) {
    auto repo = store_.get_repository(project_id);
    if (repo.is_err()) return repo;

    const std::string& path = repo.value().path;
    std::error_code ec;
    bool present = fs::is_directory(path, ec) &&
                   fs::exists(fs::path(path) / ".git", ec);
    if (present) {
        // An existing tree is never rebuilt
        if (!git_.is_repository(path)) {
            return FolioError{FolioError::ExternalTool,
                "git cannot open the repository at " + path,
                "check ownership and permissions; the directory was left untouched"};
        }
        if (!repo.value().initialized) {
            repo.value().initialized = true;
            FOLIO_TRY(store_.update_repository(repo.value()));
        }
        return repo;
    }

    log::warn("repository for project %s is missing at %s, re-initializing",
              project_id.c_str(), path.c_str());

    std::string name = fs::path(path).filename().string();
    auto head = setup_working_tree(path, name);
    if (head.is_err()) {
        return FolioError{FolioError::ExternalTool,
            "self-healing re-initialization of " + path + " failed: " +
            head.error().message, head.error().hint};
    }

    auto main = store_.find_branch(project_id, MAIN_BRANCH);
    if (main.is_ok()) {
        FOLIO_TRY(store_.update_branch_head(main.value().id, head.value()));
    } else if (!main.has_code(FolioError::NotFound)) {
        return std::move(main).error();
    }

    if (!repo.value().initialized) {
        repo.value().initialized = true;
        FOLIO_TRY(store_.update_repository(repo.value()));
    }
    return repo;
}

} // namespace folio
