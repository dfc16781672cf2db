#include <folio/branch_manager.hpp>
#include <folio/log.hpp>
#include <folio/uuid.hpp>

namespace folio {

static std::string ref_of(const std::string& name) {
    return "refs/heads/" + name;
}

BranchManager::BranchManager(IndexStore& store, PermissionIndex& perms,
                             RepositoryManager& repos, GitCli& git)
    : store_(store), perms_(perms), repos_(repos), git_(git) {}

Status BranchManager::validate_name(const std::string& name) {
    if (name.empty() || name.size() > 100) {
        return FolioError{FolioError::Validation,
            "branch name must be 1-100 characters long"};
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return FolioError{FolioError::Validation,
                "invalid character '" + std::string(1, c) + "' in branch name '" + name + "'",
                "use letters, digits, '_' and '-'"};
        }
    }
    if (name == "HEAD" || name == "master" || name == "origin") {
        return FolioError{FolioError::Validation,
            "branch name '" + name + "' is reserved"};
    }
    return ok_status();
}

Status BranchManager::ensure_ref(const Repository& repo, Branch& branch) {
    auto exists = git_.branch_exists(repo.path, branch.name);
    if (exists.is_err()) return std::move(exists).error();
    if (exists.value()) return ok_status();

    log::warn("branch ref %s missing in %s, recreating from %s",
              branch.name.c_str(), repo.path.c_str(), MAIN_BRANCH);
    FOLIO_TRY(git_.create_branch(repo.path, branch.name, MAIN_BRANCH));

    auto head = git_.resolve_ref(repo.path, ref_of(branch.name));
    if (head.is_err()) return std::move(head).error();
    branch.head_commit = head.value();
    FOLIO_TRY(store_.update_branch_head(branch.id, branch.head_commit));
    return ok_status();
}

Result<Branch> BranchManager::create(const BranchCreateRequest& req, const Actor& actor) {
    FOLIO_TRY(validate_name(req.name));

    auto repo = repos_.ensure_ready(req.project_id);
    if (repo.is_err()) return std::move(repo).error();
    const std::string& path = repo.value().path;

    std::string source_name = req.source_branch.empty() ? MAIN_BRANCH : req.source_branch;
    auto source = store_.find_branch(req.project_id, source_name);
    if (source.is_err()) return std::move(source).error();

    FOLIO_TRY(perms_.require(source.value().id, actor.id, Access::Write));

    auto taken = store_.find_branch(req.project_id, req.name);
    if (taken.is_ok()) {
        return FolioError{FolioError::Conflict,
            "branch '" + req.name + "' already exists"};
    }
    if (!taken.has_code(FolioError::NotFound)) {
        return std::move(taken).error();
    }

    FOLIO_TRY(ensure_ref(repo.value(), source.value()));

    auto ref_exists = git_.branch_exists(path, req.name);
    if (ref_exists.is_err()) return std::move(ref_exists).error();
    if (ref_exists.value()) {
        // Ref created by an earlier call that died before its row was written
        log::warn("adopting existing git branch '%s' in %s", req.name.c_str(), path.c_str());
    } else {
        FOLIO_TRY(git_.checkout(path, source_name));
        FOLIO_TRY(git_.checkout_new_branch(path, req.name));
    }

    auto head = git_.resolve_ref(path, ref_of(req.name));
    if (head.is_err()) return std::move(head).error();

    Branch b;
    b.id = new_id();
    b.project_id = req.project_id;
    b.name = req.name;
    b.description = req.description;
    b.source_branch_id = source.value().id;
    b.head_commit = head.value();
    b.is_protected = req.is_protected;
    b.created_by = actor.id;
    b.created_at = utc_timestamp();
    b.updated_at = b.created_at;

    {
        auto tx = store_.begin();
        if (tx.is_err()) return std::move(tx).error();
        FOLIO_TRY(store_.insert_branch(b));
        FOLIO_TRY(perms_.grant(b.id, actor.id, PermissionFlags::full(), actor.id));
        FOLIO_TRY(tx.value().commit());
    }

    log::info("created branch '%s' (%s) from '%s' at %.8s",
              b.name.c_str(), b.id.c_str(), source_name.c_str(), b.head_commit.c_str());
    return Result<Branch>::ok(std::move(b));
}

Result<BranchPage> BranchManager::list(const std::string& project_id, const Actor& actor,
                                       int page, int size) {
    if (page < 1) page = 1;
    if (size < 1) size = 1;
    if (size > 100) size = 100;

    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    auto total = store_.count_branches(project_id);
    if (total.is_err()) return std::move(total).error();
    auto rows = store_.list_branches(project_id, (page - 1) * size, size);
    if (rows.is_err()) return std::move(rows).error();

    BranchPage out;
    out.total = total.value();
    out.page = page;
    out.size = size;
    out.has_previous = page > 1;
    out.has_next = static_cast<int64_t>(page) * size < out.total;

    for (auto& b : rows.value()) {
        BranchSummary summary;
        auto count = store_.count_files(b.id);
        if (count.is_err()) return std::move(count).error();
        auto flags = perms_.get(b.id, actor.id);
        if (flags.is_err()) return std::move(flags).error();
        summary.file_count = count.value();
        summary.permissions = flags.value();
        summary.branch = std::move(b);
        out.branches.push_back(std::move(summary));
    }
    return Result<BranchPage>::ok(std::move(out));
}

Result<Branch> BranchManager::get(const std::string& branch_id) {
    auto b = store_.get_branch(branch_id);
    if (b.is_err()) return b;
    if (b.value().status == BranchStatus::Deleted) {
        return FolioError{FolioError::NotFound, "branch " + branch_id + " was deleted"};
    }
    return b;
}

Result<Branch> BranchManager::update(const std::string& branch_id,
                                     const BranchUpdate& update, const Actor& actor) {
    auto b = get(branch_id);
    if (b.is_err()) return b;
    FOLIO_TRY(perms_.require(branch_id, actor.id, Access::Admin));

    Branch& branch = b.value();
    if (update.status && *update.status == BranchStatus::Deleted) {
        return FolioError{FolioError::Validation,
            "use branch deletion to mark a branch deleted"};
    }
    if (update.description) branch.description = *update.description;
    if (update.is_protected) branch.is_protected = *update.is_protected;
    if (update.status) branch.status = *update.status;

    FOLIO_TRY(store_.update_branch(branch));
    return get(branch_id);
}

Status BranchManager::remove(const std::string& branch_id, const Actor& actor) {
    auto b = get(branch_id);
    if (b.is_err()) return std::move(b).error();
    FOLIO_TRY(perms_.require(branch_id, actor.id, Access::Admin));

    Branch& branch = b.value();
    if (branch.is_default) {
        return FolioError{FolioError::Validation,
            "the default branch '" + branch.name + "' cannot be deleted"};
    }

    auto repo = repos_.ensure_ready(branch.project_id);
    if (repo.is_err()) return std::move(repo).error();
    const std::string& path = repo.value().path;

    auto exists = git_.branch_exists(path, branch.name);
    if (exists.is_err()) return std::move(exists).error();
    if (exists.value()) {
        auto current = git_.current_branch(path);
        if (current.is_err()) return std::move(current).error();
        if (current.value() == branch.name) {
            FOLIO_TRY(git_.checkout(path, MAIN_BRANCH));
        }
        FOLIO_TRY(git_.delete_branch(path, branch.name));
    }

    branch.status = BranchStatus::Deleted;
    FOLIO_TRY(store_.update_branch(branch));
    log::info("deleted branch '%s' (%s)", branch.name.c_str(), branch.id.c_str());
    return ok_status();
}

Result<Branch> BranchManager::reconcile_head(const Branch& branch) {
    auto repo = repos_.get(branch.project_id);
    if (repo.is_err()) return std::move(repo).error();

    auto head = git_.resolve_ref(repo.value().path, ref_of(branch.name));
    if (head.is_err()) return std::move(head).error();

    Branch out = branch;
    if (head.value() != branch.head_commit) {
        log::warn("branch '%s' cached head %.8s differs from %.8s, repairing",
                  branch.name.c_str(), branch.head_commit.c_str(), head.value().c_str());
        FOLIO_TRY(store_.update_branch_head(branch.id, head.value()));
        out.head_commit = head.value();
    }
    return Result<Branch>::ok(std::move(out));
}

} // namespace folio
