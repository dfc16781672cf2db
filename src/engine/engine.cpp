#include <folio/engine.hpp>
#include <folio/log.hpp>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace folio {

Engine::Engine(Passkey, Config config) : config_(std::move(config)) {}

Engine::~Engine() {
    // Stop taking offloaded work before the managers it may call go away
    if (io_pool_) io_pool_->shutdown();
}

Result<std::unique_ptr<Engine>> Engine::open(const Config& config) {
    auto engine = std::make_unique<Engine>(Passkey{}, config);
    FOLIO_TRY(engine->start());
    return Result<std::unique_ptr<Engine>>::ok(std::move(engine));
}

Status Engine::start() {
    log::Level level = log::Info;
    if (!log::parse_level(config_.log.level, level)) {
        return FolioError(FolioError::Config, "unknown log level '" + config_.log.level + "'",
                          "use trace, debug, info, warn or error");
    }
    log::set_level(level);
    log::set_color_enabled(config_.log.color);

    std::string root = config_.storage_root();
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return FolioError(FolioError::IO,
            "cannot create storage root " + root + ": " + ec.message());
    }

    git_.set_timeout(config_.git.timeout);
    auto ver = git_.check_version();
    if (ver.is_err()) return std::move(ver).error();
    log::debug("using git %s", ver.value().c_str());

    FOLIO_TRY(store_.open(config_.database_path()));

    GitIdentity system{config_.git.system_name, config_.git.system_email};
    perms_ = std::make_unique<PermissionIndex>(store_);
    repos_ = std::make_unique<RepositoryManager>(store_, *perms_, git_, root, system);
    branches_ = std::make_unique<BranchManager>(store_, *perms_, *repos_, git_);
    files_ = std::make_unique<FileStore>(store_, *perms_, *repos_, *branches_, git_,
                                         config_.git.staging_attempts);
    serializer_ = make_serializer(config_.concurrency.serialize_writes);
    compiler_ = std::make_unique<CompilationScheduler>(*perms_, *repos_, *branches_, git_,
                                                       config_.compile);
    io_pool_ = std::make_unique<ThreadPool>(
        static_cast<size_t>(config_.concurrency.io_workers), "io");

    log::info("engine ready (storage %s, writes serialized by %s)", root.c_str(),
              serialize_scope_name(config_.concurrency.serialize_writes));
    return ok_status();
}

WriteKey Engine::key_for_branch(const std::string& branch_id) {
    WriteKey key;
    key.branch_id = branch_id;
    auto b = store_.get_branch(branch_id);
    if (b.is_ok()) key.project_id = b.value().project_id;
    return key;
}

// ---------------------------------------------------------------------------
// Repositories and branches
// ---------------------------------------------------------------------------

Result<RepositoryInit> Engine::initialize_repository(const std::string& project_id,
                                                     const std::string& project_name,
                                                     const Actor& actor) {
    return serialized<RepositoryInit>(WriteKey{project_id, ""}, [&] {
        return repos_->initialize(project_id, project_name, actor);
    });
}

Result<Branch> Engine::create_branch(const BranchCreateRequest& req, const Actor& actor) {
    // The new branch is checked out from the source, so key on the project
    return serialized<Branch>(WriteKey{req.project_id, ""}, [&] {
        return branches_->create(req, actor);
    });
}

Result<BranchPage> Engine::list_branches(const std::string& project_id, const Actor& actor,
                                         int page, int size) {
    return branches_->list(project_id, actor, page, size);
}

Result<BranchSummary> Engine::get_branch(const std::string& branch_id, const Actor& actor) {
    auto b = branches_->get(branch_id);
    if (b.is_err()) return std::move(b).error();

    BranchSummary summary;
    summary.branch = std::move(b).value();
    auto count = store_.count_files(branch_id);
    if (count.is_err()) return std::move(count).error();
    summary.file_count = count.value();
    auto flags = perms_->get(branch_id, actor.id);
    if (flags.is_err()) return std::move(flags).error();
    summary.permissions = flags.value();
    return Result<BranchSummary>::ok(std::move(summary));
}

Result<Branch> Engine::update_branch(const std::string& branch_id, const BranchUpdate& update,
                                     const Actor& actor) {
    return branches_->update(branch_id, update, actor);
}

Status Engine::delete_branch(const std::string& branch_id, const Actor& actor) {
    // Deleting the checked-out branch switches the shared tree back to main
    WriteKey key = key_for_branch(branch_id);
    key.branch_id.clear();
    return serialized<std::monostate>(key, [&] {
        return branches_->remove(branch_id, actor);
    });
}

// ---------------------------------------------------------------------------
// Permissions
// ---------------------------------------------------------------------------

Result<PermissionFlags> Engine::get_branch_permission(const std::string& branch_id,
                                                      const std::string& user_id) {
    auto b = branches_->get(branch_id);
    if (b.is_err()) return std::move(b).error();
    return perms_->get(branch_id, user_id);
}

Status Engine::update_branch_permission(const std::string& branch_id,
                                        const std::string& user_id,
                                        const PermissionFlags& flags, const Actor& actor) {
    auto b = branches_->get(branch_id);
    if (b.is_err()) return std::move(b).error();
    FOLIO_TRY(perms_->require(branch_id, actor.id, Access::Admin));
    FOLIO_TRY(perms_->grant(branch_id, user_id, flags, actor.id));
    log::info("granted %s read=%d write=%d admin=%d on branch %s", user_id.c_str(),
              flags.can_read, flags.can_write, flags.can_admin, b.value().name.c_str());
    return ok_status();
}

Status Engine::revoke_branch_permission(const std::string& branch_id,
                                        const std::string& user_id, const Actor& actor) {
    auto b = branches_->get(branch_id);
    if (b.is_err()) return std::move(b).error();
    FOLIO_TRY(perms_->require(branch_id, actor.id, Access::Admin));
    FOLIO_TRY(perms_->revoke(branch_id, user_id));
    log::info("revoked %s on branch %s", user_id.c_str(), b.value().name.c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

Result<WriteResult> Engine::write_file(const std::string& branch_id, const std::string& path,
                                       const std::string& content,
                                       const std::optional<std::string>& message,
                                       const Actor& actor) {
    return serialized<WriteResult>(key_for_branch(branch_id), [&] {
        return files_->write(branch_id, path, content, message, actor);
    });
}

Result<ReadResult> Engine::read_file(const std::string& branch_id, const std::string& path,
                                     const Actor& actor) {
    // Reads check out the branch too
    return serialized<ReadResult>(key_for_branch(branch_id), [&] {
        return files_->read(branch_id, path, actor);
    });
}

Result<std::vector<FileEntry>> Engine::list_files(const std::string& branch_id,
                                                  const Actor& actor) {
    return serialized<std::vector<FileEntry>>(key_for_branch(branch_id), [&] {
        return files_->list(branch_id, actor);
    });
}

Result<std::string> Engine::delete_file(const std::string& branch_id, const std::string& path,
                                        const std::optional<std::string>& message,
                                        const Actor& actor) {
    return serialized<std::string>(key_for_branch(branch_id), [&] {
        return files_->remove(branch_id, path, message, actor);
    });
}

// ---------------------------------------------------------------------------
// Sub-projects
// ---------------------------------------------------------------------------

Result<Subproject> Engine::create_subproject(const std::string& branch_id,
                                             const std::string& name,
                                             const std::string& template_name,
                                             const std::map<std::string, std::string>& files,
                                             const Actor& actor) {
    return serialized<Subproject>(key_for_branch(branch_id), [&] {
        return files_->create_subproject(branch_id, name, template_name, files, actor);
    });
}

Result<std::vector<Subproject>> Engine::list_subprojects(const std::string& branch_id,
                                                         const Actor& actor) {
    return serialized<std::vector<Subproject>>(key_for_branch(branch_id), [&] {
        return files_->list_subprojects(branch_id, actor);
    });
}

Result<Subproject> Engine::get_subproject(const std::string& branch_id,
                                          const std::string& subproject,
                                          const Actor& actor) {
    return serialized<Subproject>(key_for_branch(branch_id), [&] {
        return files_->get_subproject(branch_id, subproject, actor);
    });
}

Result<std::string> Engine::delete_subproject(const std::string& branch_id,
                                              const std::string& subproject,
                                              const std::optional<std::string>& message,
                                              const Actor& actor) {
    return serialized<std::string>(key_for_branch(branch_id), [&] {
        return files_->delete_subproject(branch_id, subproject, message, actor);
    });
}

// ---------------------------------------------------------------------------
// Compilation
// ---------------------------------------------------------------------------

Result<CompilationJob> Engine::submit_compilation(const CompileRequest& req,
                                                  const Actor& actor) {
    // Checkout and source copy are serialized; the build itself is not
    return serialized<CompilationJob>(key_for_branch(req.branch_id), [&] {
        return compiler_->submit(req, actor);
    });
}

Result<CompilationJob> Engine::compilation_status(const std::string& project_id,
                                                  const std::string& job_id,
                                                  const Actor& actor) {
    return compiler_->status(project_id, job_id, actor);
}

Result<CompiledArtifact> Engine::compiled_artifact(const std::string& project_id,
                                                   const std::string& job_id,
                                                   const Actor& actor) {
    return compiler_->output_file(project_id, job_id, actor);
}

Result<CompilationJob> Engine::mark_compilation_timeout(const std::string& project_id,
                                                        const std::string& job_id,
                                                        const Actor& actor) {
    FOLIO_TRY(compiler_->status(project_id, job_id, actor));
    return compiler_->mark_timeout(project_id, job_id);
}

Result<CompilationJob> Engine::mark_compilation_failed(const std::string& project_id,
                                                       const std::string& job_id,
                                                       const std::string& error,
                                                       const Actor& actor) {
    FOLIO_TRY(compiler_->status(project_id, job_id, actor));
    return compiler_->mark_failed(project_id, job_id, error);
}

Result<CompilationJob> Engine::monitor_compilation(const std::string& project_id,
                                                   const std::string& job_id,
                                                   std::chrono::milliseconds timeout,
                                                   const Actor& actor) {
    FOLIO_TRY(compiler_->status(project_id, job_id, actor));
    return compiler_->monitor(project_id, job_id, timeout);
}

Result<std::vector<CompilationJob>> Engine::compilation_history(const std::string& project_id,
                                                                const std::string& subproject,
                                                                size_t limit) {
    return compiler_->history(project_id, subproject, limit);
}

Result<size_t> Engine::prune_compilations(const std::string& project_id,
                                          std::chrono::system_clock::duration older_than) {
    return compiler_->prune(project_id, older_than);
}

} // namespace folio
