#pragma once

#include <folio/branch_manager.hpp>
#include <folio/compilation.hpp>
#include <folio/config.hpp>
#include <folio/file_store.hpp>
#include <folio/git.hpp>
#include <folio/index_store.hpp>
#include <folio/permission_index.hpp>
#include <folio/repository_manager.hpp>
#include <folio/result.hpp>
#include <folio/thread_pool.hpp>
#include <folio/types.hpp>
#include <folio/write_serializer.hpp>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// The operation set callers see. Owns the index, the managers and both
// worker pools.
//
// Every operation runs on the calling thread; Git-mutating ones go through
// the configured WriteSerializer. Use offload() to move any of them onto the
// I/O pool.
class Engine {
    // Private tag; only open() constructs an Engine
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    // Opens the index under the storage root, applies logging settings and
    // checks the git version.
    static Result<std::unique_ptr<Engine>> open(const Config& config);

    Engine(Passkey, Config config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Repositories
    Result<RepositoryInit> initialize_repository(const std::string& project_id,
                                                 const std::string& project_name,
                                                 const Actor& actor);

    // Branches
    Result<Branch> create_branch(const BranchCreateRequest& req, const Actor& actor);
    Result<BranchPage> list_branches(const std::string& project_id, const Actor& actor,
                                     int page = 1, int size = 20);
    Result<BranchSummary> get_branch(const std::string& branch_id, const Actor& actor);
    Result<Branch> update_branch(const std::string& branch_id, const BranchUpdate& update,
                                 const Actor& actor);
    Status delete_branch(const std::string& branch_id, const Actor& actor);

    // Permissions. Changing another user's flags needs admin on the branch.
    Result<PermissionFlags> get_branch_permission(const std::string& branch_id,
                                                  const std::string& user_id);
    Status update_branch_permission(const std::string& branch_id,
                                    const std::string& user_id,
                                    const PermissionFlags& flags, const Actor& actor);
    Status revoke_branch_permission(const std::string& branch_id,
                                    const std::string& user_id, const Actor& actor);

    // Files
    Result<WriteResult> write_file(const std::string& branch_id, const std::string& path,
                                   const std::string& content,
                                   const std::optional<std::string>& message,
                                   const Actor& actor);
    Result<ReadResult> read_file(const std::string& branch_id, const std::string& path,
                                 const Actor& actor);
    Result<std::vector<FileEntry>> list_files(const std::string& branch_id,
                                              const Actor& actor);
    Result<std::string> delete_file(const std::string& branch_id, const std::string& path,
                                    const std::optional<std::string>& message,
                                    const Actor& actor);

    // LaTeX sub-projects; ids are "<projectId>_<name>", bare names work too
    Result<Subproject> create_subproject(const std::string& branch_id,
                                         const std::string& name,
                                         const std::string& template_name,
                                         const std::map<std::string, std::string>& files,
                                         const Actor& actor);
    Result<std::vector<Subproject>> list_subprojects(const std::string& branch_id,
                                                     const Actor& actor);
    Result<Subproject> get_subproject(const std::string& branch_id,
                                      const std::string& subproject, const Actor& actor);
    Result<std::string> delete_subproject(const std::string& branch_id,
                                          const std::string& subproject,
                                          const std::optional<std::string>& message,
                                          const Actor& actor);

    // Compilation
    Result<CompilationJob> submit_compilation(const CompileRequest& req, const Actor& actor);
    Result<CompilationJob> compilation_status(const std::string& project_id,
                                              const std::string& job_id,
                                              const Actor& actor);
    Result<CompiledArtifact> compiled_artifact(const std::string& project_id,
                                               const std::string& job_id,
                                               const Actor& actor);
    Result<CompilationJob> mark_compilation_timeout(const std::string& project_id,
                                                    const std::string& job_id,
                                                    const Actor& actor);
    Result<CompilationJob> mark_compilation_failed(const std::string& project_id,
                                                   const std::string& job_id,
                                                   const std::string& error,
                                                   const Actor& actor);
    Result<CompilationJob> monitor_compilation(const std::string& project_id,
                                               const std::string& job_id,
                                               std::chrono::milliseconds timeout,
                                               const Actor& actor);
    Result<std::vector<CompilationJob>> compilation_history(const std::string& project_id,
                                                            const std::string& subproject = "",
                                                            size_t limit = 50);
    Result<size_t> prune_compilations(const std::string& project_id,
                                      std::chrono::system_clock::duration older_than);

    // Run fn on the I/O pool
    template <typename F>
    auto offload(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        return io_pool_->submit(std::forward<F>(fn));
    }

    const Config& config() const { return config_; }
    IndexStore& index() { return store_; }
    GitCli& git() { return git_; }
    FileStore& files() { return *files_; }
    CompilationScheduler& compiler() { return *compiler_; }

private:
    Status start();

    // Runs fn under the serializer lock for key and hands its result back
    template <typename T, typename F>
    Result<T> serialized(const WriteKey& key, F&& fn) {
        std::optional<Result<T>> out;
        serializer_->run(key, [&] { out.emplace(fn()); });
        return std::move(*out);
    }

    // Project of a live branch, for serializer keys
    WriteKey key_for_branch(const std::string& branch_id);

    Config config_;
    IndexStore store_;
    GitCli git_;
    std::unique_ptr<PermissionIndex> perms_;
    std::unique_ptr<RepositoryManager> repos_;
    std::unique_ptr<BranchManager> branches_;
    std::unique_ptr<FileStore> files_;
    std::unique_ptr<WriteSerializer> serializer_;
    std::unique_ptr<CompilationScheduler> compiler_;
    std::unique_ptr<ThreadPool> io_pool_;
};

} // namespace folio
