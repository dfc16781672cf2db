#pragma once

#include <folio/branch_manager.hpp>
#include <folio/config.hpp>
#include <folio/git.hpp>
#include <folio/permission_index.hpp>
#include <folio/repository_manager.hpp>
#include <folio/result.hpp>
#include <folio/thread_pool.hpp>
#include <folio/types.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <sys/types.h>

namespace folio {

enum class JobStatus { Started, Running, Completed, Failed, Timeout };

const char* job_status_name(JobStatus s);
bool parse_job_status(const std::string& name, JobStatus& out);
bool is_terminal(JobStatus s);

struct OutputFile {
    std::string name;
    int64_t size = 0;
    std::string path;   // relative to the job directory
};

// Status document, persisted as compilations/<jobId>/metadata.json
struct CompilationJob {
    std::string job_id;
    std::string project_id;
    std::string branch_id;
    std::string subproject_id;
    std::string main_file;
    std::string output_format;
    std::string engine;
    std::string actor;
    JobStatus status = JobStatus::Started;
    std::string started_at;
    std::optional<std::string> completed_at;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<OutputFile> output_files;

    // JSON with 2-space indent
    std::string to_json() const;
    static Result<CompilationJob> from_json(const std::string& text);
};

struct CompileRequest {
    std::string branch_id;
    std::string subproject;             // empty means the repository root
    std::string main_file = "main.tex";
    std::string engine = "pdflatex";
    std::string output_format = "pdf";
};

struct CompiledArtifact {
    std::string path;
    std::string download_name;          // <subproject>_<job8>.<ext>
    int64_t size = 0;
};

// Runs LaTeX builds on a worker pool. The status document on disk is the
// only record of a job; it does not survive the job directory.
//
//   started -> running -> completed | failed
//   started | running -> timeout | failed   (caller-driven)
//
// compile.timeout, when set, kills a runaway engine and records failed;
// only mark_timeout() and monitor() produce timeout.
//
// Terminal states are final. Every status write is a read-modify-write under
// one scheduler mutex, so a late worker cannot overwrite a timeout.
class CompilationScheduler {
public:
    CompilationScheduler(PermissionIndex& perms, RepositoryManager& repos,
                         BranchManager& branches, GitCli& git, CompileConfig config);
    ~CompilationScheduler();

    CompilationScheduler(const CompilationScheduler&) = delete;
    CompilationScheduler& operator=(const CompilationScheduler&) = delete;

    // Returns once metadata.json exists, before the engine runs
    Result<CompilationJob> submit(const CompileRequest& req, const Actor& actor);

    // Document plus a live scan of the output directory; needs read access
    Result<CompilationJob> status(const std::string& project_id, const std::string& job_id,
                                  const Actor& actor);

    // First artifact of the job's output format; Validation until completed
    Result<CompiledArtifact> output_file(const std::string& project_id,
                                         const std::string& job_id, const Actor& actor);

    // Caller-driven transitions. No-ops on terminal jobs; a running engine's
    // process group is terminated.
    Result<CompilationJob> mark_timeout(const std::string& project_id,
                                        const std::string& job_id);
    Result<CompilationJob> mark_failed(const std::string& project_id,
                                       const std::string& job_id, const std::string& error);

    // Poll until terminal; mark_timeout once the deadline passes
    Result<CompilationJob> monitor(const std::string& project_id, const std::string& job_id,
                                   std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds poll_interval =
                                       std::chrono::milliseconds(200));

    // Newest first. Empty subproject means all.
    Result<std::vector<CompilationJob>> history(const std::string& project_id,
                                                const std::string& subproject = "",
                                                size_t limit = 50);

    // Remove terminal jobs that finished before now - older_than.
    // Returns the number of job directories removed.
    Result<size_t> prune(const std::string& project_id,
                         std::chrono::system_clock::duration older_than);

    const CompileConfig& config() const { return config_; }

private:
    void run_job(const std::string& repo_path, const std::string& job_id);

    Result<CompilationJob> load(const std::string& repo_path, const std::string& job_id);
    Status persist(const std::string& repo_path, const CompilationJob& job);

    // Apply mutate and persist unless the job is already terminal.
    // Returns the resulting document and whether the write happened.
    Result<std::pair<CompilationJob, bool>> transition(
        const std::string& repo_path, const std::string& job_id,
        const std::function<void(CompilationJob&)>& mutate);

    Result<CompilationJob> mark_terminal(const std::string& project_id,
                                         const std::string& job_id, JobStatus to,
                                         const std::string& error);

    PermissionIndex& perms_;
    RepositoryManager& repos_;
    BranchManager& branches_;
    GitCli& git_;
    CompileConfig config_;

    std::mutex status_mutex_;
    std::unordered_map<std::string, pid_t> running_;   // job id -> process group
    std::unordered_set<std::string> cancelled_;
    std::atomic<bool> shutting_down_{false};

    // Declared last so workers stop before the members they use go away
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace folio
