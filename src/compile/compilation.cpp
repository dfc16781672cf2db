#include <folio/compilation.hpp>
#include <folio/layout.hpp>
#include <folio/log.hpp>
#include <folio/process.hpp>
#include <folio/uuid.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <signal.h>

namespace fs = std::filesystem;

namespace folio {

// ---------------------------------------------------------------------------
// Job status
// ---------------------------------------------------------------------------

const char* job_status_name(JobStatus s) {
    switch (s) {
        case JobStatus::Started:   return "started";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Timeout:   return "timeout";
    }
    return "failed";
}

bool parse_job_status(const std::string& name, JobStatus& out) {
    if (name == "started")   { out = JobStatus::Started;   return true; }
    if (name == "running")   { out = JobStatus::Running;   return true; }
    if (name == "completed") { out = JobStatus::Completed; return true; }
    if (name == "failed")    { out = JobStatus::Failed;    return true; }
    if (name == "timeout")   { out = JobStatus::Timeout;   return true; }
    return false;
}

bool is_terminal(JobStatus s) {
    return s == JobStatus::Completed || s == JobStatus::Failed || s == JobStatus::Timeout;
}

// ---------------------------------------------------------------------------
// Status document
// ---------------------------------------------------------------------------

std::string CompilationJob::to_json() const {
    nlohmann::ordered_json doc;
    doc["jobId"] = job_id;
    doc["projectId"] = project_id;
    doc["branchId"] = branch_id;
    doc["subprojectId"] = subproject_id;
    doc["mainFile"] = main_file;
    doc["outputFormat"] = output_format;
    doc["engine"] = engine;
    doc["actor"] = actor;
    doc["status"] = job_status_name(status);
    doc["startedAt"] = started_at;
    if (completed_at) {
        doc["completedAt"] = *completed_at;
    } else {
        doc["completedAt"] = nullptr;
    }
    doc["errors"] = errors;
    doc["warnings"] = warnings;
    doc["outputFiles"] = nlohmann::ordered_json::array();
    for (const auto& f : output_files) {
        nlohmann::ordered_json entry;
        entry["name"] = f.name;
        entry["size"] = f.size;
        entry["path"] = f.path;
        doc["outputFiles"].push_back(std::move(entry));
    }
    return doc.dump(2);
}

Result<CompilationJob> CompilationJob::from_json(const std::string& text) {
    try {
        auto doc = nlohmann::json::parse(text);
        CompilationJob job;
        job.job_id = doc.at("jobId").get<std::string>();
        job.project_id = doc.value("projectId", "");
        job.branch_id = doc.value("branchId", "");
        job.subproject_id = doc.value("subprojectId", "");
        job.main_file = doc.value("mainFile", "");
        job.output_format = doc.value("outputFormat", "pdf");
        job.engine = doc.value("engine", "");
        job.actor = doc.value("actor", "");

        std::string status = doc.at("status").get<std::string>();
        if (!parse_job_status(status, job.status)) {
            return FolioError{FolioError::Parse, "unknown job status '" + status + "'"};
        }
        job.started_at = doc.value("startedAt", "");
        if (doc.contains("completedAt") && doc["completedAt"].is_string()) {
            job.completed_at = doc["completedAt"].get<std::string>();
        }
        if (doc.contains("errors")) {
            job.errors = doc["errors"].get<std::vector<std::string>>();
        }
        if (doc.contains("warnings")) {
            job.warnings = doc["warnings"].get<std::vector<std::string>>();
        }
        if (doc.contains("outputFiles")) {
            for (const auto& f : doc["outputFiles"]) {
                OutputFile out;
                out.name = f.value("name", "");
                out.size = f.value("size", static_cast<int64_t>(0));
                out.path = f.value("path", "");
                job.output_files.push_back(std::move(out));
            }
        }
        return Result<CompilationJob>::ok(std::move(job));
    } catch (const nlohmann::json::exception& e) {
        return FolioError{FolioError::Parse,
            std::string("malformed compilation status document: ") + e.what()};
    }
}

// ---------------------------------------------------------------------------
// Filesystem helpers
// ---------------------------------------------------------------------------

// Copy src into dst, skipping .git anywhere and compilations/ at the top
static Status copy_source(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::create_directories(dst, ec);
    if (ec) {
        return FolioError{FolioError::IO,
            "cannot create " + dst.string() + ": " + ec.message()};
    }

    fs::recursive_directory_iterator it(src, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::string fname = entry.path().filename().string();
        if (fname == ".git" ||
            (it.depth() == 0 && fname == layout::COMPILATIONS_DIR)) {
            if (entry.is_directory()) it.disable_recursion_pending();
            continue;
        }

        fs::path target = dst / fs::relative(entry.path(), src);
        std::error_code op_ec;
        if (entry.is_directory(op_ec)) {
            fs::create_directories(target, op_ec);
        } else if (entry.is_regular_file(op_ec)) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, op_ec);
        }
        if (op_ec) {
            return FolioError{FolioError::IO,
                "cannot copy " + entry.path().string() + ": " + op_ec.message()};
        }
    }
    if (ec) {
        return FolioError{FolioError::IO,
            "cannot read source tree " + src.string() + ": " + ec.message()};
    }
    return ok_status();
}

static std::vector<OutputFile> scan_outputs(const fs::path& job_dir) {
    std::vector<OutputFile> out;
    fs::path out_dir = job_dir / "output";
    std::error_code ec;
    if (!fs::is_directory(out_dir, ec)) return out;

    for (const auto& entry : fs::directory_iterator(out_dir, ec)) {
        std::error_code fe;
        if (!entry.is_regular_file(fe)) continue;
        OutputFile f;
        f.name = entry.path().filename().string();
        auto sz = fs::file_size(entry.path(), fe);
        f.size = fe ? 0 : static_cast<int64_t>(sz);
        f.path = "output/" + f.name;
        out.push_back(std::move(f));
    }
    std::sort(out.begin(), out.end(),
              [](const OutputFile& a, const OutputFile& b) { return a.name < b.name; });
    return out;
}

static std::vector<std::string> scan_log_warnings(const fs::path& log_path) {
    std::vector<std::string> out;
    std::ifstream in(log_path);
    if (!in) return out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find("LaTeX Warning") != std::string::npos) {
            out.push_back(line);
        }
    }
    return out;
}

static std::optional<std::string> first_tex_file(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code fe;
        if (entry.is_regular_file(fe) && entry.path().extension() == ".tex") {
            names.push_back(entry.path().filename().string());
        }
    }
    if (names.empty()) return std::nullopt;
    std::sort(names.begin(), names.end());
    return names.front();
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ---------------------------------------------------------------------------
// CompilationScheduler
// ---------------------------------------------------------------------------

CompilationScheduler::CompilationScheduler(PermissionIndex& perms, RepositoryManager& repos,
                                           BranchManager& branches, GitCli& git,
                                           CompileConfig config)
    : perms_(perms), repos_(repos), branches_(branches), git_(git),
      config_(std::move(config)),
      pool_(std::make_unique<ThreadPool>(static_cast<size_t>(std::max(1, config_.workers)),
                                         "compile")) {}

CompilationScheduler::~CompilationScheduler() {
    shutting_down_ = true;
    std::vector<pid_t> groups;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        for (const auto& [job, pgid] : running_) groups.push_back(pgid);
    }
    for (pid_t pgid : groups) {
        terminate_process_group(pgid, 500);
    }
    pool_->shutdown();
}

Result<CompilationJob> CompilationScheduler::load(const std::string& repo_path,
                                                  const std::string& job_id) {
    if (!is_uuid(job_id)) {
        return FolioError{FolioError::Validation, "malformed job id '" + job_id + "'"};
    }
    fs::path meta = fs::path(layout::job_path(repo_path, job_id)) / layout::METADATA_FILE;
    std::ifstream in(meta);
    if (!in) {
        return FolioError{FolioError::NotFound, "compilation " + job_id + " not found"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return CompilationJob::from_json(ss.str());
}

Status CompilationScheduler::persist(const std::string& repo_path,
                                     const CompilationJob& job) {
    fs::path dir = layout::job_path(repo_path, job.job_id);
    fs::path meta = dir / layout::METADATA_FILE;
    fs::path tmp = dir / (std::string(layout::METADATA_FILE) + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return FolioError{FolioError::IO, "cannot write " + tmp.string()};
        }
        out << job.to_json() << "\n";
        if (!out) {
            return FolioError{FolioError::IO, "write failed: " + tmp.string()};
        }
    }
    std::error_code ec;
    fs::rename(tmp, meta, ec);
    if (ec) {
        return FolioError{FolioError::IO,
            "cannot replace " + meta.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<std::pair<CompilationJob, bool>> CompilationScheduler::transition(
    const std::string& repo_path, const std::string& job_id,
    const std::function<void(CompilationJob&)>& mutate) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    auto job = load(repo_path, job_id);
    if (job.is_err()) return std::move(job).error();

    CompilationJob& doc = job.value();
    if (is_terminal(doc.status)) {
        return Result<std::pair<CompilationJob, bool>>::ok({std::move(doc), false});
    }
    mutate(doc);
    FOLIO_TRY(persist(repo_path, doc));
    return Result<std::pair<CompilationJob, bool>>::ok({std::move(doc), true});
}

Result<CompilationJob> CompilationScheduler::submit(const CompileRequest& req,
                                                    const Actor& actor) {
    if (!contains(config_.engines, req.engine)) {
        return FolioError{FolioError::Validation,
            "LaTeX engine '" + req.engine + "' is not allowed",
            "configure compile.engines to allow it"};
    }
    static const std::vector<std::string> known_formats = {"pdf", "dvi", "ps"};
    if (!contains(known_formats, req.output_format) ||
        !contains(config_.formats, req.output_format)) {
        return FolioError{FolioError::Validation,
            "unsupported output format '" + req.output_format + "'",
            "use pdf, dvi or ps"};
    }

    auto branch = branches_.get(req.branch_id);
    if (branch.is_err()) return std::move(branch).error();
    FOLIO_TRY(perms_.require(req.branch_id, actor.id, Access::Read));

    auto repo = repos_.ensure_ready(branch.value().project_id);
    if (repo.is_err()) return std::move(repo).error();
    const std::string repo_path = repo.value().path;
    FOLIO_TRY(branches_.ensure_ref(repo.value(), branch.value()));
    FOLIO_TRY(git_.checkout(repo_path, branch.value().name));

    std::string name = layout::subproject_name(branch.value().project_id, req.subproject);
    if (!name.empty()) {
        auto checked = layout::validate_file_path(name);
        if (checked.is_err()) return std::move(checked).error();
        name = checked.value();
    }
    auto source_dir = layout::resolve_existing(repo_path, name, false);
    if (!source_dir) {
        return FolioError{FolioError::NotFound,
            "LaTeX project directory not found: " + name};
    }

    std::string main_file = req.main_file.empty() ? "main.tex" : req.main_file;
    auto main_checked = layout::validate_file_path(main_file);
    if (main_checked.is_err()) return std::move(main_checked).error();
    main_file = main_checked.value();

    std::error_code ec;
    if (!fs::is_regular_file(fs::path(*source_dir) / main_file, ec)) {
        auto fallback = first_tex_file(*source_dir);
        if (!fallback) {
            return FolioError{FolioError::NotFound,
                "main file '" + main_file + "' not found and no .tex files in " +
                (name.empty() ? std::string("the repository root") : "'" + name + "'")};
        }
        log::warn("main file '%s' not found, falling back to '%s'",
                  main_file.c_str(), fallback->c_str());
        main_file = *fallback;
    }

    CompilationJob job;
    job.job_id = new_id();
    job.project_id = branch.value().project_id;
    job.branch_id = branch.value().id;
    job.subproject_id = req.subproject;
    job.main_file = main_file;
    job.output_format = req.output_format;
    job.engine = req.engine;
    job.actor = actor.id;
    job.status = JobStatus::Started;
    job.started_at = utc_timestamp();

    fs::path job_dir = layout::job_path(repo_path, job.job_id);
    auto copied = copy_source(*source_dir, job_dir / "source");
    if (copied.is_ok()) {
        fs::create_directories(job_dir / "output", ec);
        if (ec) {
            copied = FolioError{FolioError::IO,
                "cannot create output directory: " + ec.message()};
        }
    }
    if (copied.is_ok()) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        copied = persist(repo_path, job);
    }
    if (copied.is_err()) {
        fs::remove_all(job_dir, ec);
        return std::move(copied).error();
    }

    std::string job_id = job.job_id;
    bool queued = pool_->enqueue([this, repo_path, job_id] { run_job(repo_path, job_id); });
    if (!queued) {
        auto failed = transition(repo_path, job_id, [](CompilationJob& j) {
            j.status = JobStatus::Failed;
            j.errors.push_back("compile queue rejected the job");
            j.completed_at = utc_timestamp();
        });
        if (failed.is_err()) return std::move(failed).error();
        return Result<CompilationJob>::ok(std::move(failed.value().first));
    }

    log::info("compilation %s started: %s %s on branch '%s'", job.job_id.c_str(),
              job.engine.c_str(), job.main_file.c_str(), branch.value().name.c_str());
    return Result<CompilationJob>::ok(std::move(job));
}

void CompilationScheduler::run_job(const std::string& repo_path, const std::string& job_id) {
    if (shutting_down_) {
        auto r = transition(repo_path, job_id, [](CompilationJob& j) {
            j.status = JobStatus::Failed;
            j.errors.push_back("compile scheduler shut down before the job ran");
            j.completed_at = utc_timestamp();
        });
        if (r.is_err()) {
            log::error("compilation %s: %s", job_id.c_str(), r.error().message.c_str());
        }
        return;
    }

    auto started = transition(repo_path, job_id,
                              [](CompilationJob& j) { j.status = JobStatus::Running; });
    if (started.is_err()) {
        log::error("compilation %s: cannot mark running: %s", job_id.c_str(),
                   started.error().message.c_str());
        return;
    }
    if (!started.value().second) {
        log::debug("compilation %s already finished before it ran", job_id.c_str());
        std::lock_guard<std::mutex> lock(status_mutex_);
        cancelled_.erase(job_id);
        return;
    }
    const CompilationJob& job = started.value().first;

    fs::path job_dir = layout::job_path(repo_path, job_id);
    fs::path source_dir = job_dir / "source";
    fs::path out_dir = job_dir / "output";

    CommandOptions options;
    options.working_dir = source_dir.string();
    options.timeout_seconds = config_.timeout;
    options.timeout_is_error = false;
    options.on_spawn = [this, job_id](pid_t pgid) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        running_[job_id] = pgid;
        if (cancelled_.count(job_id)) {
            kill(-pgid, SIGKILL);
        }
    };

    std::vector<std::string> argv = {
        job.engine,
        "-interaction=nonstopmode",
        "-output-directory=" + out_dir.string(),
        job.main_file,
    };
    auto result = run_command(argv, options);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        running_.erase(job_id);
    }

    fs::path log_path = out_dir / fs::path(job.main_file).filename().replace_extension(".log");
    std::vector<std::string> warnings = scan_log_warnings(log_path);
    std::vector<OutputFile> outputs = scan_outputs(job_dir);

    auto finished = transition(repo_path, job_id, [&](CompilationJob& j) {
        if (result.is_err()) {
            j.status = JobStatus::Failed;
            j.errors.push_back(result.error().message);
        } else if (result.value().timed_out) {
            // Timeout status is reserved for mark_timeout
            j.status = JobStatus::Failed;
            j.errors.push_back("LaTeX engine killed after the configured limit of " +
                               std::to_string(config_.timeout) + "s");
        } else if (result.value().exit_code == 127) {
            j.status = JobStatus::Failed;
            j.errors.push_back("LaTeX engine '" + j.engine + "' could not be executed");
        } else if (result.value().exit_code != 0) {
            j.status = JobStatus::Failed;
            const auto& cmd = result.value();
            j.errors.push_back(cmd.stderr_str.empty() ? cmd.stdout_str : cmd.stderr_str);
        } else {
            j.status = JobStatus::Completed;
        }
        j.warnings = warnings;
        j.output_files = outputs;
        j.completed_at = utc_timestamp();
    });

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        cancelled_.erase(job_id);
    }

    if (finished.is_err()) {
        log::error("compilation %s: cannot record result: %s", job_id.c_str(),
                   finished.error().message.c_str());
        return;
    }
    const CompilationJob& done = finished.value().first;
    if (!finished.value().second) {
        log::info("compilation %s ended after being marked %s", job_id.c_str(),
                  job_status_name(done.status));
    } else if (done.status == JobStatus::Completed) {
        log::info("compilation %s completed (%zu warning(s))", job_id.c_str(),
                  done.warnings.size());
    } else {
        log::error("compilation %s %s", job_id.c_str(), job_status_name(done.status));
    }
}

Result<CompilationJob> CompilationScheduler::status(const std::string& project_id,
                                                    const std::string& job_id,
                                                    const Actor& actor) {
    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    Result<CompilationJob> job = FolioError{FolioError::NotFound, job_id};
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        job = load(repo.value().path, job_id);
    }
    if (job.is_err()) return job;
    if (job.value().project_id != project_id) {
        return FolioError{FolioError::NotFound, "compilation " + job_id + " not found"};
    }
    FOLIO_TRY(perms_.require(job.value().branch_id, actor.id, Access::Read));

    fs::path job_dir = layout::job_path(repo.value().path, job_id);
    std::error_code ec;
    if (fs::is_directory(job_dir / "output", ec)) {
        job.value().output_files = scan_outputs(job_dir);
    }
    return job;
}

Result<CompiledArtifact> CompilationScheduler::output_file(const std::string& project_id,
                                                           const std::string& job_id,
                                                           const Actor& actor) {
    auto job = status(project_id, job_id, actor);
    if (job.is_err()) return std::move(job).error();
    const CompilationJob& doc = job.value();

    if (doc.status != JobStatus::Completed) {
        return FolioError{FolioError::Validation,
            "compilation " + job_id + " is not completed (" +
            job_status_name(doc.status) + ")"};
    }

    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    for (const auto& f : doc.output_files) {
        if (layout::extension_of(f.name) != doc.output_format) continue;

        std::string base = layout::subproject_name(project_id, doc.subproject_id);
        if (base.empty()) base = fs::path(doc.main_file).stem().string();

        CompiledArtifact out;
        out.path = (fs::path(layout::job_path(repo.value().path, job_id)) / f.path).string();
        out.download_name = base + "_" + short_id(job_id) + "." + doc.output_format;
        out.size = f.size;
        return Result<CompiledArtifact>::ok(std::move(out));
    }
    return FolioError{FolioError::NotFound,
        "no " + doc.output_format + " file produced by compilation " + job_id};
}

Result<CompilationJob> CompilationScheduler::mark_terminal(const std::string& project_id,
                                                           const std::string& job_id,
                                                           JobStatus to,
                                                           const std::string& error) {
    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    auto r = transition(repo.value().path, job_id, [&](CompilationJob& j) {
        j.status = to;
        if (!error.empty()) j.errors.push_back(error);
        j.completed_at = utc_timestamp();
    });
    if (r.is_err()) return std::move(r).error();

    if (r.value().second) {
        pid_t pgid = 0;
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            cancelled_.insert(job_id);
            auto it = running_.find(job_id);
            if (it != running_.end()) pgid = it->second;
        }
        if (pgid > 0) {
            terminate_process_group(pgid);
        }
        log::warn("compilation %s marked %s", job_id.c_str(), job_status_name(to));
    }
    return Result<CompilationJob>::ok(std::move(r.value().first));
}

Result<CompilationJob> CompilationScheduler::mark_timeout(const std::string& project_id,
                                                          const std::string& job_id) {
    return mark_terminal(project_id, job_id, JobStatus::Timeout, "compilation timed out");
}

Result<CompilationJob> CompilationScheduler::mark_failed(const std::string& project_id,
                                                         const std::string& job_id,
                                                         const std::string& error) {
    return mark_terminal(project_id, job_id, JobStatus::Failed, error);
}

Result<CompilationJob> CompilationScheduler::monitor(const std::string& project_id,
                                                     const std::string& job_id,
                                                     std::chrono::milliseconds timeout,
                                                     std::chrono::milliseconds poll_interval) {
    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        Result<CompilationJob> job = FolioError{FolioError::NotFound, job_id};
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            job = load(repo.value().path, job_id);
        }
        if (job.is_err()) return job;
        if (is_terminal(job.value().status)) return job;

        if (std::chrono::steady_clock::now() >= deadline) {
            return mark_timeout(project_id, job_id);
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

Result<std::vector<CompilationJob>> CompilationScheduler::history(
    const std::string& project_id, const std::string& subproject, size_t limit) {
    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    std::vector<CompilationJob> out;
    fs::path dir = layout::compilations_path(repo.value().path);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<std::vector<CompilationJob>>::ok(std::move(out));
    }

    std::string wanted = layout::subproject_name(project_id, subproject);
    std::lock_guard<std::mutex> lock(status_mutex_);
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string job_id = entry.path().filename().string();
        if (!is_uuid(job_id)) continue;
        auto job = load(repo.value().path, job_id);
        if (job.is_err()) {
            log::warn("skipping compilation %s: %s", job_id.c_str(),
                      job.error().message.c_str());
            continue;
        }
        if (!wanted.empty() &&
            layout::subproject_name(project_id, job.value().subproject_id) != wanted) {
            continue;
        }
        out.push_back(std::move(job).value());
    }

    std::sort(out.begin(), out.end(), [](const CompilationJob& a, const CompilationJob& b) {
        return a.started_at > b.started_at;
    });
    if (limit > 0 && out.size() > limit) out.resize(limit);
    return Result<std::vector<CompilationJob>>::ok(std::move(out));
}

Result<size_t> CompilationScheduler::prune(const std::string& project_id,
                                           std::chrono::system_clock::duration older_than) {
    auto repo = repos_.get(project_id);
    if (repo.is_err()) return std::move(repo).error();

    fs::path dir = layout::compilations_path(repo.value().path);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return Result<size_t>::ok(0);

    auto cutoff = std::chrono::system_clock::now() - older_than;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(status_mutex_);
    std::vector<fs::path> victims;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string job_id = entry.path().filename().string();
        if (!is_uuid(job_id)) continue;
        auto job = load(repo.value().path, job_id);
        if (job.is_err() || !is_terminal(job.value().status)) continue;

        const auto& doc = job.value();
        auto finished = parse_utc_timestamp(doc.completed_at.value_or(doc.started_at));
        if (finished && *finished <= cutoff) {
            victims.push_back(entry.path());
        }
    }

    for (const auto& p : victims) {
        std::error_code rm_ec;
        fs::remove_all(p, rm_ec);
        if (rm_ec) {
            log::warn("cannot remove %s: %s", p.string().c_str(), rm_ec.message().c_str());
            continue;
        }
        ++removed;
    }
    if (removed > 0) {
        log::info("pruned %zu compilation(s) of project %s", removed, project_id.c_str());
    }
    return Result<size_t>::ok(removed);
}

} // namespace folio
