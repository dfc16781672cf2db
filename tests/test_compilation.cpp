#include <catch2/catch.hpp>
#include "test_support.hpp"

#include <folio/compilation.hpp>
#include <folio/layout.hpp>
#include <folio/uuid.hpp>

#include <algorithm>
#include <memory>
#include <thread>

using namespace folio;
using folio::test::Stack;
using folio::test::TempDir;
using folio::test::actor;
using folio::test::slurp;
namespace fs = std::filesystem;

static const std::string PROJECT = "a1b2c3d4-0000-4000-8000-00000000beef";

// Stand-ins for pdflatex. Arguments: -interaction=... -output-directory=<dir> <main>
static const char* OK_ENGINE =
    "out=\"${2#-output-directory=}\"\n"
    "base=$(basename \"$3\" .tex)\n"
    "cat \"$3\" > \"$out/$base.pdf\"\n"
    "echo 'This is stub-latex' > \"$out/$base.log\"\n"
    "echo 'LaTeX Warning: Reference undefined on input line 3.' >> \"$out/$base.log\"\n"
    "exit 0\n";

static const char* FAILING_ENGINE =
    "echo '! Undefined control sequence.' >&2\n"
    "exit 1\n";

static const char* HANGING_ENGINE =
    "echo started\n"
    "exec sleep 30\n";

struct CompileFixture {
    Stack s;
    TempDir bin;
    Actor owner = actor("owner");
    RepositoryInit init;
    Branch draft;
    std::string ok_engine;
    std::string failing_engine;
    std::string hanging_engine;
    std::unique_ptr<CompilationScheduler> sched;

    CompileFixture() {
        ok_engine = bin.write_script("ok-latex", OK_ENGINE);
        failing_engine = bin.write_script("failing-latex", FAILING_ENGINE);
        hanging_engine = bin.write_script("hanging-latex", HANGING_ENGINE);

        CompileConfig cfg;
        cfg.engines = {ok_engine, failing_engine, hanging_engine};
        cfg.formats = {"pdf", "dvi"};
        cfg.workers = 2;
        cfg.timeout = 30;
        sched = std::make_unique<CompilationScheduler>(s.perms, s.repos, s.branches, s.git,
                                                       cfg);

        init = s.init(PROJECT, "Thesis", owner);
        draft = s.branch(PROJECT, "draft", owner);
    }

    void write(const std::string& path, const std::string& content) {
        auto r = s.files.write(draft.id, path, content, std::nullopt, owner);
        REQUIRE(r.is_ok());
    }

    CompileRequest request(const std::string& engine) {
        CompileRequest req;
        req.branch_id = draft.id;
        req.engine = engine;
        return req;
    }

    CompilationJob submit(const CompileRequest& req) {
        auto r = sched->submit(req, owner);
        REQUIRE(r.is_ok());
        return std::move(r).value();
    }

    CompilationJob wait(const std::string& job_id) {
        auto r = sched->monitor(PROJECT, job_id, std::chrono::seconds(20),
                                std::chrono::milliseconds(20));
        REQUIRE(r.is_ok());
        return std::move(r).value();
    }

    // Poll until the worker has picked the job up
    void wait_running(const std::string& job_id) {
        for (int i = 0; i < 500; ++i) {
            auto st = sched->status(PROJECT, job_id, owner);
            REQUIRE(st.is_ok());
            if (st.value().status == JobStatus::Running) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        FAIL("job never reached running");
    }
};

// ===== Helpers =====

TEST_CASE("job status names", "[compilation]") {
    JobStatus st = JobStatus::Started;
    REQUIRE(parse_job_status("timeout", st));
    REQUIRE(st == JobStatus::Timeout);
    REQUIRE_FALSE(parse_job_status("done", st));
    REQUIRE(std::string(job_status_name(JobStatus::Running)) == "running");
    REQUIRE(is_terminal(JobStatus::Completed));
    REQUIRE(is_terminal(JobStatus::Failed));
    REQUIRE(is_terminal(JobStatus::Timeout));
    REQUIRE_FALSE(is_terminal(JobStatus::Started));
    REQUIRE_FALSE(is_terminal(JobStatus::Running));
}

TEST_CASE("Status document field names", "[compilation]") {
    CompilationJob job;
    job.job_id = "j";
    job.status = JobStatus::Running;
    std::string text = job.to_json();
    REQUIRE(text.rfind("{\n  \"jobId\": \"j\"", 0) == 0);
    REQUIRE(text.find("\"completedAt\": null") != std::string::npos);
    REQUIRE(text.find("\"status\": \"running\"") != std::string::npos);
    REQUIRE(text.find("\"outputFiles\": []") != std::string::npos);

    REQUIRE(CompilationJob::from_json("{\"jobId\":\"j\",\"status\":\"lost\"}")
                .error().code == FolioError::Parse);
    REQUIRE(CompilationJob::from_json("not json").error().code == FolioError::Parse);
}

// ===== Submit =====

TEST_CASE("Compilation runs to completion", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "\\documentclass{article}");

    CompilationJob job = f.submit(f.request(f.ok_engine));
    REQUIRE(is_uuid(job.job_id));
    REQUIRE(job.status == JobStatus::Started);
    REQUIRE(job.main_file == "main.tex");
    REQUIRE(job.actor == "owner");
    REQUIRE(job.project_id == PROJECT);

    fs::path job_dir = layout::job_path(f.init.repo_path, job.job_id);
    REQUIRE(fs::exists(job_dir / layout::METADATA_FILE));
    REQUIRE(fs::exists(job_dir / "source/main.tex"));
    REQUIRE_FALSE(fs::exists(job_dir / "source/.git"));
    REQUIRE_FALSE(fs::exists(job_dir / "source" / layout::COMPILATIONS_DIR));

    CompilationJob done = f.wait(job.job_id);
    REQUIRE(done.status == JobStatus::Completed);
    REQUIRE(done.completed_at.has_value());
    REQUIRE(done.errors.empty());
    REQUIRE(done.warnings ==
            std::vector<std::string>{"LaTeX Warning: Reference undefined on input line 3."});
    REQUIRE(done.output_files.size() == 2);
    REQUIRE(done.output_files[0].name == "main.log");
    REQUIRE(done.output_files[1].name == "main.pdf");
    REQUIRE(done.output_files[1].path == "output/main.pdf");

    auto artifact = f.sched->output_file(PROJECT, job.job_id, f.owner);
    REQUIRE(artifact.is_ok());
    REQUIRE(artifact.value().download_name == "main_" + job.job_id.substr(0, 8) + ".pdf");
    REQUIRE(slurp(artifact.value().path) == "\\documentclass{article}");
    REQUIRE(artifact.value().size == 23);
}

TEST_CASE("Compilation of a subproject directory", "[compilation]") {
    CompileFixture f;
    f.write("paper/main.tex", "paper body");

    CompileRequest req = f.request(f.ok_engine);
    req.subproject = PROJECT + "_paper";
    CompilationJob job = f.submit(req);
    REQUIRE(job.subproject_id == PROJECT + "_paper");
    REQUIRE(f.wait(job.job_id).status == JobStatus::Completed);

    auto artifact = f.sched->output_file(PROJECT, job.job_id, f.owner);
    REQUIRE(artifact.value().download_name == "paper_" + job.job_id.substr(0, 8) + ".pdf");

    req.subproject = "nowhere";
    auto missing = f.sched->submit(req, f.owner);
    REQUIRE(missing.error().code == FolioError::NotFound);
}

TEST_CASE("Missing main file falls back to the first .tex file", "[compilation]") {
    CompileFixture f;
    f.write("paper.tex", "p");
    f.write("appendix.tex", "a");

    CompileRequest req = f.request(f.ok_engine);
    req.main_file = "missing.tex";
    CompilationJob job = f.submit(req);
    REQUIRE(job.main_file == "appendix.tex");
    REQUIRE(f.wait(job.job_id).status == JobStatus::Completed);
}

TEST_CASE("No .tex file at all is NotFound and leaves no job", "[compilation]") {
    CompileFixture f;
    auto r = f.sched->submit(f.request(f.ok_engine), f.owner);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FolioError::NotFound);
    REQUIRE(f.sched->history(PROJECT).value().empty());
}

TEST_CASE("Engine and format must be allowed", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");

    auto engine = f.sched->submit(f.request("/bin/rm"), f.owner);
    REQUIRE(engine.error().code == FolioError::Validation);

    CompileRequest html = f.request(f.ok_engine);
    html.output_format = "html";
    REQUIRE(f.sched->submit(html, f.owner).error().code == FolioError::Validation);

    CompileRequest ps = f.request(f.ok_engine);
    ps.output_format = "ps";
    REQUIRE(f.sched->submit(ps, f.owner).error().code == FolioError::Validation);
}

TEST_CASE("Submit needs read access on a live branch", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    auto denied = f.sched->submit(f.request(f.ok_engine), actor("stranger"));
    REQUIRE(denied.error().code == FolioError::PermissionDenied);

    REQUIRE(f.s.perms.grant(f.draft.id, "reader", PermissionFlags{true, false, false},
                            "owner").is_ok());
    auto allowed = f.sched->submit(f.request(f.ok_engine), actor("reader"));
    REQUIRE(allowed.is_ok());
    f.wait(allowed.value().job_id);

    CompileRequest gone = f.request(f.ok_engine);
    gone.branch_id = new_id();
    REQUIRE(f.sched->submit(gone, f.owner).error().code == FolioError::NotFound);
}

// ===== Outcomes =====

TEST_CASE("Engine failure records the error output", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    CompilationJob job = f.submit(f.request(f.failing_engine));
    CompilationJob done = f.wait(job.job_id);
    REQUIRE(done.status == JobStatus::Failed);
    REQUIRE(done.errors.size() == 1);
    REQUIRE(done.errors[0].find("Undefined control sequence") != std::string::npos);

    auto artifact = f.sched->output_file(PROJECT, job.job_id, f.owner);
    REQUIRE(artifact.error().code == FolioError::Validation);
}

TEST_CASE("Artifact of another format is NotFound", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    CompileRequest req = f.request(f.ok_engine);
    req.output_format = "dvi";
    CompilationJob job = f.submit(req);
    REQUIRE(f.wait(job.job_id).status == JobStatus::Completed);
    auto artifact = f.sched->output_file(PROJECT, job.job_id, f.owner);
    REQUIRE(artifact.error().code == FolioError::NotFound);
}

TEST_CASE("mark_timeout stops a running engine and is final", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    CompilationJob job = f.submit(f.request(f.hanging_engine));
    f.wait_running(job.job_id);

    auto marked = f.sched->mark_timeout(PROJECT, job.job_id);
    REQUIRE(marked.is_ok());
    REQUIRE(marked.value().status == JobStatus::Timeout);
    REQUIRE(marked.value().errors == std::vector<std::string>{"compilation timed out"});
    REQUIRE(marked.value().completed_at.has_value());

    // Terminal states do not move
    auto failed = f.sched->mark_failed(PROJECT, job.job_id, "late");
    REQUIRE(failed.value().status == JobStatus::Timeout);
    REQUIRE(failed.value().errors.size() == 1);

    // Let the killed worker finish; its result must not overwrite the timeout
    f.sched.reset();
    CompilationScheduler fresh(f.s.perms, f.s.repos, f.s.branches, f.s.git, CompileConfig{});
    auto after = fresh.status(PROJECT, job.job_id, f.owner);
    REQUIRE(after.value().status == JobStatus::Timeout);
    REQUIRE(after.value().errors.size() == 1);
}

TEST_CASE("A created sub-project compiles under its own name", "[compilation]") {
    CompileFixture f;
    auto sp = f.s.files.create_subproject(f.draft.id, "paper", "", {}, f.owner);
    REQUIRE(sp.is_ok());

    CompileRequest req = f.request(f.ok_engine);
    req.subproject = sp.value().id;
    CompilationJob job = f.submit(req);
    REQUIRE(f.wait(job.job_id).status == JobStatus::Completed);

    auto artifact = f.sched->output_file(PROJECT, job.job_id, f.owner);
    REQUIRE(artifact.is_ok());
    REQUIRE(artifact.value().download_name.rfind("paper_", 0) == 0);
}

TEST_CASE("The engine guard records failed, never timeout", "[compilation]") {
    CompileFixture f;
    CompileConfig cfg;
    cfg.engines = {f.hanging_engine};
    cfg.timeout = 1;
    f.sched = std::make_unique<CompilationScheduler>(f.s.perms, f.s.repos, f.s.branches,
                                                     f.s.git, cfg);
    f.write("main.tex", "x");

    CompilationJob job = f.submit(f.request(f.hanging_engine));
    CompilationJob done = f.wait(job.job_id);
    REQUIRE(done.status == JobStatus::Failed);
    REQUIRE(done.errors.size() == 1);
    REQUIRE(done.errors[0].find("configured limit of 1s") != std::string::npos);
    REQUIRE(done.completed_at.has_value());
}

TEST_CASE("mark_failed records the caller's error", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    CompilationJob job = f.submit(f.request(f.hanging_engine));
    auto marked = f.sched->mark_failed(PROJECT, job.job_id, "cancelled by user");
    REQUIRE(marked.value().status == JobStatus::Failed);
    REQUIRE(marked.value().errors == std::vector<std::string>{"cancelled by user"});
}

TEST_CASE("monitor marks a job timed out at its deadline", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    CompilationJob job = f.submit(f.request(f.hanging_engine));
    auto r = f.sched->monitor(PROJECT, job.job_id, std::chrono::milliseconds(300),
                              std::chrono::milliseconds(20));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().status == JobStatus::Timeout);
}

// ===== Status lookups =====

TEST_CASE("status rejects unknown, malformed and foreign job ids", "[compilation]") {
    CompileFixture f;
    REQUIRE(f.sched->status(PROJECT, new_id(), f.owner).error().code == FolioError::NotFound);
    REQUIRE(f.sched->status(PROJECT, "../../etc", f.owner).error().code ==
            FolioError::Validation);
    REQUIRE(f.sched->status(new_id(), new_id(), f.owner).error().code == FolioError::NotFound);

    f.write("main.tex", "x");
    CompilationJob job = f.submit(f.request(f.ok_engine));
    f.wait(job.job_id);
    REQUIRE(f.sched->status(PROJECT, job.job_id, actor("stranger")).error().code ==
            FolioError::PermissionDenied);
}

// ===== History and pruning =====

TEST_CASE("history is newest first and filters by subproject", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "root");
    f.write("paper/main.tex", "paper");

    CompilationJob first = f.submit(f.request(f.ok_engine));
    f.wait(first.job_id);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    CompileRequest req = f.request(f.ok_engine);
    req.subproject = "paper";
    CompilationJob second = f.submit(req);
    f.wait(second.job_id);

    auto all = f.sched->history(PROJECT).value();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].job_id == second.job_id);
    REQUIRE(all[1].job_id == first.job_id);

    auto paper = f.sched->history(PROJECT, PROJECT + "_paper").value();
    REQUIRE(paper.size() == 1);
    REQUIRE(paper[0].job_id == second.job_id);

    REQUIRE(f.sched->history(PROJECT, "", 1).value().size() == 1);
}

TEST_CASE("prune removes finished jobs past the cutoff", "[compilation]") {
    CompileFixture f;
    f.write("main.tex", "x");
    CompilationJob done = f.submit(f.request(f.ok_engine));
    f.wait(done.job_id);
    CompilationJob running = f.submit(f.request(f.hanging_engine));

    REQUIRE(f.sched->prune(PROJECT, std::chrono::hours(1)).value() == 0);
    REQUIRE(f.sched->prune(PROJECT, std::chrono::seconds(0)).value() == 1);

    fs::path dir = layout::compilations_path(f.init.repo_path);
    REQUIRE_FALSE(fs::exists(dir / done.job_id));
    REQUIRE(fs::exists(dir / running.job_id));
    REQUIRE(f.sched->status(PROJECT, done.job_id, f.owner).error().code ==
            FolioError::NotFound);

    REQUIRE(f.sched->mark_timeout(PROJECT, running.job_id).is_ok());
}
