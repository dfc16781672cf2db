// demo_workflow.cpp
//
// Walks one project through the engine: initialize, branch, write, read,
// list, scaffold a LaTeX sub-project, compile. Run it with:
//
//     ./demo_workflow                  # storage under a fresh temp dir
//     ./demo_workflow /tmp/folio-demo  # storage under the given root
//     ./demo_workflow /tmp/folio-demo folio.toml
//
// Compilation needs pdflatex on PATH; without it the job ends as failed and
// the errors show up in its status document.

#include <folio/engine.hpp>
#include <folio/log.hpp>
#include <folio/uuid.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace folio;

static int fail(const FolioError& err) {
    std::cerr << err.format() << "\n";
    return 1;
}

static const char* THESIS_MAIN =
    "\\documentclass{article}\n"
    "\\begin{document}\n"
    "\\input{chapters/intro}\n"
    "\\end{document}\n";

int main(int argc, char* argv[]) {
    std::optional<Config> local;
    if (argc > 2) {
        auto loaded = Config::load(argv[2]);
        if (loaded.is_err()) return fail(loaded.error());
        local = std::move(loaded).value();
    }
    Config config = Config::effective(std::nullopt, local);

    if (argc > 1) {
        config.storage.root = argv[1];
    } else if (!config.is_set("storage.root")) {
        config.storage.root =
            (fs::temp_directory_path() / ("folio_demo_" + short_id(new_id()))).string();
    }
    config.log.level = "debug";

    auto opened = Engine::open(config);
    if (opened.is_err()) return fail(opened.error());
    Engine& engine = *opened.value();

    Actor alice{"alice", "Alice Author", "alice@example.org"};
    std::string project_id = new_id();

    auto init = engine.initialize_repository(project_id, "Thesis", alice);
    if (init.is_err()) return fail(init.error());
    std::cout << "repository: " << init.value().repo_path << "\n";
    std::string main_id = init.value().main_branch_id;

    BranchCreateRequest req;
    req.project_id = project_id;
    req.name = "draft";
    req.description = "first draft";
    auto draft = engine.create_branch(req, alice);
    if (draft.is_err()) return fail(draft.error());
    std::string draft_id = draft.value().id;

    auto w1 = engine.write_file(draft_id, "main.tex", THESIS_MAIN, std::nullopt, alice);
    if (w1.is_err()) return fail(w1.error());
    auto w2 = engine.write_file(draft_id, "chapters/intro.tex", "Hello, thesis.\n",
                                std::string("Add introduction"), alice);
    if (w2.is_err()) return fail(w2.error());
    std::cout << "draft head: " << w2.value().commit_hash << "\n";

    auto read = engine.read_file(draft_id, "chapters/intro.tex", alice);
    if (read.is_err()) return fail(read.error());
    std::cout << "intro.tex (" << read.value().size << " bytes): " << read.value().content;

    auto files = engine.list_files(draft_id, alice);
    if (files.is_err()) return fail(files.error());
    std::cout << "files on draft:\n";
    for (const auto& f : files.value()) {
        std::cout << "  " << f.path << "  " << f.size << " bytes"
                  << (f.tracked ? "" : "  (untracked)") << "\n";
    }

    auto paper = engine.create_subproject(draft_id, "paper", "article", {}, alice);
    if (paper.is_err()) return fail(paper.error());
    auto subprojects = engine.list_subprojects(draft_id, alice);
    if (subprojects.is_err()) return fail(subprojects.error());
    std::cout << "LaTeX projects on draft:\n";
    for (const auto& sp : subprojects.value()) {
        std::cout << "  " << sp.name << "  " << sp.files.size() << " files\n";
    }

    auto branches = engine.list_branches(project_id, alice);
    if (branches.is_err()) return fail(branches.error());
    std::cout << "branches (" << branches.value().total << "):\n";
    for (const auto& s : branches.value().branches) {
        std::cout << "  " << s.branch.name << "  " << s.branch.head_commit.substr(0, 8)
                  << "  files=" << s.file_count << "\n";
    }

    // Writing a file under an existing file's name is a conflict
    auto clash = engine.write_file(main_id, "README.md/notes.tex", "x", std::nullopt, alice);
    if (clash.is_err()) std::cout << "expected: " << clash.error().format() << "\n";

    CompileRequest creq;
    creq.branch_id = draft_id;
    auto job = engine.submit_compilation(creq, alice);
    if (job.is_err()) return fail(job.error());
    std::string job_id = job.value().job_id;
    std::cout << "compilation " << job_id << " submitted\n";

    auto done = engine.monitor_compilation(project_id, job_id, std::chrono::seconds(120), alice);
    if (done.is_err()) return fail(done.error());
    std::cout << "compilation " << job_status_name(done.value().status) << "\n";
    for (const auto& e : done.value().errors) std::cout << "  error: " << e << "\n";
    for (const auto& w : done.value().warnings) std::cout << "  warning: " << w << "\n";

    if (done.value().status == JobStatus::Completed) {
        auto artifact = engine.compiled_artifact(project_id, job_id, alice);
        if (artifact.is_err()) return fail(artifact.error());
        std::cout << "artifact: " << artifact.value().path << " as "
                  << artifact.value().download_name << "\n";
    }
    return 0;
}
