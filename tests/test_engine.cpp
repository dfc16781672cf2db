#include <catch2/catch.hpp>
#include "test_support.hpp"

#include <folio/engine.hpp>
#include <folio/log.hpp>
#include <folio/uuid.hpp>

#include <future>
#include <memory>
#include <type_traits>
#include <vector>

using namespace folio;
using folio::test::TempDir;
using folio::test::actor;
namespace fs = std::filesystem;

namespace {

struct EngineFixture {
    TempDir dir;
    TempDir bin;
    Actor owner = actor("owner");
    std::string project = new_id();
    std::unique_ptr<Engine> engine;

    explicit EngineFixture(SerializeScope scope = SerializeScope::Repository) {
        Config cfg;
        cfg.storage.root = (dir.path / "repos").string();
        cfg.log.level = "warn";
        cfg.log.color = false;
        cfg.concurrency.serialize_writes = scope;
        cfg.concurrency.io_workers = 4;
        cfg.compile.engines = {bin.write_script(
            "stub-latex",
            "out=\"${2#-output-directory=}\"\n"
            "base=$(basename \"$3\" .tex)\n"
            "cp \"$3\" \"$out/$base.pdf\"\n")};
        cfg.compile.timeout = 30;

        auto opened = Engine::open(cfg);
        REQUIRE(opened.is_ok());
        engine = std::move(opened).value();
    }

    ~EngineFixture() {
        engine.reset();
        log::set_level(log::Info);
    }

    RepositoryInit init() {
        auto r = engine->initialize_repository(project, "Thesis", owner);
        REQUIRE(r.is_ok());
        return std::move(r).value();
    }

    Branch branch(const std::string& name) {
        BranchCreateRequest req;
        req.project_id = project;
        req.name = name;
        auto r = engine->create_branch(req, owner);
        REQUIRE(r.is_ok());
        return std::move(r).value();
    }
};

} // namespace

TEST_CASE("Engine::open creates the storage root and the index", "[engine]") {
    EngineFixture f;
    REQUIRE(fs::is_directory(f.dir.path / "repos"));
    REQUIRE(fs::exists(f.dir.path / "repos/folio_index.db"));
    REQUIRE(f.engine->config().concurrency.serialize_writes == SerializeScope::Repository);
    // open() is the only way in
    REQUIRE_FALSE(std::is_constructible<Engine, Config>::value);
}

TEST_CASE("Engine::open rejects an unknown log level", "[engine]") {
    TempDir dir;
    Config cfg;
    cfg.storage.root = dir.str();
    cfg.log.level = "chatty";
    auto r = Engine::open(cfg);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FolioError::Config);
}

TEST_CASE("Engine initialize is idempotent", "[engine]") {
    EngineFixture f;
    RepositoryInit first = f.init();
    RepositoryInit second = f.init();
    REQUIRE(first.main_branch_id == second.main_branch_id);
    REQUIRE(first.repo_path == second.repo_path);
    REQUIRE(fs::is_directory(fs::path(first.repo_path) / ".git"));
}

TEST_CASE("Engine file round trip on a branch", "[engine]") {
    EngineFixture f;
    f.init();
    Branch draft = f.branch("draft");

    auto w = f.engine->write_file(draft.id, "chapters/intro.tex", "Hello", std::nullopt,
                                  f.owner);
    REQUIRE(w.is_ok());
    auto r = f.engine->read_file(draft.id, "chapters/intro.tex", f.owner);
    REQUIRE(r.value().content == "Hello");

    auto summary = f.engine->get_branch(draft.id, f.owner);
    REQUIRE(summary.is_ok());
    REQUIRE(summary.value().file_count == 1);
    REQUIRE(summary.value().permissions == PermissionFlags::full());
    REQUIRE(summary.value().branch.head_commit == w.value().commit_hash);

    auto files = f.engine->list_files(draft.id, f.owner);
    REQUIRE(files.value().size() == 3);

    auto del = f.engine->delete_file(draft.id, "chapters/intro.tex", std::nullopt, f.owner);
    REQUIRE(del.is_ok());
    REQUIRE(f.engine->get_branch(draft.id, f.owner).value().file_count == 0);
}

TEST_CASE("Engine branch listing and deletion", "[engine]") {
    EngineFixture f;
    f.init();
    Branch draft = f.branch("draft");
    f.branch("review");

    auto page = f.engine->list_branches(f.project, f.owner);
    REQUIRE(page.is_ok());
    REQUIRE(page.value().total == 3);

    BranchUpdate update;
    update.description = "first pass";
    REQUIRE(f.engine->update_branch(draft.id, update, f.owner).value().description ==
            "first pass");

    REQUIRE(f.engine->delete_branch(draft.id, f.owner).is_ok());
    REQUIRE(f.engine->get_branch(draft.id, f.owner).error().code == FolioError::NotFound);
    REQUIRE(f.engine->list_branches(f.project, f.owner).value().total == 2);
}

TEST_CASE("Engine permission changes need admin", "[engine]") {
    EngineFixture f;
    f.init();
    Branch draft = f.branch("draft");
    Actor bob = actor("bob");

    REQUIRE(f.engine->get_branch_permission(draft.id, "bob").value() ==
            PermissionFlags::none());

    auto denied = f.engine->update_branch_permission(draft.id, "carol",
                                                     PermissionFlags{true, false, false}, bob);
    REQUIRE(denied.error().code == FolioError::PermissionDenied);

    REQUIRE(f.engine->update_branch_permission(draft.id, "bob",
                                               PermissionFlags{true, true, false},
                                               f.owner).is_ok());
    REQUIRE(f.engine->get_branch_permission(draft.id, "bob").value() ==
            (PermissionFlags{true, true, false}));
    REQUIRE(f.engine->write_file(draft.id, "bob.tex", "b", std::nullopt, bob).is_ok());

    // Write access does not allow granting
    REQUIRE(f.engine->revoke_branch_permission(draft.id, "owner", bob).error().code ==
            FolioError::PermissionDenied);

    REQUIRE(f.engine->revoke_branch_permission(draft.id, "bob", f.owner).is_ok());
    REQUIRE_FALSE(f.engine->get_branch_permission(draft.id, "bob").value().any());
    REQUIRE(f.engine->write_file(draft.id, "bob.tex", "b2", std::nullopt, bob)
                .error().code == FolioError::PermissionDenied);

    REQUIRE(f.engine->get_branch_permission(new_id(), "bob").error().code ==
            FolioError::NotFound);
}

TEST_CASE("Engine offload runs operations on the io pool", "[engine]") {
    EngineFixture f;
    f.init();
    Branch a = f.branch("a");
    Branch b = f.branch("b");

    std::vector<std::future<Result<WriteResult>>> writes;
    for (int i = 0; i < 4; ++i) {
        const Branch& target = (i % 2 == 0) ? a : b;
        std::string path = "part" + std::to_string(i) + ".tex";
        writes.push_back(f.engine->offload([&f, &target, path] {
            return f.engine->write_file(target.id, path, path, std::nullopt, f.owner);
        }));
    }
    for (auto& w : writes) {
        auto r = w.get();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.value().index_stale);
    }

    REQUIRE(f.engine->get_branch(a.id, f.owner).value().file_count == 2);
    REQUIRE(f.engine->get_branch(b.id, f.owner).value().file_count == 2);
    auto on_a = f.engine->read_file(a.id, "part0.tex", f.owner);
    REQUIRE(on_a.value().content == "part0.tex");
    REQUIRE(f.engine->read_file(a.id, "part1.tex", f.owner).error().code ==
            FolioError::NotFound);
}

TEST_CASE("Branch-scoped concurrent writes stay on their branch", "[engine]") {
    EngineFixture f(SerializeScope::Branch);
    auto init = f.init();
    Branch draft = f.branch("draft");

    std::vector<std::future<Result<WriteResult>>> writes;
    for (int i = 0; i < 10; ++i) {
        std::string n = std::to_string(i);
        writes.push_back(f.engine->offload([&f, &init, n] {
            return f.engine->write_file(init.main_branch_id, "main_" + n + ".tex", n,
                                        std::nullopt, f.owner);
        }));
        writes.push_back(f.engine->offload([&f, &draft, n] {
            return f.engine->write_file(draft.id, "draft_" + n + ".tex", n,
                                        std::nullopt, f.owner);
        }));
    }
    for (auto& w : writes) REQUIRE(w.get().is_ok());

    auto on_main = f.engine->list_files(init.main_branch_id, f.owner);
    REQUIRE(on_main.is_ok());
    for (const auto& e : on_main.value()) {
        INFO(e.path);
        REQUIRE(e.path.rfind("draft_", 0) != 0);
    }
    auto on_draft = f.engine->list_files(draft.id, f.owner);
    REQUIRE(on_draft.is_ok());
    int draft_files = 0;
    for (const auto& e : on_draft.value()) {
        INFO(e.path);
        REQUIRE(e.path.rfind("main_", 0) != 0);
        if (e.path.rfind("draft_", 0) == 0) ++draft_files;
    }
    REQUIRE(draft_files == 10);
}

TEST_CASE("Engine sub-project lifecycle", "[engine]") {
    EngineFixture f;
    f.init();
    Branch draft = f.branch("draft");

    auto created = f.engine->create_subproject(draft.id, "paper", "report", {}, f.owner);
    REQUIRE(created.is_ok());
    REQUIRE(created.value().id == f.project + "_paper");

    auto listed = f.engine->list_subprojects(draft.id, f.owner);
    REQUIRE(listed.is_ok());
    REQUIRE(listed.value().size() == 1);
    REQUIRE(f.engine->get_subproject(draft.id, created.value().id, f.owner).is_ok());
    REQUIRE(f.engine->get_branch(draft.id, f.owner).value().file_count == 1);

    auto deleted = f.engine->delete_subproject(draft.id, "paper", std::nullopt, f.owner);
    REQUIRE(deleted.is_ok());
    REQUIRE(f.engine->list_subprojects(draft.id, f.owner).value().empty());
    REQUIRE(f.engine->get_subproject(draft.id, "paper", f.owner).error().code ==
            FolioError::NotFound);
}

TEST_CASE("Engine compilation lifecycle", "[engine]") {
    EngineFixture f;
    f.init();
    Branch draft = f.branch("draft");
    REQUIRE(f.engine->write_file(draft.id, "main.tex", "doc", std::nullopt, f.owner).is_ok());

    CompileRequest req;
    req.branch_id = draft.id;
    req.engine = f.engine->config().compile.engines.front();
    auto job = f.engine->submit_compilation(req, f.owner);
    REQUIRE(job.is_ok());
    const std::string job_id = job.value().job_id;

    auto done = f.engine->monitor_compilation(f.project, job_id, std::chrono::seconds(20),
                                              f.owner);
    REQUIRE(done.is_ok());
    REQUIRE(done.value().status == JobStatus::Completed);

    auto artifact = f.engine->compiled_artifact(f.project, job_id, f.owner);
    REQUIRE(artifact.is_ok());
    REQUIRE(artifact.value().download_name == "main_" + job_id.substr(0, 8) + ".pdf");

    auto status = f.engine->compilation_status(f.project, job_id, f.owner);
    REQUIRE(status.value().status == JobStatus::Completed);

    // Terminal jobs stay terminal, and strangers cannot touch them
    REQUIRE(f.engine->mark_compilation_failed(f.project, job_id, "x", actor("eve"))
                .error().code == FolioError::PermissionDenied);
    REQUIRE(f.engine->mark_compilation_timeout(f.project, job_id, f.owner).value().status ==
            JobStatus::Completed);

    REQUIRE(f.engine->compilation_history(f.project).value().size() == 1);
    REQUIRE(f.engine->prune_compilations(f.project, std::chrono::seconds(0)).value() == 1);
    REQUIRE(f.engine->compilation_history(f.project).value().empty());
}
