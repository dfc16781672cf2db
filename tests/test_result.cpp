#include <catch2/catch.hpp>
#include <folio/result.hpp>
#include <memory>
#include <string>

using namespace folio;

static Result<int> try_double(Result<int> input) {
    FOLIO_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status try_steps(bool fail_second, int& reached) {
    FOLIO_TRY(ok_status());
    reached = 1;
    FOLIO_TRY(fail_second ? Status(FolioError{FolioError::Conflict, "second failed"})
                          : ok_status());
    reached = 2;
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Implicit construction from FolioError", "[result]") {
    Result<std::string> r = FolioError{FolioError::NotFound, "missing branch"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FolioError::NotFound);
    REQUIRE(r.error().message == "missing branch");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(FolioError{FolioError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(FolioError{FolioError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("map() and and_then()", "[result]") {
    auto mapped = Result<int>::ok(5).map([](int x) { return std::to_string(x); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "5");

    bool called = false;
    auto r = Result<int>::err(FolioError{FolioError::Parse, "bad input"});
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 1);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == FolioError::Parse);
}

TEST_CASE("FOLIO_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(FolioError{FolioError::Database, "locked"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == FolioError::Database);

    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("FOLIO_TRY stops at the first failing step", "[result]") {
    int reached = 0;
    auto s = try_steps(true, reached);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == FolioError::Conflict);
    REQUIRE(reached == 1);

    reached = 0;
    REQUIRE(try_steps(false, reached).is_ok());
    REQUIRE(reached == 2);
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    std::unique_ptr<int> p = std::move(r).value();
    REQUIRE(*p == 99);
}

TEST_CASE("FolioError format() output", "[error]") {
    FolioError e{FolioError::Conflict, "path 'docs' is a directory", "pick another name"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Conflict]: path 'docs' is a directory") != std::string::npos);
    REQUIRE(formatted.find("hint: pick another name") != std::string::npos);

    FolioError bare{FolioError::Parse, "unexpected token"};
    REQUIRE(bare.format() == "error[Parse]: unexpected token");
}

TEST_CASE("FolioError code_name() for all codes", "[error]") {
    REQUIRE(std::string(FolioError::code_name(FolioError::NotFound)) == "NotFound");
    REQUIRE(std::string(FolioError::code_name(FolioError::PermissionDenied)) == "PermissionDenied");
    REQUIRE(std::string(FolioError::code_name(FolioError::Conflict)) == "Conflict");
    REQUIRE(std::string(FolioError::code_name(FolioError::ExternalTool)) == "ExternalTool");
    REQUIRE(std::string(FolioError::code_name(FolioError::Validation)) == "Validation");
    REQUIRE(std::string(FolioError::code_name(FolioError::InconsistentState)) == "InconsistentState");
    REQUIRE(std::string(FolioError::code_name(FolioError::IO)) == "IO");
    REQUIRE(std::string(FolioError::code_name(FolioError::Database)) == "Database");
    REQUIRE(std::string(FolioError::code_name(FolioError::Parse)) == "Parse");
    REQUIRE(std::string(FolioError::code_name(FolioError::Config)) == "Config");
    REQUIRE(std::string(FolioError::code_name(FolioError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("Expected errors versus infrastructure failures", "[error]") {
    REQUIRE(FolioError{FolioError::PermissionDenied, ""}.is_expected());
    REQUIRE(FolioError{FolioError::Validation, ""}.is_expected());
    REQUIRE_FALSE(FolioError{FolioError::ExternalTool, ""}.is_expected());
    REQUIRE_FALSE(FolioError{FolioError::Database, ""}.is_expected());
}

TEST_CASE("Result has_code matches only errors", "[result]") {
    Result<int> missing = FolioError{FolioError::NotFound, "no row"};
    REQUIRE(missing.has_code(FolioError::NotFound));
    REQUIRE_FALSE(missing.has_code(FolioError::Conflict));
    REQUIRE_FALSE(Result<int>::ok(1).has_code(FolioError::NotFound));
}

TEST_CASE("with_context prefixes the message and keeps the hint", "[result]") {
    Result<int> r = FolioError{FolioError::Parse, "bad value", "fix line 3"};
    auto wrapped = std::move(r).with_context("folio.toml");
    REQUIRE(wrapped.error().message == "folio.toml: bad value");
    REQUIRE(wrapped.error().hint == "fix line 3");
    REQUIRE(wrapped.error().code == FolioError::Parse);

    auto passed = Result<int>::ok(5).with_context("ignored");
    REQUIRE(passed.value() == 5);
}
