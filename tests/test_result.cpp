#include <catch2/catch.hpp>
#include <pinion/result.hpp>
#include <memory>
#include <string>

using namespace pinion;

static Result<int> parse_digit(char c) {
    if (c < '0' || c > '9') {
        return PinionError{PinionError::Parse, std::string("not a digit: ") + c};
    }
    return Result<int>::ok(c - '0');
}

// Two digits through PINION_TRY; the first failure wins
static Result<int> parse_pair(const std::string& s) {
    auto hi = parse_digit(s.at(0));
    PINION_TRY(hi);
    auto lo = parse_digit(s.at(1));
    PINION_TRY(lo);
    return Result<int>::ok(hi.value() * 10 + lo.value());
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(PinionError{PinionError::NotFound, "no such package"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == PinionError::NotFound);
    REQUIRE(r.error().message == "no such package");
}

TEST_CASE("Errors convert implicitly into any Result", "[result]") {
    Result<std::string> r = PinionError{PinionError::Conflict, "pkg"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Conflict);
}

TEST_CASE("Wrong accessor throws bad_variant_access", "[result]") {
    auto err = Result<int>::err(PinionError{PinionError::IO, "fail"});
    REQUIRE_THROWS_AS(err.value(), std::bad_variant_access);
    auto ok = Result<int>::ok(1);
    REQUIRE_THROWS_AS(ok.error(), std::bad_variant_access);
}

TEST_CASE("map and and_then", "[result]") {
    SECTION("map transforms an Ok value") {
        auto r = Result<int>::ok(5).map([](int x) { return std::to_string(x); });
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == "5");
    }

    SECTION("map skips an Err") {
        bool called = false;
        auto r = Result<int>::err(PinionError{PinionError::Parse, "bad"})
                     .map([&](int x) { called = true; return x; });
        REQUIRE(r.is_err());
        REQUIRE_FALSE(called);
    }

    SECTION("and_then chains fallible steps") {
        auto r = Result<int>::ok(7).and_then([](int x) {
            return parse_digit(static_cast<char>('0' + x));
        });
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == 7);
    }

    SECTION("and_then short-circuits") {
        auto r = Result<int>::err(PinionError{PinionError::Version, "bad"})
                     .and_then([](int x) { return Result<int>::ok(x + 1); });
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::Version);
    }
}

TEST_CASE("or_else recovers from an Err", "[result]") {
    auto r = Result<int>::err(PinionError{PinionError::Network, "timeout"});
    auto recovered = r.or_else([](PinionError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);

    auto kept = Result<int>::ok(3).or_else([](PinionError&) { return Result<int>::ok(0); });
    REQUIRE(kept.value() == 3);
}

TEST_CASE("map_err rewrites the error only", "[result]") {
    auto r = Result<int>::err(PinionError{PinionError::Parse, "bad marker"});
    auto prefixed = r.map_err([](PinionError e) {
        e.message = "in 'foo': " + e.message;
        return e;
    });
    REQUIRE(prefixed.error().message == "in 'foo': bad marker");

    auto ok = Result<int>::ok(1).map_err([](PinionError e) { return e; });
    REQUIRE(ok.value() == 1);
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(4).value_or(9) == 4);
    REQUIRE(Result<int>::err(PinionError{PinionError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("PINION_TRY propagates the first failure", "[result]") {
    REQUIRE(parse_pair("42").value() == 42);

    auto first = parse_pair("x2");
    REQUIRE(first.is_err());
    REQUIRE(first.error().message == "not a digit: x");

    auto second = parse_pair("4y");
    REQUIRE(second.is_err());
    REQUIRE(second.error().message == "not a digit: y");
}

TEST_CASE("Status", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(PinionError{PinionError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == PinionError::Config);
}

TEST_CASE("Result with a move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    std::unique_ptr<int> taken = std::move(r).value();
    REQUIRE(*taken == 99);
}

TEST_CASE("PinionError format", "[error]") {
    SECTION("with hint and location") {
        PinionError e{PinionError::Manifest, "bad entry", "check the table", "Pipfile", 12};
        auto text = e.format();
        REQUIRE(text.find("error[Manifest]: bad entry") != std::string::npos);
        REQUIRE(text.find("hint: check the table") != std::string::npos);
        REQUIRE(text.find("--> Pipfile:12") != std::string::npos);
    }

    SECTION("file without a line number") {
        PinionError e{PinionError::IO, "unreadable", "", "Pipfile.lock", 0};
        auto text = e.format();
        REQUIRE(text.find("--> Pipfile.lock") != std::string::npos);
        REQUIRE(text.find("Pipfile.lock:") == std::string::npos);
    }

    SECTION("message only") {
        PinionError e{PinionError::Parse, "unexpected ';'"};
        auto text = e.format();
        REQUIRE(text == "error[Parse]: unexpected ';'");
    }
}

TEST_CASE("PinionError code names", "[error]") {
    REQUIRE(std::string(PinionError::code_name(PinionError::Unparsable)) == "Unparsable");
    REQUIRE(std::string(PinionError::code_name(PinionError::MissingEgg)) == "MissingEgg");
    REQUIRE(std::string(PinionError::code_name(PinionError::Conflict)) == "Conflict");
    REQUIRE(std::string(PinionError::code_name(PinionError::NoConvergence)) == "NoConvergence");
    REQUIRE(std::string(PinionError::code_name(PinionError::Unreachable)) == "Unreachable");
    REQUIRE(std::string(PinionError::code_name(PinionError::InvalidRef)) == "InvalidRef");
    REQUIRE(std::string(PinionError::code_name(PinionError::Corrupt)) == "Corrupt");
    REQUIRE(std::string(PinionError::code_name(PinionError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("VCS errors are grouped", "[error]") {
    REQUIRE(PinionError{PinionError::Unreachable, ""}.is_vcs_error());
    REQUIRE(PinionError{PinionError::InvalidRef, ""}.is_vcs_error());
    REQUIRE(PinionError{PinionError::Corrupt, ""}.is_vcs_error());
    REQUIRE_FALSE(PinionError{PinionError::Conflict, ""}.is_vcs_error());
    REQUIRE_FALSE(PinionError{PinionError::IO, ""}.is_vcs_error());
}

TEST_CASE("has_error checks the code of an Err", "[result]") {
    Result<int> ok = Result<int>::ok(1);
    Result<int> missing = PinionError{PinionError::NotFound, "no such key"};
    REQUIRE_FALSE(ok.has_error(PinionError::NotFound));
    REQUIRE(missing.has_error(PinionError::NotFound));
    REQUIRE_FALSE(missing.has_error(PinionError::IO));
}

TEST_CASE("prefix names where an error happened", "[error]") {
    PinionError e{PinionError::Parse, "unexpected ')'", "check the marker"};
    e.prefix("in entry 'six'");
    REQUIRE(e.message == "in entry 'six': unexpected ')'");
    REQUIRE(e.code == PinionError::Parse);
    REQUIRE(e.hint == "check the marker");
}
