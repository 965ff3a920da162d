#include <catch2/catch.hpp>
#include <pinion/version.hpp>

#include <set>

using namespace pinion;

static Version v(const std::string& s) {
    auto r = Version::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Parsing =====

TEST_CASE("parse release segments", "[version]") {
    auto r = v("1.2.3");
    REQUIRE(r.release == std::vector<uint64_t>{1, 2, 3});
    REQUIRE(r.epoch == 0);
    REQUIRE_FALSE(r.is_prerelease());
    REQUIRE(r.to_string() == "1.2.3");
}

TEST_CASE("parse epoch, pre, post, dev and local", "[version]") {
    auto r = v("2!1.0rc2.post3.dev4+ubuntu-1");
    REQUIRE(r.epoch == 2);
    REQUIRE(r.release == std::vector<uint64_t>{1, 0});
    REQUIRE(r.pre_label == "rc");
    REQUIRE(r.pre_number == 2);
    REQUIRE(r.post == 3u);
    REQUIRE(r.dev == 4u);
    REQUIRE(r.local == "ubuntu.1");
    REQUIRE(r.to_string() == "2!1.0rc2.post3.dev4+ubuntu.1");
}

TEST_CASE("alternate spellings normalize", "[version]") {
    REQUIRE(v("1.0alpha1").to_string() == "1.0a1");
    REQUIRE(v("1.0-beta.2").to_string() == "1.0b2");
    REQUIRE(v("1.0c1").to_string() == "1.0rc1");
    REQUIRE(v("1.0-1").to_string() == "1.0.post1");
    REQUIRE(v("v1.4").to_string() == "1.4");
    REQUIRE(v("1.0.DEV2").to_string() == "1.0.dev2");
}

TEST_CASE("malformed versions", "[version]") {
    REQUIRE(Version::parse("").is_err());
    REQUIRE(Version::parse("abc").is_err());
    REQUIRE(Version::parse("1.0+").is_err());
    REQUIRE(Version::parse("1.0 final").is_err());
    auto r = Version::parse("1..0");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Version);
}

TEST_CASE("numbers past 64 bits are rejected", "[version]") {
    REQUIRE(v("18446744073709551615").release == std::vector<uint64_t>{18446744073709551615u});

    auto wrapped = Version::parse("18446744073709551617");
    REQUIRE(wrapped.is_err());
    REQUIRE(wrapped.error().code == PinionError::Version);

    REQUIRE(Version::parse("3.99999999999999999999999").has_error(PinionError::Version));
    REQUIRE(Version::parse("1.0.post99999999999999999999").has_error(PinionError::Version));
    REQUIRE(Version::parse("99999999999999999999!1.0").has_error(PinionError::Version));

    auto segments = tuplize("3.99999999999999999999999");
    REQUIRE(segments.is_err());
    REQUIRE(segments.error().code == PinionError::Version);
    REQUIRE(tuplize("18446744073709551615.*").value() ==
            std::vector<uint64_t>{18446744073709551615u});
}

TEST_CASE("pre and post release flags", "[version]") {
    REQUIRE(v("1.0a1").is_prerelease());
    REQUIRE(v("1.0.dev1").is_prerelease());
    REQUIRE_FALSE(v("1.0.post1").is_prerelease());
    REQUIRE(v("1.0.post1").is_postrelease());
    REQUIRE(v("1.0rc1.post1").base().to_string() == "1.0");
}

// ===== Ordering =====

TEST_CASE("trailing zeros do not matter", "[version]") {
    REQUIRE(v("1.0") == v("1.0.0"));
    REQUIRE(v("1") == v("1.0"));
    REQUIRE(v("1.0.1") > v("1.0"));
}

TEST_CASE("PEP 440 suffix ordering", "[version]") {
    std::vector<std::string> ascending = {
        "1.0.dev1", "1.0a1", "1.0a2.dev1", "1.0a2", "1.0b1", "1.0rc1",
        "1.0", "1.0.post1.dev1", "1.0.post1", "1.1",
    };
    for (size_t i = 0; i + 1 < ascending.size(); ++i) {
        INFO(ascending[i] << " < " << ascending[i + 1]);
        REQUIRE(v(ascending[i]) < v(ascending[i + 1]));
    }
}

TEST_CASE("epoch dominates release", "[version]") {
    REQUIRE(v("1!0.1") > v("99.0"));
}

TEST_CASE("local labels break ties after the public version", "[version]") {
    REQUIRE(v("1.0+abc") != v("1.0"));
    REQUIRE(v("1.0+abc").compare(v("1.0")) == 0);
    REQUIRE(v("1.0") < v("1.0+abc"));
    REQUIRE(v("1.0+abc") < v("1.1"));

    // Numeric segments sort after alphanumeric ones, and numerically
    REQUIRE(v("1.0+abc") < v("1.0+5"));
    REQUIRE(v("1.0+9") < v("1.0+10"));
    REQUIRE(v("1.0+ubuntu") < v("1.0+ubuntu.1"));
    REQUIRE(v("1.0+ubuntu-1") == v("1.0+ubuntu.1"));
}

TEST_CASE("sets keep every local variant", "[version]") {
    std::set<Version> versions{v("1.0+a"), v("1.0+b"), v("1.0"), v("1.0+a")};
    REQUIRE(versions.size() == 3);
    REQUIRE(versions.begin()->to_string() == "1.0");
    REQUIRE(versions.rbegin()->to_string() == "1.0+b");
}

TEST_CASE("segment reads zero past the end", "[version]") {
    auto r = v("3.9");
    REQUIRE(r.segment(0) == 3);
    REQUIRE(r.segment(1) == 9);
    REQUIRE(r.segment(2) == 0);
}

// ===== Tuples =====

TEST_CASE("tuplize stops at a wildcard", "[version]") {
    REQUIRE(tuplize("3.7.*").value() == std::vector<uint64_t>{3, 7});
    REQUIRE(tuplize("2").value() == std::vector<uint64_t>{2});
    REQUIRE(tuplize("3.x").is_err());
    REQUIRE(tuplize("").is_err());
    REQUIRE(join_version({3, 10}) == "3.10");
}
