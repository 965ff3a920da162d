#include <catch2/catch.hpp>
#include <pinion/lockfile.hpp>
#include <pinion/sha256.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace pinion;

namespace fs = std::filesystem;

static std::string temp_dir() {
    const char* src = std::getenv("PINION_SOURCE_DIR");
    std::string base = src ? std::string(src) : "..";
    std::string dir = base + "/build/test_lockfile_tmp";
    fs::create_directories(dir);
    return dir;
}

static std::string write_temp_file(const std::string& name,
                                    const std::string& content) {
    std::string path = temp_dir() + "/" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

static std::string fixture_path(const std::string& name) {
    const char* src = std::getenv("PINION_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures/" + name;
    return "../tests/fixtures/" + name;
}

static Pipfile sample_pipfile() {
    auto pf = Pipfile::parse(R"(
[[source]]
name = "pypi"
url = "https://pypi.org/simple"
verify_ssl = true

[packages]
pkg-a = "*"

[dev-packages]
pkg-c = "*"

[requires]
python_version = "3.9"
)");
    REQUIRE(pf.is_ok());
    return pf.value();
}

static ResolvedSet sample_resolution() {
    ResolvedSet set;
    auto a = Requirement::from_line("pkg-a==2.0 --hash=sha256:a200").value();
    auto b = Requirement::from_line(
        "pkg-b==3.0 --hash=sha256:b300 --hash=sha256:b300-wheel").value();
    auto tool = Requirement::from_line(
        "git+https://example.com/org/tool.git@abc123#egg=tool").value();
    set.emplace("pkg-a", ResolvedPackage{a, {"sha256:a200"}});
    set.emplace("pkg-b", ResolvedPackage{b, {"sha256:b300", "sha256:b300-wheel"}});
    set.emplace("tool", ResolvedPackage{tool, {}});
    return set;
}

// ===== Building from a resolution =====

TEST_CASE("lockfile from a resolution", "[lockfile]") {
    auto pf = sample_pipfile();
    auto r = LockFile::from_resolved(pf, sample_resolution());
    REQUIRE(r.is_ok());
    const auto& lock = r.value();

    REQUIRE(lock.pipfile_hash == Sha256::of(pf.to_toml()));
    REQUIRE(lock.pipfile_hash.size() == 64);
    REQUIRE(lock.pipfile_spec == LockFile::PIPFILE_SPEC);
    REQUIRE(lock.sources == pf.sources);
    REQUIRE(lock.python_version == "3.9");
    REQUIRE(lock.develop.empty());

    REQUIRE(lock.default_packages.size() == 3);
    REQUIRE(lock.default_packages.at("pkg-a").version == "==2.0");
    REQUIRE(lock.default_packages.at("pkg-b").hashes ==
            std::vector<std::string>{"sha256:b300", "sha256:b300-wheel"});
    REQUIRE(lock.default_packages.at("tool").vcs == "git");
    REQUIRE(lock.default_packages.at("tool").ref == "abc123");
}

TEST_CASE("development resolution goes to [develop]", "[lockfile]") {
    auto pf = sample_pipfile();
    auto lock = LockFile::from_resolved(pf, sample_resolution()).value();

    ResolvedSet dev;
    dev.emplace("pkg-c", ResolvedPackage{
        Requirement::from_line("pkg-c==0.9 --hash=sha256:c090").value(), {"sha256:c090"}});
    REQUIRE(lock.add_resolved(dev, true).is_ok());
    REQUIRE(lock.develop.size() == 1);
    REQUIRE(lock.default_packages.count("pkg-c") == 0);

    auto reqs = lock.requirements(true);
    REQUIRE(reqs.is_ok());
    REQUIRE(reqs.value().size() == 1);
    REQUIRE(reqs.value()[0].to_line() == "pkg-c==0.9 --hash=sha256:c090");
}

TEST_CASE("unpinned packages cannot be locked", "[lockfile]") {
    ResolvedSet loose;
    loose.emplace("pkg-a", ResolvedPackage{Requirement::from_line("pkg-a>=1").value(), {}});
    auto r = LockFile::from_resolved(sample_pipfile(), loose);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::InvalidArg);
}

// ===== Staleness =====

TEST_CASE("lockfile staleness follows the Pipfile", "[lockfile]") {
    auto pf = sample_pipfile();
    auto lock = LockFile::from_resolved(pf, sample_resolution()).value();
    REQUIRE_FALSE(lock.is_stale(pf));

    SECTION("reformatting the Pipfile does not matter") {
        auto reformatted = Pipfile::parse(R"(
[requires]
python_version = "3.9"
[dev-packages]
"pkg-c" = "*"
[packages]
"pkg-a" = "*"
[[source]]
url = "https://pypi.org/simple"
name = "pypi"
)");
        REQUIRE(reformatted.is_ok());
        REQUIRE_FALSE(lock.is_stale(reformatted.value()));
    }

    SECTION("adding a package does") {
        pf.add(Requirement::from_line("six>=1.16").value());
        REQUIRE(lock.is_stale(pf));
    }

    SECTION("changing the python version does") {
        pf.python_version = "3.10";
        REQUIRE(lock.is_stale(pf));
    }
}

// ===== Text form =====

TEST_CASE("lockfile roundtrip", "[lockfile]") {
    auto lock = LockFile::from_resolved(sample_pipfile(), sample_resolution()).value();

    auto again = LockFile::parse(lock.to_toml());
    REQUIRE(again.is_ok());
    REQUIRE(again.value().pipfile_hash == lock.pipfile_hash);
    REQUIRE(again.value().sources == lock.sources);
    REQUIRE(again.value().python_version == "3.9");
    REQUIRE(again.value().default_packages == lock.default_packages);
    REQUIRE(again.value().to_toml() == lock.to_toml());

    auto reqs = again.value().requirements();
    REQUIRE(reqs.is_ok());
    REQUIRE(reqs.value().size() == 3);
    REQUIRE(reqs.value()[0].to_line() == "pkg-a==2.0 --hash=sha256:a200");
    REQUIRE(reqs.value()[2].to_line() ==
            "git+https://example.com/org/tool.git@abc123#egg=tool");
}

TEST_CASE("save and load lockfile", "[lockfile]") {
    auto lock = LockFile::from_resolved(sample_pipfile(), sample_resolution()).value();
    std::string path = temp_dir() + "/Pipfile.lock";

    REQUIRE(lock.save(path).is_ok());
    auto loaded = LockFile::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().default_packages == lock.default_packages);
    REQUIRE_FALSE(loaded.value().is_stale(sample_pipfile()));

    fs::remove(path);
}

TEST_CASE("load lockfile with a newer spec", "[lockfile]") {
    auto path = write_temp_file("newer.lock", R"(
[_meta]
pipfile-spec = 9

[_meta.hash]
sha256 = "abc"

[default]
six = "==1.16.0"
)");
    auto r = LockFile::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().pipfile_spec == 9);
    REQUIRE(r.value().pipfile_hash == "abc");
    REQUIRE(r.value().default_packages.at("six").version == "==1.16.0");
    REQUIRE(r.value().sources.empty());
}

TEST_CASE("malformed lockfiles", "[lockfile]") {
    SECTION("no _meta table") {
        auto r = LockFile::parse("[default]\nsix = \"==1.16.0\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::Manifest);
        REQUIRE(r.error().hint.find("pinion lock") != std::string::npos);
    }
    SECTION("invalid TOML") {
        auto r = LockFile::parse("[_meta\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::Manifest);
    }
    SECTION("bad record reports the file") {
        auto path = write_temp_file("bad.lock", "[_meta]\n[default]\nsix = 3\n");
        auto r = LockFile::load(path);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::Manifest);
        REQUIRE(r.error().file == path);
    }
    SECTION("missing file") {
        auto r = LockFile::load("/nonexistent/Pipfile.lock");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::IO);
    }
}

// ===== With the resolver =====

TEST_CASE("lock a resolved Pipfile", "[lockfile]") {
    auto index = StaticIndex::load(fixture_path("index.toml"));
    REQUIRE(index.is_ok());
    auto pf = sample_pipfile();

    auto roots = pf.requirements();
    REQUIRE(roots.is_ok());
    std::vector<RequirementInput> inputs(roots.value().begin(), roots.value().end());

    Resolver resolver(index.value(), MarkerEnvironment::for_python(pf.python_version));
    auto resolved = resolver.resolve(inputs);
    REQUIRE(resolved.is_ok());

    auto lock = LockFile::from_resolved(pf, resolved.value());
    REQUIRE(lock.is_ok());
    REQUIRE(lock.value().default_packages.at("pkg-a").version == "==2.0");
    REQUIRE(lock.value().default_packages.at("pkg-a").hashes ==
            std::vector<std::string>{"sha256:a200"});
    REQUIRE(lock.value().default_packages.at("pkg-b").version == "==3.0");
}
