#include <catch2/catch.hpp>
#include <pinion/resolver.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace pinion;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;

    TempDir() {
        const char* src = std::getenv("PINION_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("pinion_resolve_test_" + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};

std::string fixture_path(const std::string& name) {
    const char* src = std::getenv("PINION_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures/" + name;
    return "../tests/fixtures/" + name;
}

StaticIndex fixture_index() {
    auto index = StaticIndex::load(fixture_path("index.toml"));
    REQUIRE(index.is_ok());
    return std::move(index).value();
}

Version v(const std::string& s) {
    return Version::parse(s).value();
}

Requirement req(const std::string& line) {
    auto r = Requirement::from_line(line);
    REQUIRE(r.is_ok());
    return r.value();
}

std::string pinned_line(const ResolvedSet& set, const std::string& name) {
    auto it = set.find(name);
    REQUIRE(it != set.end());
    return it->second.requirement.to_line(false);
}

// Checks out nothing; every revision is "abc123"
struct StubBackend : VcsBackend {
    int* obtained;
    explicit StubBackend(int* counter) : obtained(counter) {}

    Status obtain(const std::string&, const std::string&) override {
        ++*obtained;
        return ok_status();
    }
    Status update(const std::string&, const std::string&, const std::string&) override {
        return ok_status();
    }
    Result<std::string> revision(const std::string&) override {
        return Result<std::string>::ok("abc123");
    }
    Result<bool> is_at_ref(const std::string&, const std::string&) override {
        return Result<bool>::ok(true);
    }
    bool is_repository(const std::string&) override { return *obtained > 0; }
};

} // anonymous namespace

// ===== AbstractDependency =====

TEST_CASE("dependency from published versions", "[resolver]") {
    std::vector<Version> available = {v("2.0"), v("1.5"), v("1.0")};
    auto dep = AbstractDependency::from_versions(req("Pkg>=1,<2"), available);
    REQUIRE(dep.is_ok());
    REQUIRE(dep.value().name == "pkg");
    REQUIRE(dep.value().version_set == std::set<Version>{v("1.0"), v("1.5")});
    REQUIRE(dep.value().candidates.size() == 2);
    REQUIRE(dep.value().candidates[0].to_line() == "Pkg==1.5");
    REQUIRE(dep.value().candidates[1].to_line() == "Pkg==1.0");
    REQUIRE_FALSE(dep.value().is_direct());
}

TEST_CASE("local builds of one release stay distinct candidates", "[resolver]") {
    auto dep = AbstractDependency::from_versions(req("pkg==1.0"),
                                                 {v("1.0+cpu"), v("1.0+gpu"), v("0.9")});
    REQUIRE(dep.is_ok());
    REQUIRE(dep.value().version_set.size() == 2);
    REQUIRE(dep.value().candidates.size() == 2);
    REQUIRE(dep.value().candidates[0].to_line() == "pkg==1.0+gpu");
    REQUIRE(dep.value().candidates[1].to_line() == "pkg==1.0+cpu");
}

TEST_CASE("no published version satisfies the specifier", "[resolver]") {
    auto dep = AbstractDependency::from_versions(req("pkg>=3"), {v("2.0"), v("1.0")},
                                                 false, std::string("app"));
    REQUIRE(dep.is_err());
    REQUIRE(dep.error().code == PinionError::Conflict);
    REQUIRE(dep.error().message == "no version of 'pkg' satisfies >=3 (required by app)");
    REQUIRE(dep.error().hint == "available: 2.0 1.0");
}

TEST_CASE("merging narrows the version set", "[resolver]") {
    std::vector<Version> available = {v("2.0"), v("1.5"), v("1.0")};
    auto a = AbstractDependency::from_versions(req("pkg[x]>=1"), available).value();
    auto b = AbstractDependency::from_versions(req("pkg[y]<2"), available).value();

    auto merged = a.merge(b);
    REQUIRE(merged.is_ok());
    const auto& m = merged.value();
    REQUIRE(m.version_set == std::set<Version>{v("1.0"), v("1.5")});
    REQUIRE(m.specifiers.to_string() == ">=1,<2");
    REQUIRE(m.requirement.to_line() == "pkg[x,y]>=1,<2");
    REQUIRE(m.candidates.size() == 2);
    REQUIRE(m.candidates[0].to_line() == "pkg[x,y]==1.5");
}

TEST_CASE("merging disjoint constraints is a conflict", "[resolver]") {
    std::vector<Version> available = {v("2.0"), v("1.0")};
    auto a = AbstractDependency::from_versions(req("pkg==1.0"), available, false,
                                               std::string("left")).value();
    auto b = AbstractDependency::from_versions(req("pkg==2.0"), available, false,
                                               std::string("right")).value();

    auto merged = a.merge(b);
    REQUIRE(merged.is_err());
    REQUIRE(merged.error().code == PinionError::Conflict);
    REQUIRE(merged.error().message ==
            "conflicting requirements for 'pkg': ==1.0 (required by left) and "
            "==2.0 (required by right)");
}

TEST_CASE("a direct source wins over an index constraint", "[resolver]") {
    auto named = AbstractDependency::from_versions(req("pkg[a]>=1"), {v("1.0")}).value();
    auto direct = AbstractDependency::direct(req("./vendor/pkg#egg=pkg"));
    REQUIRE(direct.is_direct());

    for (const auto& merged : {named.merge(direct), direct.merge(named)}) {
        REQUIRE(merged.is_ok());
        REQUIRE(merged.value().is_direct());
        REQUIRE(merged.value().candidates.size() == 1);
        REQUIRE(merged.value().requirement.to_line() == "./vendor/pkg#egg=pkg[a]");
    }
}

TEST_CASE("an unconditional constraint absorbs a conditional one", "[resolver]") {
    std::vector<Version> available = {v("1.0")};
    auto always = AbstractDependency::from_versions(req("pkg"), available).value();
    auto sometimes = AbstractDependency::from_versions(
        req("pkg; os_name == 'nt'"), available).value();
    REQUIRE_FALSE(always.merge(sometimes).value().markers);

    auto other = AbstractDependency::from_versions(
        req("pkg; sys_platform == 'darwin'"), available).value();
    auto either = sometimes.merge(other).value();
    REQUIRE(either.markers);
    REQUIRE(either.markers->to_string() == "os_name == 'nt' or sys_platform == 'darwin'");
}

// ===== End-to-end resolution =====

TEST_CASE("resolve picks the newest compatible versions", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));

    auto r = resolver.resolve({std::string("pkg-a")});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(pinned_line(r.value(), "pkg-a") == "pkg-a==2.0");
    REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==3.0");

    const auto& b = r.value().at("pkg-b");
    REQUIRE(b.hashes == std::set<std::string>{"sha256:b300", "sha256:b300-wheel"});
    REQUIRE(b.requirement.to_line() ==
            "pkg-b==3.0 --hash=sha256:b300 --hash=sha256:b300-wheel");
}

TEST_CASE("requires_python and markers follow the target interpreter", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.8"));

    auto r = resolver.resolve({std::string("pkg-a")});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
    REQUIRE(pinned_line(r.value(), "pkg-a") == "pkg-a==1.5");
    REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==3.0");
    REQUIRE(pinned_line(r.value(), "pkg-c") == "pkg-c==0.9; python_version < '3.9'");
}

TEST_CASE("root markers follow the interpreter", "[resolver]") {
    StaticIndex index;
    for (const char* v : {"1.0", "1.5", "2.0"}) REQUIRE(index.add_release("pkg-a", v).is_ok());
    REQUIRE(index.add_release("pkg-b", "3.0").is_ok());
    std::vector<RequirementInput> roots = {
        std::string("pkg-a>=1,<2"),
        std::string("pkg-b==3.0; python_version>='3.9'"),
    };

    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve(roots);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        REQUIRE(pinned_line(r.value(), "pkg-a") == "pkg-a==1.5");
        REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==3.0; python_version >= '3.9'");
    }
    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.8"));
        auto r = resolver.resolve(roots);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 1);
        REQUIRE(pinned_line(r.value(), "pkg-a") == "pkg-a==1.5");
    }
}

TEST_CASE("resolution records its rounds", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));

    REQUIRE(resolver.resolve({std::string("pkg-a")}).is_ok());
    const auto& state = resolver.state();
    REQUIRE(state.history.size() == 4);
    REQUIRE(state.history.front().size() == 1);
    REQUIRE(state.pinned.size() == 2);
    REQUIRE(state.constraints.count("pkg-b") == 1);
    REQUIRE(state.constraints.at("pkg-b").parent == std::optional<std::string>("pkg-a"));
}

// Known limitation: "stable" means no new pins once round 3 is reached, not
// a proven fixpoint. A package pinned later than that would be missed.
TEST_CASE("stability is declared by round count", "[resolver][convergence]") {
    auto index = fixture_index();
    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        REQUIRE(resolver.resolve({std::string("pkg-b")}, 4).is_ok());
        REQUIRE(resolver.state().history.size() == 4);
        REQUIRE((resolver.state().history[1] == resolver.state().history[3]));
    }
    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("pkg-b")}, 3);
        REQUIRE(r.has_error(PinionError::NoConvergence));
        REQUIRE(resolver.state().history.size() == 3);
    }
}

TEST_CASE("too few rounds fail to converge", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));

    auto r = resolver.resolve({std::string("pkg-b")}, 3);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::NoConvergence);
    REQUIRE(r.error().hint.find("--max-rounds") != std::string::npos);
}

TEST_CASE("a resolver runs once", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    REQUIRE(resolver.resolve({std::string("pkg-b")}).is_ok());

    auto again = resolver.resolve({std::string("pkg-b")});
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == PinionError::InvalidArg);
}

TEST_CASE("roots whose markers do not match are skipped", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));

    auto r = resolver.resolve({std::string("pkg-a; python_version < '3'"),
                               req("pkg-b==2.0")});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==2.0");
}

TEST_CASE("conflicting sub-dependencies", "[resolver]") {
    StaticIndex index;
    REQUIRE(index.add_release("left", "1.0", {"shared==1.0"}).is_ok());
    REQUIRE(index.add_release("right", "1.0", {"shared==2.0"}).is_ok());
    REQUIRE(index.add_release("shared", "1.0").is_ok());
    REQUIRE(index.add_release("shared", "2.0").is_ok());

    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    auto r = resolver.resolve({std::string("left"), std::string("right")});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Conflict);
    REQUIRE(r.error().message.find("conflicting requirements for 'shared'") != std::string::npos);
}

TEST_CASE("conflicting roots fail while seeding", "[resolver]") {
    StaticIndex index;
    REQUIRE(index.add_release("shared", "1.0").is_ok());
    REQUIRE(index.add_release("shared", "2.0").is_ok());

    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    auto r = resolver.resolve({std::string("shared==1.0"), std::string("shared==2.0")});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Conflict);
    REQUIRE(resolver.state().history.empty());
}

TEST_CASE("backtracking falls back to an older candidate", "[resolver]") {
    StaticIndex index;
    REQUIRE(index.add_release("tool", "2.0", {"shared==2.0"}).is_ok());
    REQUIRE(index.add_release("tool", "1.0", {"shared==1.0"}).is_ok());
    REQUIRE(index.add_release("shared", "1.0").is_ok());
    REQUIRE(index.add_release("shared", "2.0").is_ok());

    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    auto r = resolver.resolve({std::string("shared==1.0"), std::string("tool")});
    REQUIRE(r.is_ok());
    REQUIRE(pinned_line(r.value(), "tool") == "tool==1.0");
    REQUIRE(pinned_line(r.value(), "shared") == "shared==1.0");
}

TEST_CASE("a candidate with unreadable metadata is skipped", "[resolver]") {
    StaticIndex index;
    REQUIRE(index.add_release("app", "2.0", {"not a requirement !!"}).is_ok());
    REQUIRE(index.add_release("app", "1.0").is_ok());

    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    auto r = resolver.resolve({std::string("app")});
    REQUIRE(r.is_ok());
    REQUIRE(pinned_line(r.value(), "app") == "app==1.0");
}

TEST_CASE("unknown and unsatisfiable roots", "[resolver]") {
    auto index = fixture_index();
    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("no-such-package")});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::NotFound);
    }
    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("pkg-b>=9")});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::Conflict);
    }
    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("pkg-b 3.0")});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinionError::Unparsable);
    }
}

TEST_CASE("extras pull in gated dependencies", "[resolver]") {
    StaticIndex index;
    REQUIRE(index.add_release("web", "1.0", {"six", "gunicorn; extra == 'server'"}).is_ok());
    REQUIRE(index.add_release("six", "1.16").is_ok());
    REQUIRE(index.add_release("gunicorn", "21.2").is_ok());

    SECTION("without the extra") {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("web")});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        REQUIRE(r.value().count("gunicorn") == 0);
    }
    SECTION("with the extra") {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("web[server]")});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 3);
        REQUIRE(pinned_line(r.value(), "gunicorn") == "gunicorn==21.2");
        REQUIRE(pinned_line(r.value(), "web") == "web[server]==1.0");
    }
}

TEST_CASE("pre-releases only when allowed", "[resolver]") {
    StaticIndex index;
    REQUIRE(index.add_release("lib", "1.0").is_ok());
    REQUIRE(index.add_release("lib", "2.0b1").is_ok());

    {
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
        auto r = resolver.resolve({std::string("lib")});
        REQUIRE(pinned_line(r.value(), "lib") == "lib==1.0");
    }
    {
        ResolveOptions options;
        options.allow_prereleases = true;
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"), options);
        auto r = resolver.resolve({std::string("lib")});
        REQUIRE(pinned_line(r.value(), "lib") == "lib==2.0b1");
    }
}

TEST_CASE("a prepared abstract dependency can seed the resolver", "[resolver]") {
    auto index = fixture_index();
    auto dep = AbstractDependency::from_versions(req("pkg-b<3"), {v("3.0"), v("2.0")});
    REQUIRE(dep.is_ok());

    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    auto r = resolver.resolve({dep.value()});
    REQUIRE(r.is_ok());
    REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==2.0");
}

// ===== Direct sources =====

TEST_CASE("local project names itself from pyproject.toml", "[resolver]") {
    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));

    std::string dir = fixture_path("local_pkg");
    auto r = resolver.resolve({std::string("-e " + dir)});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);

    const auto& local = r.value().at("local-pkg");
    REQUIRE(local.requirement.is_editable());
    REQUIRE(local.hashes.empty());
    REQUIRE(local.requirement.to_line() == "-e " + dir + "#egg=local-pkg");
    REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==3.0");
}

TEST_CASE("unnamed source without metadata cannot be resolved", "[resolver]") {
    TempDir tmp;
    StaticIndex index;
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    auto r = resolver.resolve({std::string((tmp.path / "missing").string())});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Unparsable);
}

TEST_CASE("local archives are hashed from disk", "[resolver]") {
    TempDir tmp;
    tmp.write_file("dist/thing-1.0.tar.gz", "abc");
    StaticIndex index;
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));

    std::string archive = (tmp.path / "dist" / "thing-1.0.tar.gz").string();
    auto r = resolver.resolve({std::string(archive + "#egg=thing")});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().at("thing").hashes == std::set<std::string>{
        "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"});
}

TEST_CASE("VCS requirements are pinned to a revision", "[resolver]") {
    TempDir tmp;
    tmp.write_file("src/tool/pyproject.toml",
                   "[project]\nname = \"tool\"\ndependencies = [\"pkg-b==2.0\"]\n");

    int obtained = 0;
    VcsGateway gateway;
    gateway.register_backend(VcsKind::Git, std::make_unique<StubBackend>(&obtained));

    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    resolver.set_vcs(&gateway, (tmp.path / "src").string());

    auto r = resolver.resolve({std::string("git+https://example.com/org/tool.git@main#egg=tool")});
    REQUIRE(r.is_ok());
    REQUIRE(obtained == 1);

    const auto& tool = r.value().at("tool");
    REQUIRE(*tool.requirement.as_vcs()->ref == "abc123");
    REQUIRE(tool.hashes.empty());
    REQUIRE(tool.requirement.to_line() == "git+https://example.com/org/tool.git@abc123#egg=tool");
    REQUIRE(pinned_line(r.value(), "pkg-b") == "pkg-b==2.0");
}

// ===== Hashes =====

TEST_CASE("hashes come from the cache when present", "[resolver]") {
    TempDir tmp;
    HashCache cache;
    REQUIRE(cache.open((tmp.path / "hashes.db").string()).is_ok());
    REQUIRE(cache.store(HashCache::package_key("pkg-b", "3.0"), {"sha256:cached"}).is_ok());

    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    resolver.set_hash_cache(&cache);

    auto r = resolver.resolve({std::string("pkg-b")});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().at("pkg-b").hashes == std::set<std::string>{"sha256:cached"});
}

TEST_CASE("hashes fetched from the index are cached", "[resolver]") {
    TempDir tmp;
    HashCache cache;
    REQUIRE(cache.open((tmp.path / "hashes.db").string()).is_ok());

    auto index = fixture_index();
    Resolver resolver(index, MarkerEnvironment::for_python("3.9"));
    resolver.set_hash_cache(&cache);

    REQUIRE(resolver.resolve({std::string("pkg-b==2.0")}).is_ok());
    REQUIRE(cache.lookup("pkg-b==2.0").value() == std::vector<std::string>{"sha256:b200"});
}

TEST_CASE("hash collection can be disabled or run in parallel", "[resolver]") {
    auto index = fixture_index();
    {
        ResolveOptions options;
        options.collect_hashes = false;
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"), options);
        auto r = resolver.resolve({std::string("pkg-a")});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().at("pkg-a").hashes.empty());
    }
    {
        ResolveOptions options;
        options.parallel_hashes = true;
        Resolver resolver(index, MarkerEnvironment::for_python("3.9"), options);
        auto r = resolver.resolve({std::string("pkg-a")});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().at("pkg-a").hashes == std::set<std::string>{"sha256:a200"});
        REQUIRE(r.value().at("pkg-b").hashes.size() == 2);
    }
}
