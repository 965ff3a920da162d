#include <catch2/catch.hpp>
#include <pinion/requirement.hpp>

using namespace pinion;

static Requirement req(const std::string& line) {
    auto r = Requirement::from_line(line);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Named =====

TEST_CASE("named requirement from a line", "[requirement]") {
    auto r = req("Requests[security]>=2.0,<3; python_version < '3.8'");
    REQUIRE(r.is_named());
    REQUIRE(r.name() == "Requests");
    REQUIRE(r.key() == "requests");
    REQUIRE(r.extras() == std::vector<std::string>{"security"});
    REQUIRE(r.specifier()->to_string() == ">=2.0,<3");
    REQUIRE(r.markers());
    REQUIRE_FALSE(r.is_pinned());
    REQUIRE(r.to_line() == "Requests[security]>=2.0,<3; python_version < '3.8'");
}

TEST_CASE("to_line output parses back to an equal requirement", "[requirement]") {
    for (const char* line : {
             "foo==1.0",
             "foo[a,b]>=1; os_name == 'nt'",
             "-e git+https://github.com/org/repo.git@v1.0#egg=repo",
             "https://example.com/foo-1.0.tar.gz#egg=foo",
             "./pkg[dev]",
         }) {
        INFO(line);
        auto r = req(line);
        REQUIRE(req(r.to_line()) == r);
    }
}

TEST_CASE("equality canonicalizes names and extras", "[requirement]") {
    REQUIRE(req("Foo_Bar[B,a]==1.0") == req("foo-bar[a,b]==1.0"));
    REQUIRE(req("foo==1.0") != req("foo==1.1"));
    REQUIRE(req("foo==1.0") != req("foo==1.0; os_name == 'nt'"));
}

TEST_CASE("pinned versions", "[requirement]") {
    REQUIRE(*req("foo==1.0").pinned_version() == "1.0");
    REQUIRE(*req("foo===1.0-custom").pinned_version() == "1.0-custom");
    REQUIRE_FALSE(req("foo==1.*").pinned_version());
    REQUIRE_FALSE(req("foo>=1.0").pinned_version());
    REQUIRE_FALSE(req("foo").is_pinned());
}

TEST_CASE("hashes are rendered in sorted order", "[requirement]") {
    auto r = req("foo==1.0 --hash=sha256:bbb --hash=sha256:aaa");
    REQUIRE(r.hashes().size() == 2);
    REQUIRE(r.to_line() == "foo==1.0 --hash=sha256:aaa --hash=sha256:bbb");
    REQUIRE(r.to_line(false) == "foo==1.0");

    r.add_hash("sha256:ccc");
    REQUIRE(r.hashes().count("sha256:ccc") == 1);
}

TEST_CASE("editable requirements never carry hashes", "[requirement]") {
    auto r = req("-e ./pkg#egg=local").with_hashes({"sha256:aaa"});
    REQUIRE(r.is_editable());
    REQUIRE(r.to_line() == "-e ./pkg#egg=local");
    REQUIRE(r.to_manifest().hashes.empty());
}

// ===== File and VCS =====

TEST_CASE("file requirement from a URL", "[requirement]") {
    auto r = req("https://example.com/foo-1.0.tar.gz#egg=foo");
    REQUIRE(r.is_file());
    REQUIRE(r.name() == "foo");
    REQUIRE(r.as_file()->uri);
    REQUIRE(r.as_file()->uri->name.empty());

    auto e = r.to_manifest();
    REQUIRE(e.file == "https://example.com/foo-1.0.tar.gz");
    REQUIRE(e.version.empty());
}

TEST_CASE("unnamed path takes its name from metadata", "[requirement]") {
    auto r = req("./pkg[dev]");
    REQUIRE(r.is_unnamed());
    REQUIRE(r.to_line() == "./pkg[dev]");

    PackageMetadata meta;
    meta.name = "mypkg";
    auto named = r.resolve_name(meta);
    REQUIRE(named.is_ok());
    REQUIRE(named.value().name() == "mypkg");
    REQUIRE(named.value().to_line() == "./pkg#egg=mypkg[dev]");

    auto again = named.value().resolve_name(meta);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == PinionError::InvalidArg);

    meta.name = "-bad";
    REQUIRE(r.resolve_name(meta).is_err());
}

TEST_CASE("VCS requirement", "[requirement]") {
    auto r = req("-e git+https://github.com/org/repo.git@v1.0#egg=repo&subdirectory=py");
    REQUIRE(r.is_vcs());
    REQUIRE(r.is_editable());
    REQUIRE(r.is_pinned());
    REQUIRE(r.as_vcs()->vcs == VcsKind::Git);
    REQUIRE(*r.as_vcs()->ref == "v1.0");
    REQUIRE(*r.as_vcs()->subdirectory == "py");

    auto e = r.to_manifest();
    REQUIRE(e.vcs == "git");
    REQUIRE(e.vcs_url == "https://github.com/org/repo.git");
    REQUIRE(e.ref == "v1.0");
    REQUIRE(e.editable);
    REQUIRE(e.subdirectory == "py");

    auto moved = r.with_ref("abc123");
    REQUIRE(*moved.as_vcs()->ref == "abc123");
    REQUIRE(*r.as_vcs()->ref == "v1.0");
}

TEST_CASE("VCS kind names", "[requirement]") {
    REQUIRE(std::string(vcs_kind_name(VcsKind::Hg)) == "hg");
    REQUIRE(*parse_vcs_kind("svn") == VcsKind::Svn);
    REQUIRE_FALSE(parse_vcs_kind("cvs"));
}

// ===== Manifest entries =====

TEST_CASE("manifest entry for a named requirement", "[requirement]") {
    ManifestEntry e;
    e.version = ">=1.0";
    e.extras = {"Socks"};
    e.marker_keys = {{"os_name", "== 'nt'"}};
    e.index = "internal";

    auto r = Requirement::from_manifest("requests", e);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_line() == "requests[socks]>=1.0; os_name == 'nt'");
    REQUIRE(*r.value().index() == "internal");

    auto back = r.value().to_manifest();
    REQUIRE(back.version == ">=1.0");
    REQUIRE(back.markers == "os_name == 'nt'");
    REQUIRE(back.index == "internal");
}

TEST_CASE("star version means any", "[requirement]") {
    ManifestEntry e;
    e.version = "*";
    REQUIRE(e.is_bare());
    auto r = Requirement::from_manifest("six", e).value();
    REQUIRE_FALSE(r.specifier());
    REQUIRE(r.to_manifest().version == "*");
    REQUIRE(r.to_manifest().is_bare());
}

TEST_CASE("manifest entry for a VCS source", "[requirement]") {
    ManifestEntry e;
    e.vcs = "git";
    e.vcs_url = "https://github.com/org/repo.git";
    e.ref = "v1.0";

    auto r = Requirement::from_manifest("repo", e);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == req("git+https://github.com/org/repo.git@v1.0#egg=repo"));
    REQUIRE(r.value().to_manifest() == e);
}

TEST_CASE("manifest entry for local sources", "[requirement]") {
    ManifestEntry path;
    path.path = "./libs/core";
    path.editable = true;
    auto p = Requirement::from_manifest("core", path).value();
    REQUIRE(p.is_file());
    REQUIRE(*p.as_file()->path == "./libs/core");
    REQUIRE(p.to_line() == "-e ./libs/core#egg=core");

    ManifestEntry file;
    file.uri = "https://example.com/core-1.0.zip";
    auto f = Requirement::from_manifest("core", file).value();
    REQUIRE(f.as_file()->uri);
    REQUIRE(f.to_manifest().file == "https://example.com/core-1.0.zip");
}

TEST_CASE("bad manifest entries", "[requirement]") {
    ManifestEntry e;
    auto bad_name = Requirement::from_manifest("bad name", e);
    REQUIRE(bad_name.is_err());
    REQUIRE(bad_name.error().code == PinionError::Manifest);

    ManifestEntry vcs;
    vcs.vcs = "cvs";
    vcs.vcs_url = "https://example.com/r";
    REQUIRE(Requirement::from_manifest("r", vcs).error().code == PinionError::Manifest);

    ManifestEntry spec;
    spec.version = ">=1.*";
    auto bad_spec = Requirement::from_manifest("foo", spec);
    REQUIRE(bad_spec.is_err());
    REQUIRE(bad_spec.error().message.find("in entry 'foo'") != std::string::npos);
}

TEST_CASE("lock entries need a pinned version", "[requirement]") {
    auto loose = req("foo>=1.0").to_lock_entry();
    REQUIRE(loose.is_err());
    REQUIRE(loose.error().code == PinionError::InvalidArg);

    auto pinned = req("foo==1.0 --hash=sha256:aaa").to_lock_entry();
    REQUIRE(pinned.is_ok());
    REQUIRE(pinned.value().version == "==1.0");
    REQUIRE(pinned.value().hashes == std::vector<std::string>{"sha256:aaa"});

    auto back = Requirement::from_lock_entry("foo", pinned.value());
    REQUIRE(back.value() == req("foo==1.0 --hash=sha256:aaa"));
}

// ===== Derived requirements =====

TEST_CASE("merge_markers", "[requirement]") {
    auto nt = Marker::parse("os_name == 'nt'").value();
    auto on_linux = Marker::parse("sys_platform == 'linux'").value();

    auto always = req("foo");
    REQUIRE_FALSE(always.merge_markers(nt).markers());

    auto merged = always.with_markers(nt).merge_markers(on_linux);
    REQUIRE(merged.markers()->to_string() == "os_name == 'nt' or sys_platform == 'linux'");
}

TEST_CASE("with_ helpers return copies", "[requirement]") {
    auto r = req("foo>=1");
    auto pinned = r.with_version(SpecifierSet::parse("==1.2").value());
    REQUIRE(*pinned.pinned_version() == "1.2");
    REQUIRE_FALSE(r.pinned_version());

    auto extras = r.with_extras({"B", "a", "b"});
    REQUIRE(extras.extras() == std::vector<std::string>{"a", "b"});

    REQUIRE(*r.with_index("mirror").index() == "mirror");
    REQUIRE_FALSE(r.with_index("").index());
}

// ===== Local metadata =====

TEST_CASE("parse pyproject metadata", "[metadata]") {
    auto meta = parse_pyproject(R"(
[project]
name = "mypkg"
version = "0.3.0"
requires-python = ">=3.8"
dependencies = ["requests>=2", "six"]
)");
    REQUIRE(meta.is_ok());
    REQUIRE(meta.value().name == "mypkg");
    REQUIRE(meta.value().version == "0.3.0");
    REQUIRE(meta.value().requires_python == ">=3.8");
    REQUIRE(meta.value().dependencies == std::vector<std::string>{"requests>=2", "six"});
}

TEST_CASE("pyproject without a usable name", "[metadata]") {
    REQUIRE(parse_pyproject("[tool.other]\nx = 1\n").error().code == PinionError::Manifest);
    REQUIRE(parse_pyproject("[project]\nversion = \"1\"\n").is_err());
    REQUIRE(parse_pyproject("[project\n").is_err());
}

TEST_CASE("missing pyproject is an IO error", "[metadata]") {
    auto r = read_local_metadata("/nonexistent/pinion/pkg");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::IO);
}
