#include <pinion/index.hpp>
#include <pinion/name.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace pinion {

static std::vector<std::string> string_array(const toml::table& tbl, const char* key) {
    std::vector<std::string> out;
    if (auto arr = tbl[key].as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

Status StaticIndex::add_release(const std::string& name, const std::string& version,
                                std::vector<std::string> dependencies,
                                std::vector<std::string> hashes,
                                std::string requires_python) {
    if (!is_valid_name(name)) {
        return PinionError{PinionError::InvalidArg, "invalid package name '" + name + "'"};
    }
    auto v = Version::parse(version);
    if (v.is_err()) return std::move(v).error();

    auto& releases = packages_[normalize_name(name)];
    Release rel{std::move(v).value(), std::move(dependencies), std::move(hashes),
                std::move(requires_python)};

    auto it = std::find_if(releases.begin(), releases.end(),
        [&](const Release& r) { return r.version == rel.version; });
    if (it != releases.end()) {
        *it = std::move(rel);
    } else {
        releases.push_back(std::move(rel));
    }
    std::sort(releases.begin(), releases.end(),
              [](const Release& a, const Release& b) { return a.version > b.version; });
    return ok_status();
}

Result<StaticIndex> StaticIndex::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Parse,
            std::string("TOML parse error: ") + e.what()};
    }

    StaticIndex index;
    auto packages = doc["packages"].as_table();
    if (!packages) return Result<StaticIndex>::ok(std::move(index));

    for (const auto& [name, versions] : *packages) {
        auto vtbl = versions.as_table();
        if (!vtbl) {
            return PinionError{PinionError::Parse,
                "index entry '" + std::string(name) + "' must be a table of versions"};
        }
        for (const auto& [version, node] : *vtbl) {
            auto rtbl = node.as_table();
            if (!rtbl) {
                return PinionError{PinionError::Parse,
                    "index entry '" + std::string(name) + "' version '" +
                    std::string(version) + "' must be a table"};
            }
            std::string requires_python;
            if (auto v = (*rtbl)["requires_python"].value<std::string>()) requires_python = *v;

            auto status = index.add_release(std::string(name), std::string(version),
                                            string_array(*rtbl, "dependencies"),
                                            string_array(*rtbl, "hashes"),
                                            std::move(requires_python));
            if (status.is_err()) return std::move(status).error();
        }
    }

    return Result<StaticIndex>::ok(std::move(index));
}

Result<StaticIndex> StaticIndex::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return PinionError{PinionError::IO, "cannot open index file " + path};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto index = parse(ss.str());
    if (index.is_err()) {
        auto err = std::move(index).error();
        err.file = path;
        return err;
    }
    return index;
}

Result<std::vector<Version>> StaticIndex::find_versions(const std::string& name) {
    auto it = packages_.find(normalize_name(name));
    if (it == packages_.end()) {
        return PinionError{PinionError::NotFound,
            "package '" + name + "' not found in index"};
    }
    std::vector<Version> versions;
    for (const auto& r : it->second) versions.push_back(r.version);
    return Result<std::vector<Version>>::ok(std::move(versions));
}

Result<const Release*> StaticIndex::find_release(const std::string& name,
                                                 const Version& version) const {
    auto it = packages_.find(normalize_name(name));
    if (it != packages_.end()) {
        for (const auto& r : it->second) {
            if (r.version == version) return Result<const Release*>::ok(&r);
        }
    }
    return PinionError{PinionError::NotFound,
        "'" + name + "==" + version.to_string() + "' not found in index"};
}

Result<std::vector<std::string>> StaticIndex::get_dependencies(const std::string& name,
                                                               const Version& version) {
    return find_release(name, version).map(
        [](const Release* r) { return r->dependencies; });
}

Result<std::vector<std::string>> StaticIndex::get_hashes(const std::string& name,
                                                         const Version& version) {
    return find_release(name, version).map(
        [](const Release* r) { return r->hashes; });
}

std::string StaticIndex::requires_python(const std::string& name, const Version& version) {
    auto rel = find_release(name, version);
    return rel.is_ok() ? rel.value()->requires_python : "";
}

} // namespace pinion
