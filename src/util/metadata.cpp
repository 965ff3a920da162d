#include <pinion/metadata.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace pinion {

Result<PackageMetadata> parse_pyproject(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Manifest,
            std::string("TOML parse error: ") + e.what()};
    }

    auto project = doc["project"].as_table();
    if (!project) {
        return PinionError{PinionError::Manifest,
            "pyproject.toml has no [project] table",
            "declare the package name under [project]"};
    }

    PackageMetadata meta;
    if (auto v = (*project)["name"].value<std::string>()) meta.name = *v;
    if (auto v = (*project)["version"].value<std::string>()) meta.version = *v;
    if (auto v = (*project)["requires-python"].value<std::string>()) meta.requires_python = *v;
    if (auto arr = (*project)["dependencies"].as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) {
                meta.dependencies.push_back(*s);
            }
        }
    }

    if (meta.name.empty()) {
        return PinionError{PinionError::Manifest,
            "pyproject.toml [project] has no name"};
    }

    return Result<PackageMetadata>::ok(std::move(meta));
}

Result<PackageMetadata> read_local_metadata(const std::string& dir) {
    fs::path file = fs::path(dir) / "pyproject.toml";
    std::ifstream in(file);
    if (!in.is_open()) {
        return PinionError{PinionError::IO,
            "cannot read " + file.string(),
            "the package name can only be read from pyproject.toml"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto meta = parse_pyproject(ss.str());
    if (meta.is_err()) {
        auto err = std::move(meta).error();
        err.file = file.string();
        return err;
    }
    return meta;
}

} // namespace pinion
