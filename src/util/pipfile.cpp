#include <pinion/pipfile.hpp>
#include <pinion/manifest_codec.hpp>
#include <pinion/name.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace pinion {

bool PackageSource::operator==(const PackageSource& o) const {
    return name == o.name && url == o.url && verify_ssl == o.verify_ssl;
}

Result<Pipfile> Pipfile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Manifest,
            std::string("Pipfile TOML parse error: ") + e.what()};
    }

    Pipfile pf;

    if (auto sources = doc["source"].as_array()) {
        for (const auto& elem : *sources) {
            auto tbl = elem.as_table();
            if (!tbl) {
                return PinionError{PinionError::Manifest, "[[source]] entries must be tables"};
            }
            PackageSource src;
            if (auto v = (*tbl)["name"].value<std::string>()) src.name = *v;
            if (auto v = (*tbl)["url"].value<std::string>()) src.url = *v;
            if (auto v = (*tbl)["verify_ssl"].value<bool>()) src.verify_ssl = *v;
            if (src.url.empty()) {
                return PinionError{PinionError::Manifest,
                    "source '" + src.name + "' has no url"};
            }
            pf.sources.push_back(std::move(src));
        }
    }

    auto packages = entries_from_table(doc["packages"].as_table());
    if (packages.is_err()) return std::move(packages).error();
    pf.packages = std::move(packages).value();

    auto dev = entries_from_table(doc["dev-packages"].as_table());
    if (dev.is_err()) return std::move(dev).error();
    pf.dev_packages = std::move(dev).value();

    if (auto req = doc["requires"].as_table()) {
        if (auto v = (*req)["python_version"].value<std::string>()) pf.python_version = *v;
        if (auto v = (*req)["python_full_version"].value<std::string>()) pf.python_full_version = *v;
    }

    return Result<Pipfile>::ok(std::move(pf));
}

Result<Pipfile> Pipfile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinionError{PinionError::IO, "cannot open Pipfile: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto pf = Pipfile::parse(ss.str());
    if (pf.is_err()) {
        auto err = std::move(pf).error();
        err.file = path;
        return err;
    }
    return pf;
}

std::string Pipfile::to_toml() const {
    toml::table doc;

    if (!sources.empty()) {
        toml::array arr;
        for (const auto& src : sources) {
            toml::table t;
            t.insert_or_assign("name", src.name);
            t.insert_or_assign("url", src.url);
            t.insert_or_assign("verify_ssl", src.verify_ssl);
            arr.push_back(std::move(t));
        }
        doc.insert_or_assign("source", std::move(arr));
    }

    doc.insert_or_assign("packages", entries_to_table(packages));
    doc.insert_or_assign("dev-packages", entries_to_table(dev_packages));

    if (!python_version.empty() || !python_full_version.empty()) {
        toml::table req;
        if (!python_version.empty()) req.insert_or_assign("python_version", python_version);
        if (!python_full_version.empty()) {
            req.insert_or_assign("python_full_version", python_full_version);
        }
        doc.insert_or_assign("requires", std::move(req));
    }

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

Status Pipfile::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        return PinionError{PinionError::IO, "cannot write Pipfile: " + path};
    }
    out << to_toml();
    if (!out) {
        return PinionError{PinionError::IO, "failed writing Pipfile: " + path};
    }
    return ok_status();
}

Result<std::vector<Requirement>> Pipfile::requirements(bool dev) const {
    const auto& section = dev ? dev_packages : packages;
    std::vector<Requirement> out;
    for (const auto& [name, entry] : section) {
        auto req = Requirement::from_manifest(name, entry);
        if (req.is_err()) return std::move(req).error();
        out.push_back(std::move(req).value());
    }
    return Result<std::vector<Requirement>>::ok(std::move(out));
}

void Pipfile::add(const Requirement& req, bool dev) {
    auto& section = dev ? dev_packages : packages;
    // Replace any record whose name normalizes the same
    for (auto it = section.begin(); it != section.end(); ++it) {
        if (normalize_name(it->first) == req.key()) {
            section.erase(it);
            break;
        }
    }
    ManifestEntry entry = req.to_manifest();
    entry.hashes.clear();
    section[req.name()] = std::move(entry);
}

} // namespace pinion
