#include <pinion/lockfile.hpp>
#include <pinion/log.hpp>
#include <pinion/manifest_codec.hpp>
#include <pinion/sha256.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace pinion {

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Manifest,
            std::string("lockfile TOML parse error: ") + e.what()};
    }

    auto meta = doc["_meta"].as_table();
    if (!meta) {
        return PinionError{PinionError::Manifest,
            "lockfile has no [_meta] table",
            "regenerate it with 'pinion lock'"};
    }

    LockFile lock;
    if (auto v = (*meta)["pipfile-spec"].value<int64_t>()) lock.pipfile_spec = *v;
    if (auto hash = (*meta)["hash"].as_table()) {
        if (auto v = (*hash)["sha256"].value<std::string>()) lock.pipfile_hash = *v;
    }
    if (auto req = (*meta)["requires"].as_table()) {
        if (auto v = (*req)["python_version"].value<std::string>()) lock.python_version = *v;
        if (auto v = (*req)["python_full_version"].value<std::string>()) {
            lock.python_full_version = *v;
        }
    }
    if (auto sources = (*meta)["sources"].as_array()) {
        for (const auto& elem : *sources) {
            auto tbl = elem.as_table();
            if (!tbl) continue;
            PackageSource src;
            if (auto v = (*tbl)["name"].value<std::string>()) src.name = *v;
            if (auto v = (*tbl)["url"].value<std::string>()) src.url = *v;
            if (auto v = (*tbl)["verify_ssl"].value<bool>()) src.verify_ssl = *v;
            lock.sources.push_back(std::move(src));
        }
    }

    if (lock.pipfile_spec > PIPFILE_SPEC) {
        log::warn("lockfile spec %lld is newer than supported (%lld)",
                  static_cast<long long>(lock.pipfile_spec),
                  static_cast<long long>(PIPFILE_SPEC));
    }

    auto def = entries_from_table(doc["default"].as_table());
    if (def.is_err()) return std::move(def).error();
    lock.default_packages = std::move(def).value();

    auto dev = entries_from_table(doc["develop"].as_table());
    if (dev.is_err()) return std::move(dev).error();
    lock.develop = std::move(dev).value();

    return Result<LockFile>::ok(std::move(lock));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinionError{PinionError::IO, "cannot open lockfile: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto lock = LockFile::parse(ss.str());
    if (lock.is_err()) {
        auto err = std::move(lock).error();
        err.file = path;
        return err;
    }
    return lock;
}

std::string LockFile::to_toml() const {
    toml::table meta;
    meta.insert_or_assign("pipfile-spec", pipfile_spec);

    toml::table hash;
    hash.insert_or_assign("sha256", pipfile_hash);
    meta.insert_or_assign("hash", std::move(hash));

    toml::table req;
    if (!python_version.empty()) req.insert_or_assign("python_version", python_version);
    if (!python_full_version.empty()) req.insert_or_assign("python_full_version", python_full_version);
    meta.insert_or_assign("requires", std::move(req));

    toml::array srcs;
    for (const auto& src : sources) {
        toml::table t;
        t.insert_or_assign("name", src.name);
        t.insert_or_assign("url", src.url);
        t.insert_or_assign("verify_ssl", src.verify_ssl);
        srcs.push_back(std::move(t));
    }
    meta.insert_or_assign("sources", std::move(srcs));

    toml::table doc;
    doc.insert_or_assign("_meta", std::move(meta));
    doc.insert_or_assign("default", entries_to_table(default_packages));
    doc.insert_or_assign("develop", entries_to_table(develop));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

Status LockFile::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        return PinionError{PinionError::IO, "cannot write lockfile: " + path};
    }
    out << to_toml();
    if (!out) {
        return PinionError{PinionError::IO, "failed writing lockfile: " + path};
    }
    return ok_status();
}

std::string LockFile::hash_of(const Pipfile& pipfile) {
    return Sha256::of(pipfile.to_toml());
}

Result<LockFile> LockFile::from_resolved(const Pipfile& pipfile, const ResolvedSet& resolved,
                                         bool dev) {
    LockFile lock;
    lock.pipfile_hash = hash_of(pipfile);
    lock.sources = pipfile.sources;
    lock.python_version = pipfile.python_version;
    lock.python_full_version = pipfile.python_full_version;
    PINION_TRY(lock.add_resolved(resolved, dev));
    return Result<LockFile>::ok(std::move(lock));
}

Status LockFile::add_resolved(const ResolvedSet& resolved, bool dev) {
    auto& section = dev ? develop : default_packages;
    for (const auto& [name, pkg] : resolved) {
        auto entry = pkg.requirement.to_lock_entry();
        if (entry.is_err()) return std::move(entry).error();
        section[name] = std::move(entry).value();
    }
    return ok_status();
}

bool LockFile::is_stale(const Pipfile& pipfile) const {
    return pipfile_hash != hash_of(pipfile);
}

Result<std::vector<Requirement>> LockFile::requirements(bool dev) const {
    const auto& section = dev ? develop : default_packages;
    std::vector<Requirement> out;
    for (const auto& [name, entry] : section) {
        auto req = Requirement::from_lock_entry(name, entry);
        if (req.is_err()) return std::move(req).error();
        out.push_back(std::move(req).value());
    }
    return Result<std::vector<Requirement>>::ok(std::move(out));
}

} // namespace pinion
