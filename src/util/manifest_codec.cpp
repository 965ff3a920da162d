#include <pinion/manifest_codec.hpp>
#include <pinion/log.hpp>
#include <pinion/marker.hpp>

namespace pinion {

namespace {

PinionError bad_field(const std::string& name, const std::string& key, const char* expected) {
    return PinionError{PinionError::Manifest,
        "in entry '" + name + "': '" + key + "' must be " + expected};
}

Result<std::vector<std::string>> string_array(const std::string& name, const std::string& key,
                                              const toml::node& node) {
    auto arr = node.as_array();
    if (!arr) return bad_field(name, key, "an array of strings");
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) return bad_field(name, key, "an array of strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

toml::array to_array(const std::vector<std::string>& items) {
    toml::array arr;
    for (const auto& s : items) arr.push_back(s);
    return arr;
}

} // anonymous namespace

Result<ManifestEntry> entry_from_toml(const std::string& name, const toml::node& node) {
    ManifestEntry e;

    if (auto s = node.value<std::string>()) {
        e.version = *s;
        return Result<ManifestEntry>::ok(std::move(e));
    }

    auto tbl = node.as_table();
    if (!tbl) {
        return PinionError{PinionError::Manifest,
            "entry '" + name + "' must be a version string or a table"};
    }

    for (const auto& [key, val] : *tbl) {
        std::string k(key);

        if (k == "extras" || k == "hashes") {
            auto items = string_array(name, k, val);
            if (items.is_err()) return std::move(items).error();
            (k == "extras" ? e.extras : e.hashes) = std::move(items).value();
            continue;
        }
        if (k == "editable") {
            auto b = val.value<bool>();
            if (!b) return bad_field(name, k, "a boolean");
            e.editable = *b;
            continue;
        }

        auto s = val.value<std::string>();
        if (!s) return bad_field(name, k, "a string");

        if (k == "version") e.version = *s;
        else if (k == "markers") e.markers = *s;
        else if (k == "path") e.path = *s;
        else if (k == "file") e.file = *s;
        else if (k == "uri") e.uri = *s;
        else if (k == "ref") e.ref = *s;
        else if (k == "subdirectory") e.subdirectory = *s;
        else if (k == "index") e.index = *s;
        else if (parse_vcs_kind(k)) {
            if (!e.vcs.empty()) {
                return PinionError{PinionError::Manifest,
                    "in entry '" + name + "': both '" + e.vcs + "' and '" + k + "' are set"};
            }
            e.vcs = k;
            e.vcs_url = *s;
        } else if (is_marker_variable(k) && k != "extra") {
            e.marker_keys[k] = *s;
        } else {
            log::debug("ignoring unknown key '%s' in entry '%s'", k.c_str(), name.c_str());
        }
    }

    return Result<ManifestEntry>::ok(std::move(e));
}

void insert_entry(toml::table& tbl, const std::string& name, const ManifestEntry& entry) {
    if (entry.is_bare()) {
        tbl.insert_or_assign(name, entry.version.empty() ? std::string("*") : entry.version);
        return;
    }

    toml::table t;
    auto put = [&](const char* key, const std::string& value) {
        if (!value.empty()) t.insert_or_assign(key, value);
    };
    put("version", entry.version);
    if (!entry.vcs.empty()) put(entry.vcs.c_str(), entry.vcs_url);
    put("ref", entry.ref);
    put("path", entry.path);
    put("file", entry.file);
    put("uri", entry.uri);
    put("subdirectory", entry.subdirectory);
    put("markers", entry.markers);
    put("index", entry.index);
    for (const auto& [k, v] : entry.marker_keys) put(k.c_str(), v);
    if (entry.editable) t.insert_or_assign("editable", true);
    if (!entry.extras.empty()) t.insert_or_assign("extras", to_array(entry.extras));
    if (!entry.hashes.empty()) t.insert_or_assign("hashes", to_array(entry.hashes));

    tbl.insert_or_assign(name, std::move(t));
}

Result<std::map<std::string, ManifestEntry>> entries_from_table(const toml::table* tbl) {
    std::map<std::string, ManifestEntry> out;
    if (!tbl) return Result<std::map<std::string, ManifestEntry>>::ok(std::move(out));

    for (const auto& [key, val] : *tbl) {
        std::string name(key);
        auto entry = entry_from_toml(name, val);
        if (entry.is_err()) return std::move(entry).error();
        out[name] = std::move(entry).value();
    }
    return Result<std::map<std::string, ManifestEntry>>::ok(std::move(out));
}

toml::table entries_to_table(const std::map<std::string, ManifestEntry>& entries) {
    toml::table tbl;
    for (const auto& [name, entry] : entries) insert_entry(tbl, name, entry);
    return tbl;
}

} // namespace pinion
