#include <pinion/requirement.hpp>
#include <pinion/name.hpp>
#include <algorithm>

namespace pinion {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

// Strip what the requirement records separately
Uri location_only(Uri uri) {
    uri.name.clear();
    uri.extras.clear();
    uri.ref.clear();
    uri.subdirectory.clear();
    return uri;
}

std::string render_uri(Uri uri, const std::string& name,
                       const std::vector<std::string>& extras,
                       const std::optional<std::string>& ref,
                       const std::optional<std::string>& subdirectory) {
    uri.name = name;
    uri.extras = extras;
    uri.ref = ref.value_or("");
    uri.subdirectory = subdirectory.value_or("");
    UriFormat fmt;
    fmt.escape_password = false;
    return uri.to_string(fmt);
}

std::string render_path(const FileRequirement& f, const std::vector<std::string>& extras) {
    std::string line = f.path.value_or("");
    std::vector<std::string> frag;
    if (!f.name.empty()) {
        frag.push_back("egg=" + f.name + extras_to_string(extras));
    } else {
        line += extras_to_string(extras);
    }
    if (f.subdirectory) frag.push_back("subdirectory=" + *f.subdirectory);
    for (size_t i = 0; i < frag.size(); ++i) {
        line += (i == 0 ? "#" : "&") + frag[i];
    }
    return line;
}

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

bool is_url(const std::string& s) {
    return s.find("://") != std::string::npos || s.compare(0, 5, "file:") == 0;
}

PinionError in_entry(const std::string& name, PinionError err) {
    return err.prefix("in entry '" + name + "'");
}

} // anonymous namespace

const char* vcs_kind_name(VcsKind kind) {
    switch (kind) {
        case VcsKind::Git: return "git";
        case VcsKind::Hg:  return "hg";
        case VcsKind::Svn: return "svn";
        case VcsKind::Bzr: return "bzr";
    }
    return "";
}

std::optional<VcsKind> parse_vcs_kind(const std::string& name) {
    if (name == "git") return VcsKind::Git;
    if (name == "hg") return VcsKind::Hg;
    if (name == "svn") return VcsKind::Svn;
    if (name == "bzr") return VcsKind::Bzr;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ManifestEntry
// ---------------------------------------------------------------------------

bool ManifestEntry::is_bare() const {
    return extras.empty() && markers.empty() && !editable && path.empty() &&
           file.empty() && uri.empty() && vcs.empty() && ref.empty() &&
           subdirectory.empty() && index.empty() && hashes.empty() &&
           marker_keys.empty();
}

bool ManifestEntry::operator==(const ManifestEntry& o) const {
    return version == o.version && extras == o.extras && markers == o.markers &&
           editable == o.editable && path == o.path && file == o.file &&
           uri == o.uri && vcs == o.vcs && vcs_url == o.vcs_url && ref == o.ref &&
           subdirectory == o.subdirectory && index == o.index &&
           hashes == o.hashes && marker_keys == o.marker_keys;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Result<Requirement> Requirement::from_line(const std::string& line) {
    auto parsed = parse_line(line);
    if (parsed.is_err()) return std::move(parsed).error();
    return from_parsed(parsed.value());
}

Result<Requirement> Requirement::from_parsed(const ParsedLine& parsed) {
    Requirement req;
    req.extras_ = normalize_extras(parsed.extras);
    req.hashes_.insert(parsed.hashes.begin(), parsed.hashes.end());

    if (!parsed.markers.empty()) {
        auto m = Marker::parse(parsed.markers);
        if (m.is_err()) return std::move(m).error();
        req.markers_ = std::move(m).value();
    }

    switch (parsed.kind) {
    case LineKind::Named: {
        NamedRequirement n;
        n.name = parsed.name;
        if (!parsed.specifier.empty()) {
            auto spec = SpecifierSet::parse(parsed.specifier);
            if (spec.is_err()) return std::move(spec).error();
            n.version = std::move(spec).value();
        }
        req.source_ = std::move(n);
        break;
    }
    case LineKind::File: {
        FileRequirement f;
        f.name = parsed.name;
        if (parsed.uri) {
            f.uri = location_only(*parsed.uri);
        } else {
            f.path = parsed.path;
        }
        f.editable = parsed.editable;
        f.subdirectory = non_empty(parsed.subdirectory);
        req.source_ = std::move(f);
        break;
    }
    case LineKind::Vcs: {
        auto kind = parse_vcs_kind(parsed.vcs);
        if (!kind || !parsed.uri) {
            return PinionError{PinionError::Unparsable,
                "unsupported version control system in '" + parsed.line + "'",
                "supported: git, hg, svn, bzr"};
        }
        if (parsed.name.empty()) {
            return PinionError{PinionError::MissingEgg,
                "VCS requirement '" + parsed.line + "' has no package name",
                "append #egg=<name> to the URL"};
        }
        VcsRequirement v;
        v.name = parsed.name;
        v.vcs = *kind;
        v.uri = location_only(*parsed.uri);
        v.ref = non_empty(parsed.ref);
        v.editable = parsed.editable;
        v.subdirectory = non_empty(parsed.subdirectory);
        req.source_ = std::move(v);
        break;
    }
    }

    return Result<Requirement>::ok(std::move(req));
}

Result<Requirement> Requirement::from_manifest(const std::string& name,
                                               const ManifestEntry& entry) {
    if (!is_valid_name(name)) {
        return PinionError{PinionError::Manifest,
            "invalid package name '" + name + "'",
            "package names must match [A-Za-z0-9._-] and start and end alphanumeric"};
    }

    Requirement req;
    req.extras_ = normalize_extras(entry.extras);
    req.hashes_.insert(entry.hashes.begin(), entry.hashes.end());
    req.index_ = non_empty(entry.index);

    auto markers = marker_from_manifest(entry.marker_keys, entry.markers);
    if (markers.is_err()) return in_entry(name, std::move(markers).error());
    req.markers_ = std::move(markers).value();

    if (!entry.vcs.empty()) {
        auto kind = parse_vcs_kind(entry.vcs);
        if (!kind) {
            return PinionError{PinionError::Manifest,
                "in entry '" + name + "': unknown version control system '" + entry.vcs + "'",
                "supported: git, hg, svn, bzr"};
        }
        std::string url = entry.vcs_url;
        if (url.compare(0, entry.vcs.size() + 1, entry.vcs + "+") != 0) {
            url = entry.vcs + "+" + url;
        }
        auto uri = Uri::parse(url);
        if (uri.is_err()) return in_entry(name, std::move(uri).error());

        VcsRequirement v;
        v.name = name;
        v.vcs = *kind;
        v.ref = entry.ref.empty() ? non_empty(uri.value().ref) : non_empty(entry.ref);
        v.subdirectory = entry.subdirectory.empty() ? non_empty(uri.value().subdirectory)
                                                    : non_empty(entry.subdirectory);
        v.uri = location_only(std::move(uri).value());
        v.editable = entry.editable;
        req.source_ = std::move(v);
        return Result<Requirement>::ok(std::move(req));
    }

    std::string location = !entry.file.empty() ? entry.file : entry.uri;
    if (!entry.path.empty() || !location.empty()) {
        FileRequirement f;
        f.name = name;
        f.editable = entry.editable;
        f.subdirectory = non_empty(entry.subdirectory);
        if (!entry.path.empty()) {
            f.path = entry.path;
        } else if (is_url(location)) {
            auto uri = Uri::parse(location);
            if (uri.is_err()) return in_entry(name, std::move(uri).error());
            if (!f.subdirectory) f.subdirectory = non_empty(uri.value().subdirectory);
            f.uri = location_only(std::move(uri).value());
        } else {
            f.path = location;
        }
        req.source_ = std::move(f);
        return Result<Requirement>::ok(std::move(req));
    }

    NamedRequirement n;
    n.name = name;
    if (!entry.version.empty() && entry.version != "*") {
        auto spec = SpecifierSet::parse(entry.version);
        if (spec.is_err()) return in_entry(name, std::move(spec).error());
        n.version = std::move(spec).value();
    }
    req.source_ = std::move(n);
    return Result<Requirement>::ok(std::move(req));
}

Result<Requirement> Requirement::from_lock_entry(const std::string& name,
                                                 const ManifestEntry& entry) {
    return from_manifest(name, entry);
}

Requirement Requirement::named(std::string name, std::optional<SpecifierSet> version) {
    Requirement req;
    req.source_ = NamedRequirement{std::move(name), std::move(version)};
    return req;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string Requirement::to_line(bool include_hashes) const {
    std::string line;

    if (auto n = as_named()) {
        line = n->name + extras_to_string(extras_);
        if (n->version) line += n->version->to_string();
    } else if (auto f = as_file()) {
        if (f->editable) line = "-e ";
        if (f->uri) {
            line += render_uri(*f->uri, f->name, extras_, std::nullopt, f->subdirectory);
        } else {
            line += render_path(*f, extras_);
        }
    } else if (auto v = as_vcs()) {
        if (v->editable) line = "-e ";
        line += render_uri(v->uri, v->name, extras_, v->ref, v->subdirectory);
    }

    if (markers_) line += "; " + markers_->to_string();

    if (include_hashes && !is_editable()) {
        for (const auto& h : hashes_) line += " --hash=" + h;
    }
    return line;
}

ManifestEntry Requirement::to_manifest() const {
    ManifestEntry e;
    e.extras = extras_;
    if (markers_) e.markers = markers_->to_string();
    e.index = index_.value_or("");

    if (auto n = as_named()) {
        e.version = (n->version && !n->version->empty()) ? n->version->to_string() : "*";
    } else if (auto f = as_file()) {
        if (f->path) e.path = *f->path;
        if (f->uri) e.file = f->uri->full_url();
        e.editable = f->editable;
        e.subdirectory = f->subdirectory.value_or("");
    } else if (auto v = as_vcs()) {
        e.vcs = vcs_kind_name(v->vcs);
        e.vcs_url = v->uri.without_vcs_prefix();
        e.ref = v->ref.value_or("");
        e.editable = v->editable;
        e.subdirectory = v->subdirectory.value_or("");
    }

    if (!is_editable()) e.hashes.assign(hashes_.begin(), hashes_.end());
    return e;
}

Result<ManifestEntry> Requirement::to_lock_entry() const {
    ManifestEntry e = to_manifest();
    if (auto n = as_named()) {
        if (!pinned_version()) {
            return PinionError{PinionError::InvalidArg,
                "'" + n->name + "' is not pinned to a single version",
                "lock entries need an == specifier"};
        }
        e.version = n->version->to_string();
    }
    return Result<ManifestEntry>::ok(std::move(e));
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

const std::string& Requirement::name() const {
    return std::visit([](const auto& s) -> const std::string& { return s.name; }, source_);
}

std::string Requirement::key() const {
    return normalize_name(name());
}

bool Requirement::is_editable() const {
    if (auto f = as_file()) return f->editable;
    if (auto v = as_vcs()) return v->editable;
    return false;
}

std::optional<std::string> Requirement::pinned_version() const {
    auto n = as_named();
    if (!n || !n->version || n->version->size() != 1) return std::nullopt;
    const auto& spec = n->version->specs().front();
    if ((spec.op == SpecOp::Eq && !spec.has_wildcard()) || spec.op == SpecOp::Arbitrary) {
        return spec.version;
    }
    return std::nullopt;
}

bool Requirement::is_pinned() const {
    if (pinned_version()) return true;
    auto v = as_vcs();
    return v && v->ref.has_value();
}

std::optional<SpecifierSet> Requirement::specifier() const {
    if (auto n = as_named()) return n->version;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Derived requirements
// ---------------------------------------------------------------------------

Result<Requirement> Requirement::resolve_name(const PackageMetadata& meta) const {
    if (!is_unnamed()) {
        return PinionError{PinionError::InvalidArg,
            "requirement '" + name() + "' already has a name"};
    }
    if (!is_valid_name(meta.name)) {
        return PinionError{PinionError::Manifest,
            "invalid package name '" + meta.name + "' in local metadata"};
    }

    Requirement out = *this;
    if (auto f = std::get_if<FileRequirement>(&out.source_)) f->name = meta.name;
    return Result<Requirement>::ok(std::move(out));
}

Requirement Requirement::merge_markers(const Marker& m) const {
    // No marker means always active, which absorbs any alternative
    if (!markers_) return *this;
    Requirement out = *this;
    out.markers_ = or_markers(*markers_, m);
    return out;
}

Requirement Requirement::with_markers(std::optional<Marker> m) const {
    Requirement out = *this;
    out.markers_ = std::move(m);
    return out;
}

Requirement Requirement::with_extras(std::vector<std::string> extras) const {
    Requirement out = *this;
    out.extras_ = normalize_extras(extras);
    return out;
}

Requirement Requirement::with_hashes(const std::set<std::string>& hashes) const {
    Requirement out = *this;
    out.hashes_.insert(hashes.begin(), hashes.end());
    return out;
}

Requirement Requirement::with_version(SpecifierSet version) const {
    Requirement out = *this;
    if (auto n = std::get_if<NamedRequirement>(&out.source_)) n->version = std::move(version);
    return out;
}

Requirement Requirement::with_ref(std::string ref) const {
    Requirement out = *this;
    if (auto v = std::get_if<VcsRequirement>(&out.source_)) v->ref = std::move(ref);
    return out;
}

Requirement Requirement::with_index(std::string index) const {
    Requirement out = *this;
    out.index_ = non_empty(index);
    return out;
}

void Requirement::add_hash(std::string hash) {
    hashes_.insert(std::move(hash));
}

// ---------------------------------------------------------------------------
// Equality under canonicalization
// ---------------------------------------------------------------------------

static std::optional<std::string> location(const std::optional<Uri>& uri) {
    if (!uri) return std::nullopt;
    return uri->full_url();
}

bool Requirement::operator==(const Requirement& o) const {
    if (key() != o.key() || source_.index() != o.source_.index()) return false;
    if (extras_ != o.extras_ || hashes_ != o.hashes_ || index_ != o.index_) return false;
    if (markers_ != o.markers_) return false;

    if (auto n = as_named()) {
        return n->version == o.as_named()->version;
    }
    if (auto f = as_file()) {
        auto g = o.as_file();
        return f->path == g->path && location(f->uri) == location(g->uri) &&
               f->editable == g->editable && f->subdirectory == g->subdirectory;
    }
    auto v = as_vcs();
    auto w = o.as_vcs();
    return v->vcs == w->vcs && v->uri.full_url() == w->uri.full_url() &&
           v->ref == w->ref && v->editable == w->editable &&
           v->subdirectory == w->subdirectory;
}

bool Requirement::operator!=(const Requirement& o) const {
    return !(*this == o);
}

} // namespace pinion
