#pragma once

#include <pinion/result.hpp>
#include <pinion/uri.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

enum class LineKind { Named, File, Vcs };

// A requirement line split into its parts. Nothing here is interpreted
// beyond syntax: specifier and marker text are kept raw for the
// requirement model to parse.
struct ParsedLine {
    std::string line;                   // input as given
    LineKind kind = LineKind::Named;
    bool editable = false;

    std::string name;                   // empty for an unnamed file source
    std::vector<std::string> extras;    // normalized
    std::string specifier;              // Named only, e.g. ">=1,<2"

    std::optional<Uri> uri;             // URL and VCS forms
    std::string path;                   // local path form
    std::string vcs;                    // "git", "hg", "svn", "bzr"
    std::string ref;
    std::string subdirectory;

    std::string markers;                // text after ';'
    std::vector<std::string> hashes;    // values of --hash=
};

// Parse one pip-style requirement line:
//   [-e] (name[extras][specifier] | url | vcs+url | path) [; marker] [--hash=v ...]
Result<ParsedLine> parse_line(const std::string& line);

// True for strings that name a local path rather than a package
bool looks_like_path(const std::string& s);

// True for local or remote archive names (.zip, .tar.gz, .whl, ...)
bool is_archive_file(const std::string& s);

} // namespace pinion
