#pragma once

#include <folio/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// On-disk layout of the repository store
//
//   <root>/<sanitized-name>_<projectId[0:8]>/          Git working tree
//   <repo>/<subproject>/...                            LaTeX sub-projects
//   <repo>/file/<subproject>/...                       legacy layout (read only)
//   <repo>/compilations/<jobId>/{source/,output/,metadata.json}
namespace layout {

constexpr const char* COMPILATIONS_DIR = "compilations";
constexpr const char* LEGACY_FILE_DIR = "file";
constexpr const char* METADATA_FILE = "metadata.json";

// Lowercase; every character outside [a-z0-9_-] becomes '_'
std::string sanitize_name(const std::string& name);

// <sanitized-name>_<first 8 chars of projectId>
std::string repo_dir_name(const std::string& project_name, const std::string& project_id);

std::string repo_path(const std::string& root, const std::string& project_name,
                      const std::string& project_id);

std::string compilations_path(const std::string& repo_path);
std::string job_path(const std::string& repo_path, const std::string& job_id);

// Strip leading slashes, collapse "//" and trailing "/"; backslashes become "/"
std::string normalize_path(const std::string& path);

// Normalized path, or Validation error: empty, "." or ".." components,
// a .git component anywhere, or under the top-level compilations/
Result<std::string> validate_file_path(const std::string& path);

// Ordered list of candidate locations for a repository-relative path:
// current layout first, then the legacy file/ layout. Writers only ever use
// the first entry.
std::vector<std::string> candidate_paths(const std::string& repo_path,
                                         const std::string& relative);

// First candidate that exists on disk (as a regular file when want_file,
// otherwise as a directory)
std::optional<std::string> resolve_existing(const std::string& repo_path,
                                            const std::string& relative,
                                            bool want_file);

// Reduce a sub-project id "<projectId>_<name>" to "<name>"; bare names
// pass through
std::string subproject_name(const std::string& project_id, const std::string& subproject);

// "<projectId>_<name>"
std::string subproject_id(const std::string& project_id, const std::string& name);

// The name itself, or Validation error: not exactly one path component, or a
// reserved top-level directory (compilations, file)
Result<std::string> validate_subproject_name(const std::string& name);

// File extension without the dot, lowercased ("" when there is none)
std::string extension_of(const std::string& path);

// Last path component
std::string file_name_of(const std::string& path);

} // namespace layout
} // namespace folio
