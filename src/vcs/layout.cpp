#include <folio/layout.hpp>
#include <folio/uuid.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace folio::layout {

std::string sanitize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        char lc = static_cast<char>(std::tolower(c));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') ||
            lc == '_' || lc == '-') {
            out += lc;
        } else {
            out += '_';
        }
    }
    return out;
}

std::string repo_dir_name(const std::string& project_name,
                          const std::string& project_id) {
    return sanitize_name(project_name) + "_" + short_id(project_id);
}

std::string repo_path(const std::string& root, const std::string& project_name,
                      const std::string& project_id) {
    return (fs::path(root) / repo_dir_name(project_name, project_id)).string();
}

std::string compilations_path(const std::string& repo_path) {
    return (fs::path(repo_path) / COMPILATIONS_DIR).string();
}

std::string job_path(const std::string& repo_path, const std::string& job_id) {
    return (fs::path(repo_path) / COMPILATIONS_DIR / job_id).string();
}

std::string normalize_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\') c = '/';
        if (c == '/' && (out.empty() || out.back() == '/')) continue;
        out += c;
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

Result<std::string> validate_file_path(const std::string& path) {
    std::string norm = normalize_path(path);
    if (norm.empty()) {
        return FolioError{FolioError::Validation, "file path must not be empty"};
    }

    size_t start = 0;
    bool first = true;
    while (start <= norm.size()) {
        size_t pos = norm.find('/', start);
        if (pos == std::string::npos) pos = norm.size();
        std::string comp = norm.substr(start, pos - start);

        if (comp == "." || comp == "..") {
            return FolioError{FolioError::Validation,
                "file path '" + path + "' contains a '" + comp + "' component",
                "use a path relative to the repository root"};
        }
        // Git never tracks anything below a .git directory, at any depth
        if (comp == ".git" || (first && comp == COMPILATIONS_DIR)) {
            return FolioError{FolioError::Validation,
                "file path '" + path + "' is inside reserved directory '" + comp + "'"};
        }
        first = false;
        start = pos + 1;
    }
    return Result<std::string>::ok(std::move(norm));
}

std::vector<std::string> candidate_paths(const std::string& repo_path,
                                         const std::string& relative) {
    std::vector<std::string> out;
    fs::path root(repo_path);
    if (relative.empty()) {
        out.push_back(root.string());
        return out;
    }
    out.push_back((root / relative).string());
    out.push_back((root / LEGACY_FILE_DIR / relative).string());
    return out;
}

std::optional<std::string> resolve_existing(const std::string& repo_path,
                                            const std::string& relative,
                                            bool want_file) {
    for (const auto& candidate : candidate_paths(repo_path, relative)) {
        std::error_code ec;
        bool ok = want_file ? fs::is_regular_file(candidate, ec)
                            : fs::is_directory(candidate, ec);
        if (ok) return candidate;
    }
    return std::nullopt;
}

std::string subproject_name(const std::string& project_id, const std::string& subproject) {
    std::string prefix = project_id + "_";
    if (!project_id.empty() && subproject.compare(0, prefix.size(), prefix) == 0) {
        return subproject.substr(prefix.size());
    }
    return subproject;
}

std::string subproject_id(const std::string& project_id, const std::string& name) {
    return project_id + "_" + name;
}

Result<std::string> validate_subproject_name(const std::string& name) {
    auto norm = validate_file_path(name);
    if (norm.is_err()) return norm;
    if (norm.value().find('/') != std::string::npos || norm.value() != name) {
        return FolioError{FolioError::Validation,
            "sub-project name '" + name + "' must be a single directory name"};
    }
    if (name == LEGACY_FILE_DIR) {
        return FolioError{FolioError::Validation,
            "sub-project name '" + name + "' is reserved"};
    }
    return norm;
}

std::string extension_of(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string file_name_of(const std::string& path) {
    return fs::path(path).filename().string();
}

} // namespace folio::layout
