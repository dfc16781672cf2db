#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// Resolved identity supplied by the caller
struct Actor {
    std::string id;
    std::string name;
    std::string email;
};

struct Repository {
    std::string id;
    std::string project_id;
    std::string path;
    std::string default_branch_id;   // empty until the main branch row exists
    bool initialized = false;
    std::string created_at;
};

enum class BranchStatus { Active, Merged, Archived, Deleted };

const char* branch_status_name(BranchStatus s);
bool parse_branch_status(const std::string& name, BranchStatus& out);

struct Branch {
    std::string id;
    std::string project_id;
    std::string name;
    std::string description;
    std::string source_branch_id;    // empty for main
    std::string head_commit;
    bool is_default = false;
    bool is_protected = false;
    BranchStatus status = BranchStatus::Active;
    std::string created_by;
    std::string created_at;
    std::string updated_at;
};

struct FileRecord {
    std::string id;
    std::string project_id;
    std::string branch_id;
    std::string path;                // POSIX, relative to the repository root
    std::string name;
    std::string type = "tex";
    int64_t size = 0;
    std::string encoding = "utf-8";
    std::string created_by;
    std::string last_modified_by;
    std::string created_at;
    std::string updated_at;
    std::optional<std::string> deleted_at;
};

struct PermissionFlags {
    bool can_read = false;
    bool can_write = false;
    bool can_admin = false;

    static PermissionFlags full() { return {true, true, true}; }
    static PermissionFlags none() { return {}; }
    bool any() const { return can_read || can_write || can_admin; }
    bool operator==(const PermissionFlags& o) const {
        return can_read == o.can_read && can_write == o.can_write &&
               can_admin == o.can_admin;
    }
    bool operator!=(const PermissionFlags& o) const { return !(*this == o); }
};

struct BranchPermission {
    std::string branch_id;
    std::string user_id;
    PermissionFlags flags;
    std::string granted_by;
    std::string granted_at;
};

// Current time as ISO-8601 UTC with millisecond precision: 2024-05-01T12:00:00.000Z
std::string utc_timestamp();

// Parses the format above (fraction and 'Z' optional); nullopt when malformed
std::optional<std::chrono::system_clock::time_point>
parse_utc_timestamp(const std::string& ts);

} // namespace folio
