#pragma once

#include <folio/index_store.hpp>
#include <folio/result.hpp>
#include <folio/types.hpp>
#include <string>
#include <vector>

namespace folio {

enum class Access { Read, Write, Admin };

const char* access_name(Access a);

// Admin implies write implies read
bool allows(const PermissionFlags& flags, Access needed);

// Per-branch, per-user access flags stored in the index
class PermissionIndex {
public:
    explicit PermissionIndex(IndexStore& store);

    // No row means no access
    Result<PermissionFlags> get(const std::string& branch_id, const std::string& user_id);

    // Idempotent upsert; flags are stored exactly as given
    Status grant(const std::string& branch_id, const std::string& user_id,
                 const PermissionFlags& flags, const std::string& granted_by);

    Status revoke(const std::string& branch_id, const std::string& user_id);

    Result<std::vector<BranchPermission>> list(const std::string& branch_id);

    // PermissionDenied unless the user holds the access level
    Status require(const std::string& branch_id, const std::string& user_id,
                   Access needed);

private:
    IndexStore& store_;
};

} // namespace folio
