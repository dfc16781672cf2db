#include <folio/permission_index.hpp>
#include <folio/log.hpp>

namespace folio {

const char* access_name(Access a) {
    switch (a) {
        case Access::Read:  return "read";
        case Access::Write: return "write";
        case Access::Admin: return "admin";
    }
    return "read";
}

bool allows(const PermissionFlags& flags, Access needed) {
    switch (needed) {
        case Access::Read:  return flags.can_read || flags.can_write || flags.can_admin;
        case Access::Write: return flags.can_write || flags.can_admin;
        case Access::Admin: return flags.can_admin;
    }
    return false;
}

PermissionIndex::PermissionIndex(IndexStore& store) : store_(store) {}

Result<PermissionFlags> PermissionIndex::get(const std::string& branch_id,
                                             const std::string& user_id) {
    auto row = store_.get_permission(branch_id, user_id);
    if (row.is_err()) return std::move(row).error();
    if (!row.value().has_value()) {
        return Result<PermissionFlags>::ok(PermissionFlags::none());
    }
    return Result<PermissionFlags>::ok(row.value()->flags);
}

Status PermissionIndex::grant(const std::string& branch_id, const std::string& user_id,
                              const PermissionFlags& flags,
                              const std::string& granted_by) {
    if (user_id.empty()) {
        return FolioError{FolioError::InvalidArg, "grant: empty user id"};
    }
    BranchPermission perm;
    perm.branch_id = branch_id;
    perm.user_id = user_id;
    perm.flags = flags;
    perm.granted_by = granted_by;
    perm.granted_at = utc_timestamp();
    FOLIO_TRY(store_.upsert_permission(perm));

    log::debug("granted r=%d w=%d a=%d on branch %s to %s",
               flags.can_read, flags.can_write, flags.can_admin,
               branch_id.c_str(), user_id.c_str());
    return ok_status();
}

Status PermissionIndex::revoke(const std::string& branch_id,
                               const std::string& user_id) {
    return store_.delete_permission(branch_id, user_id);
}

Result<std::vector<BranchPermission>> PermissionIndex::list(const std::string& branch_id) {
    return store_.list_permissions(branch_id);
}

Status PermissionIndex::require(const std::string& branch_id, const std::string& user_id,
                                Access needed) {
    auto flags = get(branch_id, user_id);
    if (flags.is_err()) return std::move(flags).error();
    if (!allows(flags.value(), needed)) {
        return FolioError{FolioError::PermissionDenied,
            "user " + user_id + " lacks " + access_name(needed) +
            " access on branch " + branch_id};
    }
    return ok_status();
}

} // namespace folio
