#pragma once

#include <folio/result.hpp>
#include <folio/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// SQLite-backed relational index of repositories, branches, file records and
// branch permissions. Bytes never live here; Git is the content store.
//
// One connection per store, guarded by a recursive mutex. Every public call
// locks it; a Transaction keeps it locked for its whole scope so that the
// statements it groups are not interleaved with other threads' statements.
class IndexStore {
    struct Impl;

public:
    // Scoped transaction. Rolls back on destruction unless commit() succeeded.
    // Nested transactions on the same thread become savepoints.
    class Transaction {
    public:
        Transaction(Transaction&& other) noexcept;
        Transaction& operator=(Transaction&&) = delete;
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        ~Transaction();

        Status commit();
        Status rollback();
        bool active() const { return active_; }

    private:
        friend class IndexStore;
        Transaction(Impl* impl, std::unique_lock<std::recursive_mutex> lock,
                    std::string savepoint);

        Impl* impl_ = nullptr;
        std::unique_lock<std::recursive_mutex> lock_;
        std::string savepoint_;
        bool active_ = false;
    };

    IndexStore();
    ~IndexStore();
    IndexStore(IndexStore&&) noexcept;
    IndexStore& operator=(IndexStore&&) noexcept;

    // Database lifecycle. ":memory:" opens a private in-memory index.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    Result<Transaction> begin();

    // Raw SQL for migrations and diagnostics
    Status execute(const std::string& sql);

    // Repositories (one per project)
    Result<Repository> get_repository(const std::string& project_id);
    Status insert_repository(const Repository& repo);
    Status update_repository(const Repository& repo);

    // Branches
    Result<Branch> get_branch(const std::string& branch_id);
    // Non-deleted branch by exact name
    Result<Branch> find_branch(const std::string& project_id, const std::string& name);
    Status insert_branch(const Branch& branch);
    Status update_branch(const Branch& branch);
    Status update_branch_head(const std::string& branch_id, const std::string& commit);
    // Non-deleted branches, default branch first, then by creation time
    Result<std::vector<Branch>> list_branches(const std::string& project_id,
                                              int offset, int limit);
    Result<int64_t> count_branches(const std::string& project_id);

    // File records
    Result<FileRecord> find_file(const std::string& branch_id, const std::string& path);
    Result<std::vector<FileRecord>> list_files(const std::string& branch_id);
    Result<int64_t> count_files(const std::string& branch_id);
    // Insert, or update size/modifier and revive a soft-deleted record
    Result<FileRecord> upsert_file(const FileRecord& record);
    Status update_file_size(const std::string& file_id, int64_t size);
    // Returns false when no live record existed
    Result<bool> soft_delete_file(const std::string& branch_id, const std::string& path,
                                  const std::string& actor_id);

    // Branch permissions
    Result<std::optional<BranchPermission>> get_permission(const std::string& branch_id,
                                                           const std::string& user_id);
    Status upsert_permission(const BranchPermission& perm);
    Status delete_permission(const std::string& branch_id, const std::string& user_id);
    Result<std::vector<BranchPermission>> list_permissions(const std::string& branch_id);

private:
    std::unique_ptr<Impl> impl_;
};

} // namespace folio
