#pragma once

#include <folio/config.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace folio {

// Key material for one Git-mutating operation
struct WriteKey {
    std::string project_id;
    std::string branch_id;
};

// Decides which Git-mutating operations run one at a time.
// Operations sharing a working tree race on checkout without one.
class WriteSerializer {
public:
    virtual ~WriteSerializer() = default;

    // Runs fn while holding whatever lock the key maps to
    virtual void run(const WriteKey& key, const std::function<void()>& fn) = 0;
};

// No locking; concurrent writers on one branch may interleave
class NullSerializer : public WriteSerializer {
public:
    void run(const WriteKey& key, const std::function<void()>& fn) override;
};

// One mutex per branch or per repository, created on first use.
//
// All branches of a project share one working tree, so every call that names
// a project also holds that project's tree mutex. Branch scope adds a branch
// mutex taken before it, which queues callers on one branch behind each other
// without letting two branches check out at once.
class KeyedMutexSerializer : public WriteSerializer {
public:
    explicit KeyedMutexSerializer(SerializeScope scope);

    void run(const WriteKey& key, const std::function<void()>& fn) override;

    SerializeScope scope() const { return scope_; }

private:
    std::mutex& mutex_for(const std::string& key);

    SerializeScope scope_;
    std::mutex map_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> mutexes_;
};

std::unique_ptr<WriteSerializer> make_serializer(SerializeScope scope);

} // namespace folio
