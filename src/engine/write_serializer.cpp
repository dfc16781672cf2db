#include <folio/write_serializer.hpp>

namespace folio {

void NullSerializer::run(const WriteKey&, const std::function<void()>& fn) {
    fn();
}

KeyedMutexSerializer::KeyedMutexSerializer(SerializeScope scope) : scope_(scope) {}

std::mutex& KeyedMutexSerializer::mutex_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = mutexes_[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

void KeyedMutexSerializer::run(const WriteKey& key, const std::function<void()>& fn) {
    if (scope_ == SerializeScope::Branch && !key.branch_id.empty()) {
        // Branch first, then the working tree; project-keyed calls take only
        // the second, so the order never inverts
        std::lock_guard<std::mutex> branch_lock(mutex_for("branch:" + key.branch_id));
        if (key.project_id.empty()) {
            fn();
            return;
        }
        std::lock_guard<std::mutex> tree_lock(mutex_for("project:" + key.project_id));
        fn();
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_for("project:" + key.project_id));
    fn();
}

std::unique_ptr<WriteSerializer> make_serializer(SerializeScope scope) {
    if (scope == SerializeScope::None) {
        return std::make_unique<NullSerializer>();
    }
    return std::make_unique<KeyedMutexSerializer>(scope);
}

} // namespace folio
