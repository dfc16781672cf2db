#include <catch2/catch.hpp>
#include <folio/write_serializer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace folio;

namespace {

// Runs one call per key concurrently and reports the peak number of
// callbacks inside the serializer at once
int peak_concurrency(WriteSerializer& serializer, const std::vector<WriteKey>& keys) {
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;
    for (const auto& key : keys) {
        threads.emplace_back([&, key] {
            serializer.run(key, [&] {
                int now = ++inside;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                // Hold long enough for the others to try
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                --inside;
            });
        });
    }
    for (auto& t : threads) t.join();
    return peak.load();
}

} // namespace

TEST_CASE("make_serializer picks the implementation by scope", "[write_serializer]") {
    auto none = make_serializer(SerializeScope::None);
    REQUIRE(dynamic_cast<NullSerializer*>(none.get()) != nullptr);

    auto branch = make_serializer(SerializeScope::Branch);
    auto* keyed = dynamic_cast<KeyedMutexSerializer*>(branch.get());
    REQUIRE(keyed != nullptr);
    REQUIRE(keyed->scope() == SerializeScope::Branch);

    auto repo = make_serializer(SerializeScope::Repository);
    REQUIRE(dynamic_cast<KeyedMutexSerializer*>(repo.get())->scope() ==
            SerializeScope::Repository);
}

TEST_CASE("NullSerializer runs the callback once", "[write_serializer]") {
    NullSerializer s;
    int calls = 0;
    s.run(WriteKey{"p", "b"}, [&] { ++calls; });
    REQUIRE(calls == 1);
}

TEST_CASE("Branch scope serializes one branch", "[write_serializer]") {
    KeyedMutexSerializer s(SerializeScope::Branch);
    REQUIRE(peak_concurrency(s, {{"p", "b1"}, {"p", "b1"}, {"p", "b1"}}) == 1);
}

TEST_CASE("Branch scope still serializes branches of one working tree", "[write_serializer]") {
    KeyedMutexSerializer s(SerializeScope::Branch);
    REQUIRE(peak_concurrency(s, {{"p", "b1"}, {"p", "b2"}, {"p", "b3"}}) == 1);
    // Project-keyed calls wait for branch-keyed ones
    REQUIRE(peak_concurrency(s, {{"p", "b1"}, {"p", ""}}) == 1);
}

TEST_CASE("Branch scope lets different projects overlap", "[write_serializer]") {
    KeyedMutexSerializer s(SerializeScope::Branch);
    REQUIRE(peak_concurrency(s, {{"p1", "b1"}, {"p2", "b2"}}) == 2);
}

TEST_CASE("Branch scope without a branch falls back to the project", "[write_serializer]") {
    KeyedMutexSerializer s(SerializeScope::Branch);
    REQUIRE(peak_concurrency(s, {{"p", ""}, {"p", ""}}) == 1);
}

TEST_CASE("Repository scope serializes across branches", "[write_serializer]") {
    KeyedMutexSerializer s(SerializeScope::Repository);
    REQUIRE(peak_concurrency(s, {{"p", "b1"}, {"p", "b2"}, {"p", "b3"}}) == 1);
    REQUIRE(peak_concurrency(s, {{"p1", "b"}, {"p2", "b"}}) == 2);
}
