#include <folio/types.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>

namespace folio {

const char* branch_status_name(BranchStatus s) {
    switch (s) {
        case BranchStatus::Active:   return "active";
        case BranchStatus::Merged:   return "merged";
        case BranchStatus::Archived: return "archived";
        case BranchStatus::Deleted:  return "deleted";
    }
    return "active";
}

bool parse_branch_status(const std::string& name, BranchStatus& out) {
    if (name == "active")   { out = BranchStatus::Active;   return true; }
    if (name == "merged")   { out = BranchStatus::Merged;   return true; }
    if (name == "archived") { out = BranchStatus::Archived; return true; }
    if (name == "deleted")  { out = BranchStatus::Deleted;  return true; }
    return false;
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

std::optional<std::chrono::system_clock::time_point>
parse_utc_timestamp(const std::string& ts) {
    std::tm tm{};
    int ms = 0;
    int n = std::sscanf(ts.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms);
    if (n < 6) return std::nullopt;
    if (n == 6) ms = 0;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(ms);
}

} // namespace folio
