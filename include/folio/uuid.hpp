#pragma once

#include <folio/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace folio {

// 128-bit identifier for index rows and compilation jobs. Everything outside
// this file passes ids around as canonical lowercase strings.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();

    // Accepts upper or lower case hex; Validation error otherwise
    static Result<Uuid> from_string(const std::string& s);

    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

std::string new_id();

// Well-formed 36-character id of any version
bool is_uuid(const std::string& s);

// First 8 characters, used in directory and download names
inline std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace folio
