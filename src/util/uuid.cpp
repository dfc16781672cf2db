#include <folio/uuid.hpp>

#include <algorithm>
#include <fstream>
#include <random>

namespace folio {

namespace {

const char HEX[] = "0123456789abcdef";

// Byte offsets (in the 36-char text form) of the four dashes
constexpr int DASHES[] = {8, 13, 18, 23};

bool is_dash_position(size_t i) {
    for (int d : DASHES) {
        if (static_cast<size_t>(d) == i) return true;
    }
    return false;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Position of the first character that breaks the 8-4-4-4-12 shape,
// or -1 when s is well formed. Fills bytes when given.
int first_bad_char(const std::string& s, uint8_t* bytes) {
    if (s.size() != 36) return static_cast<int>(std::min<size_t>(s.size(), 36));
    int out = 0;
    for (size_t i = 0; i < 36;) {
        if (is_dash_position(i)) {
            if (s[i] != '-') return static_cast<int>(i);
            ++i;
            continue;
        }
        int hi = hex_value(s[i]);
        int lo = hex_value(s[i + 1]);
        if (hi < 0) return static_cast<int>(i);
        if (lo < 0) return static_cast<int>(i + 1);
        if (bytes) bytes[out] = static_cast<uint8_t>((hi << 4) | lo);
        ++out;
        i += 2;
    }
    return -1;
}

// Kernel randomness; a per-thread engine only if /dev/urandom is unreadable
void random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len))) {
        return;
    }
    thread_local std::mt19937_64 gen{std::random_device{}()};
    for (size_t i = 0; i < len; i += 8) {
        uint64_t word = gen();
        for (size_t j = 0; j < 8 && i + j < len; ++j) {
            buf[i + j] = static_cast<uint8_t>(word >> (8 * j));
        }
    }
}

} // namespace

Uuid Uuid::v4() {
    Uuid u;
    random_bytes(u.bytes.data(), u.bytes.size());
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;   // version 4
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;   // RFC 4122 variant
    return u;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (is_dash_position(out.size())) out += '-';
        out += HEX[bytes[i] >> 4];
        out += HEX[bytes[i] & 0x0F];
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    Uuid u;
    int bad = first_bad_char(s, u.bytes.data());
    if (bad < 0) return Result<Uuid>::ok(u);

    std::string hint = s.size() != 36
        ? "expected 36 characters, got " + std::to_string(s.size())
        : "unexpected character at position " + std::to_string(bad);
    return FolioError(FolioError::Validation, "malformed identifier '" + s + "'",
                      hint + " (format xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)");
}

bool Uuid::operator==(const Uuid& other) const { return bytes == other.bytes; }
bool Uuid::operator!=(const Uuid& other) const { return bytes != other.bytes; }

std::string new_id() {
    return Uuid::v4().to_string();
}

bool is_uuid(const std::string& s) {
    return first_bad_char(s, nullptr) < 0;
}

} // namespace folio
