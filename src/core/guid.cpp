// ============================================================================
// unionkit/core/guid.cpp - Guid Parsing and Formatting
// ============================================================================

#include "unionkit/core/guid.hpp"

#include <algorithm>
#include <cstddef>

namespace unionkit {

namespace {

constexpr size_t kCanonicalLength = 36;
constexpr std::array<size_t, 4> kHyphenPositions = {8, 13, 18, 23};
constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool IsHyphenPosition(size_t index) noexcept {
    return std::find(kHyphenPositions.begin(), kHyphenPositions.end(), index) != kHyphenPositions.end();
}

}  // namespace

Option<Guid> Guid::Parse(std::string_view text) {
    if (text.size() == kCanonicalLength + 2) {
        if (text.front() != '{' || text.back() != '}') return None;
        text = text.substr(1, kCanonicalLength);
    }
    if (text.size() != kCanonicalLength) return None;

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (IsHyphenPosition(i)) {
            if (text[i] != '-') return None;
            continue;
        }
        int value = HexValue(text[i]);
        if (value < 0) return None;
        auto& byte = bytes[nibble / 2];
        byte = static_cast<std::uint8_t>(nibble % 2 == 0 ? value << 4 : byte | value);
        ++nibble;
    }
    return Guid(bytes);
}

bool Guid::IsNil() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::string Guid::ToString() const {
    std::string out;
    out.reserve(kCanonicalLength);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += kHexDigits[bytes_[i] >> 4];
        out += kHexDigits[bytes_[i] & 0x0F];
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Guid& guid) {
    return os << guid.ToString();
}

}  // namespace unionkit
