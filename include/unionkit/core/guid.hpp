// ============================================================================
// unionkit/core/guid.hpp - 128-bit Identifiers
// ============================================================================
//
// Guid is a plain 16-byte value with the canonical text form
// "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx". Parsing never throws: malformed
// text yields None.
//
// USAGE:
// ------
//   Option<Guid> id = Guid::Parse("{0f8fad5b-d9cb-469f-a165-70867728950e}");
//
//   Result<Guid> checked = id.ToResult(NotFoundError("Order.MissingId", "No id"))
//       .EnsureThat()
//       .Check(checks::NotNil());
//
// ============================================================================

#pragma once

#include "unionkit/core/option.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace unionkit {

class Guid {
   public:
    using Bytes = std::array<std::uint8_t, 16>;

    // The nil GUID, all sixteen bytes zero.
    constexpr Guid() noexcept = default;
    constexpr explicit Guid(const Bytes& bytes) noexcept : bytes_(bytes) {}

    // Accepts the 36-character hyphenated form, optionally wrapped in
    // braces. Hex digits may be either case.
    static Option<Guid> Parse(std::string_view text);

    const Bytes& Data() const noexcept { return bytes_; }

    bool IsNil() const noexcept;

    // Lowercase hyphenated form.
    std::string ToString() const;

    friend bool operator==(const Guid&, const Guid&) = default;
    friend auto operator<=>(const Guid&, const Guid&) = default;

   private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const Guid& guid);

}  // namespace unionkit
