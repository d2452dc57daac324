// ============================================================================
// unionkit/core/check.hpp - Always-On Precondition Checks
// ============================================================================
//
// UNIONKIT_CHECK(cond, msg) is an assertion that survives Release builds.
// It guards the unchecked accessors of the value types:
//
//   Option<T>::Value()      on None
//   Result<T>::Value()      on a failure
//   Result<T>::Error()      on a success
//   ErrorBuilder::Build()   with nothing accumulated
//
// These are programming errors, not recoverable failures. A caller that
// cannot prove the state must use Match(), ValueOr() or TryGetValue().
//
// OUTPUT:
// -------
//   unionkit: precondition violated: Option is None
//     check: IsSome()
//     at:    include/unionkit/core/option.hpp:134
//     in:    const T& unionkit::Option<T>::Value() const & [with T = int]
//
// followed by std::abort().
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <source_location>
#include <string_view>

namespace unionkit::detail {

// Digits of value, written backwards from the end of the buffer.
inline std::string_view FormatLine(unsigned int value, char (&buf)[12]) {
    char* end = buf + sizeof(buf);
    char* p = end;
    do {
        *--p = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    return std::string_view(p, static_cast<size_t>(end - p));
}

inline void WriteParts(std::initializer_list<std::string_view> parts) {
    for (std::string_view part : parts) std::fwrite(part.data(), 1, part.size(), stderr);
}

[[noreturn]] inline void PreconditionFailed(const char* condition, const char* message,
                                            const std::source_location& site) {
    char line_buf[12];
    WriteParts({"unionkit: precondition violated: ", message, "\n  check: ", condition, "\n  at:    ",
                site.file_name(), ":", FormatLine(site.line(), line_buf), "\n  in:    ", site.function_name(), "\n"});
    std::fflush(stderr);
    std::abort();
}

}  // namespace unionkit::detail

#define UNIONKIT_CHECK(cond, msg)                                                                \
    do {                                                                                         \
        if (!(cond)) [[unlikely]] {                                                              \
            ::unionkit::detail::PreconditionFailed(#cond, msg, std::source_location::current()); \
        }                                                                                        \
    } while (0)
