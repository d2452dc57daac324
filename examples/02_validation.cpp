// ============================================================================
// Example 02: Validation with Named Checks
// ============================================================================
//
// This example validates a sign-up form two ways: fail-fast with
// EnsureThat(), and reporting every problem at once with EnsureAll().
//
// RUN:
//   cd build && ./examples/02_validation
//
// ============================================================================

#include "unionkit/unionkit.hpp"

#include <iostream>
#include <string>

using namespace unionkit;

struct SignUp {
    std::string name;
    int age;
    std::string email;
};

// Stops at the first broken rule
Result<std::string> ValidateEmail(const std::string& email) {
    return Result<std::string>(email)
        .EnsureThat()
        .Check(checks::NotBlank())
        .Check(checks::Contains("@"), ValidationError("Email.Invalid", "Email must contain '@'"))
        .Check(checks::ShorterThanOrEqualTo(64));
}

// Reports every broken rule
Result<void> ValidateForm(const SignUp& form) {
    return EnsureAll({
        {!form.name.empty(), ValidationError("Name.Required", "Name required")},
        {form.age >= 0 && form.age < 150, ValidationError("Age.Invalid", "Age invalid")},
        {ValidateEmail(form.email).IsSuccess(), ValidationError("Email.Invalid", "Email invalid")},
    });
}

int main() {
    std::cout << "=== Unionkit Example 02: Validation ===" << std::endl;
    std::cout << std::endl;

    // Example 1: Fail-fast
    std::cout << "--- Example 1: EnsureThat ---" << std::endl;
    std::cout << ValidateEmail("ada@example.org") << std::endl;
    std::cout << ValidateEmail("   ") << std::endl;
    std::cout << ValidateEmail("ada.example.org") << std::endl;
    std::cout << std::endl;

    // Example 2: Accumulating
    std::cout << "--- Example 2: EnsureAll ---" << std::endl;
    std::cout << ValidateForm(SignUp{"Ada", 36, "ada@example.org"}) << std::endl;
    std::cout << ValidateForm(SignUp{"", -1, "ada@example.org"}) << std::endl;
    std::cout << std::endl;

    // Example 3: Filtering an Option keeps only the value, not the reason
    std::cout << "--- Example 3: Filter ---" << std::endl;
    Option<std::string> nickname = Some(std::string("x"));
    Option<std::string> usable = nickname.Filter().Check(checks::LongerThanOrEqualTo(3));
    std::cout << "nickname: " << usable << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
