// ============================================================================
// Example 01: Basic Option and Result Usage
// ============================================================================
//
// This example demonstrates Option<T> for values that may be absent and
// Result<T> for operations that may fail.
//
// RUN:
//   cd build && ./examples/01_basic_option
//
// ============================================================================

#include "unionkit/unionkit.hpp"

#include <iostream>
#include <map>
#include <string>

using namespace unionkit;

// A lookup that may find nothing
Option<int> FindPort(const std::map<std::string, int>& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) return None;
    return it->second;
}

// A parse that may fail with a reason
Result<int> ParsePositive(const std::string& text) {
    if (text.empty()) return ValidationError("Number.Empty", "Input is empty");
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return ValidationError("Number.Invalid", "Not a number: " + text);
        value = value * 10 + (c - '0');
    }
    return value;
}

int main() {
    std::cout << "=== Unionkit Example 01: Basic Option ===" << std::endl;
    std::cout << std::endl;

    std::map<std::string, int> config = {{"http", 80}, {"https", 443}};

    // Example 1: Present and absent values
    std::cout << "--- Example 1: Lookup ---" << std::endl;
    std::cout << "https: " << FindPort(config, "https") << std::endl;
    std::cout << "ftp:   " << FindPort(config, "ftp") << std::endl;
    std::cout << std::endl;

    // Example 2: Transforming without unwrapping
    std::cout << "--- Example 2: Map and OrElse ---" << std::endl;
    auto url = FindPort(config, "http").Map([](int port) { return "localhost:" + std::to_string(port); });
    auto fallback = FindPort(config, "ftp").OrElse(Some(21));
    std::cout << "url:      " << url << std::endl;
    std::cout << "fallback: " << fallback << std::endl;
    std::cout << std::endl;

    // Example 3: Failures carry an Error
    std::cout << "--- Example 3: Result ---" << std::endl;
    for (const std::string input : {"42", "", "4x2"}) {
        auto message = ParsePositive(input).Match(
            [](int v) { return "parsed " + std::to_string(v); },
            [](const Error& e) { return e.ToString(); });
        std::cout << "'" << input << "' -> " << message << std::endl;
    }
    std::cout << std::endl;

    // Example 4: Crossing between the two
    std::cout << "--- Example 4: Option to Result ---" << std::endl;
    Result<int> required = FindPort(config, "ssh").ToResult(NotFoundError("Config.Missing", "No ssh port"));
    std::cout << required << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
