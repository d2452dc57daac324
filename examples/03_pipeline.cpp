// ============================================================================
// Example 03: Pipelines over Collections
// ============================================================================
//
// This example parses a batch of records, first stopping at the first bad
// record, then collecting every bad record, then combining independent
// lookups into one value.
//
// RUN:
//   cd build && ./examples/03_pipeline
//
// ============================================================================

#include "unionkit/unionkit.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace unionkit;

Result<int> ParseQuantity(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return ValidationError("Quantity.Invalid", "Invalid quantity '" + text + "'");
    }
    return std::stoi(text);
}

Result<std::string> FindCustomer(int id) {
    if (id != 7) return NotFoundError("Customer.NotFound", "No customer " + std::to_string(id));
    return std::string("Ada");
}

Result<double> FindPrice(const std::string& sku) {
    if (sku != "A-1") return NotFoundError("Price.NotFound", "No price for " + sku);
    return 9.5;
}

int main() {
    std::cout << "=== Unionkit Example 03: Pipeline ===" << std::endl;
    std::cout << std::endl;

    std::vector<std::string> lines = {"3", "x", "12", "", "5"};

    // Example 1: Traverse stops at the first failure
    std::cout << "--- Example 1: Traverse ---" << std::endl;
    std::cout << Traverse(lines, ParseQuantity).Map([](const std::vector<int>& v) { return v.size(); })
              << std::endl;
    std::cout << std::endl;

    // Example 2: CollectAll reports every failure
    std::cout << "--- Example 2: CollectAll and Partition ---" << std::endl;
    std::vector<Result<int>> parsed;
    for (const auto& line : lines) parsed.push_back(ParseQuantity(line));

    auto all = CollectAll(parsed);
    all.OnFailure([](const Error& e) { std::cout << e << std::endl; });

    auto [quantities, errors] = Partition(parsed);
    std::cout << quantities.size() << " good, " << errors.size() << " bad" << std::endl;
    std::cout << std::endl;

    // Example 3: Combine independent lookups
    std::cout << "--- Example 3: Combine ---" << std::endl;
    auto order = Combine(FindCustomer(7), FindPrice("A-1"), ParseQuantity("3"))
                     .Map([](const std::string& customer, double price, int quantity) {
                         return customer + " owes " + std::to_string(price * quantity);
                     });
    std::cout << order << std::endl;

    auto broken = BindAll(FindCustomer(8), FindPrice("B-2"));
    std::cout << broken.Match([](const std::string&, double) { return std::string("ok"); },
                              [](const Error& e) { return e.ToString(); })
              << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
