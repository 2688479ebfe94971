/**
 * RoutingTable tests
 */

#include "../include/rpc/routing_table.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcpgw::rpc;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_EQ(a, b) assert((a) == (b))

TEST(test_lookup) {
    RoutingTable routes;
    ASSERT_TRUE(routes.empty());
    ASSERT_TRUE(routes.add("get_price", "market-data"));
    ASSERT_TRUE(routes.add("get_balance", "portfolio"));

    ASSERT_EQ(routes.size(), 2u);
    ASSERT_EQ(*routes.lookup("get_price"), "market-data");
    ASSERT_EQ(*routes.lookup("get_balance"), "portfolio");
    ASSERT_TRUE(routes.contains("get_price"));
    ASSERT_FALSE(routes.lookup("missing").has_value());
    ASSERT_FALSE(routes.contains("missing"));
}

TEST(test_same_pair_is_idempotent) {
    RoutingTable routes;
    ASSERT_TRUE(routes.add("get_price", "market-data"));
    ASSERT_TRUE(routes.add("get_price", "market-data"));
    ASSERT_EQ(routes.size(), 1u);
}

TEST(test_conflict_keeps_first_owner) {
    RoutingTable routes;
    ASSERT_TRUE(routes.add("analyze", "technical-analysis"));

    std::string owner;
    ASSERT_FALSE(routes.add("analyze", "social-analysis", &owner));
    ASSERT_EQ(owner, "technical-analysis");
    ASSERT_EQ(*routes.lookup("analyze"), "technical-analysis");

    // Owner pointer is optional
    ASSERT_FALSE(routes.add("analyze", "alerts"));
}

TEST(test_clear) {
    RoutingTable routes;
    routes.add("a", "w1");
    routes.add("b", "w2");
    ASSERT_EQ(routes.entries().size(), 2u);
    ASSERT_EQ(routes.entries().begin()->first, "a");
    routes.clear();
    ASSERT_TRUE(routes.empty());
    ASSERT_FALSE(routes.lookup("a").has_value());
}

int main() {
    std::cout << "=== Routing Table Tests ===\n";
    RUN_TEST(test_lookup);
    RUN_TEST(test_same_pair_is_idempotent);
    RUN_TEST(test_conflict_keeps_first_owner);
    RUN_TEST(test_clear);
    std::cout << "All tests passed!\n";
    return 0;
}
