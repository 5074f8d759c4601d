#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dashwire/router/router.hpp"
#include "common/test_check.hpp"

using namespace dashwire;
using namespace dashwire::router;

namespace {

protocol::RawFrame frame(std::string type, std::optional<std::string> channel = std::nullopt) {
    protocol::RawFrame f;
    f.type = std::move(type);
    f.channel = std::move(channel);
    return f;
}

} // namespace

// -----------------------------------------------------------------------------
// Test: type, then channel, then wildcard
// -----------------------------------------------------------------------------
void test_dispatch_order() {
    std::cout << "[TEST] Router dispatch order\n";

    Router router;
    std::vector<std::string> calls;

    auto u1 = router.on_all([&](const protocol::RawFrame&) { calls.push_back("all"); });
    auto u2 = router.on_channel("agents", [&](const protocol::RawFrame&) { calls.push_back("channel"); });
    auto u3 = router.on("agent:status", [&](const protocol::RawFrame&) { calls.push_back("type"); });

    router.route(frame("agent:status", std::string("agents")));
    TEST_CHECK((calls == std::vector<std::string>{"type", "channel", "all"}));

    // No channel: type and wildcard only
    calls.clear();
    router.route(frame("agent:status"));
    TEST_CHECK((calls == std::vector<std::string>{"type", "all"}));

    // Unmatched type still reaches the wildcard
    calls.clear();
    router.route(frame("task:update", std::string("tasks")));
    TEST_CHECK((calls == std::vector<std::string>{"all"}));

    TEST_CHECK(router.routed_count() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: frame types that look like reserved keys are not dispatched by type
// -----------------------------------------------------------------------------
void test_reserved_types() {
    std::cout << "[TEST] Router reserved frame types\n";

    Router router;
    int all = 0;
    int agents = 0;

    auto u1 = router.on_all([&](const protocol::RawFrame&) { ++all; });
    auto u2 = router.on_channel("agents", [&](const protocol::RawFrame&) { ++agents; });

    router.route(frame("*"));
    TEST_CHECK(all == 1);

    router.route(frame("channel:agents"));
    TEST_CHECK(agents == 0);
    TEST_CHECK(all == 2);

    router.route(frame("channel:agents", std::string("agents")));
    TEST_CHECK(agents == 1);
    TEST_CHECK(all == 3);

    TEST_CHECK(is_reserved_type("*"));
    TEST_CHECK(is_reserved_type("channel:x"));
    TEST_CHECK(!is_reserved_type("agent:status"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: registration order within a key
// -----------------------------------------------------------------------------
void test_registration_order() {
    std::cout << "[TEST] Router registration order\n";

    Router router;
    std::vector<int> calls;
    auto u1 = router.on("task:update", [&](const protocol::RawFrame&) { calls.push_back(1); });
    auto u2 = router.on("task:update", [&](const protocol::RawFrame&) { calls.push_back(2); });
    auto u3 = router.on("task:update", [&](const protocol::RawFrame&) { calls.push_back(3); });

    router.route(frame("task:update"));
    TEST_CHECK((calls == std::vector<int>{1, 2, 3}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: unsubscribe removes exactly one handler and erases empty keys
// -----------------------------------------------------------------------------
void test_unsubscribe() {
    std::cout << "[TEST] Router unsubscribe\n";

    Router router;
    int a = 0;
    int b = 0;
    auto ua = router.on("agent:update", [&](const protocol::RawFrame&) { ++a; });
    auto ub = router.on("agent:update", [&](const protocol::RawFrame&) { ++b; });
    TEST_CHECK(router.handler_count() == 2);

    ua();
    router.route(frame("agent:update"));
    TEST_CHECK(a == 0);
    TEST_CHECK(b == 1);

    // Idempotent
    ua();
    TEST_CHECK(router.handler_count() == 1);

    ub();
    TEST_CHECK(!router.has_handlers("agent:update"));
    TEST_CHECK(router.key_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a stale closure never removes a handler registered later
// -----------------------------------------------------------------------------
void test_stale_unsubscribe() {
    std::cout << "[TEST] Router stale unsubscribe\n";

    Router router;
    int calls = 0;
    auto first = router.on("agent:status", [](const protocol::RawFrame&) {});
    first();

    auto second = router.on("agent:status", [&](const protocol::RawFrame&) { ++calls; });
    first();
    router.route(frame("agent:status"));
    TEST_CHECK(calls == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a throwing handler is isolated and counted
// -----------------------------------------------------------------------------
void test_fault_isolation() {
    std::cout << "[TEST] Router fault isolation\n";

    Router router;
    int reached = 0;
    auto u1 = router.on("system:alert", [](const protocol::RawFrame&) { throw std::runtime_error("boom"); });
    auto u2 = router.on("system:alert", [&](const protocol::RawFrame&) { ++reached; });
    auto u3 = router.on_all([](const protocol::RawFrame&) { throw 42; });
    auto u4 = router.on_all([&](const protocol::RawFrame&) { ++reached; });

    router.route(frame("system:alert"));
    TEST_CHECK(reached == 2);
    TEST_CHECK(router.fault_count() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: handlers may unsubscribe themselves while being dispatched
// -----------------------------------------------------------------------------
void test_self_unsubscribe() {
    std::cout << "[TEST] Router self unsubscribe\n";

    Router router;
    int once = 0;
    int always = 0;
    Unsubscribe self;
    self = router.on("task:created", [&](const protocol::RawFrame&) {
        ++once;
        self();
    });
    auto other = router.on("task:created", [&](const protocol::RawFrame&) { ++always; });

    router.route(frame("task:created"));
    router.route(frame("task:created"));
    TEST_CHECK(once == 1);
    TEST_CHECK(always == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: remove_channel and clear
// -----------------------------------------------------------------------------
void test_remove_channel_and_clear() {
    std::cout << "[TEST] Router remove_channel/clear\n";

    Router router;
    int hits = 0;
    auto u1 = router.on_channel("agents", [&](const protocol::RawFrame&) { ++hits; });
    auto u2 = router.on_channel("agents", [&](const protocol::RawFrame&) { ++hits; });
    auto u3 = router.on("agent:status", [&](const protocol::RawFrame&) { ++hits; });
    TEST_CHECK(router.has_handlers(channel_key("agents")));

    router.remove_channel("agents");
    TEST_CHECK(!router.has_handlers("channel:agents"));
    router.route(frame("agent:status", std::string("agents")));
    TEST_CHECK(hits == 1);

    // Closures outliving their key are harmless
    u1();

    router.clear();
    TEST_CHECK(router.key_count() == 0);
    router.route(frame("agent:status"));
    TEST_CHECK(hits == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: closures stay callable after the router is gone
// -----------------------------------------------------------------------------
void test_unsubscribe_after_destruction() {
    std::cout << "[TEST] Router unsubscribe after destruction\n";

    Unsubscribe unsub;
    {
        Router router;
        unsub = router.on_all([](const protocol::RawFrame&) {});
    }
    unsub();

    std::cout << "[TEST] OK\n";
}

int main() {
    log::Logger::instance().set_level(log::Level::Fatal);

    test_dispatch_order();
    test_reserved_types();
    test_registration_order();
    test_unsubscribe();
    test_stale_unsubscribe();
    test_fault_isolation();
    test_self_unsubscribe();
    test_remove_channel_and_clear();
    test_unsubscribe_after_destruction();

    std::cout << "\n[ALL ROUTER TESTS PASSED]\n";
    return 0;
}
