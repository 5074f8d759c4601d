#include <iostream>
#include <set>
#include <string>

#include "dashwire/event/normalizer.hpp"
#include "common/test_check.hpp"

using namespace dashwire;
using namespace dashwire::event;

namespace {

constexpr std::int64_t Now = 1'700'000'000'000;

protocol::RawFrame frame(std::string type, std::optional<double> ts = std::nullopt) {
    protocol::RawFrame f;
    f.type = std::move(type);
    f.timestamp = ts;
    return f;
}

} // namespace

// -----------------------------------------------------------------------------
// Test: whitelist, custom escape pattern and configured extras
// -----------------------------------------------------------------------------
void test_accepts() {
    std::cout << "[TEST] Normalizer accepts\n";

    Normalizer normalizer({"deploy:finished"});

    TEST_CHECK(normalizer.accepts("agent:status"));
    TEST_CHECK(normalizer.accepts("agent:update"));
    TEST_CHECK(normalizer.accepts("task:update"));
    TEST_CHECK(normalizer.accepts("message:sent"));
    TEST_CHECK(normalizer.accepts("memory:operation"));
    TEST_CHECK(normalizer.accepts("metrics:update"));
    TEST_CHECK(normalizer.accepts("topology:change"));

    TEST_CHECK(normalizer.accepts("custom:my-event_1.v2"));
    TEST_CHECK(normalizer.accepts("deploy:finished"));

    TEST_CHECK(!normalizer.accepts("custom:"));
    TEST_CHECK(!normalizer.accepts("custom:has space"));
    TEST_CHECK(!normalizer.accepts("unknown:type"));
    TEST_CHECK(!normalizer.accepts("raw"));
    TEST_CHECK(!normalizer.accepts(""));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: rejected frames are counted and produce nothing
// -----------------------------------------------------------------------------
void test_reject() {
    std::cout << "[TEST] Normalizer reject\n";

    Normalizer normalizer;
    TEST_CHECK(!normalizer.try_normalize(frame("bogus"), Now).has_value());
    TEST_CHECK(!normalizer.try_normalize(frame("raw"), Now).has_value());
    TEST_CHECK(normalizer.rejected_total() == 2);

    TEST_CHECK(normalizer.try_normalize(frame("agent:status"), Now).has_value());
    TEST_CHECK(normalizer.rejected_total() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: seconds-vs-milliseconds timestamp heuristic
// -----------------------------------------------------------------------------
void test_timestamp_heuristic() {
    std::cout << "[TEST] Normalizer timestamp heuristic\n";

    // Seconds are scaled
    TEST_CHECK(normalize_timestamp(1'700'000'000.0, Now) == 1'700'000'000'000);
    TEST_CHECK(normalize_timestamp(1'700'000'000.5, Now) == 1'700'000'000'500);
    // Milliseconds pass through
    TEST_CHECK(normalize_timestamp(1'700'000'000'123.0, Now) == 1'700'000'000'123);
    TEST_CHECK(normalize_timestamp(1e12, Now) == 1'000'000'000'000);
    // Missing becomes now
    TEST_CHECK(normalize_timestamp(std::nullopt, Now) == Now);

    Normalizer normalizer;
    auto ev = normalizer.try_normalize(frame("task:update", 1'700'000'100.0), Now);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->timestamp == 1'700'000'100'000);
    TEST_CHECK(ev->received_at == Now);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: timestamps outside the int64 millisecond range become now
// -----------------------------------------------------------------------------
void test_timestamp_out_of_range() {
    std::cout << "[TEST] Normalizer out of range timestamp\n";

    TEST_CHECK(normalize_timestamp(1e20, Now) == Now);
    TEST_CHECK(normalize_timestamp(-1e17, Now) == Now);
    TEST_CHECK(normalize_timestamp(-1e20, Now) == Now);
    // Large but representable still passes through
    TEST_CHECK(normalize_timestamp(1e18, Now) == 1'000'000'000'000'000'000);

    Normalizer normalizer;
    auto ev = normalizer.try_normalize(frame("system:alert", 1e20), Now);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->timestamp == Now);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: normalized fields
// -----------------------------------------------------------------------------
void test_normalize_fields() {
    std::cout << "[TEST] Normalizer fields\n";

    protocol::RawFrame f = frame("agent:status");
    f.channel = "agents";
    f.payload = R"({"agentId":"a-1"})";

    Normalizer normalizer;
    auto ev = normalizer.try_normalize(f, Now);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->type == "agent:status");
    TEST_CHECK(ev->channel == std::optional<std::string>("agents"));
    TEST_CHECK(ev->payload == R"({"agentId":"a-1"})");
    TEST_CHECK(ev->timestamp == Now);
    TEST_CHECK(ev->id.rfind("evt-", 0) == 0);

    // No payload normalizes to JSON null
    auto bare = normalizer.try_normalize(frame("task:update"), Now);
    TEST_CHECK(bare && bare->payload == "null");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: ids are unique within the process
// -----------------------------------------------------------------------------
void test_unique_ids() {
    std::cout << "[TEST] Normalizer unique ids\n";

    Normalizer a;
    Normalizer b;
    std::set<std::string> seen;
    for (int i = 0; i < 500; ++i) {
        auto ea = a.try_normalize(frame("agent:update"), Now);
        auto eb = b.try_normalize(frame("agent:update"), Now);
        TEST_CHECK(seen.insert(ea->id).second);
        TEST_CHECK(seen.insert(eb->id).second);
    }

    std::cout << "[TEST] OK\n";
}

int main() {
    test_accepts();
    test_reject();
    test_timestamp_heuristic();
    test_timestamp_out_of_range();
    test_normalize_fields();
    test_unique_ids();

    std::cout << "\n[ALL NORMALIZER TESTS PASSED]\n";
    return 0;
}
