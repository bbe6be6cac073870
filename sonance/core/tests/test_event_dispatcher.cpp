#include <catch2/catch_test_macros.hpp>
#include <sonance/core/event_dispatcher.hpp>
#include <string>
#include <vector>

using namespace sonance::core;

// Test event types
struct TestEvent {
    int value = 0;
};

struct AnotherEvent {
    std::string message;
};

TEST_CASE("EventDispatcher subscription and dispatch", "[core][events]") {
    EventDispatcher dispatcher;

    SECTION("Subscribe and receive event") {
        int received_value = 0;
        auto conn = dispatcher.subscribe<TestEvent>([&](const TestEvent& e) {
            received_value = e.value;
        });

        dispatcher.dispatch(TestEvent{42});
        REQUIRE(received_value == 42);
    }

    SECTION("Handlers run in subscription order") {
        std::vector<int> order;
        auto conn1 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(1); });
        auto conn2 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(2); });

        dispatcher.dispatch(TestEvent{});
        REQUIRE(order == std::vector<int>{1, 2});
    }

    SECTION("Different event types are isolated") {
        int test_count = 0;
        int another_count = 0;

        auto conn1 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { test_count++; });
        auto conn2 = dispatcher.subscribe<AnotherEvent>([&](const AnotherEvent&) { another_count++; });

        dispatcher.dispatch(TestEvent{});
        REQUIRE(test_count == 1);
        REQUIRE(another_count == 0);
    }

    SECTION("Dispatch with no subscribers is a no-op") {
        dispatcher.dispatch(AnotherEvent{"nobody"});
        REQUIRE_FALSE(dispatcher.has_handlers<AnotherEvent>());
    }

    SECTION("Handler may disconnect itself during dispatch") {
        int received = 0;
        ScopedConnection conn;
        conn = dispatcher.subscribe<TestEvent>([&](const TestEvent&) {
            received++;
            conn.disconnect();
        });

        dispatcher.dispatch(TestEvent{});
        dispatcher.dispatch(TestEvent{});
        REQUIRE(received == 1);
    }
}

TEST_CASE("ScopedConnection RAII behavior", "[core][events]") {
    EventDispatcher dispatcher;

    SECTION("Connection disconnects on destruction") {
        int received_count = 0;
        {
            auto conn = dispatcher.subscribe<TestEvent>([&](const TestEvent&) {
                received_count++;
            });
            dispatcher.dispatch(TestEvent{});
            REQUIRE(received_count == 1);
        }
        dispatcher.dispatch(TestEvent{});
        REQUIRE(received_count == 1);
    }

    SECTION("Move connection") {
        int received_count = 0;
        ScopedConnection conn2;
        {
            auto conn1 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) {
                received_count++;
            });
            conn2 = std::move(conn1);
        }
        dispatcher.dispatch(TestEvent{});
        REQUIRE(received_count == 1);
        REQUIRE(conn2.connected());
    }
}

TEST_CASE("EventDispatcher handler management", "[core][events]") {
    EventDispatcher dispatcher;

    SECTION("Handler count tracking") {
        REQUIRE(dispatcher.handler_count<TestEvent>() == 0);

        auto conn1 = dispatcher.subscribe<TestEvent>([](const TestEvent&) {});
        auto conn2 = dispatcher.subscribe<TestEvent>([](const TestEvent&) {});
        REQUIRE(dispatcher.handler_count<TestEvent>() == 2);

        conn1.disconnect();
        REQUIRE(dispatcher.handler_count<TestEvent>() == 1);
    }

    SECTION("Clear handlers") {
        auto conn1 = dispatcher.subscribe<TestEvent>([](const TestEvent&) {});
        auto conn2 = dispatcher.subscribe<AnotherEvent>([](const AnotherEvent&) {});

        dispatcher.clear_handlers<TestEvent>();
        REQUIRE(dispatcher.handler_count<TestEvent>() == 0);
        REQUIRE(dispatcher.handler_count<AnotherEvent>() == 1);

        dispatcher.clear_all_handlers();
        REQUIRE(dispatcher.handler_count<AnotherEvent>() == 0);
    }
}
