// tests/router_test.cpp
// Handler pattern matching and dispatch order.

#include <gtest/gtest.h>
#include "router.hpp"

#include <string>
#include <vector>

using namespace kratos;

namespace {

using Registrations = std::vector<HandlerRegistration>;

Message to(const std::string& destination) {
    return Message::simple_event("dns:server", destination, {});
}

} // namespace

TEST(RouterTest, NoHandlers) {
    Router router(Registrations{});
    EXPECT_EQ(router.size(), 0u);
    EXPECT_EQ(router.dispatch(to("mac:112233445566/config")), 0u);
}

TEST(RouterTest, FanOutInRegistrationOrder) {
    std::vector<std::string> calls;
    Router router(Registrations{
        {"/config", [&](const Message&) { calls.push_back("config"); }},
        {".*", [&](const Message&) { calls.push_back("all"); }},
        {"/other", [&](const Message&) { calls.push_back("other"); }},
        {"mac:", [&](const Message&) { calls.push_back("mac"); }},
    });

    EXPECT_EQ(router.dispatch(to("mac:112233445566/config")), 3u);
    EXPECT_EQ(calls, (std::vector<std::string>{"config", "all", "mac"}));
}

TEST(RouterTest, PatternIsSearchedNotAnchored) {
    int hits = 0;
    Router router(Registrations{{"config", [&](const Message&) { hits++; }}});
    router.dispatch(to("mac:112233445566/config/sub"));
    router.dispatch(to("event:device-status"));
    EXPECT_EQ(hits, 1);
}

TEST(RouterTest, AnchorsRespected) {
    int hits = 0;
    Router router(Registrations{{"^event:", [&](const Message&) { hits++; }}});
    router.dispatch(to("event:device-status"));
    router.dispatch(to("mac:112233445566/event:x"));
    EXPECT_EQ(hits, 1);
}

TEST(RouterTest, HandlerSeesMessage) {
    std::string payload;
    Router router(Registrations{{".*", [&](const Message& m) { payload = m.payload_string(); }}});
    router.dispatch(Message::simple_event("a", "b", {'h', 'i'}));
    EXPECT_EQ(payload, "hi");
}

TEST(RouterTest, InvalidPatternRejected) {
    try {
        Router router(Registrations{{"([unclosed", [](const Message&) {}}});
        FAIL() << "expected throw";
    } catch (const KratosError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
    }
}

TEST(RouterTest, EmptyHandlerRejected) {
    EXPECT_THROW(Router(Registrations{{".*", MessageHandler()}}), KratosError);
}
