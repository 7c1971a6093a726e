// tests/config_test.cpp
// Unit tests for ClientConfig and builder.

#include <gtest/gtest.h>
#include "kratos/config.hpp"

using namespace kratos;

namespace {

DeviceIdentity test_identity() {
    return DeviceIdentity{"mac:112233445566", "fw-1.0", "model-x", "acme"};
}

ClientConfigBuilder test_builder() {
    return ClientConfig::builder(test_identity(), "https://petasos.example.net:8080");
}

} // namespace

TEST(ConfigTest, Defaults) {
    auto config = test_builder().build();
    EXPECT_EQ(config.destination_url(), "https://petasos.example.net:8080");
    EXPECT_EQ(config.ping_period(), std::chrono::milliseconds(270000));
    EXPECT_EQ(config.pong_wait(), std::chrono::milliseconds(300000));
    EXPECT_EQ(config.write_wait(), std::chrono::milliseconds(10000));
    EXPECT_EQ(config.connect_timeout(), std::chrono::milliseconds(30000));
    EXPECT_EQ(config.tls_handshake_timeout(), std::chrono::milliseconds(5000));
    EXPECT_EQ(config.handshake_timeout(), std::chrono::milliseconds(10000));
    EXPECT_EQ(config.max_message_size(), 2048u);
    EXPECT_EQ(config.buffer_size(), 65535u);
    EXPECT_TRUE(config.handlers().empty());
    EXPECT_FALSE(config.on_ping_miss());
    EXPECT_EQ(config.logger(), nullptr);
    EXPECT_FALSE(config.tls_identity().has_value());
}

TEST(ConfigTest, BuilderCustomValues) {
    auto config = test_builder()
        .ping_period(std::chrono::milliseconds(100))
        .pong_wait(std::chrono::milliseconds(250))
        .write_wait(std::chrono::milliseconds(50))
        .max_message_size(4096)
        .buffer_size(1024)
        .handler("/config", [](const Message&) {})
        .handler(".*", [](const Message&) {})
        .on_ping_miss([] {})
        .build();
    EXPECT_EQ(config.ping_period(), std::chrono::milliseconds(100));
    EXPECT_EQ(config.pong_wait(), std::chrono::milliseconds(250));
    EXPECT_EQ(config.write_wait(), std::chrono::milliseconds(50));
    EXPECT_EQ(config.max_message_size(), 4096u);
    EXPECT_EQ(config.buffer_size(), 1024u);
    ASSERT_EQ(config.handlers().size(), 2u);
    EXPECT_EQ(config.handlers()[0].pattern, "/config");
    EXPECT_EQ(config.handlers()[1].pattern, ".*");
    EXPECT_TRUE(config.on_ping_miss());
}

TEST(ConfigTest, DialOptionsFollowConfig) {
    auto options = test_builder()
        .pong_wait(std::chrono::milliseconds(400000))
        .write_wait(std::chrono::milliseconds(7000))
        .handshake_timeout(std::chrono::milliseconds(3000))
        .buffer_size(4096)
        .build()
        .dial_options();
    EXPECT_EQ(options.read_timeout, std::chrono::milliseconds(400000));
    EXPECT_EQ(options.write_timeout, std::chrono::milliseconds(7000));
    EXPECT_EQ(options.handshake_timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(options.buffer_size, 4096u);
    EXPECT_EQ(options.max_message_size, 2048u);
}

TEST(ConfigTest, TlsIdentityNeedsBothFiles) {
    auto cert_only = test_builder().certificate("/etc/kratos/cert.pem").build();
    EXPECT_FALSE(cert_only.tls_identity().has_value());

    auto both = test_builder()
        .certificate("/etc/kratos/cert.pem")
        .private_key("/etc/kratos/key.pem")
        .build();
    ASSERT_TRUE(both.tls_identity().has_value());
    EXPECT_EQ(both.tls_identity()->certificate_path, "/etc/kratos/cert.pem");
    EXPECT_EQ(both.tls_identity()->key_path, "/etc/kratos/key.pem");
}

TEST(ConfigTest, HttpUrlAccepted) {
    EXPECT_NO_THROW(ClientConfig::builder(test_identity(), "http://localhost:6200").build());
}

TEST(ConfigTest, InvalidUrlScheme) {
    try {
        ClientConfig::builder(test_identity(), "ws://petasos.example.net").build();
        FAIL() << "expected throw";
    } catch (const KratosError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
    }
}

TEST(ConfigTest, EmptyUrl) {
    EXPECT_THROW(ClientConfig::builder(test_identity(), "").build(), KratosError);
}

TEST(ConfigTest, ZeroDurationRejected) {
    EXPECT_THROW(test_builder().write_wait(std::chrono::milliseconds(0)).build(), KratosError);
    EXPECT_THROW(test_builder().connect_timeout(std::chrono::milliseconds(-1)).build(),
                 KratosError);
}

TEST(ConfigTest, PingPeriodMustBeShorterThanPongWait) {
    EXPECT_THROW(test_builder()
                     .ping_period(std::chrono::milliseconds(300))
                     .pong_wait(std::chrono::milliseconds(300))
                     .build(),
                 KratosError);
}

TEST(ConfigTest, ZeroSizesRejected) {
    EXPECT_THROW(test_builder().max_message_size(0).build(), KratosError);
    EXPECT_THROW(test_builder().buffer_size(0).build(), KratosError);
}

TEST(ConfigTest, TinyBufferRejected) {
    EXPECT_THROW(test_builder().buffer_size(4).build(), KratosError);
    EXPECT_NO_THROW(test_builder().buffer_size(8).build());
}

TEST(ConfigTest, DeviceIdNotCheckedAtBuild) {
    // The id is parsed by Client::create, before any network call.
    auto config = ClientConfig::builder({"bogus", "fw", "m", "acme"}, "http://localhost").build();
    EXPECT_EQ(config.identity().device_name, "bogus");
}
