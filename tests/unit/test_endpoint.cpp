#include "connstr/endpoint/endpoint.hpp"

#include <gtest/gtest.h>
#include <utility>

namespace {

connstr::host_addr domain(const char* name) {
    auto host = connstr::host_addr::from_domain(name);
    EXPECT_TRUE(host.has_value());
    return std::move(host.value());
}

TEST(endpoint_test, network_factory_rejects_path_schemes) {
    const auto value = connstr::endpoint::network(
        connstr::scheme::unix_socket, domain("h"), 80);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().kind(), connstr::errc::invalid_scheme);
}

TEST(endpoint_test, local_factory_rejects_network_schemes) {
    const auto value = connstr::endpoint::local(connstr::scheme::tcp, "/tmp/x");
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().kind(), connstr::errc::invalid_scheme);

    const auto file = connstr::endpoint::local(connstr::scheme::file, "/tmp/x");
    ASSERT_TRUE(file.has_value()) << file.error().message();
    EXPECT_EQ(file.value(), connstr::endpoint::file("/tmp/x"));
}

TEST(endpoint_test, network_endpoint_exposes_location_only) {
    const auto value =
        connstr::endpoint::network(connstr::scheme::redis, domain("cache"), 6379);
    ASSERT_TRUE(value.has_value()) << value.error().message();

    EXPECT_TRUE(value->is_network());
    EXPECT_FALSE(value->is_path());
    EXPECT_EQ(value->path(), nullptr);
    ASSERT_NE(value->location(), nullptr);
    EXPECT_EQ(value->location()->port, 6379);
}

TEST(endpoint_test, equality_compares_scheme_and_payload) {
    const auto tcp =
        connstr::endpoint::network(connstr::scheme::tcp, domain("h"), 1);
    const auto udp =
        connstr::endpoint::network(connstr::scheme::udp, domain("h"), 1);
    const auto other_port =
        connstr::endpoint::network(connstr::scheme::tcp, domain("h"), 2);
    ASSERT_TRUE(tcp.has_value());
    ASSERT_TRUE(udp.has_value());
    ASSERT_TRUE(other_port.has_value());

    EXPECT_NE(tcp.value(), udp.value());
    EXPECT_NE(tcp.value(), other_port.value());
    EXPECT_EQ(tcp.value(), tcp.value());

    EXPECT_NE(connstr::endpoint::unix_socket("/a"),
              connstr::endpoint::file("/a"));
}

} // namespace
