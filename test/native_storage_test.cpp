#include <gtest/gtest.h>

#include <sockany/sockany.hpp>

#include <array>
#include <cstddef>
#include <cstring>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>

namespace {

using sockany::any_endpoint;
using sockany::native_storage;
using sockany::ip::address_v4;
using sockany::ip::address_v6;
using sockany::ip::endpoint_v4;
using sockany::ip::endpoint_v6;

auto sample_endpoints() -> std::vector<any_endpoint> {
  std::vector<any_endpoint> eps{
    endpoint_v4{address_v4::any(), 0},
    endpoint_v4{address_v4::loopback(), 8080},
    endpoint_v6{address_v6::any(), 0},
    endpoint_v6{address_v6{{0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x42}, 3},
                65535, 0xabcde},
  };
#if SOCKANY_HAS_LOCAL
  eps.emplace_back(sockany::local::endpoint{});
  eps.emplace_back(*sockany::local::endpoint::from_path("/tmp/sock"));
  eps.emplace_back(
    *sockany::local::endpoint::from_path(std::string(sockany::local::endpoint::max_path_length, 'm')));
#endif
#if SOCKANY_HAS_ABSTRACT_LOCAL
  eps.emplace_back(*sockany::local::endpoint::from_abstract(std::string_view{"x\0y", 3}));
#endif
#if SOCKANY_HAS_NETLINK
  eps.emplace_back(sockany::netlink::endpoint{1234, 0x10});
#endif
#if SOCKANY_HAS_XDP
  eps.emplace_back(sockany::xdp::endpoint{0, 2, 3, 0});
#endif
  return eps;
}

TEST(native_storage_test, capacity_is_sockaddr_storage) {
  EXPECT_EQ(native_storage::capacity(), static_cast<socklen_t>(sizeof(sockaddr_storage)));
  native_storage storage;
  EXPECT_EQ(storage.bytes().size(), sizeof(sockaddr_storage));
}

TEST(native_storage_test, write_then_read_roundtrips_every_family) {
  for (auto const& ep : sample_endpoints()) {
    native_storage storage;
    auto const len = sockany::write(ep, storage);
    ASSERT_GT(len, 0u) << ep;

    auto back = sockany::read(storage, len);
    ASSERT_TRUE(back) << ep << ": " << back.error().message();
    EXPECT_EQ(*back, ep);
    EXPECT_EQ(back->family(), ep.family());
  }
}

TEST(native_storage_test, write_reports_family_layout_size) {
  native_storage storage;
  EXPECT_EQ(sockany::write(any_endpoint{endpoint_v4{}}, storage),
            static_cast<socklen_t>(sizeof(sockaddr_in)));
  EXPECT_EQ(sockany::write(any_endpoint{endpoint_v6{}}, storage),
            static_cast<socklen_t>(sizeof(sockaddr_in6)));
  EXPECT_EQ(sockany::write(endpoint_v4{}, storage), static_cast<socklen_t>(sizeof(sockaddr_in)));
#if SOCKANY_HAS_LOCAL
  EXPECT_EQ(sockany::write(any_endpoint{sockany::local::endpoint{}}, storage),
            static_cast<socklen_t>(offsetof(sockaddr_un, sun_path)));
#endif
}

TEST(native_storage_test, one_byte_short_is_rejected_per_family) {
  for (auto const& ep : sample_endpoints()) {
    native_storage storage;
    auto const len = sockany::write(ep, storage);

    socklen_t min_len = 0;
    ep.visit([&](auto const& alt) {
      min_len = static_cast<socklen_t>(std::remove_cvref_t<decltype(alt)>::min_native_size);
    });
    ASSERT_LE(min_len, len) << ep;

    auto r = sockany::read(storage, min_len - 1);
    ASSERT_FALSE(r) << ep;
    EXPECT_EQ(r.error(), std::error_code{sockany::error::too_short}) << ep;
  }
}

TEST(native_storage_test, ipv4_example_layout) {
  native_storage storage;
  auto const len = sockany::write(any_endpoint{endpoint_v4{address_v4::loopback(), 8080}}, storage);
  ASSERT_EQ(len, static_cast<socklen_t>(sizeof(sockaddr_in)));

  auto const bytes = storage.bytes();
  sa_family_t family{};
  std::memcpy(&family, bytes.data() + offsetof(sockaddr_in, sin_family), sizeof(family));
  EXPECT_EQ(family, AF_INET);

  auto const* port = bytes.data() + offsetof(sockaddr_in, sin_port);
  EXPECT_EQ(static_cast<unsigned char>(port[0]), 0x1f);
  EXPECT_EQ(static_cast<unsigned char>(port[1]), 0x90);

  auto const* addr = bytes.data() + offsetof(sockaddr_in, sin_addr);
  EXPECT_EQ(static_cast<unsigned char>(addr[0]), 127);
  EXPECT_EQ(static_cast<unsigned char>(addr[1]), 0);
  EXPECT_EQ(static_cast<unsigned char>(addr[2]), 0);
  EXPECT_EQ(static_cast<unsigned char>(addr[3]), 1);
}

TEST(native_storage_test, decode_hand_built_ipv4_bytes) {
  native_storage storage;
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(8080);
  sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  std::memcpy(storage.data(), &sa, sizeof(sa));

  auto ep = sockany::read(storage, sizeof(sa));
  ASSERT_TRUE(ep) << ep.error().message();
  EXPECT_EQ(*ep, (any_endpoint{endpoint_v4{address_v4::loopback(), 8080}}));
}

TEST(native_storage_test, unix_example_layout) {
#if SOCKANY_HAS_LOCAL
  native_storage storage;
  auto const len =
    sockany::write(any_endpoint{*sockany::local::endpoint::from_path("/tmp/sock")}, storage);
  EXPECT_EQ(len, static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 9 + 1));

  sockaddr_un sa{};
  std::memcpy(&sa, storage.data(), static_cast<std::size_t>(len));
  EXPECT_EQ(sa.sun_family, AF_UNIX);
  EXPECT_EQ(std::string(sa.sun_path), "/tmp/sock");

  auto back = sockany::read(storage, len);
  ASSERT_TRUE(back);
  ASSERT_TRUE(back->is<sockany::local::endpoint>());
  EXPECT_EQ(back->get<sockany::local::endpoint>().path(), "/tmp/sock");
  EXPECT_EQ(back->get<sockany::local::endpoint>().path_length(), 9u);
#else
  GTEST_SKIP() << "AF_UNIX endpoints are disabled";
#endif
}

TEST(native_storage_test, unknown_family_is_unsupported) {
  native_storage storage;
  sockaddr_storage ss{};
  ss.ss_family = AF_UNSPEC;
  std::memcpy(storage.data(), &ss, sizeof(ss));

  auto r = sockany::read(storage, native_storage::capacity());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), std::error_code{sockany::error::unsupported_address_family});

  ss.ss_family = AF_APPLETALK;
  std::memcpy(storage.data(), &ss, sizeof(ss));
  auto r2 = sockany::read(storage, native_storage::capacity());
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error(), std::error_code{sockany::error::unsupported_address_family});
}

TEST(native_storage_test, length_bounds) {
  native_storage storage;
  (void)sockany::write(any_endpoint{endpoint_v4{}}, storage);

  auto empty = sockany::read(storage, 0);
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error(), std::error_code{sockany::error::too_short});

  auto oversized = sockany::any_endpoint::from_native(storage.data(), native_storage::capacity() + 1);
  ASSERT_FALSE(oversized);
  EXPECT_EQ(oversized.error(), std::error_code{sockany::error::invalid_endpoint});

  auto null = sockany::any_endpoint::from_native(nullptr, sizeof(sockaddr_in));
  ASSERT_FALSE(null);
  EXPECT_EQ(null.error(), std::error_code{sockany::error::invalid_argument});
}

TEST(native_storage_test, to_native_checks_capacity) {
  any_endpoint ep{endpoint_v6{address_v6::loopback(), 1}};
  std::array<std::byte, sizeof(sockaddr_in6)> exact{};
  std::array<std::byte, sizeof(sockaddr_in6) - 1> small{};

  auto ok = ep.to_native(reinterpret_cast<sockaddr*>(exact.data()), exact.size());
  ASSERT_TRUE(ok);
  EXPECT_EQ(*ok, static_cast<socklen_t>(exact.size()));

  auto fail = ep.to_native(reinterpret_cast<sockaddr*>(small.data()), small.size());
  ASSERT_FALSE(fail);
  EXPECT_EQ(fail.error(), std::error_code{sockany::error::no_buffer_space});
}

}  // namespace
