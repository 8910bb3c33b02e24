#include <gtest/gtest.h>

#include <sockany/config.hpp>
#include <sockany/local.hpp>

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

#include <sys/socket.h>
#include <sys/un.h>

#if SOCKANY_HAS_LOCAL

namespace {

using sockany::local::endpoint;

constexpr auto path_offset = offsetof(sockaddr_un, sun_path);

auto as_sockaddr(void const* p) -> sockaddr const* { return static_cast<sockaddr const*>(p); }

TEST(local_endpoint_test, pathname_layout) {
  auto ep = endpoint::from_path("/tmp/sock");
  ASSERT_TRUE(ep) << ep.error().message();

  EXPECT_TRUE(ep->is_pathname());
  EXPECT_EQ(ep->path(), "/tmp/sock");
  EXPECT_EQ(ep->path_length(), 9u);
  EXPECT_EQ(ep->size(), static_cast<socklen_t>(path_offset + 9 + 1));
  EXPECT_EQ(ep->to_string(), "/tmp/sock");

  auto const sa = ep->encode();
  EXPECT_EQ(sa.sun_family, AF_UNIX);
  EXPECT_EQ(std::memcmp(sa.sun_path, "/tmp/sock", 9), 0);
  EXPECT_EQ(sa.sun_path[9], '\0');
}

TEST(local_endpoint_test, pathname_roundtrip) {
  auto ep = endpoint::from_path("/tmp/sock");
  ASSERT_TRUE(ep);

  auto back = endpoint::from_native(ep->data(), ep->size());
  ASSERT_TRUE(back) << back.error().message();
  EXPECT_EQ(*back, *ep);
  EXPECT_EQ(back->path(), "/tmp/sock");
}

TEST(local_endpoint_test, path_at_maximum_succeeds) {
  std::string path(endpoint::max_path_length, 'a');
  path[0] = '/';

  auto ep = endpoint::from_path(path);
  ASSERT_TRUE(ep) << ep.error().message();
  EXPECT_EQ(ep->path(), path);
  EXPECT_EQ(ep->size(), static_cast<socklen_t>(sizeof(sockaddr_un)));

  auto back = endpoint::from_native(ep->data(), ep->size());
  ASSERT_TRUE(back) << back.error().message();
  EXPECT_EQ(*back, *ep);
}

TEST(local_endpoint_test, path_one_over_maximum_fails) {
  std::string path(endpoint::max_path_length + 1, 'a');
  auto ep = endpoint::from_path(path);
  ASSERT_FALSE(ep);
  EXPECT_EQ(ep.error(), std::error_code{sockany::error::path_too_long});
}

TEST(local_endpoint_test, pathname_rejects_embedded_nul) {
  auto ep = endpoint::from_path(std::string_view{"/tmp/a\0b", 8});
  ASSERT_FALSE(ep);
  EXPECT_EQ(ep.error(), std::error_code{sockany::error::invalid_argument});
}

TEST(local_endpoint_test, empty_path_is_unnamed) {
  auto ep = endpoint::from_path("");
  ASSERT_TRUE(ep);
  EXPECT_TRUE(ep->is_unnamed());
  EXPECT_EQ(*ep, endpoint::unnamed());
  EXPECT_EQ(ep->size(), static_cast<socklen_t>(path_offset));
  EXPECT_EQ(ep->path_length(), 0u);
  EXPECT_EQ(ep->to_string(), "(unnamed)");
}

TEST(local_endpoint_test, unnamed_roundtrip) {
  endpoint ep{};
  auto back = endpoint::from_native(ep.data(), ep.size());
  ASSERT_TRUE(back) << back.error().message();
  EXPECT_TRUE(back->is_unnamed());
  EXPECT_EQ(*back, ep);
}

TEST(local_endpoint_test, decode_ignores_bytes_past_terminator) {
  sockaddr_un sa{};
  sa.sun_family = AF_UNIX;
  std::memcpy(sa.sun_path, "/run/x", 6);
  // Garbage after the terminator, with a length covering it (as some kernels report).
  std::memcpy(sa.sun_path + 7, "junk", 4);

  auto ep = endpoint::from_native(as_sockaddr(&sa), sizeof(sa));
  ASSERT_TRUE(ep) << ep.error().message();
  EXPECT_EQ(ep->path(), "/run/x");
  EXPECT_EQ(*ep, *endpoint::from_path("/run/x"));
}

TEST(local_endpoint_test, decode_without_terminator) {
  sockaddr_un sa{};
  sa.sun_family = AF_UNIX;
  std::memcpy(sa.sun_path, "/run/y", 6);

  auto ep = endpoint::from_native(as_sockaddr(&sa), static_cast<socklen_t>(path_offset + 6));
  ASSERT_TRUE(ep) << ep.error().message();
  EXPECT_EQ(ep->path(), "/run/y");
  EXPECT_EQ(ep->size(), static_cast<socklen_t>(path_offset + 7));
}

TEST(local_endpoint_test, decode_full_sun_path_without_terminator_is_too_long) {
  sockaddr_un sa{};
  sa.sun_family = AF_UNIX;
  std::memset(sa.sun_path, 'p', sizeof(sa.sun_path));

  auto ep = endpoint::from_native(as_sockaddr(&sa), sizeof(sa));
  ASSERT_FALSE(ep);
  EXPECT_EQ(ep.error(), std::error_code{sockany::error::path_too_long});
}

TEST(local_endpoint_test, decode_rejects_bad_lengths) {
  sockaddr_storage ss{};
  ss.ss_family = AF_UNIX;

  auto shorter = endpoint::from_native(as_sockaddr(&ss), static_cast<socklen_t>(path_offset - 1));
  ASSERT_FALSE(shorter);
  EXPECT_EQ(shorter.error(), std::error_code{sockany::error::too_short});

  auto longer = endpoint::from_native(as_sockaddr(&ss), sizeof(sockaddr_un) + 1);
  ASSERT_FALSE(longer);
  EXPECT_EQ(longer.error(), std::error_code{sockany::error::invalid_endpoint});
}

TEST(local_endpoint_test, ordering_is_structural) {
  auto a = *endpoint::from_path("/a");
  auto b = *endpoint::from_path("/b");
  auto ab = *endpoint::from_path("/ab");

  EXPECT_LT(endpoint::unnamed(), a);
  EXPECT_LT(a, b);
  EXPECT_LT(a, ab);
  EXPECT_EQ(a, *endpoint::from_path("/a"));
  EXPECT_NE(a, ab);
}

TEST(local_endpoint_test, decode_leading_nul_never_drops_the_name) {
  sockaddr_un sa{};
  sa.sun_family = AF_UNIX;
  std::memcpy(sa.sun_path, "\0bus", 4);
  auto ep = endpoint::from_native(as_sockaddr(&sa), static_cast<socklen_t>(path_offset + 4));

#if SOCKANY_HAS_ABSTRACT_LOCAL
  ASSERT_TRUE(ep) << ep.error().message();
  EXPECT_TRUE(ep->is_abstract());
  EXPECT_EQ(ep->abstract_name(), "bus");
#else
  ASSERT_FALSE(ep);
  EXPECT_EQ(ep.error(), std::error_code{sockany::error::invalid_endpoint});

  // A zero-filled sun_path is how some kernels report an unnamed socket.
  sockaddr_un zero{};
  zero.sun_family = AF_UNIX;
  auto unnamed = endpoint::from_native(as_sockaddr(&zero), sizeof(zero));
  ASSERT_TRUE(unnamed) << unnamed.error().message();
  EXPECT_TRUE(unnamed->is_unnamed());
#endif
}

#if SOCKANY_HAS_ABSTRACT_LOCAL

TEST(local_endpoint_test, abstract_layout_and_roundtrip) {
  auto ep = endpoint::from_abstract("sockany");
  ASSERT_TRUE(ep) << ep.error().message();

  EXPECT_TRUE(ep->is_abstract());
  EXPECT_EQ(ep->abstract_name(), "sockany");
  EXPECT_EQ(ep->path(), "");
  EXPECT_EQ(ep->path_length(), 7u);
  EXPECT_EQ(ep->size(), static_cast<socklen_t>(path_offset + 1 + 7));
  EXPECT_EQ(ep->to_string(), "@sockany");

  auto back = endpoint::from_native(ep->data(), ep->size());
  ASSERT_TRUE(back) << back.error().message();
  EXPECT_EQ(*back, *ep);
}

TEST(local_endpoint_test, abstract_name_with_embedded_nul) {
  std::string_view name{"a\0b\x01", 4};
  auto ep = endpoint::from_abstract(name);
  ASSERT_TRUE(ep) << ep.error().message();
  EXPECT_EQ(ep->abstract_name(), name);
  EXPECT_EQ(ep->to_string(), "@a\\x00b\\x01");

  auto back = endpoint::from_native(ep->data(), ep->size());
  ASSERT_TRUE(back) << back.error().message();
  EXPECT_EQ(back->abstract_name(), name);
  EXPECT_EQ(*back, *ep);
}

TEST(local_endpoint_test, abstract_limits) {
  auto empty = endpoint::from_abstract("");
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error(), std::error_code{sockany::error::invalid_argument});

  auto max = endpoint::from_abstract(std::string(endpoint::max_path_length, 'x'));
  ASSERT_TRUE(max) << max.error().message();
  EXPECT_EQ(max->size(), static_cast<socklen_t>(sizeof(sockaddr_un)));

  auto over = endpoint::from_abstract(std::string(endpoint::max_path_length + 1, 'x'));
  ASSERT_FALSE(over);
  EXPECT_EQ(over.error(), std::error_code{sockany::error::path_too_long});
}

TEST(local_endpoint_test, abstract_and_pathname_never_collide) {
  auto abstract = *endpoint::from_abstract("x");
  auto pathname = *endpoint::from_path("x");
  EXPECT_NE(abstract, pathname);
  EXPECT_LT(abstract, pathname);
}

TEST(local_endpoint_test, decode_rejects_empty_abstract_name) {
  sockaddr_un sa{};
  sa.sun_family = AF_UNIX;
  auto ep = endpoint::from_native(as_sockaddr(&sa), static_cast<socklen_t>(path_offset + 1));
  ASSERT_FALSE(ep);
  EXPECT_EQ(ep.error(), std::error_code{sockany::error::invalid_endpoint});
}

#endif  // SOCKANY_HAS_ABSTRACT_LOCAL

}  // namespace

#else

TEST(local_endpoint_test, unavailable) { GTEST_SKIP() << "AF_UNIX endpoints are disabled"; }

#endif  // SOCKANY_HAS_LOCAL
