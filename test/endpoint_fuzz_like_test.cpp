#include <gtest/gtest.h>

#include <sockany/sockany.hpp>

#include <cstddef>
#include <cstring>
#include <random>
#include <vector>

#include <sys/socket.h>

namespace {

auto interesting_families() -> std::vector<sa_family_t> {
  std::vector<sa_family_t> families{AF_UNSPEC, AF_INET, AF_INET6, AF_APPLETALK};
#if SOCKANY_HAS_LOCAL
  families.push_back(AF_UNIX);
#endif
#if SOCKANY_HAS_NETLINK
  families.push_back(AF_NETLINK);
#endif
#if SOCKANY_HAS_XDP
  families.push_back(AF_XDP);
#endif
  return families;
}

}  // namespace

TEST(endpoint_fuzz_like_test, random_storage_decodes_safely) {
  auto const families = interesting_families();
  std::mt19937_64 rng(0xC0FFEEULL);
  std::uniform_int_distribution<int> byte_dist(0, 255);
  std::uniform_int_distribution<std::size_t> family_dist(0, families.size() - 1);
  std::uniform_int_distribution<int> len_dist(
    0, static_cast<int>(sockany::native_storage::capacity()) + 8);

  int decoded = 0;
  for (int i = 0; i < 20000; ++i) {
    sockany::native_storage storage;
    for (auto& b : storage.bytes()) {
      b = static_cast<std::byte>(byte_dist(rng));
    }
    auto const family = families[family_dist(rng)];
    std::memcpy(reinterpret_cast<unsigned char*>(storage.data()) + offsetof(sockaddr, sa_family),
                &family, sizeof(family));

    auto const len = static_cast<socklen_t>(len_dist(rng));
    auto ep = sockany::any_endpoint::from_native(storage.data(), len);
    if (!ep) {
      continue;
    }
    ++decoded;
    EXPECT_EQ(ep->family(), family);

    sockany::native_storage again;
    auto const again_len = sockany::write(*ep, again);
    auto back = sockany::read(again, again_len);
    ASSERT_TRUE(back) << *ep << ": " << back.error().message();
    EXPECT_EQ(*back, *ep);
  }
  EXPECT_GT(decoded, 0);
}
