#include <sockany/ip/address_v4.hpp>

#include <cstdint>
#include <cstring>
#include <string>

// inet_ntop
#include <arpa/inet.h>
#include <netinet/in.h>

namespace sockany::ip {

inline auto address_v4::to_string() const -> std::string {
  auto addr = in_addr{};
  static_assert(sizeof(addr.s_addr) == 4);
  std::memcpy(&addr.s_addr, bytes_.data(), 4);

  char buf[INET_ADDRSTRLEN]{};
  if (::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
    // Should never fail for AF_INET + 4 bytes.
    return "0.0.0.0";
  }
  return std::string(buf);
}

}  // namespace sockany::ip
