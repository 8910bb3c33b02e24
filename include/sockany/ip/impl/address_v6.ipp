#include <sockany/ip/address_v6.hpp>

#include <cstdint>
#include <cstring>
#include <string>

// inet_ntop
#include <arpa/inet.h>
#include <netinet/in.h>

namespace sockany::ip {

inline auto address_v6::to_string() const -> std::string {
  auto addr = in6_addr{};
  static_assert(sizeof(addr.s6_addr) == 16);
  std::memcpy(addr.s6_addr, bytes_.data(), 16);

  char buf[INET6_ADDRSTRLEN]{};
  if (::inet_ntop(AF_INET6, &addr, buf, sizeof(buf)) == nullptr) {
    return "::";
  }

  std::string out(buf);
  if (scope_id_ != 0) {
    out.push_back('%');
    out += std::to_string(scope_id_);
  }
  return out;
}

}  // namespace sockany::ip
