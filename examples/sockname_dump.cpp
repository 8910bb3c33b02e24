#include <sockany/sockany.hpp>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <system_error>

#include <sys/socket.h>
#include <unistd.h>

namespace {

struct fd_guard {
  int fd{-1};
  ~fd_guard() {
    if (fd >= 0) {
      (void)::close(fd);
    }
  }
};

auto last_error() -> std::error_code { return {errno, std::generic_category()}; }

// bind() `ep` on a fresh socket, then print what getsockname() reports.
auto bind_and_dump(int domain, int type, sockany::any_endpoint const& ep) -> bool {
  fd_guard sock{::socket(domain, type, 0)};
  if (sock.fd < 0) {
    std::cerr << "sockname_dump: socket failed: " << last_error().message() << "\n";
    return false;
  }

  auto const rc = sockany::with_native(
    ep, [&](sockaddr const* addr, socklen_t len) { return ::bind(sock.fd, addr, len); });
  if (rc != 0) {
    std::cerr << "sockname_dump: bind " << ep << " failed: " << last_error().message() << "\n";
    return false;
  }

  sockany::native_storage storage;
  auto len = sockany::native_storage::capacity();
  if (::getsockname(sock.fd, storage.data(), &len) != 0) {
    std::cerr << "sockname_dump: getsockname failed: " << last_error().message() << "\n";
    return false;
  }

  auto bound = sockany::read(storage, len);
  if (!bound) {
    std::cerr << "sockname_dump: decode failed: " << bound.error().message() << "\n";
    return false;
  }
  std::cout << "requested " << ep << " -> bound " << *bound << " (" << len << " bytes)\n";
  return true;
}

}  // namespace

int main() {
  bool ok = true;

  ok &= bind_and_dump(AF_INET, SOCK_DGRAM,
                      sockany::ip::endpoint_v4{sockany::ip::address_v4::loopback(), 0});
  ok &= bind_and_dump(AF_INET6, SOCK_DGRAM,
                      sockany::ip::endpoint_v6{sockany::ip::address_v6::loopback(), 0});

#if SOCKANY_HAS_ABSTRACT_LOCAL
  auto abstract = sockany::local::endpoint::from_abstract("sockany-sockname-" +
                                                          std::to_string(::getpid()));
  if (!abstract) {
    std::cerr << "sockname_dump: " << abstract.error().message() << "\n";
    return 1;
  }
  ok &= bind_and_dump(AF_UNIX, SOCK_DGRAM, *abstract);
#endif

  return ok ? 0 : 1;
}
