// Preloaded into transfer programs that cannot pick a source address
// themselves. Binds every outgoing IP socket to $BIND_ADDRESS before the real
// connect(2) runs.

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <dlfcn.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace {

using connect_fn = int (*)(int, const struct sockaddr*, socklen_t);

connect_fn real_connect() {
  static const connect_fn fn = reinterpret_cast<connect_fn>(::dlsym(RTLD_NEXT, "connect"));
  return fn;
}

bool already_bound(const sockaddr_storage& local) {
  if (local.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&local);
    return in->sin_port != 0 || in->sin_addr.s_addr != htonl(INADDR_ANY);
  }
  const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&local);
  return in6->sin6_port != 0 ||
         std::memcmp(&in6->sin6_addr, &in6addr_any, sizeof(in6->sin6_addr)) != 0;
}

bool is_v4_mapped(const sockaddr* addr) {
  if (addr->sa_family != AF_INET6) {
    return false;
  }
  const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
  return IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr);
}

// Returns 0 when the socket was bound or left alone, -1 with errno set when
// the socket cannot leave from $BIND_ADDRESS. A family mismatch fails with
// EAFNOSUPPORT so the client moves on to an address of the bound family.
int bind_to_configured_address(int fd, const sockaddr* dest) {
  const char* text = std::getenv("BIND_ADDRESS");
  if (text == nullptr || *text == '\0') {
    return 0;
  }

  sockaddr_storage local{};
  socklen_t len = sizeof(local);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0 ||
      local.ss_family != dest->sa_family || already_bound(local)) {
    return 0;
  }

  in_addr v4{};
  in6_addr v6{};
  const bool want_v4 = ::inet_pton(AF_INET, text, &v4) == 1;
  const bool want_v6 = !want_v4 && ::inet_pton(AF_INET6, text, &v6) == 1;
  if (!want_v4 && !want_v6) {
    errno = EINVAL;
    return -1;
  }

  if (dest->sa_family == AF_INET) {
    if (!want_v4) {
      errno = EAFNOSUPPORT;
      return -1;
    }
    sockaddr_in sin{};
    sin.sin_family = AF_INET;
    sin.sin_addr = v4;
    return ::bind(fd, reinterpret_cast<const sockaddr*>(&sin), sizeof(sin));
  }

  sockaddr_in6 sin6{};
  sin6.sin6_family = AF_INET6;
  if (want_v6 && !is_v4_mapped(dest)) {
    sin6.sin6_addr = v6;
  } else if (want_v4 && is_v4_mapped(dest)) {
    // ::ffff:a.b.c.d
    sin6.sin6_addr.s6_addr[10] = 0xff;
    sin6.sin6_addr.s6_addr[11] = 0xff;
    std::memcpy(&sin6.sin6_addr.s6_addr[12], &v4, sizeof(v4));
  } else {
    errno = EAFNOSUPPORT;
    return -1;
  }
  return ::bind(fd, reinterpret_cast<const sockaddr*>(&sin6), sizeof(sin6));
}

}  // namespace

extern "C" int connect(int fd, const struct sockaddr* addr, socklen_t len) {
  const auto fn = real_connect();
  if (fn == nullptr) {
    errno = ENOSYS;
    return -1;
  }
  if (addr != nullptr && (addr->sa_family == AF_INET || addr->sa_family == AF_INET6)) {
    const int saved = errno;
    if (bind_to_configured_address(fd, addr) != 0) {
      return -1;
    }
    errno = saved;
  }
  return fn(fd, addr, len);
}
