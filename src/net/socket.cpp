#include "net/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "util/logging.hpp"

namespace autopay::net {

namespace {

// RAII holder for a getaddrinfo result.
class AddrInfoList {
 public:
  AddrInfoList(const char* node, const std::string& port, const addrinfo& hints) {
    status_ = ::getaddrinfo(node, port.c_str(), &hints, &head_);
  }
  ~AddrInfoList() {
    if (head_) {
      ::freeaddrinfo(head_);
    }
  }
  AddrInfoList(const AddrInfoList&) = delete;
  AddrInfoList& operator=(const AddrInfoList&) = delete;

  bool ok() const { return status_ == 0 && head_ != nullptr; }
  const addrinfo* head() const { return head_; }
  const char* error() const { return ::gai_strerror(status_); }

 private:
  addrinfo* head_{nullptr};
  int status_{0};
};

bool ConnectWithTimeout(int fd, const sockaddr* addr, socklen_t addr_len, int timeout_ms) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    return false;
  }
  int rc = ::connect(fd, addr, addr_len);
  if (rc != 0 && errno == EINPROGRESS) {
    pollfd pfd{fd, POLLOUT, 0};
    rc = ::poll(&pfd, 1, timeout_ms);
    if (rc == 1) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      rc = (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) ? 0
                                                                                         : -1;
    } else {
      rc = -1;
    }
  }
  ::fcntl(fd, F_SETFL, flags);
  return rc == 0;
}

}  // namespace

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : handle_(other.handle_) {
  other.handle_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    other.handle_ = -1;
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, int timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  AddrInfoList addresses(host.c_str(), std::to_string(port), hints);
  if (!addresses.ok()) {
    util::LogDebug("resolve " + host + " failed: " + addresses.error());
    return false;
  }
  for (const auto* entry = addresses.head(); entry != nullptr; entry = entry->ai_next) {
    const int fd = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
      continue;
    }
    if (ConnectWithTimeout(fd, entry->ai_addr, entry->ai_addrlen, timeout_ms)) {
      Close();
      handle_ = fd;
      return true;
    }
    ::close(fd);
  }
  util::LogDebug("connect " + host + ":" + std::to_string(port) + " failed");
  return false;
}

bool TcpSocket::BindAndListen(const std::string& address, std::uint16_t port, int backlog) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST;
  const bool any_v4 = address.empty() || address == "0.0.0.0";
  const bool any_v6 = address == "::";
  hints.ai_family = any_v4 ? AF_INET : (any_v6 ? AF_INET6 : AF_UNSPEC);
  AddrInfoList addresses(any_v4 || any_v6 ? nullptr : address.c_str(), std::to_string(port),
                         hints);
  if (!addresses.ok()) {
    util::LogWarn("invalid bind address " + address + ": " + addresses.error());
    return false;
  }
  for (const auto* entry = addresses.head(); entry != nullptr; entry = entry->ai_next) {
    const int fd = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
      continue;
    }
    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (::bind(fd, entry->ai_addr, entry->ai_addrlen) != 0 || ::listen(fd, backlog) != 0) {
      ::close(fd);
      continue;
    }
    Close();
    handle_ = fd;
    return true;
  }
  return false;
}

TcpSocket TcpSocket::AcceptWithTimeout(int timeout_ms) const {
  if (!IsValid()) {
    return TcpSocket();
  }
  pollfd pfd{handle_, POLLIN, 0};
  if (::poll(&pfd, 1, timeout_ms) != 1 || (pfd.revents & POLLIN) == 0) {
    return TcpSocket();
  }
  const int client = ::accept(handle_, nullptr, nullptr);
  return client < 0 ? TcpSocket() : TcpSocket(client);
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) {
    return -1;
  }
  return ::send(handle_, data, length, MSG_NOSIGNAL);
}

bool TcpSocket::SendAll(std::string_view data) const {
  const auto* cursor = reinterpret_cast<const std::uint8_t*>(data.data());
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const auto sent = Send(cursor, remaining);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return false;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) {
    return -1;
  }
  std::ptrdiff_t received = 0;
  do {
    received = ::recv(handle_, data, length, 0);
  } while (received < 0 && errno == EINTR);
  return received;
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) {
    return false;
  }
  timeval tv{milliseconds / 1000, (milliseconds % 1000) * 1000};
  return ::setsockopt(handle_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(handle_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::string TcpSocket::PeerAddress() const {
  if (!IsValid()) {
    return {};
  }
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return {};
  }
  char host[NI_MAXHOST]{};
  if (::getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host), nullptr, 0,
                    NI_NUMERICHOST) != 0) {
    return {};
  }
  std::string peer(host);
  // IPv4 clients of a dual-stack listener show up as ::ffff:a.b.c.d.
  constexpr std::string_view kMapped = "::ffff:";
  if (peer.rfind(kMapped, 0) == 0 && peer.find('.') != std::string::npos) {
    peer.erase(0, kMapped.size());
  }
  return peer;
}

std::uint16_t TcpSocket::LocalPort() const {
  if (!IsValid()) {
    return 0;
  }
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

void TcpSocket::Close() {
  if (handle_ >= 0) {
    ::close(handle_);
    handle_ = -1;
  }
}

}  // namespace autopay::net
