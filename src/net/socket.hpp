#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace autopay::net {

// Blocking TCP stream with optional timeouts. Move-only; closes on
// destruction. POSIX sockets only.
class TcpSocket {
 public:
  TcpSocket() = default;
  explicit TcpSocket(int handle) : handle_(handle) {}
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  bool Connect(const std::string& host, std::uint16_t port, int timeout_ms = 5000);
  bool BindAndListen(const std::string& address, std::uint16_t port, int backlog = 8);
  // Invalid socket when nothing arrived within the timeout.
  TcpSocket AcceptWithTimeout(int timeout_ms) const;

  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  // Loops until everything is written. False on error or timeout.
  bool SendAll(std::string_view data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);

  std::string PeerAddress() const;
  // Port the socket is bound to; 0 when unbound.
  std::uint16_t LocalPort() const;
  void Close();
  bool IsValid() const noexcept { return handle_ >= 0; }

 private:
  int handle_{-1};
};

}  // namespace autopay::net
