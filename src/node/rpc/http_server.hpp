#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "net/socket.hpp"

namespace autopay::rpc {

// Minimal HTTP/1.1 front for JSON-RPC: POST with an application/json body,
// HTTP Basic auth, loopback peers unless told otherwise. One connection is
// served at a time and every response closes the connection.
class HttpServer {
 public:
  struct Options {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{0};  // 0 picks an ephemeral port
    std::string rpc_user;
    std::string rpc_password;
    bool require_auth{true};
    std::vector<std::string> allowed_hosts;  // exact peer addresses; empty -> loopback only
    std::size_t max_body_bytes{1024 * 1024};
    int socket_timeout_ms{5000};
  };

  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  HttpServer(Options options, Handler handler);
  ~HttpServer();

  // Binds and serves on a background thread. Throws std::runtime_error when
  // the port cannot be bound.
  void Start();
  // Closes the listener and joins the worker. Safe to call repeatedly.
  void Stop();
  // Start() and block until another thread calls Stop().
  void Serve();

  std::uint16_t bound_port() const { return bound_port_; }

 private:
  void ServeLoop();
  void HandleClient(net::TcpSocket client);
  bool ReadRequest(net::TcpSocket& client, std::string* body, int* status);
  bool Authorized(const std::string& headers, const std::string& peer) const;
  bool HostAllowed(const std::string& peer) const;
  void SendResponse(net::TcpSocket& client, int status, const std::string& json_body);

  Options options_;
  Handler handler_;
  std::atomic<bool> running_{false};
  std::uint16_t bound_port_{0};
  net::TcpSocket listener_;
  std::thread worker_;
};

}  // namespace autopay::rpc
