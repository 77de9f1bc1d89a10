#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <thread>
#include "app/StatusBoard.hpp"
#include "model/Status.hpp"

struct io_uring;

namespace mapwatch::app {

// Serialize a StatusSnapshot into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string status_to_prometheus(const model::StatusSnapshot& snap);

struct HttpReply {
  int status{200};
  std::string content_type{"text/plain"};
  std::string body;
  bool head_only{false};
};

// GET and HEAD are served: /metrics (query string ignored) and /.
// Other paths are 404, other methods 405, a malformed request line 400.
[[nodiscard]] HttpReply route_metrics_request(std::string_view request, const StatusBoard& board);

[[nodiscard]] std::string render_reply(const HttpReply& reply);

// Reads one request from a connected socket and writes the reply.
// False when the peer sent nothing or the socket failed.
bool serve_metrics_client(int fd, const StatusBoard& board);

// Plain-HTTP exporter for the status board.
// Built on io_uring when liburing is available; otherwise start() fails.
class MetricsServer {
public:
  MetricsServer(const StatusBoard& board, uint16_t port, std::string bind_address = "0.0.0.0");
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  // Binds, then serves on a worker thread. Returns the bound port, which
  // differs from the requested one only when that was 0.
  [[nodiscard]] std::expected<uint16_t, std::string> start();
  void stop();

private:
  void serve(struct io_uring& ring, std::stop_token st);

  const StatusBoard& board_;
  uint16_t port_;
  std::string bind_address_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace mapwatch::app
