#include "app/MetricsServer.hpp"
#include "util/Log.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <charconv>
#include <cstring>

namespace mapwatch::app {

static constexpr size_t kMaxRequest = 8192;

static const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
  }
  return "Error";
}

static HttpReply plain(int status) {
  HttpReply r;
  r.status = status;
  r.body = std::to_string(status) + " " + reason_phrase(status) + "\n";
  return r;
}

HttpReply route_metrics_request(std::string_view request, const StatusBoard& board) {
  std::string_view line = request.substr(0, request.find_first_of("\r\n"));
  auto sp1 = line.find(' ');
  auto sp2 = (sp1 == std::string_view::npos) ? sp1 : line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos || !line.substr(sp2 + 1).starts_with("HTTP/1."))
    return plain(400);

  std::string_view method = line.substr(0, sp1);
  std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);
  if (method != "GET" && method != "HEAD") return plain(405);

  HttpReply r;
  if (target == "/metrics") {
    r.content_type = "text/plain; version=0.0.4; charset=utf-8";
    r.body = status_to_prometheus(board.read());
  } else if (target == "/") {
    r.body = "mapwatch: use /metrics\n";
  } else {
    r = plain(404);
  }
  r.head_only = (method == "HEAD");
  return r;
}

std::string render_reply(const HttpReply& reply) {
  std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " + reason_phrase(reply.status) + "\r\n";
  out += "Content-Type: " + reply.content_type + "\r\n";
  if (reply.status == 405) out += "Allow: GET, HEAD\r\n";
  out += "Connection: close\r\nContent-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), reply.body.size());
  out.append(len_buf, ptr);
  out += "\r\n\r\n";
  if (!reply.head_only) out += reply.body;
  return out;
}

bool serve_metrics_client(int fd, const StatusBoard& board) {
  // Slow clients must not stall the loop
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
      ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    util::log(util::LogLevel::Warn, "metrics server: socket timeouts: %s", std::strerror(errno));
  }

  std::string req;
  char buf[1024];
  while (req.size() < kMaxRequest && req.find("\r\n\r\n") == std::string::npos &&
         req.find("\n\n") == std::string::npos) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      util::log(util::LogLevel::Warn, "metrics server: recv failed: %s", std::strerror(errno));
      return false;
    }
    if (n == 0) break;
    req.append(buf, static_cast<size_t>(n));
  }
  if (req.empty()) return false;

  const std::string wire = render_reply(route_metrics_request(req, board));
  size_t off = 0;
  while (off < wire.size()) {
    ssize_t n = ::send(fd, wire.data() + off, wire.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      util::log(util::LogLevel::Warn, "metrics server: send failed: %s", std::strerror(errno));
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

} // namespace mapwatch::app
