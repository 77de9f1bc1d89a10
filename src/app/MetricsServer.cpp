#ifdef MAPWATCH_HAVE_URING

#include "app/MetricsServer.hpp"
#include "util/Log.hpp"
#include <liburing.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <future>

namespace mapwatch::app {

// user_data of each submission
enum class UringTag : uint64_t { Accept = 1, Stop = 2 };

static void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

static std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

MetricsServer::MetricsServer(const StatusBoard& board, uint16_t port, std::string bind_address)
    : board_(board), port_(port), bind_address_(std::move(bind_address)) {}

MetricsServer::~MetricsServer() { stop(); }

std::expected<uint16_t, std::string> MetricsServer::start() {
  if (thread_.joinable()) return port_;

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (::inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1)
    return std::unexpected("bad bind address \"" + bind_address_ + "\"");

  // Blocking: accepts are driven by the ring, never by the socket
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) return std::unexpected(errno_text("socket"));

  int optval = 1;
  if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0)
    util::log(util::LogLevel::Warn, "metrics server: SO_REUSEADDR: %s", std::strerror(errno));

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
      ::listen(listen_fd_, 16) < 0) {
    auto err = errno_text("bind/listen");
    close_fd(listen_fd_);
    return std::unexpected(err + " on " + bind_address_ + ":" + std::to_string(port_));
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
    port_ = ntohs(addr.sin_port);

  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    auto err = errno_text("eventfd");
    close_fd(listen_fd_);
    return std::unexpected(err);
  }

  // The ring is created on the worker; wait until it is armed
  std::promise<std::string> ready;
  auto armed = ready.get_future();
  thread_ = std::jthread([this, &ready](std::stop_token st){
    struct io_uring ring{};
    if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
      ready.set_value(std::string("io_uring_queue_init: ") + std::strerror(-rc));
      return;
    }
    ready.set_value({});
    serve(ring, st);
    io_uring_queue_exit(&ring);
  });

  std::string err = armed.get();
  if (!err.empty()) {
    thread_.join();
    close_fd(stop_eventfd_);
    close_fd(listen_fd_);
    return std::unexpected(err);
  }
  util::log(util::LogLevel::Info, "metrics server: listening on %s:%u", bind_address_.c_str(), unsigned{port_});
  return port_;
}

void MetricsServer::stop() {
  if (!thread_.joinable()) return;
  uint64_t val = 1;
  if (::write(stop_eventfd_, &val, sizeof(val)) < 0)
    util::log(util::LogLevel::Warn, "metrics server: stop signal failed: %s", std::strerror(errno));
  thread_.request_stop();
  thread_.join();
  close_fd(stop_eventfd_);
  close_fd(listen_fd_);
}

void MetricsServer::serve(struct io_uring& ring, std::stop_token st) {
  auto arm = [&](UringTag tag) -> bool {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    if (!sqe) return false;
    if (tag == UringTag::Accept) io_uring_prep_accept(sqe, listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    else io_uring_prep_poll_add(sqe, stop_eventfd_, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
    return true;
  };

  if (!arm(UringTag::Accept) || !arm(UringTag::Stop)) {
    util::log(util::LogLevel::Error, "metrics server: submission queue full");
    return;
  }
  if (int rc = io_uring_submit(&ring); rc < 0) {
    util::log(util::LogLevel::Error, "metrics server: io_uring_submit: %s", std::strerror(-rc));
    return;
  }

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      util::log(util::LogLevel::Error, "metrics server: io_uring_wait_cqe: %s", std::strerror(-ret));
      return;
    }
    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::Stop || st.stop_requested()) return;

    if (res >= 0) {
      int one = 1;
      if (::setsockopt(res, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
        util::log(util::LogLevel::Warn, "metrics server: TCP_NODELAY: %s", std::strerror(errno));
      serve_metrics_client(res, board_);
      ::close(res);
    } else if (res != -EINTR && res != -EAGAIN && res != -ECONNABORTED) {
      util::log(util::LogLevel::Warn, "metrics server: accept: %s", std::strerror(-res));
    }

    if (!arm(UringTag::Accept)) {
      util::log(util::LogLevel::Error, "metrics server: submission queue full");
      return;
    }
    if (int rc = io_uring_submit(&ring); rc < 0) {
      util::log(util::LogLevel::Error, "metrics server: io_uring_submit: %s", std::strerror(-rc));
      return;
    }
  }
}

} // namespace mapwatch::app

#endif // MAPWATCH_HAVE_URING
