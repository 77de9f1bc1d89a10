#include "app/MetricsServer.hpp"

namespace mapwatch::app {

MetricsServer::MetricsServer(const StatusBoard& board, uint16_t port, std::string bind_address)
    : board_(board), port_(port), bind_address_(std::move(bind_address)) {}

MetricsServer::~MetricsServer() = default;

std::expected<uint16_t, std::string> MetricsServer::start() {
  return std::unexpected("built without liburing, :" + std::to_string(port_) + " not served");
}

void MetricsServer::stop() {}

} // namespace mapwatch::app
