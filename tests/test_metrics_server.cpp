#include "minitest.hpp"
#include "loopback.hpp"
#include "app/MetricsServer.hpp"
#include <chrono>
#include <string>

using mapwatch::app::MetricsServer;
using mapwatch::app::StatusBoard;
using mapwatch::model::Severity;

static void publish_two(StatusBoard& board) {
  mapwatch::model::StatusSnapshot s;
  s.cycle = 9;
  s.authenticated = true;
  mapwatch::model::EntityStatus a;
  a.id = "core";
  a.display_name = "Core";
  a.last.severity = Severity::Error;
  a.last.error_count = 2;
  mapwatch::model::EntityStatus b;
  b.id = "edge";
  b.display_name = "Edge";
  b.last.severity = Severity::Warning;
  s.entities = {a, b};
  board.publish(std::move(s));
}

TEST(metrics_server_serves_status_board) {
  StatusBoard board;
  publish_two(board);
  MetricsServer server(board, 0, "127.0.0.1");
  auto port = server.start();
  ASSERT_TRUE(port.has_value());
  ASSERT_TRUE(*port != 0);

  auto reply = loopback::exchange(*port, "GET /metrics HTTP/1.1\r\nHost: localhost\r\n\r\n");
  ASSERT_TRUE(reply.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(reply.find("mapwatch_entity_severity{entity=\"core\",severity=\"error\"} 1") != std::string::npos);
  ASSERT_TRUE(reply.find("mapwatch_entity_severity{entity=\"edge\",severity=\"warning\"} 1") != std::string::npos);
  ASSERT_TRUE(reply.find("mapwatch_cycles_total 9") != std::string::npos);

  // Later publishes show up on the next scrape
  mapwatch::model::StatusSnapshot next = board.read();
  next.entities[0].last.severity = Severity::Normal;
  board.publish(std::move(next));
  auto again = loopback::exchange(*port, "GET /metrics HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(again.find("mapwatch_entity_severity{entity=\"core\",severity=\"normal\"} 1") != std::string::npos);

  auto missing = loopback::exchange(*port, "GET /nope HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(missing.starts_with("HTTP/1.1 404 Not Found\r\n"));

  auto t0 = std::chrono::steady_clock::now();
  server.stop();
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
}

TEST(metrics_server_port_in_use) {
  StatusBoard board;
  MetricsServer first(board, 0, "127.0.0.1");
  auto port = first.start();
  ASSERT_TRUE(port.has_value());

  MetricsServer second(board, *port, "127.0.0.1");
  auto clash = second.start();
  ASSERT_TRUE(!clash.has_value());
  ASSERT_TRUE(clash.error().find("bind") != std::string::npos);
}

TEST(metrics_server_bad_bind_address) {
  StatusBoard board;
  MetricsServer server(board, 0, "not-an-address");
  auto res = server.start();
  ASSERT_TRUE(!res.has_value());
  server.stop();
}
