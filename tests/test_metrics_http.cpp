#include "minitest.hpp"
#include "app/MetricsServer.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <string>

using mapwatch::app::HttpReply;
using mapwatch::app::StatusBoard;
using mapwatch::model::Severity;

static void publish_one(StatusBoard& board) {
  mapwatch::model::StatusSnapshot s;
  s.cycle = 3;
  s.authenticated = true;
  mapwatch::model::EntityStatus e;
  e.id = "core";
  e.display_name = "Core";
  e.last.severity = Severity::Error;
  e.last.error_count = 4;
  s.entities = {e};
  board.publish(std::move(s));
}

TEST(metrics_route_serves_status) {
  StatusBoard board;
  publish_one(board);
  HttpReply r = mapwatch::app::route_metrics_request("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n", board);
  ASSERT_EQ(r.status, 200);
  ASSERT_EQ(r.content_type, "text/plain; version=0.0.4; charset=utf-8");
  ASSERT_TRUE(r.body.find("mapwatch_entity_severity{entity=\"core\",severity=\"error\"} 1") != std::string::npos);
  ASSERT_TRUE(!r.head_only);

  auto q = mapwatch::app::route_metrics_request("GET /metrics?name[]=x HTTP/1.0\r\n\r\n", board);
  ASSERT_EQ(q.status, 200);
}

TEST(metrics_route_errors) {
  StatusBoard board;
  ASSERT_EQ(mapwatch::app::route_metrics_request("GET / HTTP/1.1\r\n\r\n", board).status, 200);
  ASSERT_EQ(mapwatch::app::route_metrics_request("GET /metricsx HTTP/1.1\r\n\r\n", board).status, 404);
  ASSERT_EQ(mapwatch::app::route_metrics_request("GET /favicon.ico HTTP/1.1\r\n\r\n", board).status, 404);
  ASSERT_EQ(mapwatch::app::route_metrics_request("POST /metrics HTTP/1.1\r\n\r\n", board).status, 405);
  ASSERT_EQ(mapwatch::app::route_metrics_request("GET /metrics\r\n\r\n", board).status, 400);
  ASSERT_EQ(mapwatch::app::route_metrics_request("garbage", board).status, 400);
  ASSERT_EQ(mapwatch::app::route_metrics_request("", board).status, 400);
}

TEST(metrics_render_reply) {
  HttpReply r;
  r.body = "hello\n";
  auto wire = mapwatch::app::render_reply(r);
  ASSERT_TRUE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(wire.find("Content-Length: 6\r\n") != std::string::npos);
  ASSERT_TRUE(wire.find("Connection: close\r\n") != std::string::npos);
  ASSERT_TRUE(wire.ends_with("\r\n\r\nhello\n"));

  r.head_only = true;
  auto head = mapwatch::app::render_reply(r);
  ASSERT_TRUE(head.find("Content-Length: 6\r\n") != std::string::npos);
  ASSERT_TRUE(head.ends_with("\r\n\r\n"));

  r.status = 405;
  r.head_only = false;
  auto not_allowed = mapwatch::app::render_reply(r);
  ASSERT_TRUE(not_allowed.starts_with("HTTP/1.1 405 Method Not Allowed\r\n"));
  ASSERT_TRUE(not_allowed.find("Allow: GET, HEAD\r\n") != std::string::npos);
}

// Full client round over a socket pair, request split across two writes
TEST(metrics_serve_client_over_socket) {
  StatusBoard board;
  publish_one(board);
  int sv[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);

  std::string first = "GET /metrics HTTP/1.1\r\n";
  std::string rest = "Host: localhost\r\n\r\n";
  ASSERT_TRUE(::write(sv[0], first.data(), first.size()) == static_cast<ssize_t>(first.size()));
  ASSERT_TRUE(::write(sv[0], rest.data(), rest.size()) == static_cast<ssize_t>(rest.size()));

  ASSERT_TRUE(mapwatch::app::serve_metrics_client(sv[1], board));
  ::close(sv[1]);

  std::string reply;
  char buf[4096];
  ssize_t n;
  while ((n = ::read(sv[0], buf, sizeof(buf))) > 0) reply.append(buf, static_cast<size_t>(n));
  ::close(sv[0]);

  ASSERT_TRUE(reply.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(reply.find("mapwatch_entity_error_count{entity=\"core\",name=\"Core\"} 4") != std::string::npos);
}

TEST(metrics_serve_client_peer_closed) {
  StatusBoard board;
  int sv[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);
  ::close(sv[0]);
  ASSERT_TRUE(!mapwatch::app::serve_metrics_client(sv[1], board));
  ::close(sv[1]);
}
