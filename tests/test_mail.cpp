#include "minitest.hpp"
#include "loopback.hpp"
#include "app/MailSink.hpp"
#include "util/Curl.hpp"
#include <cctype>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mapwatch::app;

static mapwatch::model::Alert sample_alert(const std::string& name) {
  mapwatch::model::Alert a;
  a.entity_display_name = name;
  a.dashboard_url = "https://prtg.example.com/mapshow.htm?id=2041";
  a.status_label = "error (2)";
  a.fired_at = std::chrono::system_clock::now();
  return a;
}

static MailOptions sample_options() {
  MailOptions o;
  o.server = "smtp.example.com";
  o.sender = "mapwatch@example.com";
  o.recipients = {"ops@example.com", "noc@example.com"};
  return o;
}

TEST(mail_header_ascii_passthrough) {
  ASSERT_EQ(encode_header_value("[mapwatch] Dashboard alert - Core"), "[mapwatch] Dashboard alert - Core");
}

TEST(mail_header_utf8_encoded) {
  // "é" = C3 A9 -> "w6k="
  ASSERT_EQ(encode_header_value("\xC3\xA9"), "=?UTF-8?B?w6k=?=");
  ASSERT_EQ(encode_header_value("ab\xC3\xA9"), "=?UTF-8?B?YWLDqQ==?=");
}

TEST(mail_format_contains_fields) {
  auto m = format_mail(sample_alert("Core Switches"), sample_options());
  ASSERT_TRUE(m.find("From: mapwatch@example.com\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("To: ops@example.com, noc@example.com\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("Subject: [mapwatch] Dashboard alert - Core Switches\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("Content-Type: text/plain; charset=UTF-8\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("Entity:    Core Switches\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("Dashboard: https://prtg.example.com/mapshow.htm?id=2041\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("Status:    error (2)\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("Detected:  ") != std::string::npos);
  // Headers end with one blank line
  ASSERT_TRUE(m.find("\r\n\r\n") != std::string::npos);
  ASSERT_TRUE(m.find("\r\n\r\n") > m.find("Subject:"));
}

TEST(mail_format_non_ascii_subject) {
  auto m = format_mail(sample_alert("N\xC3\xBC" "rnberg"), sample_options());
  ASSERT_TRUE(m.find("Subject: =?UTF-8?B?") != std::string::npos);
  // Body stays raw UTF-8
  ASSERT_TRUE(m.find("Entity:    N\xC3\xBC" "rnberg\r\n") != std::string::npos);
}

TEST(mail_smtp_url) {
  MailOptions o = sample_options();
  ASSERT_EQ(smtp_url(o), "smtp://smtp.example.com:587");
  o.port = 465;
  ASSERT_EQ(smtp_url(o), "smtps://smtp.example.com:465");
}

TEST(mail_disabled_without_server_or_recipients) {
  MailOptions o = sample_options();
  o.server.clear();
  MailSink no_server(o);
  ASSERT_TRUE(!no_server.enabled());
  std::stop_source ss;
  auto res = no_server.deliver(sample_alert("Core"), ss.get_token());
  ASSERT_TRUE(res.has_value());
  ASSERT_TRUE(*res == DeliveryStatus::Disabled);

  MailOptions o2 = sample_options();
  o2.recipients.clear();
  MailSink no_rcpt(o2);
  ASSERT_TRUE(!no_rcpt.enabled());
  ASSERT_TRUE(MailSink(sample_options()).enabled());
}

TEST(mail_make_alert_uses_summary) {
  mapwatch::model::Entity e{"core", "", "101"};
  mapwatch::model::Verdict v;
  v.severity = mapwatch::model::Severity::Error;
  v.summary = "error (3)";
  auto a = make_alert(e, v, "https://x/mapshow.htm?id=101");
  ASSERT_EQ(a.entity_display_name, "core");
  ASSERT_EQ(a.status_label, "error (3)");
  ASSERT_EQ(a.dashboard_url, "https://x/mapshow.htm?id=101");
}

// ---- delivery against a loopback SMTP server ----

namespace {

const mapwatch::util::CurlGlobal g_curl;

struct SmtpBehavior {
  bool greet{true};
  bool advertise_auth{false};
  std::string auth_reply{"235 2.7.0 accepted"};
  std::string rcpt_reply{"250 2.1.5 ok"};
};

// Minimal ESMTP dialogue; records every command and the DATA payload
class SmtpServer {
public:
  explicit SmtpServer(SmtpBehavior b)
      : b_(std::move(b)), server_([this](int fd, std::stop_token st){ converse(fd, st); }) {}

  uint16_t port() const { return server_.port(); }

  std::vector<std::string> commands() const {
    std::lock_guard<std::mutex> lk(mu_);
    return commands_;
  }
  std::string data() const {
    std::lock_guard<std::mutex> lk(mu_);
    return data_;
  }

private:
  void reply(int fd, const std::string& line) { loopback::send_all(fd, line + "\r\n"); }

  void converse(int fd, std::stop_token st) {
    if (!b_.greet) { loopback::hold_until_stopped(st); return; }
    reply(fd, "220 loopback ESMTP");
    loopback::Reader r(fd);
    for (;;) {
      std::string line = r.until("\r\n", st);
      if (line.empty()) return;
      line.resize(line.size() - 2);
      {
        std::lock_guard<std::mutex> lk(mu_);
        commands_.push_back(line);
      }
      std::string verb = line.substr(0, line.find(' '));
      for (auto& c : verb) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      if (verb == "EHLO") {
        if (b_.advertise_auth) reply(fd, "250-loopback\r\n250 AUTH PLAIN");
        else reply(fd, "250 loopback");
      } else if (verb == "HELO" || verb == "MAIL" || verb == "RSET" || verb == "NOOP") {
        reply(fd, "250 ok");
      } else if (verb == "AUTH") {
        if (line.find(' ', 5) == std::string::npos) {
          // No initial response: ask for the credentials first
          reply(fd, "334 ");
          if (r.until("\r\n", st).empty()) return;
        }
        reply(fd, b_.auth_reply);
      } else if (verb == "RCPT") {
        reply(fd, b_.rcpt_reply);
      } else if (verb == "DATA") {
        reply(fd, "354 end with <CRLF>.<CRLF>");
        std::string body = r.until("\r\n.\r\n", st);
        if (body.empty()) return;
        {
          std::lock_guard<std::mutex> lk(mu_);
          data_ = body;
        }
        reply(fd, "250 2.0.0 queued");
      } else if (verb == "QUIT") {
        reply(fd, "221 bye");
        return;
      } else {
        reply(fd, "502 unrecognized");
      }
    }
  }

  SmtpBehavior b_;
  mutable std::mutex mu_;
  std::vector<std::string> commands_;
  std::string data_;
  loopback::Server server_;   // last: its thread stops first
};

MailOptions loopback_mail(uint16_t port) {
  MailOptions o = sample_options();
  o.server = "127.0.0.1";
  o.port = port;
  o.use_tls = false;
  o.timeout_s = 10;
  return o;
}

bool has_command(const std::vector<std::string>& cmds, const std::string& needle) {
  for (const auto& c : cmds)
    if (c.find(needle) != std::string::npos) return true;
  return false;
}

} // namespace

TEST(mail_delivers_over_smtp) {
  SmtpServer smtp(SmtpBehavior{});
  MailSink sink(loopback_mail(smtp.port()));
  std::stop_source ss;
  auto res = sink.deliver(sample_alert("Core Switches"), ss.get_token());
  ASSERT_TRUE(res.has_value());
  ASSERT_TRUE(*res == DeliveryStatus::Sent);

  auto cmds = smtp.commands();
  ASSERT_TRUE(has_command(cmds, "MAIL FROM:<mapwatch@example.com>"));
  ASSERT_TRUE(has_command(cmds, "RCPT TO:<ops@example.com>"));
  ASSERT_TRUE(has_command(cmds, "RCPT TO:<noc@example.com>"));
  auto data = smtp.data();
  ASSERT_TRUE(data.find("Subject: [mapwatch] Dashboard alert - Core Switches\r\n") != std::string::npos);
  ASSERT_TRUE(data.find("Status:    error (2)\r\n") != std::string::npos);
}

TEST(mail_rejected_recipient_is_transport_error) {
  SmtpBehavior b;
  b.rcpt_reply = "550 5.1.1 no such user";
  SmtpServer smtp(b);
  MailSink sink(loopback_mail(smtp.port()));
  std::stop_source ss;
  auto res = sink.deliver(sample_alert("Core"), ss.get_token());
  ASSERT_TRUE(!res.has_value());
  ASSERT_TRUE(res.error().kind == DeliveryError::Kind::Transport);
  ASSERT_TRUE(smtp.data().empty());
}

TEST(mail_login_denied_is_auth_error) {
  SmtpBehavior b;
  b.advertise_auth = true;
  b.auth_reply = "535 5.7.8 authentication failed";
  SmtpServer smtp(b);
  MailOptions o = loopback_mail(smtp.port());
  o.username = "alerts@example.com";
  o.password = "wrong";
  MailSink sink(o);
  std::stop_source ss;
  auto res = sink.deliver(sample_alert("Core"), ss.get_token());
  ASSERT_TRUE(!res.has_value());
  ASSERT_TRUE(res.error().kind == DeliveryError::Kind::Auth);
}

TEST(mail_unreachable_server) {
  uint16_t port = 0;
  {
    SmtpServer gone(SmtpBehavior{});
    port = gone.port();
  }
  MailSink sink(loopback_mail(port));
  std::stop_source ss;
  auto res = sink.deliver(sample_alert("Core"), ss.get_token());
  ASSERT_TRUE(!res.has_value());
  ASSERT_TRUE(res.error().kind == DeliveryError::Kind::Transport);
}

TEST(mail_stop_aborts_delivery) {
  SmtpBehavior b;
  b.greet = false;
  SmtpServer smtp(b);
  MailOptions o = loopback_mail(smtp.port());
  o.timeout_s = 30;
  MailSink sink(o);

  std::stop_source ss;
  std::jthread stopper([&ss]{
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ss.request_stop();
  });
  auto t0 = std::chrono::steady_clock::now();
  auto res = sink.deliver(sample_alert("Core"), ss.get_token());
  ASSERT_TRUE(!res.has_value());
  ASSERT_TRUE(res.error().kind == DeliveryError::Kind::Cancelled);
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
}
