#pragma once
#include "app/Alerts.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mapwatch::app {

struct MailOptions {
  std::string server;                    // empty disables mail
  int port{587};
  bool use_tls{true};                    // STARTTLS on smtp://, implicit on 465
  bool verify_tls{true};
  std::string username;
  std::string password;
  std::string sender;
  std::vector<std::string> recipients;
  long timeout_s{30};
};

// SMTP delivery over libcurl, one connection per alert.
class MailSink : public IAlertSink {
public:
  explicit MailSink(MailOptions opts);

  [[nodiscard]] auto deliver(const model::Alert& alert, std::stop_token st)
      -> std::expected<DeliveryStatus, DeliveryError> override;
  [[nodiscard]] const char* name() const override { return "smtp"; }

  [[nodiscard]] bool enabled() const { return !opts_.server.empty() && !opts_.recipients.empty(); }

private:
  MailOptions opts_;
};

// Full RFC 5322 message (headers + plain-text body, CRLF line endings)
[[nodiscard]] std::string format_mail(const model::Alert& alert, const MailOptions& opts);

// RFC 2047 "B" encoding when the header value is not plain ASCII
[[nodiscard]] std::string encode_header_value(std::string_view value);

[[nodiscard]] std::string smtp_url(const MailOptions& opts);

} // namespace mapwatch::app
