#include "app/MailSink.hpp"
#include "util/Curl.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ctime>

namespace mapwatch::app {

static std::string base64(std::string_view in) {
  static constexpr char tbl[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((in.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    uint32_t n = (uint32_t(uint8_t(in[i])) << 16) | (uint32_t(uint8_t(in[i+1])) << 8) | uint8_t(in[i+2]);
    out += tbl[(n >> 18) & 63]; out += tbl[(n >> 12) & 63]; out += tbl[(n >> 6) & 63]; out += tbl[n & 63];
  }
  if (i + 1 == in.size()) {
    uint32_t n = uint32_t(uint8_t(in[i])) << 16;
    out += tbl[(n >> 18) & 63]; out += tbl[(n >> 12) & 63]; out += "==";
  } else if (i + 2 == in.size()) {
    uint32_t n = (uint32_t(uint8_t(in[i])) << 16) | (uint32_t(uint8_t(in[i+1])) << 8);
    out += tbl[(n >> 18) & 63]; out += tbl[(n >> 12) & 63]; out += tbl[(n >> 6) & 63]; out += '=';
  }
  return out;
}

std::string encode_header_value(std::string_view value) {
  bool ascii = std::all_of(value.begin(), value.end(), [](char c){
    auto u = static_cast<unsigned char>(c);
    return u >= 0x20 && u < 0x7F;
  });
  if (ascii) return std::string(value);
  return "=?UTF-8?B?" + base64(value) + "?=";
}

static std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &tm);
  return buf;
}

static std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += sep;
    out += v[i];
  }
  return out;
}

std::string smtp_url(const MailOptions& opts) {
  const char* scheme = (opts.port == 465) ? "smtps://" : "smtp://";
  return std::string(scheme) + opts.server + ":" + std::to_string(opts.port);
}

std::string format_mail(const model::Alert& alert, const MailOptions& opts) {
  std::string m;
  m += "Date: " + format_time(alert.fired_at, "%a, %d %b %Y %H:%M:%S %z") + "\r\n";
  m += "From: " + opts.sender + "\r\n";
  m += "To: " + join(opts.recipients, ", ") + "\r\n";
  m += "Subject: " + encode_header_value("[mapwatch] Dashboard alert - " + alert.entity_display_name) + "\r\n";
  m += "MIME-Version: 1.0\r\n";
  m += "Content-Type: text/plain; charset=UTF-8\r\n";
  m += "Content-Transfer-Encoding: 8bit\r\n";
  m += "\r\n";
  m += "An error state was detected on a monitored dashboard.\r\n";
  m += "\r\n";
  m += "Entity:    " + alert.entity_display_name + "\r\n";
  m += "Dashboard: " + alert.dashboard_url + "\r\n";
  m += "Detected:  " + format_time(alert.fired_at, "%Y-%m-%d %H:%M:%S") + "\r\n";
  m += "Status:    " + alert.status_label + "\r\n";
  m += "\r\n";
  m += "Log in to PRTG and check the affected devices.\r\n";
  m += "\r\n";
  m += "-- \r\n";
  m += "Sent automatically by mapwatch\r\n";
  return m;
}

namespace {

struct Upload {
  const std::string* data;
  size_t offset{0};
};

size_t read_upload(char* buf, size_t size, size_t nmemb, void* userp) {
  auto* up = static_cast<Upload*>(userp);
  size_t room = size * nmemb;
  size_t left = up->data->size() - up->offset;
  size_t n = std::min(room, left);
  std::memcpy(buf, up->data->data() + up->offset, n);
  up->offset += n;
  return n;
}

} // namespace

MailSink::MailSink(MailOptions opts) : opts_(std::move(opts)) {
  if (!enabled())
    util::log(util::LogLevel::Warn, "smtp: no server or recipients configured, mail alerts disabled");
}

auto MailSink::deliver(const model::Alert& alert, std::stop_token st)
    -> std::expected<DeliveryStatus, DeliveryError> {
  if (!enabled()) {
    util::log(util::LogLevel::Warn, "smtp: [%s] mail disabled, alert not sent", alert.entity_display_name.c_str());
    return DeliveryStatus::Disabled;
  }

  util::CurlEasy h(curl_easy_init());
  if (!h) return std::unexpected(DeliveryError{DeliveryError::Kind::Transport, "curl_easy_init failed"});

  std::string url = smtp_url(opts_);
  std::string payload = format_mail(alert, opts_);
  Upload up{&payload};

  curl_slist* list = nullptr;
  for (const auto& r : opts_.recipients) {
    curl_slist* next = curl_slist_append(list, r.c_str());
    if (!next) {
      curl_slist_free_all(list);
      return std::unexpected(DeliveryError{DeliveryError::Kind::Transport, "out of memory"});
    }
    list = next;
  }
  util::CurlSlist rcpt(list);

  CURL* c = h.get();
  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  if (opts_.use_tls) curl_easy_setopt(c, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
  if (!opts_.verify_tls) {
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 0L);
  }
  if (!opts_.username.empty() && !opts_.password.empty()) {
    curl_easy_setopt(c, CURLOPT_USERNAME, opts_.username.c_str());
    curl_easy_setopt(c, CURLOPT_PASSWORD, opts_.password.c_str());
  }
  curl_easy_setopt(c, CURLOPT_MAIL_FROM, opts_.sender.c_str());
  curl_easy_setopt(c, CURLOPT_MAIL_RCPT, rcpt.get());
  curl_easy_setopt(c, CURLOPT_READFUNCTION, read_upload);
  curl_easy_setopt(c, CURLOPT_READDATA, &up);
  curl_easy_setopt(c, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(c, CURLOPT_TIMEOUT, opts_.timeout_s);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  util::curl_bind_stop(c, &st);

  CURLcode rc = curl_easy_perform(c);
  if (rc == CURLE_ABORTED_BY_CALLBACK)
    return std::unexpected(DeliveryError{DeliveryError::Kind::Cancelled, "transfer aborted"});
  if (rc == CURLE_LOGIN_DENIED)
    return std::unexpected(DeliveryError{DeliveryError::Kind::Auth, curl_easy_strerror(rc)});
  if (rc != CURLE_OK)
    return std::unexpected(DeliveryError{DeliveryError::Kind::Transport, curl_easy_strerror(rc)});

  util::log(util::LogLevel::Info, "smtp: [%s] alert mailed to %s", alert.entity_display_name.c_str(),
            join(opts_.recipients, ", ").c_str());
  return DeliveryStatus::Sent;
}

} // namespace mapwatch::app
