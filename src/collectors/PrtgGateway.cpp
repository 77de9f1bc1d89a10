#include "collectors/PrtgGateway.hpp"
#include "util/Curl.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <cctype>

namespace mapwatch::collectors {

const char* describe(AuthError::Kind k) {
  switch (k) {
    case AuthError::Kind::BadCredentials: return "bad credentials";
    case AuthError::Kind::Unreachable:    return "endpoint unreachable";
    case AuthError::Kind::Cancelled:      return "cancelled";
  }
  return "auth error";
}

const char* describe(FetchError::Kind k) {
  switch (k) {
    case FetchError::Kind::Timeout:        return "timeout";
    case FetchError::Kind::Network:        return "network failure";
    case FetchError::Kind::BadResponse:    return "unexpected response";
    case FetchError::Kind::SessionExpired: return "session expired";
    case FetchError::Kind::Cancelled:      return "cancelled";
  }
  return "fetch error";
}

static std::string strip_slash(std::string s) {
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

static std::string lower_copy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string prtg_login_url(const std::string& base_url) {
  return strip_slash(base_url) + "/public/checklogin.htm";
}

std::string prtg_fragment_url(const std::string& base_url, const std::string& ref) {
  return strip_slash(base_url) + "/controls/maponly.htm?id=" + ref;
}

std::string prtg_dashboard_url(const std::string& base_url, const std::string& ref) {
  return strip_slash(base_url) + "/mapshow.htm?id=" + ref;
}

bool prtg_is_login_page(const std::string& base_url, const std::string& effective_url) {
  auto base = strip_slash(base_url);
  std::string tail = effective_url;
  if (tail.rfind(base, 0) == 0) tail = tail.substr(base.size());
  return lower_copy(tail).find("login") != std::string::npos;
}

namespace {

void apply_common(CURL* h, const PrtgOptions& o) {
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT, o.timeout_s);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, o.connect_timeout_s);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_USERAGENT, "mapwatch/1.0");
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, util::curl_write_string);
  if (!o.verify_tls) {
    // PRTG installs commonly run on self-signed certificates
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
  }
}

class PrtgSession : public ISession {
public:
  PrtgSession(util::CurlEasy handle, const PrtgOptions& opts)
      : h_(std::move(handle)), base_(strip_slash(opts.base_url)) {}

  ~PrtgSession() override {
    // Dropping the handle discards the session cookies
    util::log(util::LogLevel::Info, "prtg: session released");
  }

  PrtgSession(const PrtgSession&) = delete;
  PrtgSession& operator=(const PrtgSession&) = delete;

  auto fetch_fragment(const std::string& dashboard_ref, std::stop_token st)
      -> std::expected<StatusFragment, FetchError> override {
    CURL* h = h_.get();
    std::string body;
    std::string url = prtg_fragment_url(base_, util::curl_escape(h, dashboard_ref));
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    util::curl_bind_stop(h, &st);

    CURLcode rc = curl_easy_perform(h);
    util::curl_bind_stop(h, nullptr);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, nullptr);

    if (rc == CURLE_ABORTED_BY_CALLBACK)
      return std::unexpected(FetchError{FetchError::Kind::Cancelled, "transfer aborted"});
    if (rc == CURLE_OPERATION_TIMEDOUT)
      return std::unexpected(FetchError{FetchError::Kind::Timeout, curl_easy_strerror(rc)});
    if (rc != CURLE_OK)
      return std::unexpected(FetchError{FetchError::Kind::Network, curl_easy_strerror(rc)});

    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    char* eff = nullptr;
    curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &eff);
    if (code == 401 || code == 403 || (eff && prtg_is_login_page(base_, eff)))
      return std::unexpected(FetchError{FetchError::Kind::SessionExpired, "redirected to login"});
    if (code < 200 || code >= 300)
      return std::unexpected(FetchError{FetchError::Kind::BadResponse, "HTTP " + std::to_string(code)});
    if (body.empty())
      return std::unexpected(FetchError{FetchError::Kind::BadResponse, "empty body"});
    return StatusFragment{std::move(body)};
  }

  std::string dashboard_url(const std::string& dashboard_ref) const override {
    return prtg_dashboard_url(base_, dashboard_ref);
  }

private:
  util::CurlEasy h_;
  std::string base_;
};

} // namespace

PrtgGateway::PrtgGateway(PrtgOptions opts) : opts_(std::move(opts)) {}

auto PrtgGateway::authenticate(std::stop_token st)
    -> std::expected<std::unique_ptr<ISession>, AuthError> {
  util::CurlEasy h(curl_easy_init());
  if (!h) return std::unexpected(AuthError{AuthError::Kind::Unreachable, "curl_easy_init failed"});

  util::log(util::LogLevel::Info, "prtg: logging in to %s as %s", opts_.base_url.c_str(), opts_.username.c_str());

  apply_common(h.get(), opts_);
  // Empty cookie file turns on the in-memory cookie engine for this handle
  curl_easy_setopt(h.get(), CURLOPT_COOKIEFILE, "");

  std::string form = "username=" + util::curl_escape(h.get(), opts_.username) +
                     "&password=" + util::curl_escape(h.get(), opts_.password) +
                     "&loginurl=";
  std::string url = prtg_login_url(opts_.base_url);
  std::string body;
  curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, form.c_str());
  curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &body);
  util::curl_bind_stop(h.get(), &st);

  CURLcode rc = curl_easy_perform(h.get());
  util::curl_bind_stop(h.get(), nullptr);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, nullptr);
  curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, nullptr);

  if (rc == CURLE_ABORTED_BY_CALLBACK)
    return std::unexpected(AuthError{AuthError::Kind::Cancelled, "login aborted"});
  if (rc != CURLE_OK)
    return std::unexpected(AuthError{AuthError::Kind::Unreachable, curl_easy_strerror(rc)});

  long code = 0;
  curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &code);
  char* eff = nullptr;
  curl_easy_getinfo(h.get(), CURLINFO_EFFECTIVE_URL, &eff);
  if (code == 401 || code == 403)
    return std::unexpected(AuthError{AuthError::Kind::BadCredentials, "login rejected"});
  if (code < 200 || code >= 400)
    return std::unexpected(AuthError{AuthError::Kind::Unreachable, "HTTP " + std::to_string(code)});
  // A successful login leaves the login pages behind
  if (eff && prtg_is_login_page(opts_.base_url, eff))
    return std::unexpected(AuthError{AuthError::Kind::BadCredentials, "login rejected"});

  util::log(util::LogLevel::Info, "prtg: login ok");
  return std::make_unique<PrtgSession>(std::move(h), opts_);
}

} // namespace mapwatch::collectors
