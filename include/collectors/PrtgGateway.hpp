#pragma once
#include "collectors/ISessionGateway.hpp"
#include <string>

namespace mapwatch::collectors {

struct PrtgOptions {
  std::string base_url;          // e.g. https://prtg.example.com (no trailing slash needed)
  std::string username;
  std::string password;
  bool verify_tls{true};
  long timeout_s{15};
  long connect_timeout_s{10};
};

// PRTG web UI over libcurl: form login into a cookie session, then map
// fragments from /controls/maponly.htm?id=<ref>.
class PrtgGateway : public ISessionGateway {
public:
  explicit PrtgGateway(PrtgOptions opts);

  [[nodiscard]] auto authenticate(std::stop_token st)
      -> std::expected<std::unique_ptr<ISession>, AuthError> override;

  [[nodiscard]] const char* name() const override { return "prtg"; }

  [[nodiscard]] const PrtgOptions& options() const { return opts_; }

private:
  PrtgOptions opts_;
};

// URL helpers, exposed for tests
[[nodiscard]] std::string prtg_login_url(const std::string& base_url);
[[nodiscard]] std::string prtg_fragment_url(const std::string& base_url, const std::string& ref);
[[nodiscard]] std::string prtg_dashboard_url(const std::string& base_url, const std::string& ref);
// True when the URL curl ended on is (still) a login page
[[nodiscard]] bool prtg_is_login_page(const std::string& base_url, const std::string& effective_url);

} // namespace mapwatch::collectors
