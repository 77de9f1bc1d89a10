#pragma once
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

namespace mapwatch::collectors {

struct StatusFragment {
  std::string markup;
};

struct AuthError {
  enum class Kind { BadCredentials, Unreachable, Cancelled };
  Kind kind{Kind::Unreachable};
  std::string detail;
};

struct FetchError {
  enum class Kind { Timeout, Network, BadResponse, SessionExpired, Cancelled };
  Kind kind{Kind::Network};
  std::string detail;
};

[[nodiscard]] const char* describe(AuthError::Kind k);
[[nodiscard]] const char* describe(FetchError::Kind k);

// One authenticated, stateful dashboard session. Not safe for concurrent
// fetches; the destructor releases it.
class ISession {
public:
  virtual ~ISession() = default;

  [[nodiscard]] virtual auto fetch_fragment(const std::string& dashboard_ref, std::stop_token st)
      -> std::expected<StatusFragment, FetchError> = 0;

  // Link an operator can open for this dashboard
  [[nodiscard]] virtual std::string dashboard_url(const std::string& dashboard_ref) const = 0;
};

// Source of sessions. authenticate() must succeed before any fetch.
class ISessionGateway {
public:
  virtual ~ISessionGateway() = default;

  [[nodiscard]] virtual auto authenticate(std::stop_token st)
      -> std::expected<std::unique_ptr<ISession>, AuthError> = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace mapwatch::collectors
