#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/Alerts.hpp"
#include "app/Classifier.hpp"
#include "app/StateStore.hpp"
#include "app/StatusBoard.hpp"
#include "collectors/ISessionGateway.hpp"
#include "model/Entity.hpp"
#include "model/Status.hpp"

namespace mapwatch::app {

struct MonitorOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
};

// What happened to one entity in one cycle
struct CheckEvent {
  uint64_t cycle{};
  const model::Entity* entity{};
  model::Verdict verdict{};
  std::optional<model::Severity> previous{};
  std::string failure;                      // fetch/classify failure text, empty on success
  bool alerted{false};                      // qualifying edge; an alert was built
  std::optional<DeliveryStatus> delivered{};
  std::string delivery_failure;             // set when the sink reported an error
};

struct CycleReport {
  uint64_t cycle{};
  size_t checked{};
  size_t unknown{};
  size_t errors{};
  size_t alerts_fired{};
  size_t alerts_failed{};
  bool session_expired{false};
  bool cancelled{false};
};

// ChecksFailed: a --once cycle in which no entity produced a verdict
enum class RunOutcome { Stopped, Completed, AuthFailed, ChecksFailed, Failed };

[[nodiscard]] const char* describe(RunOutcome o);

// Polls every entity through one authenticated session, classifies, debounces
// and alerts. One worker; entities are checked sequentially.
class Monitor {
public:
  using CheckObserver = std::function<void(const CheckEvent&)>;
  using CycleObserver = std::function<void(const CycleReport&)>;
  using CycleStartObserver = std::function<void(uint64_t cycle)>;

  Monitor(std::vector<model::Entity> entities, collectors::ISessionGateway& gateway, IAlertSink& sink,
          StatusClassifier classifier, MonitorOptions opts = {}, StatusBoard* board = nullptr);
  ~Monitor();
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // Register before start()/run()
  void on_check(CheckObserver fn) { check_observers_.push_back(std::move(fn)); }
  void on_cycle(CycleObserver fn) { cycle_observers_.push_back(std::move(fn)); }
  void on_cycle_start(CycleStartObserver fn) { cycle_start_observers_.push_back(std::move(fn)); }

  // Authenticate, then cycle until st is stopped; once = exactly one cycle.
  // The session is released on every return path.
  [[nodiscard]] RunOutcome run(std::stop_token st, bool once = false);

  // Same loop on a worker thread
  void start(bool once = false);
  void stop();
  [[nodiscard]] bool finished() const { return finished_.load(std::memory_order_acquire); }
  [[nodiscard]] std::optional<RunOutcome> outcome() const;

  // One pass over all entities with an established session
  CycleReport run_cycle(collectors::ISession& session, std::stop_token st);

  [[nodiscard]] const EntityStateStore& store() const { return store_; }
  [[nodiscard]] const std::vector<model::Entity>& entities() const { return entities_; }

private:
  void check_entity(size_t idx, collectors::ISession& session, std::stop_token st, CycleReport& rep);
  // false when woken by a stop request
  bool sleep_for(std::chrono::milliseconds d, std::stop_token st);
  void publish(bool authenticated);

  std::vector<model::Entity> entities_;
  collectors::ISessionGateway& gateway_;
  IAlertSink& sink_;
  StatusClassifier classifier_;
  MonitorOptions opts_;
  StatusBoard* board_;

  EntityStateStore store_;
  std::vector<model::EntityStatus> status_;
  uint64_t cycle_{0};

  std::vector<CheckObserver> check_observers_;
  std::vector<CycleObserver> cycle_observers_;
  std::vector<CycleStartObserver> cycle_start_observers_;

  std::mutex sleep_mu_;
  std::condition_variable_any sleep_cv_;
  std::atomic<bool> finished_{false};
  std::atomic<int> outcome_{-1};
  std::jthread thread_{};
};

} // namespace mapwatch::app
