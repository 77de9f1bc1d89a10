#include "app/Monitor.hpp"
#include "util/Log.hpp"
#include <exception>

namespace mapwatch::app {

using model::Severity;

const char* describe(RunOutcome o) {
  switch (o) {
    case RunOutcome::Stopped:    return "stopped";
    case RunOutcome::Completed:  return "completed";
    case RunOutcome::AuthFailed: return "authentication failed";
    case RunOutcome::ChecksFailed: return "every check failed";
    case RunOutcome::Failed:     return "failed";
  }
  return "unknown";
}

Monitor::Monitor(std::vector<model::Entity> entities, collectors::ISessionGateway& gateway, IAlertSink& sink,
                 StatusClassifier classifier, MonitorOptions opts, StatusBoard* board)
    : entities_(std::move(entities)), gateway_(gateway), sink_(sink),
      classifier_(std::move(classifier)), opts_(opts), board_(board) {
  status_.reserve(entities_.size());
  for (const auto& e : entities_) {
    model::EntityStatus st;
    st.id = e.id;
    st.display_name = e.display_name;
    status_.push_back(std::move(st));
  }
}

Monitor::~Monitor() { stop(); }

void Monitor::start(bool once) {
  if (thread_.joinable()) return;
  finished_.store(false, std::memory_order_release);
  outcome_.store(-1, std::memory_order_release);
  thread_ = std::jthread([this, once](std::stop_token st){
    RunOutcome o = RunOutcome::Failed;
    try {
      o = run(st, once);
    } catch (const std::exception& e) {
      util::log(util::LogLevel::Error, "monitor: aborted: %s", e.what());
    }
    outcome_.store(static_cast<int>(o), std::memory_order_release);
    finished_.store(true, std::memory_order_release);
  });
}

void Monitor::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

std::optional<RunOutcome> Monitor::outcome() const {
  int v = outcome_.load(std::memory_order_acquire);
  if (v < 0) return std::nullopt;
  return static_cast<RunOutcome>(v);
}

bool Monitor::sleep_for(std::chrono::milliseconds d, std::stop_token st) {
  std::unique_lock<std::mutex> lk(sleep_mu_);
  // Predicate-only wake: returns early only on a stop request
  sleep_cv_.wait_for(lk, st, d, []{ return false; });
  return !st.stop_requested();
}

void Monitor::publish(bool authenticated) {
  if (!board_) return;
  model::StatusSnapshot snap;
  snap.cycle = cycle_;
  snap.authenticated = authenticated;
  snap.updated_at = std::chrono::system_clock::now();
  snap.entities = status_;
  board_->publish(std::move(snap));
}

RunOutcome Monitor::run(std::stop_token st, bool once) {
  auto session = gateway_.authenticate(st);
  if (!session) {
    if (session.error().kind == collectors::AuthError::Kind::Cancelled) return RunOutcome::Stopped;
    util::log(util::LogLevel::Error, "monitor: %s login failed: %s (%s)", gateway_.name(),
              collectors::describe(session.error().kind), session.error().detail.c_str());
    publish(false);
    return RunOutcome::AuthFailed;
  }
  // Owned here so every exit path, exceptions included, releases it
  std::unique_ptr<collectors::ISession> owned = std::move(*session);
  publish(true);

  util::log(util::LogLevel::Info, "monitor: watching %zu entities, interval %llds", entities_.size(),
            static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(opts_.interval).count()));

  while (!st.stop_requested()) {
    CycleReport rep = run_cycle(*owned, st);
    if (rep.cancelled) break;
    if (once) {
      if (rep.checked > 0 && rep.unknown == rep.checked) return RunOutcome::ChecksFailed;
      return RunOutcome::Completed;
    }

    if (rep.session_expired) {
      util::log(util::LogLevel::Warn, "monitor: session expired, logging in again");
      owned.reset();
      auto again = gateway_.authenticate(st);
      if (!again) {
        if (again.error().kind == collectors::AuthError::Kind::Cancelled) break;
        util::log(util::LogLevel::Error, "monitor: re-login failed: %s (%s)",
                  collectors::describe(again.error().kind), again.error().detail.c_str());
        publish(false);
        return RunOutcome::AuthFailed;
      }
      owned = std::move(*again);
    }

    if (!sleep_for(opts_.interval, st)) break;
  }
  util::log(util::LogLevel::Info, "monitor: stop requested, shutting down");
  return RunOutcome::Stopped;
}

CycleReport Monitor::run_cycle(collectors::ISession& session, std::stop_token st) {
  CycleReport rep;
  rep.cycle = ++cycle_;
  for (auto& fn : cycle_start_observers_) fn(rep.cycle);
  for (size_t i = 0; i < entities_.size(); ++i) {
    if (st.stop_requested()) { rep.cancelled = true; break; }
    check_entity(i, session, st, rep);
    publish(true);
  }
  if (!rep.cancelled && st.stop_requested()) rep.cancelled = true;
  for (auto& fn : cycle_observers_) fn(rep);
  return rep;
}

void Monitor::check_entity(size_t idx, collectors::ISession& session, std::stop_token st, CycleReport& rep) {
  const model::Entity& entity = entities_[idx];
  model::EntityStatus& status = status_[idx];

  CheckEvent ev;
  ev.cycle = rep.cycle;
  ev.entity = &entity;
  ev.previous = store_.get(entity.id);

  std::string url;
  try {
    url = session.dashboard_url(entity.dashboard_ref);
    auto fragment = session.fetch_fragment(entity.dashboard_ref, st);
    if (fragment) {
      ev.verdict = classifier_.classify(fragment->markup);
      if (ev.verdict.severity == Severity::Unknown) ev.failure = "unrecognized markup";
    } else {
      const auto& err = fragment.error();
      ev.verdict = StatusClassifier::failed();
      ev.failure = std::string(collectors::describe(err.kind));
      if (!err.detail.empty()) ev.failure += ": " + err.detail;
      if (err.kind == collectors::FetchError::Kind::SessionExpired) rep.session_expired = true;
      if (err.kind == collectors::FetchError::Kind::Cancelled) rep.cancelled = true;
    }
  } catch (const std::exception& e) {
    ev.verdict = StatusClassifier::failed();
    ev.failure = std::string("exception: ") + e.what();
  }

  ++rep.checked;
  ++status.checks;
  status.dashboard_url = url;
  status.last = ev.verdict;

  if (ev.verdict.severity == Severity::Unknown) {
    ++rep.unknown;
    ++status.failed_checks;
    if (!rep.cancelled)
      util::log(util::LogLevel::Warn, "monitor: [%s] check failed: %s", entity.display_name.c_str(), ev.failure.c_str());
  } else if (ev.verdict.severity == Severity::Error) {
    ++rep.errors;
  }

  Transition t = store_.transition(entity.id, ev.verdict);
  if (t.alert) {
    ev.alerted = true;
    util::log(util::LogLevel::Warn, "monitor: [%s] entered error state (%s), sending alert",
              entity.display_name.c_str(), ev.verdict.summary.c_str());
    model::Alert alert = make_alert(entity, ev.verdict, url);
    std::expected<DeliveryStatus, DeliveryError> res =
        std::unexpected(DeliveryError{DeliveryError::Kind::Transport, "not attempted"});
    try {
      res = sink_.deliver(alert, st);
    } catch (const std::exception& e) {
      res = std::unexpected(DeliveryError{DeliveryError::Kind::Transport, e.what()});
    }
    if (res) {
      ev.delivered = *res;
      if (*res == DeliveryStatus::Sent) {
        ++rep.alerts_fired;
        ++status.alerts_fired;
      }
    } else {
      ev.delivery_failure = std::string(describe(res.error().kind));
      if (!res.error().detail.empty()) ev.delivery_failure += ": " + res.error().detail;
      ++rep.alerts_failed;
      ++status.alerts_failed;
      util::log(util::LogLevel::Error, "monitor: [%s] alert delivery via %s failed: %s", entity.display_name.c_str(),
                sink_.name(), ev.delivery_failure.c_str());
    }
  } else if (ev.verdict.severity == Severity::Error) {
    util::log(util::LogLevel::Info, "monitor: [%s] error state persists, alert suppressed", entity.display_name.c_str());
  }
  // Committed after the delivery attempt whatever its result: at most one alert per error run
  if (t.commit) store_.set(entity.id, *t.commit);
  status.stored = store_.get(entity.id);

  for (auto& fn : check_observers_) fn(ev);
}

} // namespace mapwatch::app
