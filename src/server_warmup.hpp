#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

class Logger;

enum class WarmupStatus { Idle, Checking, Warming, Ready, Timeout };

const char* to_string(WarmupStatus status);

struct WarmupTiming {
  std::chrono::milliseconds warm_threshold{2000};
  std::chrono::milliseconds poll_interval{3000};
  std::chrono::milliseconds max_wait{90000};
  std::chrono::milliseconds probe_timeout{5000};
};

// GET {http_url}/health. The callback receives true for any 2xx status within
// the timeout and false for every failure. Runs on io; never throws.
void async_probe_health(asio::io_context& io,
                        const std::string& http_url,
                        std::chrono::milliseconds timeout,
                        std::function<void(bool)> done);

// Blocking form of async_probe_health on a private io_context.
bool probe_health(const std::string& http_url,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

// Warm-up state machine without timers or sockets. Times are offsets on any
// monotonic clock; the caller reports probe results and elapsed time.
class WarmupMonitor {
public:
  explicit WarmupMonitor(WarmupTiming timing = WarmupTiming{});

  void start(std::chrono::milliseconds now, bool local_endpoint);
  void probe_started(std::chrono::milliseconds now);
  void probe_finished(bool ok, std::chrono::milliseconds now);
  void tick(std::chrono::milliseconds now);

  bool probe_due(std::chrono::milliseconds now) const;
  // Earliest instant at which tick() may change something.
  std::chrono::milliseconds next_deadline() const;

  WarmupStatus status() const { return status_; }
  bool finished() const { return status_ == WarmupStatus::Ready || status_ == WarmupStatus::Timeout; }
  bool show_overlay() const { return show_overlay_; }
  std::chrono::milliseconds elapsed(std::chrono::milliseconds now) const;

private:
  void enter_warming();

  WarmupTiming timing_;
  WarmupStatus status_ = WarmupStatus::Idle;
  bool show_overlay_ = false;
  bool probe_in_flight_ = false;
  std::chrono::milliseconds started_at_{0};
  std::chrono::milliseconds next_probe_at_{0};
};

// Drives a WarmupMonitor with a steady timer on the node's io_context.
class ServerWarmup : public std::enable_shared_from_this<ServerWarmup> {
public:
  using Completion = std::function<void(WarmupStatus)>;
  // Replaces the network probe; used by tests.
  using Prober = std::function<void(std::function<void(bool)>)>;

  ServerWarmup(asio::io_context& io,
               std::string http_url,
               std::shared_ptr<Logger> logger,
               WarmupTiming timing = WarmupTiming{});

  void set_prober(Prober prober) { prober_ = std::move(prober); }

  // The completion runs exactly once: with Ready or Timeout, or with the
  // current status when cancel() stops the loop first.
  void start(Completion done);
  void cancel();

  WarmupStatus status() const { return monitor_.status(); }
  bool show_overlay() const { return monitor_.show_overlay(); }

private:
  static std::chrono::milliseconds clock_now();
  void launch_probe();
  void schedule();
  void on_timer();
  void complete();

  asio::io_context& io_;
  std::string http_url_;
  std::shared_ptr<Logger> logger_;
  WarmupTiming timing_;
  WarmupMonitor monitor_;
  asio::steady_timer timer_;
  Prober prober_;
  Completion done_;
  bool cancelled_ = false;
};
