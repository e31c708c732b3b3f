#include "server_warmup.hpp"

#include "endpoint.hpp"
#include "log.hpp"

#include <asio/ssl.hpp>

#include <algorithm>

namespace {

// One GET /health exchange. Every failure path funnels into finish(false).
class HealthProbe : public std::enable_shared_from_this<HealthProbe> {
public:
  HealthProbe(asio::io_context& io,
              EndpointUrl url,
              std::chrono::milliseconds timeout,
              std::function<void(bool)> done)
    : url_(std::move(url)),
      ssl_ctx_(asio::ssl::context::tls_client),
      stream_(io, ssl_ctx_),
      resolver_(io),
      timer_(io),
      timeout_(timeout),
      done_(std::move(done)) {}

  void start() {
    auto self = shared_from_this();
    timer_.expires_after(timeout_);
    timer_.async_wait([self](const std::error_code& ec){
      if(!ec) self->finish(false);
    });
    resolver_.async_resolve(url_.host, std::to_string(url_.port),
      [self](const std::error_code& ec, asio::ip::tcp::resolver::results_type results){
        if(ec) return self->finish(false);
        asio::async_connect(self->stream_.next_layer(), results,
          [self](const std::error_code& ec, const asio::ip::tcp::endpoint&){
            if(ec) return self->finish(false);
            if(self->url_.secure) {
              self->handshake();
            } else {
              self->send_request();
            }
          });
      });
  }

private:
  template<typename Fn>
  void with_stream(Fn&& fn) {
    if(url_.secure) {
      fn(stream_);
    } else {
      fn(stream_.next_layer());
    }
  }

  void handshake() {
    std::error_code ec;
    ssl_ctx_.set_default_verify_paths(ec);
    stream_.set_verify_mode(asio::ssl::verify_peer, ec);
    SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str());
    auto self = shared_from_this();
    stream_.async_handshake(asio::ssl::stream_base::client, [self](const std::error_code& ec){
      if(ec) return self->finish(false);
      self->send_request();
    });
  }

  void send_request() {
    request_ = "GET /health HTTP/1.1\r\nHost: " + url_.host +
               "\r\nCache-Control: no-store\r\nConnection: close\r\n\r\n";
    auto self = shared_from_this();
    with_stream([&](auto& stream){
      asio::async_write(stream, asio::buffer(request_),
        [self](const std::error_code& ec, std::size_t){
          if(ec) return self->finish(false);
          self->read_status();
        });
    });
  }

  void read_status() {
    auto self = shared_from_this();
    with_stream([&](auto& stream){
      asio::async_read_until(stream, response_, "\r\n",
        [self](const std::error_code& ec, std::size_t){
          if(ec) return self->finish(false);
          std::istream is(&self->response_);
          std::string version;
          int code = 0;
          is >> version >> code;
          self->finish(version.rfind("HTTP/", 0) == 0 && code >= 200 && code < 300);
        });
    });
  }

  void finish(bool ok) {
    if(finished_) return;
    finished_ = true;
    timer_.cancel();
    resolver_.cancel();
    std::error_code ec;
    stream_.next_layer().close(ec);
    auto done = std::move(done_);
    if(done) done(ok);
  }

  EndpointUrl url_;
  asio::ssl::context ssl_ctx_;
  asio::ssl::stream<asio::ip::tcp::socket> stream_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer timer_;
  std::chrono::milliseconds timeout_;
  std::function<void(bool)> done_;
  std::string request_;
  asio::streambuf response_;
  bool finished_ = false;
};

} // namespace

const char* to_string(WarmupStatus status){
  switch(status) {
    case WarmupStatus::Idle: return "idle";
    case WarmupStatus::Checking: return "checking";
    case WarmupStatus::Warming: return "warming";
    case WarmupStatus::Ready: return "ready";
    case WarmupStatus::Timeout: return "timeout";
  }
  return "unknown";
}

void async_probe_health(asio::io_context& io,
                        const std::string& http_url,
                        std::chrono::milliseconds timeout,
                        std::function<void(bool)> done){
  auto url = parse_endpoint_url(http_url);
  if(!url) {
    asio::post(io, [done]{ done(false); });
    return;
  }
  try {
    std::make_shared<HealthProbe>(io, *url, timeout, done)->start();
  } catch(const std::system_error&) {
    asio::post(io, [done]{ done(false); });
  }
}

bool probe_health(const std::string& http_url, std::chrono::milliseconds timeout){
  asio::io_context io;
  bool result = false;
  async_probe_health(io, http_url, timeout, [&result](bool ok){ result = ok; });
  io.run();
  return result;
}

WarmupMonitor::WarmupMonitor(WarmupTiming timing)
  : timing_(timing) {}

void WarmupMonitor::start(std::chrono::milliseconds now, bool local_endpoint){
  started_at_ = now;
  next_probe_at_ = now;
  probe_in_flight_ = false;
  show_overlay_ = false;
  status_ = local_endpoint ? WarmupStatus::Ready : WarmupStatus::Checking;
}

void WarmupMonitor::probe_started(std::chrono::milliseconds){
  probe_in_flight_ = true;
}

void WarmupMonitor::probe_finished(bool ok, std::chrono::milliseconds now){
  probe_in_flight_ = false;
  if(finished() || status_ == WarmupStatus::Idle) return;
  const auto waited = elapsed(now);
  if(ok) {
    if(status_ == WarmupStatus::Checking && waited >= timing_.warm_threshold) enter_warming();
    status_ = WarmupStatus::Ready;
    return;
  }
  if(waited >= timing_.max_wait) {
    status_ = WarmupStatus::Timeout;
    return;
  }
  if(status_ == WarmupStatus::Checking) enter_warming();
  next_probe_at_ = now + timing_.poll_interval;
}

void WarmupMonitor::tick(std::chrono::milliseconds now){
  if(finished() || status_ == WarmupStatus::Idle) return;
  const auto waited = elapsed(now);
  if(waited >= timing_.max_wait) {
    status_ = WarmupStatus::Timeout;
  } else if(status_ == WarmupStatus::Checking && waited >= timing_.warm_threshold) {
    enter_warming();
  }
}

bool WarmupMonitor::probe_due(std::chrono::milliseconds now) const {
  if(status_ != WarmupStatus::Checking && status_ != WarmupStatus::Warming) return false;
  return !probe_in_flight_ && now >= next_probe_at_;
}

std::chrono::milliseconds WarmupMonitor::next_deadline() const {
  auto deadline = started_at_ + timing_.max_wait;
  if(status_ == WarmupStatus::Checking) {
    deadline = std::min(deadline, started_at_ + timing_.warm_threshold);
  }
  if(!probe_in_flight_) deadline = std::min(deadline, next_probe_at_);
  return deadline;
}

std::chrono::milliseconds WarmupMonitor::elapsed(std::chrono::milliseconds now) const {
  if(status_ == WarmupStatus::Idle) return std::chrono::milliseconds(0);
  return now - started_at_;
}

void WarmupMonitor::enter_warming(){
  status_ = WarmupStatus::Warming;
  show_overlay_ = true;
}

ServerWarmup::ServerWarmup(asio::io_context& io,
                           std::string http_url,
                           std::shared_ptr<Logger> logger,
                           WarmupTiming timing)
  : io_(io),
    http_url_(std::move(http_url)),
    logger_(std::move(logger)),
    timing_(timing),
    monitor_(timing),
    timer_(io) {}

std::chrono::milliseconds ServerWarmup::clock_now(){
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now().time_since_epoch());
}

void ServerWarmup::start(Completion done){
  done_ = std::move(done);
  monitor_.start(clock_now(), is_local_endpoint(http_url_));
  if(monitor_.finished()) {
    log_debug(logger_.get(), "Warm-up skipped for local relay {}", http_url_);
    auto self = shared_from_this();
    asio::post(io_, [self]{ self->complete(); });
    return;
  }
  log_debug(logger_.get(), "Checking relay health at {}/health", http_url_);
  on_timer();
}

void ServerWarmup::cancel(){
  auto self = shared_from_this();
  asio::post(io_, [self]{
    self->cancelled_ = true;
    self->complete();
  });
}

void ServerWarmup::launch_probe(){
  monitor_.probe_started(clock_now());
  auto self = shared_from_this();
  auto on_result = [self](bool ok){
    asio::post(self->io_, [self, ok]{
      if(self->cancelled_ || !self->done_) return;
      bool was_warming = self->monitor_.show_overlay();
      self->monitor_.probe_finished(ok, clock_now());
      if(!was_warming && self->monitor_.show_overlay()) {
        log_info(self->logger_.get(), "Relay is waking up, polling every {} ms",
                 self->timing_.poll_interval.count());
      }
      if(self->monitor_.finished()) {
        self->complete();
      } else {
        self->schedule();
      }
    });
  };
  if(prober_) {
    prober_(on_result);
  } else {
    async_probe_health(io_, http_url_, timing_.probe_timeout, on_result);
  }
}

void ServerWarmup::schedule(){
  auto wait = monitor_.next_deadline() - clock_now();
  if(wait < std::chrono::milliseconds(0)) wait = std::chrono::milliseconds(0);
  timer_.expires_after(wait);
  auto self = shared_from_this();
  timer_.async_wait([self](const std::error_code& ec){
    if(ec) return;
    self->on_timer();
  });
}

void ServerWarmup::on_timer(){
  if(cancelled_ || !done_) return;
  bool was_warming = monitor_.show_overlay();
  const auto now = clock_now();
  monitor_.tick(now);
  if(!was_warming && monitor_.show_overlay()) {
    log_info(logger_.get(), "Relay is waking up, polling every {} ms", timing_.poll_interval.count());
  }
  if(monitor_.finished()) {
    complete();
    return;
  }
  if(monitor_.probe_due(now)) launch_probe();
  schedule();
}

void ServerWarmup::complete(){
  if(!done_) return;
  timer_.cancel();
  auto done = std::move(done_);
  done_ = nullptr;
  switch(monitor_.status()) {
    case WarmupStatus::Ready:
      log_info(logger_.get(), "Relay ready at {}", http_url_);
      break;
    case WarmupStatus::Timeout:
      log_error(logger_.get(), "Relay did not respond within {} ms", timing_.max_wait.count());
      break;
    default:
      log_debug(logger_.get(), "Warm-up stopped in state {}", to_string(monitor_.status()));
      break;
  }
  done(monitor_.status());
}
