#include "connection.hpp"
#include "log.hpp"

#include <istream>

namespace {

std::shared_ptr<asio::ssl::context> make_client_context(bool secure) {
  auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
  if(secure) {
    std::error_code ec;
    ctx->set_default_verify_paths(ec);
    ctx->set_verify_mode(asio::ssl::verify_peer, ec);
  }
  return ctx;
}

std::string describe(const asio::ip::tcp::socket& sock) {
  std::error_code ec;
  auto ep = sock.remote_endpoint(ec);
  if(ec) return "unknown";
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

std::shared_ptr<Connection> Connection::create(asio::io_context& io,
                                               asio::ip::tcp::socket sock,
                                               std::shared_ptr<Logger> logger){
  auto c = std::shared_ptr<Connection>(new Connection(io, make_client_context(false), false, std::move(logger)));
  c->stream_.next_layer() = std::move(sock);
  c->remote_address_ = describe(c->stream_.next_layer());
  return c;
}

void Connection::connect(asio::io_context& io,
                         const std::string& host,
                         unsigned short port,
                         bool secure,
                         std::shared_ptr<Logger> logger,
                         ConnectHandler done){
  std::shared_ptr<Connection> conn;
  try {
    conn = std::shared_ptr<Connection>(new Connection(io, make_client_context(secure), secure, logger));
  } catch(const std::system_error& e) {
    auto code = e.code();
    asio::post(io, [done, code]{ done(code, nullptr); });
    return;
  }
  auto resolver = std::make_shared<asio::ip::tcp::resolver>(io);
  resolver->async_resolve(host, std::to_string(port),
    [resolver, conn, host, port, logger, done](const std::error_code& ec,
                                                asio::ip::tcp::resolver::results_type results){
      if(ec){
        log_debug(logger.get(), "Resolve failed for {}:{}  {}", host, port, ec.message());
        done(ec, nullptr);
        return;
      }
      asio::async_connect(conn->stream_.next_layer(), results,
        [conn, host, done](const std::error_code& ec, const asio::ip::tcp::endpoint& ep){
          if(ec){
            done(ec, nullptr);
            return;
          }
          conn->remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
          if(!conn->secure_) {
            done(ec, conn);
            return;
          }
          SSL_set_tlsext_host_name(conn->stream_.native_handle(), host.c_str());
          conn->stream_.async_handshake(asio::ssl::stream_base::client,
            [conn, done](const std::error_code& ec){
              if(ec) {
                std::error_code ignored;
                conn->stream_.next_layer().close(ignored);
                done(ec, nullptr);
                return;
              }
              done(ec, conn);
            });
        });
    });
}

Connection::Connection(asio::io_context& io,
                       std::shared_ptr<asio::ssl::context> ssl_ctx,
                       bool secure,
                       std::shared_ptr<Logger> logger)
  : io_(io),
    ssl_ctx_(std::move(ssl_ctx)),
    stream_(io, *ssl_ctx_),
    secure_(secure),
    logger_(std::move(logger)) {}

Connection::~Connection(){
  std::error_code ec;
  stream_.next_layer().close(ec);
}

void Connection::set_handlers(LineHandler on_line, CloseHandler on_close){
  on_line_ = std::move(on_line);
  on_close_ = std::move(on_close);
}

void Connection::start(){
  do_read();
}

void Connection::do_read(){
  auto self = shared_from_this();
  with_stream([&](auto& stream){
    asio::async_read_until(stream, read_buf_, '\n',
      [this, self](const std::error_code& ec, std::size_t){
        if(ec){
          if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
            log_debug(logger_.get(), "Connection read error from {}: {}", remote_address_, ec.message());
          }
          shutdown(ec);
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        if(!line.empty() && line.back() == '\r') line.pop_back();
        if(!line.empty() && on_line_){
          auto handler = on_line_;
          handler(self, std::move(line));
        }
        if(open_) do_read();
      });
  });
}

void Connection::send_json(const nlohmann::json& j){
  enqueue(j.dump() + "\n");
}

void Connection::send_raw(std::string data){
  enqueue(std::move(data));
}

void Connection::enqueue(std::string data){
  auto self = shared_from_this();
  asio::post(io_, [this, self, data = std::move(data)]() mutable {
    if(!open_) return;
    bool start_write = write_queue_.empty();
    write_queue_.push_back(std::move(data));
    if(start_write) do_write();
  });
}

void Connection::do_write(){
  if(write_queue_.empty()) return;
  auto self = shared_from_this();
  with_stream([&](auto& stream){
    asio::async_write(stream, asio::buffer(write_queue_.front()),
      [this, self](const std::error_code& ec, std::size_t){
        if(ec){
          log_debug(logger_.get(), "Connection write error to {}: {}", remote_address_, ec.message());
          shutdown(ec);
          return;
        }
        write_queue_.pop_front();
        if(!write_queue_.empty()){
          do_write();
        } else if(close_when_drained_) {
          shutdown(std::error_code());
        }
      });
  });
}

void Connection::close_after_flush(){
  auto self = shared_from_this();
  asio::post(io_, [this, self]{
    if(write_queue_.empty()) {
      shutdown(std::error_code());
    } else {
      close_when_drained_ = true;
    }
  });
}

void Connection::close(){
  auto self = shared_from_this();
  asio::post(io_, [this, self]{ shutdown(std::error_code()); });
}

void Connection::shutdown(const std::error_code& ec){
  if(!open_) return;
  open_ = false;
  write_queue_.clear();
  std::error_code ignored;
  stream_.next_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  stream_.next_layer().close(ignored);
  auto handler = std::move(on_close_);
  on_close_ = nullptr;
  on_line_ = nullptr;
  if(handler) handler(shared_from_this(), ec);
}
