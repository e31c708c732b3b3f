#pragma once
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>

class Logger;

// Newline-delimited link over TCP, optionally wrapped in TLS. Used for the
// relay control channel on both ends and for direct peer links.
class Connection : public std::enable_shared_from_this<Connection> {
public:
  using LineHandler = std::function<void(const std::shared_ptr<Connection>&, std::string line)>;
  using CloseHandler = std::function<void(const std::shared_ptr<Connection>&, const std::error_code&)>;
  using ConnectHandler = std::function<void(const std::error_code&, std::shared_ptr<Connection>)>;

  // Bytes a single line may occupy before the link is dropped.
  static constexpr std::size_t kMaxLineBytes = 8 * 1024 * 1024;

  // Wraps an already connected plain socket.
  static std::shared_ptr<Connection> create(asio::io_context& io,
                                            asio::ip::tcp::socket sock,
                                            std::shared_ptr<Logger> logger);

  // Resolves, connects and, when secure, completes the TLS handshake.
  static void connect(asio::io_context& io,
                      const std::string& host,
                      unsigned short port,
                      bool secure,
                      std::shared_ptr<Logger> logger,
                      ConnectHandler done);

  ~Connection();

  void set_handlers(LineHandler on_line, CloseHandler on_close);
  void start();

  // Thread-safe; queued on the io_context.
  void send_json(const nlohmann::json& j);
  void send_raw(std::string data);
  // Closes once every queued write has gone out.
  void close_after_flush();
  void close();

  bool is_open() const { return open_; }
  std::string remote_address() const { return remote_address_; }

  // Free-form label owned by whoever manages the link (peer or session id).
  void set_tag(std::string tag) { tag_ = std::move(tag); }
  const std::string& tag() const { return tag_; }

private:
  Connection(asio::io_context& io,
             std::shared_ptr<asio::ssl::context> ssl_ctx,
             bool secure,
             std::shared_ptr<Logger> logger);

  template<typename Fn>
  void with_stream(Fn&& fn) {
    if(secure_) {
      fn(stream_);
    } else {
      fn(stream_.next_layer());
    }
  }

  void do_read();
  void enqueue(std::string data);
  void do_write();
  void shutdown(const std::error_code& ec);

  asio::io_context& io_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  asio::ssl::stream<asio::ip::tcp::socket> stream_;
  bool secure_ = false;
  std::shared_ptr<Logger> logger_;
  asio::streambuf read_buf_{kMaxLineBytes};
  std::deque<std::string> write_queue_;
  LineHandler on_line_;
  CloseHandler on_close_;
  std::string remote_address_;
  std::string tag_;
  bool open_ = true;
  bool close_when_drained_ = false;
};
