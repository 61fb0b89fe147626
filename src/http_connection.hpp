#pragma once

#include <asio.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "handler.hpp"
#include "http_message.hpp"

class Logger;
class Router;

// One accepted socket, one request. Reads the head, lets the Router pick a
// response or a body sink, streams the body in, streams the response out and
// closes. Every step is an async operation on the shared io_context, so a
// stalled client only holds its own socket.
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
  // Invoked after a response flagged completes_transfer was fully written.
  using TransferCallback = std::function<void()>;

  static std::shared_ptr<HttpConnection> create(asio::ip::tcp::socket socket,
                                                Router& router,
                                                std::shared_ptr<Logger> logger,
                                                TransferCallback on_transfer);

  ~HttpConnection();

  void start();

private:
  HttpConnection(asio::ip::tcp::socket socket,
                 Router& router,
                 std::shared_ptr<Logger> logger,
                 TransferCallback on_transfer);

  void do_read_head();
  void handle_head(std::size_t head_size);
  void begin_body(std::unique_ptr<BodySink> sink);
  void write_continue();
  void do_read_body();
  bool deliver_body(const char* data, std::size_t size);
  void finish_body();
  void fail(int status, const std::string& message);

  void send_response(HttpResponse response);
  void do_write_file();
  void on_response_sent();
  void do_drain();
  void log_access(const char* outcome);
  void close();

  bool request_has_body() const;

  static constexpr std::size_t kChunkSize = 64 * 1024;
  static constexpr std::size_t kMaxDrainBytes = 1024 * 1024;

  asio::ip::tcp::socket socket_;
  Router& router_;
  std::shared_ptr<Logger> logger_;
  TransferCallback on_transfer_;

  asio::streambuf read_buf_;
  std::vector<char> chunk_;
  std::string remote_;

  HttpRequest request_;
  std::unique_ptr<BodySink> sink_;
  std::uint64_t body_remaining_ = 0;
  bool drain_on_close_ = false;
  std::size_t drained_ = 0;

  HttpResponse response_;
  std::string head_;
  std::uint64_t file_remaining_ = 0;
  std::uint64_t body_bytes_sent_ = 0;
  bool closed_ = false;
};
