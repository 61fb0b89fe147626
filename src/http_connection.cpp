#include "http_connection.hpp"

#include <algorithm>
#include <array>

#include "log.hpp"
#include "router.hpp"

namespace {
const std::string kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";
}

std::shared_ptr<HttpConnection> HttpConnection::create(asio::ip::tcp::socket socket,
                                                       Router& router,
                                                       std::shared_ptr<Logger> logger,
                                                       TransferCallback on_transfer) {
  return std::shared_ptr<HttpConnection>(
    new HttpConnection(std::move(socket), router, std::move(logger), std::move(on_transfer)));
}

HttpConnection::HttpConnection(asio::ip::tcp::socket socket,
                               Router& router,
                               std::shared_ptr<Logger> logger,
                               TransferCallback on_transfer)
  : socket_(std::move(socket)),
    router_(router),
    logger_(std::move(logger)),
    on_transfer_(std::move(on_transfer)),
    read_buf_(kMaxRequestHeadBytes),
    chunk_(kChunkSize) {}

HttpConnection::~HttpConnection() {
  close();
}

void HttpConnection::start() {
  std::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  remote_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  request_.remote = remote_;
  do_read_head();
}

void HttpConnection::do_read_head() {
  auto self = shared_from_this();
  asio::async_read_until(socket_, read_buf_, "\r\n\r\n",
    [this, self](std::error_code ec, std::size_t head_size) {
      if(ec == asio::error::not_found) {
        fail(400, "request head too large");
        return;
      }
      if(ec) {
        if(ec != asio::error::eof) {
          log_debug(logger_.get(), "{} read error: {}", remote_, ec.message());
        }
        close();
        return;
      }
      handle_head(head_size);
    });
}

void HttpConnection::handle_head(std::size_t head_size) {
  auto begin = asio::buffers_begin(read_buf_.data());
  std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_size));
  read_buf_.consume(head_size);

  try {
    request_ = parse_request_head(head);
  } catch(const HttpError& e) {
    request_.remote = remote_;
    fail(e.status(), e.what());
    return;
  }
  request_.remote = remote_;
  log_debug(logger_.get(), "{} request {} {}", remote_, request_.method, request_.target);

  auto result = router_.route(request_);
  if(!result.sink) {
    drain_on_close_ = request_has_body();
    send_response(std::move(result.response));
    return;
  }
  begin_body(std::move(result.sink));
}

bool HttpConnection::request_has_body() const {
  if(request_.is_chunked()) return true;
  try {
    auto length = request_.content_length();
    return length && *length > 0;
  } catch(const HttpError&) {
    return true;
  }
}

void HttpConnection::begin_body(std::unique_ptr<BodySink> sink) {
  if(request_.is_chunked()) {
    fail(411, "chunked request bodies are not supported; send Content-Length");
    return;
  }
  std::optional<std::uint64_t> length;
  try {
    length = request_.content_length();
  } catch(const HttpError& e) {
    fail(e.status(), e.what());
    return;
  }
  if(!length) {
    fail(411, "Content-Length required");
    return;
  }
  auto limit = sink->max_body_bytes();
  if(limit != 0 && *length > limit) {
    body_remaining_ = *length;
    fail(400, "request body too large");
    return;
  }

  sink_ = std::move(sink);
  body_remaining_ = *length;

  // part of the body may have arrived together with the head
  bool had_buffered = read_buf_.size() > 0;
  if(had_buffered && body_remaining_ > 0) {
    auto n = static_cast<std::size_t>(std::min<std::uint64_t>(read_buf_.size(), body_remaining_));
    n = std::min(n, chunk_.size());
    asio::buffer_copy(asio::buffer(chunk_.data(), n), read_buf_.data());
    read_buf_.consume(n);
    if(!deliver_body(chunk_.data(), n)) return;
  }

  if(body_remaining_ == 0) {
    finish_body();
  } else if(request_.expects_continue() && !had_buffered) {
    write_continue();
  } else {
    do_read_body();
  }
}

void HttpConnection::write_continue() {
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(kContinueResponse),
    [this, self](std::error_code ec, std::size_t) {
      if(ec) {
        log_access("aborted");
        close();
        return;
      }
      do_read_body();
    });
}

void HttpConnection::do_read_body() {
  auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_.size(), body_remaining_));
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(chunk_.data(), want),
    [this, self](std::error_code ec, std::size_t n) {
      if(ec) {
        // the sink drops whatever it staged
        log_info(logger_.get(), "{} disconnected with {} body bytes outstanding", remote_, body_remaining_);
        log_access("aborted");
        close();
        return;
      }
      if(!deliver_body(chunk_.data(), n)) return;
      if(body_remaining_ == 0) {
        finish_body();
      } else {
        do_read_body();
      }
    });
}

bool HttpConnection::deliver_body(const char* data, std::size_t size) {
  body_remaining_ -= std::min<std::uint64_t>(size, body_remaining_);
  try {
    sink_->write(data, size);
    return true;
  } catch(const HttpError& e) {
    fail(e.status(), e.what());
  } catch(const std::exception& e) {
    log_error(logger_.get(), "{} \"{} {}\" failed: {}", remote_, request_.method, request_.target, e.what());
    fail(500, "internal server error");
  }
  return false;
}

void HttpConnection::finish_body() {
  HttpResponse response;
  try {
    response = sink_->finish();
  } catch(const HttpError& e) {
    fail(e.status(), e.what());
    return;
  } catch(const std::exception& e) {
    log_error(logger_.get(), "{} \"{} {}\" failed: {}", remote_, request_.method, request_.target, e.what());
    fail(500, "internal server error");
    return;
  }
  sink_.reset();
  send_response(std::move(response));
}

void HttpConnection::fail(int status, const std::string& message) {
  sink_.reset();
  drain_on_close_ = body_remaining_ > 0 || request_.method.empty() || status == 411;
  if(status >= 500) {
    log_error(logger_.get(), "{} \"{} {}\": {}", remote_, request_.method, request_.target, message);
  }
  send_response(error_response(request_, status, message));
}

void HttpConnection::send_response(HttpResponse response) {
  response_ = std::move(response);
  head_ = response_.serialize_head();
  auto self = shared_from_this();

  if(response_.body_file) {
    file_remaining_ = response_.body_file_size;
    asio::async_write(socket_, asio::buffer(head_),
      [this, self](std::error_code ec, std::size_t) {
        if(ec) {
          log_access("aborted");
          close();
          return;
        }
        do_write_file();
      });
    return;
  }

  std::array<asio::const_buffer, 2> buffers{asio::buffer(head_), asio::buffer(response_.body)};
  asio::async_write(socket_, buffers,
    [this, self](std::error_code ec, std::size_t) {
      if(ec) {
        log_access("aborted");
        close();
        return;
      }
      body_bytes_sent_ = response_.body.size();
      on_response_sent();
    });
}

void HttpConnection::do_write_file() {
  if(file_remaining_ == 0) {
    on_response_sent();
    return;
  }
  auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_.size(), file_remaining_));
  response_.body_file->read(chunk_.data(), static_cast<std::streamsize>(want));
  auto got = static_cast<std::size_t>(response_.body_file->gcount());
  if(got == 0) {
    log_warn(logger_.get(), "{} file shrank while being sent to {}", request_.target, remote_);
    log_access("truncated");
    close();
    return;
  }
  file_remaining_ -= got;

  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(chunk_.data(), got),
    [this, self](std::error_code ec, std::size_t n) {
      if(ec) {
        log_access("aborted");
        close();
        return;
      }
      body_bytes_sent_ += n;
      do_write_file();
    });
}

void HttpConnection::on_response_sent() {
  log_access(nullptr);
  bool completed = response_.completes_transfer && response_.status < 400;

  if(drain_on_close_) {
    // unread request bytes would turn close() into a reset that can destroy
    // the response before the client reads it
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    if(ec) {
      close();
    } else {
      do_drain();
    }
  } else {
    close();
  }

  if(completed && on_transfer_) {
    on_transfer_();
  }
}

void HttpConnection::do_drain() {
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(chunk_),
    [this, self](std::error_code ec, std::size_t n) {
      drained_ += n;
      if(ec || drained_ > kMaxDrainBytes) {
        close();
        return;
      }
      do_drain();
    });
}

void HttpConnection::log_access(const char* outcome) {
  std::string method = request_.method.empty() ? "-" : request_.method;
  std::string target = request_.target.empty() ? "-" : request_.target;
  std::string status = head_.empty() ? "-" : std::to_string(response_.status);
  if(outcome) {
    log_info(logger_.get(), "{} \"{} {}\" {} {} {}", remote_, method, target, status, body_bytes_sent_, outcome);
  } else {
    log_info(logger_.get(), "{} \"{} {}\" {} {}", remote_, method, target, status, body_bytes_sent_);
  }
}

void HttpConnection::close() {
  if(closed_) return;
  closed_ = true;
  sink_.reset();
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}
