#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "http_message.hpp"

// Receives a request body as it arrives; finish() is called once all
// Content-Length bytes were delivered. Destroying an unfinished sink discards
// whatever it staged.
class BodySink {
public:
  virtual ~BodySink() = default;

  // 0 = unlimited
  virtual std::uint64_t max_body_bytes() const = 0;
  virtual void write(const char* data, std::size_t size) = 0;
  virtual HttpResponse finish() = 0;
};

// Keeps the whole body in memory; for small form submissions only.
class BufferedBodySink : public BodySink {
public:
  using Completion = std::function<HttpResponse(std::string body)>;

  BufferedBodySink(std::uint64_t limit, Completion on_complete)
    : limit_(limit), on_complete_(std::move(on_complete)) {}

  std::uint64_t max_body_bytes() const override { return limit_; }

  void write(const char* data, std::size_t size) override {
    if(limit_ != 0 && body_.size() + size > limit_) {
      throw HttpError(400, "request body too large");
    }
    body_.append(data, size);
  }

  HttpResponse finish() override { return on_complete_(std::move(body_)); }

private:
  std::uint64_t limit_;
  Completion on_complete_;
  std::string body_;
};

// Either an immediate response or a sink that wants the request body.
struct RouteResult {
  HttpResponse response;
  std::unique_ptr<BodySink> sink;

  static RouteResult respond(HttpResponse response) {
    RouteResult result;
    result.response = std::move(response);
    return result;
  }

  static RouteResult consume(std::unique_ptr<BodySink> sink) {
    RouteResult result;
    result.sink = std::move(sink);
    return result;
  }
};

// One implementation per PortalMode; the Router owns exactly one.
class ModeHandler {
public:
  virtual ~ModeHandler() = default;

  // `relative` is the percent-decoded path below the service path, without
  // leading or trailing '/'; empty for the service path itself.
  virtual RouteResult handle(const HttpRequest& request, const std::string& relative) = 0;
};

// Error page, or {"error": ...} for clients asking for JSON.
HttpResponse error_response(const HttpRequest& request, int status, std::string_view message);
HttpResponse method_not_allowed(const HttpRequest& request, std::string allow);
