#include "text_handler.hpp"

#include <optional>

#include <nlohmann/json.hpp>

#include "html_pages.hpp"
#include "log.hpp"
#include "multipart.hpp"

namespace {

// Keeps the first field named "text".
class TextFieldCollector : public MultipartParser::Handler {
public:
  void on_part_begin(const MultipartPartHeaders& headers) override {
    in_text_ = !value_ && headers.name == "text";
    if(in_text_) current_.clear();
  }

  void on_part_data(const char* data, std::size_t size) override {
    if(in_text_) current_.append(data, size);
  }

  void on_part_end() override {
    if(in_text_) value_ = std::move(current_);
    in_text_ = false;
  }

  std::optional<std::string>& value() { return value_; }

private:
  bool in_text_ = false;
  std::string current_;
  std::optional<std::string> value_;
};

} // namespace

RouteResult SendTextHandler::handle(const HttpRequest& request, const std::string& relative) {
  if(!relative.empty()) {
    throw HttpError(404, "not found");
  }
  if(request.method != "GET") {
    return RouteResult::respond(method_not_allowed(request, "GET"));
  }
  auto response = HttpResponse::text(200, text_);
  response.completes_transfer = true;
  return RouteResult::respond(std::move(response));
}

ReceiveTextHandler::ReceiveTextHandler(TextSlot& slot,
                                       std::uint64_t max_text_bytes,
                                       std::shared_ptr<Logger> logger)
  : slot_(slot), max_text_bytes_(max_text_bytes), logger_(std::move(logger)) {}

RouteResult ReceiveTextHandler::handle(const HttpRequest& request, const std::string& relative) {
  if(!relative.empty()) {
    throw HttpError(404, "not found");
  }
  if(request.method == "GET") {
    return RouteResult::respond(HttpResponse::html(200, render_paste_page(slot_.filled())));
  }
  if(request.method != "POST") {
    return RouteResult::respond(method_not_allowed(request, "GET, POST"));
  }
  // the sink outlives this call; copy what submit() needs
  HttpRequest head;
  head.method = request.method;
  head.target = request.target;
  head.headers = request.headers;
  return RouteResult::consume(std::make_unique<BufferedBodySink>(
    max_text_bytes_,
    [this, head = std::move(head)](std::string body) { return submit(head, std::move(body)); }));
}

HttpResponse ReceiveTextHandler::submit(const HttpRequest& request, std::string body) {
  auto text = extract_text(request.header("Content-Type"), std::move(body));
  auto size = text.size();
  if(!slot_.try_fill(std::move(text))) {
    log_info(logger_.get(), "rejected a second text submission");
    if(request.wants_json()) {
      return HttpResponse::json(409, nlohmann::json{{"error", "text already received"}}.dump());
    }
    return HttpResponse::html(409, render_paste_page(true));
  }
  log_info(logger_.get(), "received {} bytes of text", size);

  HttpResponse response = request.wants_json()
    ? HttpResponse::json(200, nlohmann::json{{"received", size}}.dump())
    : HttpResponse::html(200, render_ok_page());
  response.completes_transfer = true;
  return response;
}

std::string ReceiveTextHandler::extract_text(const std::string& content_type, std::string body) {
  auto type = media_type(content_type);
  if(type == "multipart/form-data") {
    auto boundary = header_parameter(content_type, "boundary");
    if(!boundary || boundary->empty()) {
      throw HttpError(400, "multipart boundary missing");
    }
    TextFieldCollector collector;
    MultipartParser parser(*boundary, collector);
    parser.feed(body.data(), body.size());
    parser.finish();
    if(!collector.value()) {
      throw HttpError(400, "form has no text field");
    }
    return std::move(*collector.value());
  }
  if(type == "application/x-www-form-urlencoded") {
    auto fields = parse_form_urlencoded(body);
    auto it = fields.find("text");
    if(it == fields.end()) {
      throw HttpError(400, "form has no text field");
    }
    return it->second;
  }
  return body;
}
