#include "router.hpp"

#include <nlohmann/json.hpp>

#include "file_handler.hpp"
#include "html_pages.hpp"
#include "log.hpp"
#include "text_handler.hpp"
#include "utils.hpp"

HttpResponse error_response(const HttpRequest& request, int status, std::string_view message) {
  if(request.wants_json()) {
    return HttpResponse::json(status, nlohmann::json{{"error", std::string(message)}}.dump());
  }
  return HttpResponse::html(status, render_error_page(status, message));
}

HttpResponse method_not_allowed(const HttpRequest& request, std::string allow) {
  auto response = error_response(request, 405, "method " + request.method + " not allowed");
  response.set_header("Allow", std::move(allow));
  return response;
}

Router::Router(const PortalConfig& config, TextSlot& text_slot, std::shared_ptr<Logger> logger)
  : base_path_(normalize_base_path(config.base_path)),
    logger_(std::move(logger)),
    handler_(make_handler(config, text_slot, logger_)) {}

std::unique_ptr<ModeHandler> Router::make_handler(const PortalConfig& config,
                                                  TextSlot& text_slot,
                                                  const std::shared_ptr<Logger>& logger) {
  switch(config.mode) {
    case PortalMode::SingleFile:
      return std::make_unique<SingleFileHandler>(config.payload_path);
    case PortalMode::Directory:
      return std::make_unique<DirectoryHandler>(config.payload_path,
                                                normalize_base_path(config.base_path),
                                                config.max_upload_bytes,
                                                logger);
    case PortalMode::SendText:
      return std::make_unique<SendTextHandler>(config.text);
    case PortalMode::ReceiveText:
      return std::make_unique<ReceiveTextHandler>(text_slot, config.max_text_bytes, logger);
  }
  throw StartupError("unknown portal mode");
}

std::optional<std::string> Router::relative_path(const std::string& raw_path) const {
  std::string_view rest(raw_path);
  if(base_path_ != "/") {
    if(rest.size() < base_path_.size() || !iequals(rest.substr(0, base_path_.size()), base_path_)) {
      return std::nullopt;
    }
    rest.remove_prefix(base_path_.size());
    if(!rest.empty() && rest.front() != '/') return std::nullopt;
  }
  if(!rest.empty() && rest.front() == '/') rest.remove_prefix(1);
  while(!rest.empty() && rest.back() == '/') rest.remove_suffix(1);

  auto decoded = percent_decode(rest);
  if(!decoded) {
    throw HttpError(400, "malformed percent-encoding");
  }
  if(decoded->find('\0') != std::string::npos) {
    throw HttpError(400, "NUL byte in path");
  }
  return decoded;
}

RouteResult Router::route(const HttpRequest& request) {
  try {
    auto relative = relative_path(request.path);
    if(!relative) {
      throw HttpError(404, "not found");
    }
    return handler_->handle(request, *relative);
  } catch(const HttpError& e) {
    if(e.status() >= 500) {
      log_error(logger_.get(), "{} \"{} {}\": {}", request.remote, request.method, request.target, e.what());
    }
    return RouteResult::respond(error_response(request, e.status(), e.what()));
  } catch(const std::exception& e) {
    log_error(logger_.get(), "{} \"{} {}\" failed: {}", request.remote, request.method, request.target, e.what());
    return RouteResult::respond(error_response(request, 500, "internal server error"));
  }
}
