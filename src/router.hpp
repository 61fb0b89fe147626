#pragma once

#include <memory>
#include <optional>
#include <string>

#include "handler.hpp"
#include "portal.hpp"

class Logger;
class TextSlot;

// Maps a request onto the handler of the active mode. The handler is chosen
// once, at construction; `route` never throws.
class Router {
public:
  Router(const PortalConfig& config, TextSlot& text_slot, std::shared_ptr<Logger> logger);

  RouteResult route(const HttpRequest& request);

  const std::string& base_path() const { return base_path_; }

  // Decoded path below the base path without outer slashes; nullopt when the
  // request is outside it. Throws HttpError(400) for bad escapes or NUL bytes.
  std::optional<std::string> relative_path(const std::string& raw_path) const;

private:
  static std::unique_ptr<ModeHandler> make_handler(const PortalConfig& config,
                                                   TextSlot& text_slot,
                                                   const std::shared_ptr<Logger>& logger);

  std::string base_path_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<ModeHandler> handler_;
};
