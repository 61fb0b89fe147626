#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "handler.hpp"
#include "text_slot.hpp"

class Logger;

// "-t": every GET / returns the same text.
class SendTextHandler : public ModeHandler {
public:
  explicit SendTextHandler(std::string text) : text_(std::move(text)) {}

  RouteResult handle(const HttpRequest& request, const std::string& relative) override;

private:
  const std::string text_;
};

// "-p": a paste form whose first submission fills the slot.
class ReceiveTextHandler : public ModeHandler {
public:
  ReceiveTextHandler(TextSlot& slot, std::uint64_t max_text_bytes, std::shared_ptr<Logger> logger);

  RouteResult handle(const HttpRequest& request, const std::string& relative) override;

  HttpResponse submit(const HttpRequest& request, std::string body);

  // The "text" field of a multipart or urlencoded form, else the raw body.
  // Throws HttpError(400) for a form without a text field.
  static std::string extract_text(const std::string& content_type, std::string body);

private:
  TextSlot& slot_;
  std::uint64_t max_text_bytes_;
  std::shared_ptr<Logger> logger_;
};
