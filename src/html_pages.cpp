#include "html_pages.hpp"

#include <cstdio>

#include "http_message.hpp"

namespace {

constexpr const char* kViewport =
  "<meta name=\"viewport\" content=\"width=device-width,initial-scale=1.0,maximum-scale=1.0,user-scalable=no\" />\n";

std::string page_head(std::string_view title) {
  std::string out;
  out += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n<title>";
  out += html_escape(title);
  out += "</title>\n";
  out += kViewport;
  out += "</head>\n";
  return out;
}

} // namespace

std::string html_escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for(char c : text) {
    switch(c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

std::string format_size(std::uint64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  if(bytes < 1024) return std::to_string(bytes) + " B";
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
  return buf;
}

std::string render_listing_page(std::string_view title,
                                const std::vector<ListingEntry>& entries,
                                std::string_view parent_href,
                                std::string_view upload_action) {
  std::string out = page_head("LaPort - " + std::string(title));
  out += "<body style=\"margin: 5vh 10% 0; font-family: sans-serif;\">\n";
  out += "<h2>" + html_escape(title) + "</h2>\n";
  if(!upload_action.empty()) {
    out += "<form enctype=\"multipart/form-data\" method=\"post\" action=\"";
    out += html_escape(upload_action);
    out += "\">\n  <input name=\"file\" type=\"file\" multiple/>\n  <input type=\"submit\" value=\"Upload\"/>\n</form>\n<hr/>\n";
  }
  out += "<table>\n";
  if(!parent_href.empty()) {
    out += "<tr><td><a href=\"" + html_escape(parent_href) + "\">..</a></td><td></td></tr>\n";
  }
  for(const auto& entry : entries) {
    out += "<tr><td><a href=\"";
    out += html_escape(entry.href);
    out += "\">";
    out += html_escape(entry.name);
    if(entry.is_directory) out += "/";
    out += "</a></td><td style=\"text-align: right; padding-left: 2em;\">";
    out += entry.is_directory ? std::string("-") : format_size(entry.size);
    out += "</td></tr>\n";
  }
  out += "</table>\n</body>\n</html>\n";
  return out;
}

std::string render_paste_page(bool already_received) {
  std::string out = page_head("LaPort - Paste");
  out += "<body style=\"margin: 10vh 15% 0;\">\n";
  if(already_received) {
    out += "<p style=\"text-align: center;\">A text has already been received.</p>\n";
  }
  out +=
    "<form enctype=\"multipart/form-data\" method=\"post\">\n"
    "    <textarea name=\"text\" required style=\"resize: none; height: 50vh; width: 100%;\"></textarea>\n"
    "    <div style=\"text-align: right; margin: 15px;\"><input type=\"submit\"/></div>\n"
    "</form>\n</body>\n</html>\n";
  return out;
}

std::string render_ok_page(const std::vector<std::string>& details) {
  std::string out = page_head("LaPort");
  out +=
    "<body style=\"text-align: center; margin: 30vh 0 0;\">\n"
    "    <div style=\"font-size: 120px; font-weight: bold; color: darkgreen;\">\n"
    "        &check;\n"
    "    </div>\n";
  for(const auto& line : details) {
    out += "    <p>" + html_escape(line) + "</p>\n";
  }
  out += "</body>\n</html>\n";
  return out;
}

std::string render_error_page(int status, std::string_view message) {
  std::string heading = std::to_string(status) + " " + status_reason(status);
  std::string out = page_head("LaPort - " + heading);
  out += "<body style=\"text-align: center; margin: 30vh 0 0; font-family: sans-serif;\">\n";
  out += "<h1>" + html_escape(heading) + "</h1>\n";
  if(!message.empty()) {
    out += "<p>" + html_escape(message) + "</p>\n";
  }
  out += "</body>\n</html>\n";
  return out;
}
