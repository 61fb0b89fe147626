#include "http_message.hpp"

#include <cctype>
#include <charconv>

#include "utils.hpp"

namespace {

std::string_view trim_view(std::string_view value) {
  while(!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
  while(!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) value.remove_suffix(1);
  return value;
}

bool is_token_char(char c) {
  if(std::isalnum(static_cast<unsigned char>(c))) return true;
  switch(c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
      return true;
    default:
      return false;
  }
}

int hex_value(char c) {
  if(c >= '0' && c <= '9') return c - '0';
  if(c >= 'a' && c <= 'f') return c - 'a' + 10;
  if(c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string find_header(const HeaderList& headers, std::string_view name) {
  for(const auto& entry : headers) {
    if(iequals(entry.first, name)) return entry.second;
  }
  return std::string();
}

} // namespace

std::string HttpRequest::header(std::string_view name) const {
  return find_header(headers, name);
}

bool HttpRequest::has_header(std::string_view name) const {
  for(const auto& entry : headers) {
    if(iequals(entry.first, name)) return true;
  }
  return false;
}

std::optional<std::uint64_t> HttpRequest::content_length() const {
  if(!has_header("Content-Length")) return std::nullopt;
  auto raw = trim_copy(header("Content-Length"));
  std::uint64_t value = 0;
  auto result = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if(raw.empty() || result.ec != std::errc() || result.ptr != raw.data() + raw.size()) {
    throw HttpError(400, "invalid Content-Length");
  }
  return value;
}

bool HttpRequest::is_chunked() const {
  return to_lower(header("Transfer-Encoding")).find("chunked") != std::string::npos;
}

bool HttpRequest::expects_continue() const {
  return iequals(trim_copy(header("Expect")), "100-continue");
}

bool HttpRequest::wants_json() const {
  auto accept = to_lower(header("Accept"));
  auto json_pos = accept.find("application/json");
  if(json_pos == std::string::npos) return false;
  auto html_pos = accept.find("text/html");
  return html_pos == std::string::npos || json_pos < html_pos;
}

void HttpResponse::set_header(std::string name, std::string value) {
  for(auto& entry : headers) {
    if(iequals(entry.first, name)) {
      entry.second = std::move(value);
      return;
    }
  }
  headers.emplace_back(std::move(name), std::move(value));
}

std::string HttpResponse::header(std::string_view name) const {
  return find_header(headers, name);
}

std::uint64_t HttpResponse::content_length() const {
  return body_file ? body_file_size : body.size();
}

std::string HttpResponse::serialize_head() const {
  std::string out;
  out.reserve(256);
  out += "HTTP/1.1 ";
  out += std::to_string(status);
  out += ' ';
  out += status_reason(status);
  out += "\r\n";
  for(const auto& entry : headers) {
    if(iequals(entry.first, "Content-Length") || iequals(entry.first, "Connection")) continue;
    out += entry.first;
    out += ": ";
    out += entry.second;
    out += "\r\n";
  }
  out += "Content-Length: " + std::to_string(content_length()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  return out;
}

HttpResponse HttpResponse::text(int status, std::string body, std::string content_type) {
  HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.set_header("Content-Type", std::move(content_type));
  return response;
}

HttpResponse HttpResponse::html(int status, std::string body) {
  return text(status, std::move(body), "text/html; charset=utf-8");
}

HttpResponse HttpResponse::json(int status, std::string body) {
  return text(status, std::move(body), "application/json");
}

HttpRequest parse_request_head(std::string_view head) {
  HttpRequest request;

  auto line_end = head.find("\r\n");
  std::string_view request_line = head.substr(0, line_end);
  std::string_view rest = line_end == std::string_view::npos ? std::string_view() : head.substr(line_end + 2);

  auto first_space = request_line.find(' ');
  auto second_space = first_space == std::string_view::npos ? first_space : request_line.find(' ', first_space + 1);
  if(first_space == std::string_view::npos || second_space == std::string_view::npos ||
     request_line.find(' ', second_space + 1) != std::string_view::npos) {
    throw HttpError(400, "malformed request line");
  }
  request.method = std::string(request_line.substr(0, first_space));
  request.target = std::string(request_line.substr(first_space + 1, second_space - first_space - 1));
  request.version = std::string(request_line.substr(second_space + 1));

  if(request.method.empty()) throw HttpError(400, "missing method");
  for(char c : request.method) {
    if(!is_token_char(c)) throw HttpError(400, "malformed method");
  }
  if(request.target.empty() || request.target.front() != '/') {
    throw HttpError(400, "request target must be an absolute path");
  }
  if(request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
    if(request.version.rfind("HTTP/", 0) == 0) throw HttpError(505, "unsupported HTTP version");
    throw HttpError(400, "malformed HTTP version");
  }

  auto query_pos = request.target.find('?');
  request.path = request.target.substr(0, query_pos);
  if(query_pos != std::string::npos) request.query = request.target.substr(query_pos + 1);

  while(!rest.empty()) {
    auto end = rest.find("\r\n");
    std::string_view line = rest.substr(0, end);
    rest = end == std::string_view::npos ? std::string_view() : rest.substr(end + 2);
    if(line.empty()) break;
    if(line.front() == ' ' || line.front() == '\t') {
      throw HttpError(400, "obsolete header folding");
    }
    auto colon = line.find(':');
    if(colon == std::string_view::npos || colon == 0) {
      throw HttpError(400, "malformed header line");
    }
    auto name = line.substr(0, colon);
    for(char c : name) {
      if(!is_token_char(c)) throw HttpError(400, "malformed header name");
    }
    request.headers.emplace_back(std::string(name), std::string(trim_view(line.substr(colon + 1))));
  }
  return request;
}

const char* status_reason(int status) {
  switch(status) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 505: return "HTTP Version Not Supported";
    default: return "Unknown";
  }
}

std::optional<std::string> percent_decode(std::string_view input, bool plus_as_space) {
  std::string out;
  out.reserve(input.size());
  for(std::size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if(c == '%') {
      if(i + 2 >= input.size()) return std::nullopt;
      int hi = hex_value(input[i + 1]);
      int lo = hex_value(input[i + 2]);
      if(hi < 0 || lo < 0) return std::nullopt;
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else if(c == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string percent_encode_path(std::string_view input) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(input.size());
  for(unsigned char c : input) {
    if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::optional<std::string> header_parameter(std::string_view header_value, std::string_view name) {
  std::size_t pos = header_value.find(';');
  while(pos != std::string_view::npos) {
    std::string_view rest = header_value.substr(pos + 1);
    std::string_view param = trim_view(rest);
    auto eq = param.find('=');
    std::size_t consumed = 0;
    if(eq != std::string_view::npos) {
      auto key = trim_view(param.substr(0, eq));
      std::string value;
      std::size_t i = eq + 1;
      while(i < param.size() && param[i] == ' ') ++i;
      if(i < param.size() && param[i] == '"') {
        ++i;
        while(i < param.size() && param[i] != '"') {
          // browsers send backslashes literally (C:\dir\a.txt) and only escape quotes
          if(param[i] == '\\' && i + 1 < param.size() && param[i + 1] == '"') ++i;
          value.push_back(param[i]);
          ++i;
        }
        if(i < param.size()) ++i; // closing quote
      } else {
        while(i < param.size() && param[i] != ';') {
          value.push_back(param[i]);
          ++i;
        }
        value = std::string(trim_view(value));
      }
      if(iequals(key, name)) return value;
      consumed = i;
    }
    // advance to the next ';' after the current parameter
    std::size_t offset = static_cast<std::size_t>(param.data() - header_value.data()) + consumed;
    pos = header_value.find(';', offset);
  }
  return std::nullopt;
}

std::string media_type(std::string_view content_type) {
  auto semi = content_type.find(';');
  return to_lower(std::string(trim_view(content_type.substr(0, semi))));
}

std::map<std::string, std::string> parse_form_urlencoded(std::string_view body) {
  std::map<std::string, std::string> out;
  while(!body.empty()) {
    auto amp = body.find('&');
    auto pair = body.substr(0, amp);
    body = amp == std::string_view::npos ? std::string_view() : body.substr(amp + 1);
    if(pair.empty()) continue;
    auto eq = pair.find('=');
    auto key = percent_decode(pair.substr(0, eq), true);
    auto value = eq == std::string_view::npos ? std::optional<std::string>(std::string())
                                              : percent_decode(pair.substr(eq + 1), true);
    if(!key || !value) throw HttpError(400, "malformed form encoding");
    out.emplace(std::move(*key), std::move(*value));
  }
  return out;
}
