#pragma once

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// A request that must be answered with `status` instead of being served.
class HttpError : public std::runtime_error {
public:
  HttpError(int status, const std::string& message)
    : std::runtime_error(message), status_(status) {}

  int status() const { return status_; }

private:
  int status_;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;
  std::string target;   // as sent, e.g. "/dir/a%20b.txt?x=1"
  std::string path;     // target without the query, still percent-encoded
  std::string query;
  std::string version;
  HeaderList headers;
  std::string remote;   // peer address, for logging

  // Case-insensitive lookup; empty when absent.
  std::string header(std::string_view name) const;
  bool has_header(std::string_view name) const;

  // nullopt without a Content-Length header; HttpError(400) when it is malformed.
  std::optional<std::uint64_t> content_length() const;
  bool is_chunked() const;
  bool expects_continue() const;
  bool wants_json() const;
};

struct HttpResponse {
  int status = 200;
  HeaderList headers;
  std::string body;

  // When set, the file is streamed after the head instead of `body`.
  std::unique_ptr<std::ifstream> body_file;
  std::uint64_t body_file_size = 0;

  // Set on responses whose delivery completes a transfer (single-shot policy).
  bool completes_transfer = false;

  void set_header(std::string name, std::string value);
  std::string header(std::string_view name) const;
  std::uint64_t content_length() const;

  // Status line and headers, including Content-Length and Connection: close.
  std::string serialize_head() const;

  static HttpResponse text(int status, std::string body,
                           std::string content_type = "text/plain; charset=utf-8");
  static HttpResponse html(int status, std::string body);
  static HttpResponse json(int status, std::string body);
};

constexpr std::size_t kMaxRequestHeadBytes = 64 * 1024;

// Parses the request line and headers (terminating blank line optional).
// Throws HttpError: 400 for malformed input, 505 for unsupported versions.
HttpRequest parse_request_head(std::string_view head);

const char* status_reason(int status);

// nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(std::string_view input, bool plus_as_space = false);
// Escapes everything but unreserved characters and '/'.
std::string percent_encode_path(std::string_view input);

// Value of `name` in a header such as `form-data; name="file"; filename="a.txt"`.
std::optional<std::string> header_parameter(std::string_view header_value, std::string_view name);
// Lowercased media type without parameters: "multipart/form-data".
std::string media_type(std::string_view content_type);

// application/x-www-form-urlencoded; first occurrence of each key wins.
std::map<std::string, std::string> parse_form_urlencoded(std::string_view body);
