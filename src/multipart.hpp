#pragma once

#include <cstddef>
#include <optional>
#include <string>

struct MultipartPartHeaders {
  std::string name;                     // form field name
  std::optional<std::string> filename;  // present for file parts
  std::string content_type;
};

// Incremental multipart/form-data parser. Body bytes may arrive in chunks of
// any size; part data is forwarded as soon as it cannot be the start of a
// boundary, so a part is never buffered whole.
class MultipartParser {
public:
  class Handler {
  public:
    virtual ~Handler() = default;
    virtual void on_part_begin(const MultipartPartHeaders& headers) = 0;
    virtual void on_part_data(const char* data, std::size_t size) = 0;
    virtual void on_part_end() = 0;
  };

  MultipartParser(const std::string& boundary, Handler& handler);

  // Throws HttpError(400) on malformed input.
  void feed(const char* data, std::size_t size);
  // Throws HttpError(400) unless the closing boundary was seen.
  void finish();

  bool done() const { return state_ == State::Epilogue; }

private:
  enum class State { Preamble, AfterDelimiter, Headers, Body, Epilogue };

  bool step();
  void parse_part_headers(const std::string& block);

  static constexpr std::size_t kMaxPartHeaderBytes = 16 * 1024;

  std::string delimiter_;
  Handler& handler_;
  std::string buffer_;
  State state_ = State::Preamble;
};
