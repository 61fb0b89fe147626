#include "multipart.hpp"

#include "http_message.hpp"
#include "utils.hpp"

MultipartParser::MultipartParser(const std::string& boundary, Handler& handler)
  : delimiter_("\r\n--" + boundary),
    handler_(handler),
    buffer_("\r\n") {
  if(boundary.empty() || boundary.size() > 70) {
    throw HttpError(400, "invalid multipart boundary");
  }
}

void MultipartParser::feed(const char* data, std::size_t size) {
  if(state_ == State::Epilogue) return;
  buffer_.append(data, size);
  while(step()) {}
}

void MultipartParser::finish() {
  while(step()) {}
  if(state_ != State::Epilogue) {
    throw HttpError(400, "multipart body ended before the closing boundary");
  }
}

bool MultipartParser::step() {
  switch(state_) {
    case State::Preamble: {
      auto pos = buffer_.find(delimiter_);
      if(pos == std::string::npos) {
        if(buffer_.size() >= delimiter_.size()) {
          buffer_.erase(0, buffer_.size() - (delimiter_.size() - 1));
        }
        return false;
      }
      buffer_.erase(0, pos + delimiter_.size());
      state_ = State::AfterDelimiter;
      return true;
    }
    case State::AfterDelimiter: {
      if(buffer_.size() < 2) return false;
      if(buffer_.compare(0, 2, "--") == 0) {
        state_ = State::Epilogue;
        buffer_.clear();
        return false;
      }
      auto crlf = buffer_.find("\r\n");
      if(crlf == std::string::npos) {
        if(buffer_.size() > 256) throw HttpError(400, "malformed multipart delimiter line");
        return false;
      }
      for(std::size_t i = 0; i < crlf; ++i) {
        if(buffer_[i] != ' ' && buffer_[i] != '\t') {
          throw HttpError(400, "malformed multipart delimiter line");
        }
      }
      buffer_.erase(0, crlf + 2);
      state_ = State::Headers;
      return true;
    }
    case State::Headers: {
      std::string block;
      if(buffer_.compare(0, 2, "\r\n") == 0) {
        buffer_.erase(0, 2);
      } else {
        auto end = buffer_.find("\r\n\r\n");
        if(end == std::string::npos) {
          if(buffer_.size() > kMaxPartHeaderBytes) throw HttpError(400, "multipart part headers too large");
          return false;
        }
        block = buffer_.substr(0, end);
        buffer_.erase(0, end + 4);
      }
      parse_part_headers(block);
      state_ = State::Body;
      return true;
    }
    case State::Body: {
      auto pos = buffer_.find(delimiter_);
      if(pos != std::string::npos) {
        if(pos > 0) handler_.on_part_data(buffer_.data(), pos);
        handler_.on_part_end();
        buffer_.erase(0, pos + delimiter_.size());
        state_ = State::AfterDelimiter;
        return true;
      }
      // keep a tail that could still be the start of the delimiter
      std::size_t keep = delimiter_.size() - 1;
      if(buffer_.size() > keep) {
        std::size_t emit = buffer_.size() - keep;
        handler_.on_part_data(buffer_.data(), emit);
        buffer_.erase(0, emit);
      }
      return false;
    }
    case State::Epilogue:
      return false;
  }
  return false;
}

void MultipartParser::parse_part_headers(const std::string& block) {
  MultipartPartHeaders headers;
  bool has_disposition = false;
  std::size_t start = 0;
  while(start < block.size()) {
    auto end = block.find("\r\n", start);
    if(end == std::string::npos) end = block.size();
    std::string line = block.substr(start, end - start);
    start = end + 2;

    auto colon = line.find(':');
    if(colon == std::string::npos) throw HttpError(400, "malformed multipart header");
    auto name = trim_copy(line.substr(0, colon));
    auto value = trim_copy(line.substr(colon + 1));
    if(iequals(name, "Content-Disposition")) {
      if(media_type(value) != "form-data") throw HttpError(400, "multipart part is not form-data");
      has_disposition = true;
      headers.name = header_parameter(value, "name").value_or("");
      headers.filename = header_parameter(value, "filename");
    } else if(iequals(name, "Content-Type")) {
      headers.content_type = value;
    }
  }
  if(!has_disposition) throw HttpError(400, "multipart part without Content-Disposition");
  handler_.on_part_begin(headers);
}
