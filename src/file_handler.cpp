#include "file_handler.hpp"

#include <algorithm>
#include <iterator>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "html_pages.hpp"
#include "log.hpp"
#include "mime_types.hpp"
#include "multipart.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool plain_ascii_name(const std::string& name) {
  for(unsigned char c : name) {
    if(c < 0x20 || c > 0x7e || c == '"' || c == '\\') return false;
  }
  return true;
}

// Stores every file part of a multipart/form-data body.
class MultipartUploadSink : public BodySink, private MultipartParser::Handler {
public:
  MultipartUploadSink(DirectoryHandler& owner,
                      const std::string& boundary,
                      std::uint64_t limit,
                      bool as_json)
    : owner_(owner), parser_(boundary, *this), limit_(limit), as_json_(as_json) {}

  std::uint64_t max_body_bytes() const override { return limit_; }

  void write(const char* data, std::size_t size) override {
    received_ += size;
    if(limit_ != 0 && received_ > limit_) {
      throw HttpError(400, "upload exceeds the size limit");
    }
    parser_.feed(data, size);
  }

  // Nothing becomes visible until the closing boundary was parsed; a body
  // that fails part way leaves only staging files, removed with the sink.
  HttpResponse finish() override {
    parser_.finish();
    if(complete_.empty()) {
      throw HttpError(400, "no file in upload");
    }
    std::vector<StoredUpload> stored;
    stored.reserve(complete_.size());
    for(auto& part : complete_) {
      stored.push_back(owner_.store().commit(*part.file, part.name));
      const auto& item = stored.back();
      log_info(owner_.logger(), "stored upload {} ({} bytes, sha256 {})", item.name, item.size, item.sha256);
    }
    complete_.clear();
    return owner_.upload_response(as_json_, stored);
  }

private:
  struct PendingPart {
    std::string name;
    std::unique_ptr<UploadStore::StagedFile> file;
  };

  void on_part_begin(const MultipartPartHeaders& headers) override {
    current_.file.reset();
    // plain form fields and empty file inputs carry nothing to store
    if(!headers.filename || headers.filename->empty()) return;
    current_.name = owner_.validate_upload_name(*headers.filename);
    current_.file = owner_.store().stage();
  }

  void on_part_data(const char* data, std::size_t size) override {
    if(current_.file) current_.file->write(data, size);
  }

  void on_part_end() override {
    if(!current_.file) return;
    complete_.push_back(std::move(current_));
    current_ = PendingPart{};
  }

  DirectoryHandler& owner_;
  MultipartParser parser_;
  std::uint64_t limit_;
  bool as_json_;
  std::uint64_t received_ = 0;
  PendingPart current_;
  std::vector<PendingPart> complete_;
};

// PUT /<name>: the whole body is the file.
class RawUploadSink : public BodySink {
public:
  RawUploadSink(DirectoryHandler& owner, std::string name, std::uint64_t limit, bool as_json)
    : owner_(owner), name_(std::move(name)), limit_(limit), as_json_(as_json),
      staged_(owner.store().stage()) {}

  std::uint64_t max_body_bytes() const override { return limit_; }

  void write(const char* data, std::size_t size) override {
    if(limit_ != 0 && staged_->size() + size > limit_) {
      throw HttpError(400, "upload exceeds the size limit");
    }
    staged_->write(data, size);
  }

  HttpResponse finish() override {
    auto stored = owner_.store().commit(*staged_, name_);
    log_info(owner_.logger(), "stored upload {} ({} bytes, sha256 {})", stored.name, stored.size, stored.sha256);
    return owner_.upload_response(as_json_, {stored});
  }

private:
  DirectoryHandler& owner_;
  std::string name_;
  std::uint64_t limit_;
  bool as_json_;
  std::unique_ptr<UploadStore::StagedFile> staged_;
};

} // namespace

std::string content_disposition(std::string_view type, const std::string& filename) {
  std::string fallback;
  fallback.reserve(filename.size());
  for(unsigned char c : filename) {
    fallback += (c < 0x20 || c > 0x7e || c == '"' || c == '\\') ? '_' : static_cast<char>(c);
  }
  std::string out(type);
  out += "; filename=\"" + fallback + "\"";
  if(!plain_ascii_name(filename)) {
    out += "; filename*=UTF-8''" + percent_encode_path(filename);
  }
  return out;
}

HttpResponse serve_file(const fs::path& file, bool attachment) {
  auto stream = std::make_unique<std::ifstream>(file, std::ios::binary);
  if(!stream->is_open()) {
    throw HttpError(404, "file not found");
  }
  std::error_code ec;
  auto size = fs::file_size(file, ec);
  if(ec) {
    throw HttpError(404, "file not found");
  }

  HttpResponse response;
  response.status = 200;
  response.set_header("Content-Type", mime_type_for(file));
  response.set_header("Content-Disposition",
                      content_disposition(attachment ? "attachment" : "inline", file.filename().string()));
  response.body_file = std::move(stream);
  response.body_file_size = size;
  response.completes_transfer = true;
  return response;
}

SingleFileHandler::SingleFileHandler(fs::path file)
  : file_(std::move(file)), file_name_(file_.filename().string()) {}

RouteResult SingleFileHandler::handle(const HttpRequest& request, const std::string& relative) {
  if(!relative.empty() && !iequals(relative, file_name_)) {
    throw HttpError(404, "not found");
  }
  if(request.method != "GET") {
    return RouteResult::respond(method_not_allowed(request, "GET"));
  }
  return RouteResult::respond(serve_file(file_, true));
}

DirectoryHandler::DirectoryHandler(const fs::path& root,
                                   std::string base_path,
                                   std::uint64_t max_upload_bytes,
                                   std::shared_ptr<Logger> logger)
  : guard_(root),
    store_(guard_.root(), logger),
    base_path_(std::move(base_path)),
    max_upload_bytes_(max_upload_bytes),
    logger_(std::move(logger)) {}

RouteResult DirectoryHandler::handle(const HttpRequest& request, const std::string& relative) {
  if(relative.empty()) {
    if(request.method == "GET") {
      return RouteResult::respond(list_directory(request, guard_.root(), relative));
    }
    if(request.method == "POST") {
      return RouteResult::consume(begin_multipart_upload(request));
    }
    return RouteResult::respond(method_not_allowed(request, "GET, POST"));
  }

  if(request.method == "PUT") {
    return RouteResult::consume(begin_raw_upload(request, relative));
  }
  if(request.method != "GET") {
    return RouteResult::respond(method_not_allowed(request, "GET, PUT"));
  }

  auto first_segment = relative.substr(0, relative.find('/'));
  if(UploadStore::is_internal_name(first_segment)) {
    throw HttpError(404, "not found");
  }
  auto resolved = guard_.resolve(relative);
  if(!resolved) {
    throw HttpError(403, "forbidden");
  }
  if(PathGuard::is_within(guard_.root() / UploadStore::kStagingDirName, *resolved)) {
    throw HttpError(404, "not found");
  }

  std::error_code ec;
  auto status = fs::status(*resolved, ec);
  if(ec || !fs::exists(status)) {
    throw HttpError(404, "not found");
  }
  if(fs::is_directory(status)) {
    return RouteResult::respond(list_directory(request, *resolved, relative));
  }
  if(!fs::is_regular_file(status)) {
    throw HttpError(404, "not found");
  }
  return RouteResult::respond(serve_file(*resolved, false));
}

std::string DirectoryHandler::href_for(const std::string& relative, bool directory) const {
  std::string out = base_path_ == "/" ? std::string() : percent_encode_path(base_path_);
  out += '/';
  out += percent_encode_path(relative);
  if(directory && !relative.empty()) out += '/';
  return out;
}

HttpResponse DirectoryHandler::list_directory(const HttpRequest& request,
                                              const fs::path& dir,
                                              const std::string& relative) const {
  std::vector<ListingEntry> entries;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) {
    throw HttpError(403, "cannot read directory: " + ec.message());
  }
  fs::directory_iterator end;
  for(; it != end; it.increment(ec)) {
    if(ec) break;
    ListingEntry entry;
    entry.name = it->path().filename().string();
    if(relative.empty() && UploadStore::is_internal_name(entry.name)) continue;

    std::error_code entry_ec;
    entry.is_directory = it->is_directory(entry_ec);
    if(!entry.is_directory) {
      auto size = it->file_size(entry_ec);
      if(!entry_ec) entry.size = size;
    }
    entry.href = href_for(relative.empty() ? entry.name : relative + "/" + entry.name, entry.is_directory);
    entries.push_back(std::move(entry));
  }
  if(ec) {
    throw HttpError(500, "directory listing failed: " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), [](const ListingEntry& a, const ListingEntry& b) {
    auto la = to_lower(a.name);
    auto lb = to_lower(b.name);
    if(la != lb) return la < lb;
    return a.name < b.name;
  });

  if(request.wants_json()) {
    nlohmann::json doc;
    doc["path"] = "/" + relative;
    doc["entries"] = nlohmann::json::array();
    for(const auto& entry : entries) {
      doc["entries"].push_back({
        {"name", entry.name},
        {"type", entry.is_directory ? "directory" : "file"},
        {"size", entry.size}
      });
    }
    return HttpResponse::json(200, doc.dump());
  }

  std::string parent_href;
  if(!relative.empty()) {
    auto slash = relative.rfind('/');
    parent_href = href_for(slash == std::string::npos ? std::string() : relative.substr(0, slash), true);
  }
  std::string upload_action = relative.empty() ? href_for("", true) : std::string();
  return HttpResponse::html(200, render_listing_page("/" + relative, entries, parent_href, upload_action));
}

std::string DirectoryHandler::validate_upload_name(std::string_view declared) const {
  // old browsers send the full client-side path
  auto backslash = declared.rfind('\\');
  if(backslash != std::string_view::npos) declared.remove_prefix(backslash + 1);

  if(declared.empty() || declared == "." || declared == "..") {
    throw HttpError(400, "invalid file name");
  }
  auto normalized = PathGuard::normalize(declared);
  if(!normalized) {
    throw HttpError(403, "forbidden file name");
  }
  if(normalized->empty()) {
    throw HttpError(400, "invalid file name");
  }
  if(std::distance(normalized->begin(), normalized->end()) != 1) {
    throw HttpError(403, "uploads must go directly into the shared directory");
  }
  auto name = normalized->string();
  if(UploadStore::is_internal_name(name)) {
    throw HttpError(403, "reserved file name");
  }
  // catches a dangling symlink pointing out of the root
  if(!guard_.resolve(name)) {
    throw HttpError(403, "forbidden file name");
  }
  return name;
}

std::unique_ptr<BodySink> DirectoryHandler::begin_multipart_upload(const HttpRequest& request) {
  auto content_type = request.header("Content-Type");
  if(media_type(content_type) != "multipart/form-data") {
    throw HttpError(400, "expected multipart/form-data");
  }
  auto boundary = header_parameter(content_type, "boundary");
  if(!boundary || boundary->empty()) {
    throw HttpError(400, "multipart boundary missing");
  }
  return std::make_unique<MultipartUploadSink>(*this, *boundary, max_upload_bytes_, request.wants_json());
}

std::unique_ptr<BodySink> DirectoryHandler::begin_raw_upload(const HttpRequest& request, const std::string& name) {
  return std::make_unique<RawUploadSink>(*this, validate_upload_name(name), max_upload_bytes_, request.wants_json());
}

HttpResponse DirectoryHandler::upload_response(bool as_json, const std::vector<StoredUpload>& stored) const {
  HttpResponse response;
  if(as_json) {
    nlohmann::json doc;
    doc["stored"] = nlohmann::json::array();
    for(const auto& item : stored) {
      doc["stored"].push_back({{"name", item.name}, {"size", item.size}, {"sha256", item.sha256}});
    }
    response = HttpResponse::json(201, doc.dump());
  } else {
    std::vector<std::string> details;
    details.reserve(stored.size());
    for(const auto& item : stored) {
      details.push_back(fmt::format("{} ({}) sha256 {}", item.name, format_size(item.size), item.sha256));
    }
    response = HttpResponse::html(201, render_ok_page(details));
  }
  if(stored.size() == 1) {
    response.set_header("Location", href_for(stored.front().name, false));
  }
  response.completes_transfer = true;
  return response;
}
