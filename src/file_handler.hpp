#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "handler.hpp"
#include "path_guard.hpp"
#include "upload_store.hpp"

class Logger;

// Streams one regular file. `attachment` selects the Content-Disposition type.
// Throws HttpError(404) when the file can no longer be opened.
HttpResponse serve_file(const std::filesystem::path& file, bool attachment);

// attachment; filename="a.txt" plus filename*=UTF-8''... for non-ASCII names.
std::string content_disposition(std::string_view type, const std::string& filename);

// "-f": the one shared file, under "/" and under its own name.
class SingleFileHandler : public ModeHandler {
public:
  explicit SingleFileHandler(std::filesystem::path file);

  RouteResult handle(const HttpRequest& request, const std::string& relative) override;

private:
  std::filesystem::path file_;
  std::string file_name_;
};

// "-d": browse, download and upload inside one directory.
class DirectoryHandler : public ModeHandler {
public:
  DirectoryHandler(const std::filesystem::path& root,
                   std::string base_path,
                   std::uint64_t max_upload_bytes,
                   std::shared_ptr<Logger> logger);

  RouteResult handle(const HttpRequest& request, const std::string& relative) override;

  HttpResponse list_directory(const HttpRequest& request,
                              const std::filesystem::path& dir,
                              const std::string& relative) const;

  // Turns a client-supplied upload name into a single safe path segment.
  // Throws HttpError: 400 for empty, "." or ".." names, 403 for names that
  // would land anywhere but directly in the root.
  std::string validate_upload_name(std::string_view declared) const;

  std::unique_ptr<BodySink> begin_multipart_upload(const HttpRequest& request);
  std::unique_ptr<BodySink> begin_raw_upload(const HttpRequest& request, const std::string& name);

  HttpResponse upload_response(bool as_json, const std::vector<StoredUpload>& stored) const;

  UploadStore& store() { return store_; }
  const PathGuard& guard() const { return guard_; }
  Logger* logger() const { return logger_.get(); }

  // Absolute href for a path below the service path.
  std::string href_for(const std::string& relative, bool directory) const;

private:
  PathGuard guard_;
  UploadStore store_;
  std::string base_path_;
  std::uint64_t max_upload_bytes_;
  std::shared_ptr<Logger> logger_;
};
