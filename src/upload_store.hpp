#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "utils.hpp"

class Logger;

struct StoredUpload {
  std::string name;             // final name, may carry a _N suffix
  std::filesystem::path path;
  std::uint64_t size = 0;
  std::string sha256;
};

// Lands uploads in the shared directory. Bytes go to a staging file under
// `.laport_tmp` first and are linked into place under a free name only once
// complete, so a partial upload is never visible and nothing is overwritten.
class UploadStore {
public:
  static constexpr const char* kStagingDirName = ".laport_tmp";

  class StagedFile {
  public:
    ~StagedFile();
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    // Throws HttpError(500) when the disk write fails.
    void write(const char* data, std::size_t size);
    std::uint64_t size() const { return size_; }
    const std::filesystem::path& path() const { return path_; }

  private:
    friend class UploadStore;
    StagedFile(std::filesystem::path path, int fd);
    void close_file();

    std::filesystem::path path_;
    int fd_ = -1;
    std::uint64_t size_ = 0;
    Sha256Stream digest_;
    bool committed_ = false;
  };

  UploadStore(std::filesystem::path root, std::shared_ptr<Logger> logger);
  ~UploadStore();
  UploadStore(const UploadStore&) = delete;
  UploadStore& operator=(const UploadStore&) = delete;

  const std::filesystem::path& root() const { return root_; }

  // Throws HttpError(500) when the staging file cannot be created.
  std::unique_ptr<StagedFile> stage();

  // Moves the staged bytes to `name` inside the root, or to the first free
  // `stem_N.ext` when taken. `name` must be a validated single path segment.
  StoredUpload commit(StagedFile& staged, const std::string& name);

  // "photo.jpg", 2 -> "photo_2.jpg"; "notes", 1 -> "notes_1".
  static std::string candidate_name(const std::string& name, unsigned attempt);

  static bool is_internal_name(std::string_view name);

private:
  std::filesystem::path root_;
  std::filesystem::path staging_dir_;
  std::shared_ptr<Logger> logger_;
  std::mutex name_mutex_;
};
