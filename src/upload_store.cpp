#include "upload_store.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

#include "http_message.hpp"
#include "log.hpp"

namespace {

constexpr unsigned kMaxNameAttempts = 10000;

bool link_unsupported(int err) {
  return err == EPERM || err == ENOTSUP || err == EOPNOTSUPP || err == EXDEV || err == EMLINK;
}

} // namespace

UploadStore::StagedFile::StagedFile(std::filesystem::path path, int fd)
  : path_(std::move(path)), fd_(fd) {}

UploadStore::StagedFile::~StagedFile() {
  if(fd_ >= 0) ::close(fd_);
  if(!committed_) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
}

void UploadStore::StagedFile::write(const char* data, std::size_t size) {
  if(fd_ < 0) throw HttpError(500, "upload already closed");
  std::size_t written = 0;
  while(written < size) {
    ssize_t n = ::write(fd_, data + written, size - written);
    if(n < 0) {
      if(errno == EINTR) continue;
      throw HttpError(500, std::string("failed to write upload: ") + std::strerror(errno));
    }
    written += static_cast<std::size_t>(n);
  }
  digest_.update(data, size);
  size_ += size;
}

void UploadStore::StagedFile::close_file() {
  if(fd_ < 0) return;
  int rc = ::close(fd_);
  fd_ = -1;
  if(rc != 0) {
    throw HttpError(500, std::string("failed to finish upload: ") + std::strerror(errno));
  }
}

UploadStore::UploadStore(std::filesystem::path root, std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    staging_dir_(root_ / kStagingDirName),
    logger_(std::move(logger)) {}

UploadStore::~UploadStore() {
  // only succeeds when no staged upload is left behind
  std::error_code ec;
  if(std::filesystem::is_directory(std::filesystem::symlink_status(staging_dir_, ec))) {
    std::filesystem::remove(staging_dir_, ec);
  }
}

std::unique_ptr<UploadStore::StagedFile> UploadStore::stage() {
  std::error_code ec;
  std::filesystem::create_directories(staging_dir_, ec);
  if(ec) {
    throw HttpError(500, "cannot create staging directory: " + ec.message());
  }
  for(int attempt = 0; attempt < 8; ++attempt) {
    auto path = staging_dir_ / (random_token(16) + ".part");
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if(fd >= 0) {
      return std::unique_ptr<StagedFile>(new StagedFile(path, fd));
    }
    if(errno != EEXIST) {
      throw HttpError(500, std::string("cannot create staging file: ") + std::strerror(errno));
    }
  }
  throw HttpError(500, "cannot create staging file");
}

StoredUpload UploadStore::commit(StagedFile& staged, const std::string& name) {
  staged.close_file();

  StoredUpload stored;
  stored.size = staged.size();
  stored.sha256 = staged.digest_.finish_hex();

  std::lock_guard lg(name_mutex_);
  for(unsigned attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
    std::string candidate = candidate_name(name, attempt);
    auto target = root_ / candidate;

    // link() fails with EEXIST instead of replacing: an atomic test-and-create.
    if(::link(staged.path().c_str(), target.c_str()) == 0) {
      std::error_code ec;
      std::filesystem::remove(staged.path(), ec);
      if(ec) log_warn(logger_.get(), "could not remove staging file {}: {}", staged.path().string(), ec.message());
      staged.committed_ = true;
      stored.name = candidate;
      stored.path = target;
      return stored;
    }
    int err = errno;
    if(err == EEXIST) continue;
    if(!link_unsupported(err)) {
      throw HttpError(500, "cannot store " + candidate + ": " + std::strerror(err));
    }

    // No hard links on this filesystem; name_mutex_ serializes our writers.
    std::error_code ec;
    if(std::filesystem::symlink_status(target, ec).type() != std::filesystem::file_type::not_found) continue;
    std::filesystem::rename(staged.path(), target, ec);
    if(ec) {
      throw HttpError(500, "cannot store " + candidate + ": " + ec.message());
    }
    staged.committed_ = true;
    stored.name = candidate;
    stored.path = target;
    return stored;
  }
  throw HttpError(500, "no free file name for " + name);
}

std::string UploadStore::candidate_name(const std::string& name, unsigned attempt) {
  if(attempt == 0) return name;
  std::filesystem::path p(name);
  std::string stem = p.stem().string();
  std::string ext = p.extension().string();
  return stem + "_" + std::to_string(attempt) + ext;
}

bool UploadStore::is_internal_name(std::string_view name) {
  return name == kStagingDirName;
}
