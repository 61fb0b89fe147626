#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

// Trust boundary between client-supplied relative paths and the filesystem.
// Stateless after construction; safe to share between connections.
class PathGuard {
public:
  // `root` must exist; it is canonicalized once here.
  explicit PathGuard(const std::filesystem::path& root);

  const std::filesystem::path& root() const { return root_; }

  // Returns the canonical absolute path for `relative` (already percent-decoded),
  // or nullopt when it is absolute, contains empty segments or NUL bytes, or
  // resolves (through ".." or symlinks) outside the root. An empty string names
  // the root itself.
  std::optional<std::filesystem::path> resolve(std::string_view relative) const;

  // Lexical part of resolve(): "a/./b/../c" -> "a/c". Nullopt on rejection.
  static std::optional<std::filesystem::path> normalize(std::string_view relative);

  static bool is_within(const std::filesystem::path& base, const std::filesystem::path& candidate);

private:
  std::filesystem::path root_;
};
