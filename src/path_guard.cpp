#include "path_guard.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

PathGuard::PathGuard(const std::filesystem::path& root)
  : root_(std::filesystem::canonical(root)) {}

std::optional<std::filesystem::path> PathGuard::normalize(std::string_view relative) {
  if(relative.find('\0') != std::string_view::npos) return std::nullopt;
  if(!relative.empty() && relative.front() == '/') return std::nullopt;

  std::vector<std::string_view> segments;
  std::size_t start = 0;
  while(!relative.empty()) {
    auto end = relative.find('/', start);
    if(end == std::string_view::npos) end = relative.size();
    auto segment = relative.substr(start, end - start);
    if(segment.empty()) return std::nullopt;
    if(segment == "..") {
      if(segments.empty()) return std::nullopt;
      segments.pop_back();
    } else if(segment != ".") {
      segments.push_back(segment);
    }
    if(end == relative.size()) break;
    start = end + 1;
  }

  std::filesystem::path out;
  for(auto segment : segments) {
    out /= std::filesystem::path(std::string(segment));
  }
  return out;
}

bool PathGuard::is_within(const std::filesystem::path& base, const std::filesystem::path& candidate) {
  auto mismatch = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
  return mismatch.first == base.end();
}

std::optional<std::filesystem::path> PathGuard::resolve(std::string_view relative) const {
  auto normalized = normalize(relative);
  if(!normalized) return std::nullopt;
  if(normalized->empty()) return root_;

  std::error_code ec;
  auto candidate = std::filesystem::weakly_canonical(root_ / *normalized, ec);
  if(ec) return std::nullopt;
  if(!is_within(root_, candidate)) return std::nullopt;
  return candidate;
}
