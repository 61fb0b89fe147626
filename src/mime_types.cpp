#include "mime_types.hpp"

#include <unordered_map>

#include "utils.hpp"

std::string mime_type_for(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, std::string> types = {
    {".html", "text/html; charset=utf-8"}, {".htm", "text/html; charset=utf-8"},
    {".txt", "text/plain; charset=utf-8"}, {".md", "text/markdown; charset=utf-8"},
    {".csv", "text/csv; charset=utf-8"}, {".log", "text/plain; charset=utf-8"},
    {".css", "text/css"}, {".js", "text/javascript"}, {".mjs", "text/javascript"},
    {".json", "application/json"}, {".xml", "application/xml"},
    {".pdf", "application/pdf"}, {".zip", "application/zip"},
    {".gz", "application/gzip"}, {".tar", "application/x-tar"},
    {".7z", "application/x-7z-compressed"}, {".apk", "application/vnd.android.package-archive"},
    {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
    {".gif", "image/gif"}, {".webp", "image/webp"}, {".bmp", "image/bmp"},
    {".svg", "image/svg+xml"}, {".ico", "image/x-icon"}, {".heic", "image/heic"},
    {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"},
    {".flac", "audio/flac"}, {".m4a", "audio/mp4"},
    {".mp4", "video/mp4"}, {".webm", "video/webm"}, {".mov", "video/quicktime"},
    {".mkv", "video/x-matroska"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".epub", "application/epub+zip"}
  };
  auto it = types.find(to_lower(path.extension().string()));
  return it == types.end() ? "application/octet-stream" : it->second;
}
