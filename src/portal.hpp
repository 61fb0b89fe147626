#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>

class SettingsManager;

enum class PortalMode { SingleFile, Directory, SendText, ReceiveText };

const char* mode_name(PortalMode mode);

// Fatal before serving: payload missing or unusable, bind failure, bad address.
class StartupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct PortalConfig {
  PortalMode mode = PortalMode::SendText;
  std::filesystem::path payload_path;   // SingleFile: the file, Directory: the root
  std::string text;                     // SendText only
  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 0;
  std::string base_path = "/";
  std::size_t workers = 4;
  bool once = false;
  std::uint64_t max_upload_bytes = 0;   // 0 = unlimited
  std::uint64_t max_text_bytes = 1024 * 1024;
};

// Canonical form: leading slash, no trailing slash except for "/" itself.
std::string normalize_base_path(const std::string& path);

// Resolves the mode flags and limits. Text given as "-" is read from `text_input`
// exactly once. Throws StartupError for a missing or ambiguous mode.
PortalConfig make_portal_config(const SettingsManager& settings, std::istream& text_input);

// Checks that the payload exists and makes file paths absolute and canonical.
void validate_payload(PortalConfig& config);
