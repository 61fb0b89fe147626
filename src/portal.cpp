#include "portal.hpp"

#include <istream>
#include <iterator>
#include <system_error>
#include <unistd.h>

#include "settings_manager.hpp"
#include "utils.hpp"

const char* mode_name(PortalMode mode) {
  switch(mode) {
    case PortalMode::SingleFile: return "send-file";
    case PortalMode::Directory: return "recv-file";
    case PortalMode::SendText: return "send-text";
    case PortalMode::ReceiveText: return "recv-text";
  }
  return "unknown";
}

std::string normalize_base_path(const std::string& path) {
  std::string out = trim_copy(path);
  if(out.empty() || out.front() != '/') out.insert(out.begin(), '/');
  while(out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

PortalConfig make_portal_config(const SettingsManager& settings, std::istream& text_input) {
  PortalConfig config;

  auto send_file = settings.get<std::string>("send_file");
  auto recv_file = settings.get<std::string>("recv_file");
  auto send_text = settings.get<std::string>("send_text");
  bool recv_text = settings.get<bool>("recv_text");

  // a mode is selected by giving its option; "-t ''" shares an empty text
  bool has_send_file = !send_file.empty();
  bool has_recv_file = !recv_file.empty();
  bool has_send_text = settings.is_set("send_text");

  int selected = has_send_file + has_recv_file + has_send_text + recv_text;
  if(selected == 0) {
    throw StartupError("one of --send-file, --recv-file, --send-text or --recv-text is required");
  }
  if(selected > 1) {
    throw StartupError("--send-file, --recv-file, --send-text and --recv-text are mutually exclusive");
  }

  if(has_send_file) {
    config.mode = PortalMode::SingleFile;
    config.payload_path = send_file;
  } else if(has_recv_file) {
    config.mode = PortalMode::Directory;
    config.payload_path = recv_file;
  } else if(has_send_text) {
    config.mode = PortalMode::SendText;
    if(send_text == "-") {
      config.text.assign(std::istreambuf_iterator<char>(text_input), std::istreambuf_iterator<char>());
      if(text_input.bad()) throw StartupError("failed to read text from stdin");
    } else {
      config.text = send_text;
    }
  } else {
    config.mode = PortalMode::ReceiveText;
    config.once = true;
  }

  config.listen_ip = settings.get<std::string>("addr");
  int port = settings.get<int>("port");
  if(port < 0 || port > 65535) {
    throw StartupError("invalid port " + std::to_string(port));
  }
  config.listen_port = static_cast<uint16_t>(port);

  if(settings.get<bool>("random_path")) {
    config.base_path = "/" + random_token(4);
  } else {
    config.base_path = normalize_base_path(settings.get<std::string>("path"));
  }

  int workers = settings.get<int>("workers");
  if(workers < 1) {
    throw StartupError("workers must be at least 1");
  }
  config.workers = static_cast<std::size_t>(workers);
  config.once = config.once || settings.get<bool>("once");
  config.max_upload_bytes = settings.get<std::uint64_t>("max_upload_bytes");
  config.max_text_bytes = settings.get<std::uint64_t>("max_text_bytes");
  return config;
}

void validate_payload(PortalConfig& config) {
  namespace fs = std::filesystem;
  std::error_code ec;
  switch(config.mode) {
    case PortalMode::SingleFile: {
      auto canonical = fs::canonical(config.payload_path, ec);
      if(ec) {
        throw StartupError("cannot share " + config.payload_path.string() + ": " + ec.message());
      }
      if(!fs::is_regular_file(canonical, ec)) {
        throw StartupError(config.payload_path.string() + " is not a regular file");
      }
      if(::access(canonical.c_str(), R_OK) != 0) {
        throw StartupError(config.payload_path.string() + " is not readable");
      }
      config.payload_path = canonical;
      break;
    }
    case PortalMode::Directory: {
      auto canonical = fs::canonical(config.payload_path, ec);
      if(ec) {
        throw StartupError("cannot receive into " + config.payload_path.string() + ": " + ec.message());
      }
      if(!fs::is_directory(canonical, ec)) {
        throw StartupError(config.payload_path.string() + " is not a directory");
      }
      if(::access(canonical.c_str(), R_OK | W_OK | X_OK) != 0) {
        throw StartupError(config.payload_path.string() + " is not writable");
      }
      config.payload_path = canonical;
      break;
    }
    case PortalMode::SendText:
    case PortalMode::ReceiveText:
      break;
  }
}
