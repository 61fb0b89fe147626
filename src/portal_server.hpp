#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "portal.hpp"
#include "text_slot.hpp"

class Router;

class PortalServer {
public:
  using ReadyCallback = std::function<void(const std::string& url)>;

  explicit PortalServer(PortalConfig config, std::shared_ptr<Logger> logger = nullptr);
  ~PortalServer();

  PortalServer(const PortalServer&) = delete;
  PortalServer& operator=(const PortalServer&) = delete;

  // Validates the payload, binds and reports the URL through `on_ready`
  // before the first accept. Throws StartupError.
  void start(ReadyCallback on_ready = {});
  // Serves on `workers` threads, the caller's included, until stopped.
  void run();
  void start_background();
  // Safe from any thread, including a handler.
  void stop();

  // SIGINT and SIGTERM stop the server; for the CLI.
  void enable_signal_stop() { handle_signals_ = true; }

  const PortalConfig& config() const { return config_; }
  uint16_t listen_port() const { return listen_port_; }
  const std::string& url() const { return url_; }
  const TextSlot& text_slot() const { return text_slot_; }
  std::size_t completed_transfers() const { return completed_transfers_.load(); }
  std::shared_ptr<Logger> logger() const { return logger_; }

  // Best guess at the address other machines on the LAN reach us on.
  static std::string detect_lan_address(asio::io_context& io);

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void on_transfer_complete();
  void request_stop();
  std::string build_url() const;

  PortalConfig config_;
  std::shared_ptr<Logger> logger_;
  TextSlot text_slot_;
  std::unique_ptr<Router> router_;

  asio::io_context io_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::signal_set> signals_;
  std::vector<std::thread> io_threads_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<std::size_t> completed_transfers_{0};
  bool handle_signals_ = false;
  uint16_t listen_port_ = 0;
  std::string url_;
};
