#include "portal_server.hpp"

#include <algorithm>
#include <csignal>
#include <system_error>

#include "http_connection.hpp"
#include "router.hpp"

PortalServer::PortalServer(PortalConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("laport")) {
  config_.base_path = normalize_base_path(config_.base_path);
  if(config_.workers == 0) config_.workers = 1;
}

PortalServer::~PortalServer() {
  stop();
}

void PortalServer::start(ReadyCallback on_ready) {
  if(started_) return;

  validate_payload(config_);
  router_ = std::make_unique<Router>(config_, text_slot_, logger_);

  std::error_code ec;
  auto listen_address = asio::ip::make_address(config_.listen_ip, ec);
  if(ec) {
    throw StartupError("invalid listen address '" + config_.listen_ip + "': " + ec.message());
  }

  tcp::endpoint endpoint(listen_address, config_.listen_port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    acceptor_.reset();
    throw StartupError("cannot listen on " + config_.listen_ip + ":" +
                       std::to_string(config_.listen_port) + ": " + ec.message());
  }
  listen_port_ = acceptor_->local_endpoint().port();
  url_ = build_url();
  started_ = true;

  logger_->info("{} mode on {}:{} (path {})", mode_name(config_.mode), config_.listen_ip, listen_port_, config_.base_path);
  if(on_ready) on_ready(url_);

  if(handle_signals_) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& error, int signal_number) {
      if(error) return;
      logger_->info("signal {} received, stopping", signal_number);
      request_stop();
    });
  }

  start_accept();
}

void PortalServer::start_accept() {
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket) {
      if(stopping_) return;
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("Accept error: {}", ec.message());
      } else {
        HttpConnection::create(std::move(socket), *router_, logger_, [this]() { on_transfer_complete(); })->start();
      }
      start_accept();
    });
}

void PortalServer::on_transfer_complete() {
  completed_transfers_.fetch_add(1);
  if(config_.once) {
    logger_->info("transfer complete, shutting down");
    request_stop();
  }
}

void PortalServer::request_stop() {
  if(stopping_.exchange(true)) return;
  asio::post(io_, [this]() {
    std::error_code ec;
    if(acceptor_) acceptor_->close(ec);
    if(signals_) signals_->cancel(ec);
    io_.stop();
  });
}

void PortalServer::run() {
  if(!started_) start();
  std::vector<std::thread> helpers;
  for(std::size_t i = 1; i < config_.workers; ++i) {
    helpers.emplace_back([this]() { io_.run(); });
  }
  io_.run();
  io_.stop();
  for(auto& t : helpers) t.join();
}

void PortalServer::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  for(std::size_t i = 0; i < config_.workers; ++i) {
    io_threads_.emplace_back([this]() { io_.run(); });
  }
}

void PortalServer::stop() {
  if(!started_) return;
  request_stop();
  io_.stop();
  auto self_id = std::this_thread::get_id();
  for(auto& t : io_threads_) {
    if(t.joinable() && t.get_id() != self_id) t.join();
  }
  io_threads_.erase(std::remove_if(io_threads_.begin(), io_threads_.end(),
                                   [](const std::thread& t) { return !t.joinable(); }),
                    io_threads_.end());
}

std::string PortalServer::build_url() const {
  std::error_code ec;
  auto bound = asio::ip::make_address(config_.listen_ip, ec);
  std::string host;
  if(!ec && !bound.is_unspecified()) {
    host = bound.to_string();
  } else {
    asio::io_context probe_io;
    host = detect_lan_address(probe_io);
  }
  if(host.find(':') != std::string::npos) host = "[" + host + "]";
  return "http://" + host + ":" + std::to_string(listen_port_) + config_.base_path;
}

std::string PortalServer::detect_lan_address(asio::io_context& io) {
  std::error_code ec;

  // connecting a UDP socket sends nothing; it only asks the routing table
  // which local address would be used
  asio::ip::udp::socket probe(io);
  probe.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("10.255.255.255"), 1), ec);
  if(!ec) {
    auto local = probe.local_endpoint(ec);
    if(!ec && !local.address().is_unspecified() && !local.address().is_loopback()) {
      return local.address().to_string();
    }
  }

  auto host_name = asio::ip::host_name(ec);
  if(!ec) {
    tcp::resolver resolver(io);
    auto results = resolver.resolve(tcp::v4(), host_name, "", ec);
    if(!ec) {
      for(const auto& entry : results) {
        auto address = entry.endpoint().address();
        if(!address.is_loopback() && !address.is_unspecified()) return address.to_string();
      }
    }
  }
  return "127.0.0.1";
}
