#include "sage_api/server.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace sage_api {

Server::Server(std::string host, int port) : host_(std::move(host)), port_(port) {}

Server::~Server() {
  stop();
}

std::pair<std::string, int> Server::parse_address(const std::string &address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("Expected host:port, got '" + address + "'");
  }
  const std::string port_text = address.substr(colon + 1);
  size_t consumed = 0;
  const int port = std::stoi(port_text, &consumed);
  if (consumed != port_text.size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("Invalid port in '" + address + "'");
  }
  return {address.substr(0, colon), port};
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.signal_clear();
  app_.port(static_cast<std::uint16_t>(port_)).bindaddr(host_).multithreaded();

  running_ = true;
  std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
  listener_ = std::async(std::launch::async, [this] { app_.run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (listener_.valid()) {
    try {
      listener_.get();
    } catch (const std::exception &e) {
      std::cerr << "Server thread exited with error: " << e.what() << std::endl;
    }
  }
  running_ = false;
  std::cout << "Server on " << host_ << ":" << port_ << " stopped" << std::endl;
}

}  // namespace sage_api
