#pragma once
#include <crow.h>

#include <future>
#include <string>
#include <utility>

namespace sage_api {

// Owns the Crow app and the background thread that serves it
class Server {
 public:
  Server(std::string host, int port);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  // Splits "host:port"; throws std::invalid_argument on a malformed address
  static std::pair<std::string, int> parse_address(const std::string &address);

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Returns once the listener thread is launched. Crow's own SIGINT/SIGTERM
  // handlers are cleared so the process decides when to stop.
  void start();

  // Blocks until the listener thread has exited
  void stop();

  bool is_running() const {
    return running_;
  }
  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> listener_;
  bool running_ = false;
};

}  // namespace sage_api
