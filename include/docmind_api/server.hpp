#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace docmind_api {

// Runs the Crow application on a background thread
class Server {
 public:
  Server(const std::string &host, int port, unsigned int concurrency);
  ~Server();

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  // Stops accepting requests and waits for the server thread to exit
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned int concurrency_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace docmind_api
