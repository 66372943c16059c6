#include "docmind_api/server.hpp"

#include <iostream>

namespace docmind_api {

Server::Server(const std::string &host, int port, unsigned int concurrency)
    : host_(host), port_(port), concurrency_(concurrency == 0 ? 1 : concurrency) {}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Server listening on " << host_ << ":" << port_ << " with " << concurrency_
            << " threads" << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.bindaddr(host_).port(port_).concurrency(concurrency_).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    try {
      server_thread_future_.get();
    } catch (const std::exception &e) {
      std::cerr << "Server thread exited with error: " << e.what() << std::endl;
    }
  }
  running_ = false;
}

}  // namespace docmind_api
