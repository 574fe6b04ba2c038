#include <chrono>
#include <iostream>
#include <keelson/keelson.hpp>
#include <thread>

using namespace keelson;

namespace {

RequestTask Hello(RequestResponseCycle &cycle) {
  co_await cycle.start(http::ResponseHead(http::StatusCodeOK).header("Content-Type", "text/plain"));
  co_await cycle.send("hello from async server\n");
}

}  // namespace

int main() {
  HttpServer server(HttpServerConfig{}, Hello);
  server.lifecycle().setStartupHook([] { std::cout << "Startup hook called\n"; });
  server.lifecycle().setShutdownHook([] { std::cout << "Shutdown hook called\n"; });

  auto handle = server.start();
  std::cout << "Async server listening on port " << server.port() << '\n';
  std::cout << "Sleeping for 2 seconds while serving..." << '\n';
  std::this_thread::sleep_for(std::chrono::seconds(2));

  handle.stop();
  handle.rethrowIfError();
  std::cout << "Server stopped." << '\n';
}
