#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <keelson/keelson.hpp>
#include <string>

using namespace keelson;

namespace {

// POST /upload: counts the request body as it arrives.
// Anything else: streams 64 lines with chunked encoding, the server pausing the producer when the client reads slowly.
RequestTask Stream(RequestResponseCycle &cycle) {
  if (cycle.request().path() == "/upload") {
    std::size_t nbBytes = 0;
    for (BodyEvent event = co_await cycle.receive(); event.type != BodyEvent::Type::End;
         event = co_await cycle.receive()) {
      if (event.type == BodyEvent::Type::Disconnect) {
        co_return;
      }
      nbBytes += event.data.size();
    }
    co_await cycle.start(http::ResponseHead(http::StatusCodeOK).header("Content-Type", "text/plain"));
    co_await cycle.send("received " + std::to_string(nbBytes) + " bytes\n");
    co_return;
  }

  co_await cycle.start(http::ResponseHead(http::StatusCodeOK).header("Content-Type", "text/plain"));
  for (int lineNb = 0; lineNb < 64; ++lineNb) {
    std::string line = "line " + std::to_string(lineNb) + ' ' + std::string(1024, '.') + '\n';
    if (co_await cycle.send(line, true) == SendStatus::Disconnected) {
      co_return;
    }
  }
  co_await cycle.send("");
}

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::debug);
  SignalHandler::Enable();

  try {
    HttpServer server(HttpServerConfig{}.withFlowControlWatermarks(4096, 16384), Stream);
    std::cout << "Streaming server listening on port " << server.port() << '\n';
    server.run();
    const ServerStats stats = server.stats();
    std::cout << "Served " << stats.totalRequestsServed << " requests, paused " << stats.flowControlPauses
              << " times\n";
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
