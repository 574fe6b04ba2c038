#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <keelson/keelson.hpp>
#include <string>

using namespace keelson;

namespace {

RequestTask Describe(RequestResponseCycle &cycle) {
  const http::RequestHead &req = cycle.request();
  std::string body("Hello from keelson minimal server! You requested ");
  body.append(req.path());
  body.append("\nMethod: ");
  body.append(req.method());
  body.append("\nVersion: HTTP/");
  body.append(std::to_string(req.version().major));
  body.push_back('.');
  body.append(std::to_string(req.version().minor));
  body.append("\nHeaders:\n");
  for (const auto &[headerKey, headerValue] : req.headers()) {
    body.append(headerKey);
    body.append(": ");
    body.append(headerValue);
    body.push_back('\n');
  }
  co_await cycle.start(http::ResponseHead(http::StatusCodeOK)
                           .header("Content-Type", "text/plain")
                           .header("Content-Length", std::to_string(body.size())));
  co_await cycle.send(body);
}

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    HttpServer server(HttpServerConfig{}.withPort(port), Describe);
    std::cout << "Listening on port " << server.port() << '\n';
    server.run();  // blocking run, until Ctrl+C
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
