// keelson Umbrella Header
//
// Include this single header to pull in the public API of the server:
//   - HttpServer, its AsyncHandle and the LifecycleController (startup / shutdown hooks)
//   - HttpServerConfig and ServerStats
//   - The exchange primitives used by applications (RequestResponseCycle, RequestTask, BodyEvent)
//   - Request and response heads, status codes
//   - SignalHandler for Ctrl+C driven graceful shutdown
//
// Each re-exported header line is annotated with IWYU pragma: export.
//
// Usage Example:
//    #include <keelson/keelson.hpp>
//    using namespace keelson;
//
//    RequestTask Hello(RequestResponseCycle& cycle) {
//      co_await cycle.start(http::ResponseHead(200).header("Content-Type", "text/plain"));
//      co_await cycle.send("hello\n");
//    }
//
//    int main() {
//      HttpServer server(HttpServerConfig{}.withPort(8080), Hello);
//      server.run();
//    }
#pragma once

#include "keelson/http-request-head.hpp"        // IWYU pragma: export
#include "keelson/http-response-head.hpp"       // IWYU pragma: export
#include "keelson/http-server-config.hpp"       // IWYU pragma: export
#include "keelson/http-server.hpp"              // IWYU pragma: export
#include "keelson/http-status-code.hpp"         // IWYU pragma: export
#include "keelson/lifecycle-controller.hpp"     // IWYU pragma: export
#include "keelson/request-response-cycle.hpp"   // IWYU pragma: export
#include "keelson/request-task.hpp"             // IWYU pragma: export
#include "keelson/server-stats.hpp"             // IWYU pragma: export
#include "keelson/signal-handler.hpp"           // IWYU pragma: export
