#pragma once

#include <cstdint>
#include <string>

namespace keelson {

struct ServerStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Enumerates all fields, in serialization order.
  template <class F>
  void for_each_field(F&& fun) const {
    fun("totalBytesQueued", totalBytesQueued);
    fun("totalBytesWrittenImmediate", totalBytesWrittenImmediate);
    fun("totalBytesWrittenFlush", totalBytesWrittenFlush);
    fun("deferredWriteEvents", deferredWriteEvents);
    fun("flowControlPauses", flowControlPauses);
    fun("totalRequestsServed", totalRequestsServed);
    fun("activeConnections", activeConnections);
    fun("connectionsAccepted", connectionsAccepted);
    fun("connectionsRefused", connectionsRefused);
    fun("parseErrors", parseErrors);
    fun("applicationErrors", applicationErrors);
    fun("clientDisconnects", clientDisconnects);
    fun("timeouts", timeouts);
    fun("eventPoolHits", eventPoolHits);
    fun("eventPoolMisses", eventPoolMisses);
    fun("eventPoolDiscards", eventPoolDiscards);
  }

  uint64_t totalBytesQueued{};
  uint64_t totalBytesWrittenImmediate{};
  uint64_t totalBytesWrittenFlush{};
  uint64_t deferredWriteEvents{};
  uint64_t flowControlPauses{};
  uint64_t totalRequestsServed{};
  uint64_t activeConnections{};
  uint64_t connectionsAccepted{};
  uint64_t connectionsRefused{};
  uint64_t parseErrors{};
  uint64_t applicationErrors{};
  uint64_t clientDisconnects{};
  uint64_t timeouts{};
  uint64_t eventPoolHits{};
  uint64_t eventPoolMisses{};
  uint64_t eventPoolDiscards{};
};

}  // namespace keelson
