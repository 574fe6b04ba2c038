#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace keelson::internal {

enum class ProtocolState : uint8_t { Idle, ReadingRequest, Processing, WritingResponse, Closing, Closed };

enum class ConnectionEvent : uint8_t {
  RequestBytes,        // bytes of a request head arrived
  HeadComplete,        // a request head was parsed, its exchange starts
  ResponseStarted,     // the head-of-line exchange wrote its response head
  ExchangeDone,        // head-of-line exchange finished, connection kept alive, nothing pipelined
  NextExchange,        // head-of-line exchange finished, connection kept alive, pipelined exchange promoted
  CloseAfterResponse,  // no further exchange: close once the output is flushed
  ProtocolError,       // invalid request or client timeout
  PeerClosed,          // client closed or reset the connection
  Shutdown,            // server shutdown requested
  TransportClosed      // the connection socket is released
};

inline constexpr std::size_t kNbProtocolStates = 6;
inline constexpr std::size_t kNbConnectionEvents = 10;

struct Transition {
  enum class Kind : uint8_t { Move, Stay, Invalid };

  Kind kind;
  ProtocolState target;
};

namespace detail {

inline constexpr Transition kStay{Transition::Kind::Stay, ProtocolState::Idle};
inline constexpr Transition kInvalid{Transition::Kind::Invalid, ProtocolState::Idle};

constexpr Transition To(ProtocolState target) noexcept { return {Transition::Kind::Move, target}; }

using Row = std::array<Transition, kNbConnectionEvents>;

// Columns follow the ConnectionEvent order:
// RequestBytes, HeadComplete, ResponseStarted, ExchangeDone, NextExchange, CloseAfterResponse, ProtocolError,
// PeerClosed, Shutdown, TransportClosed
inline constexpr std::array<Row, kNbProtocolStates> kTransitions{{
    // Idle
    Row{To(ProtocolState::ReadingRequest), To(ProtocolState::Processing), kInvalid, kInvalid, kInvalid,
        To(ProtocolState::Closing), To(ProtocolState::Closing), To(ProtocolState::Closed), To(ProtocolState::Closing),
        To(ProtocolState::Closed)},
    // ReadingRequest
    Row{kStay, To(ProtocolState::Processing), kInvalid, kInvalid, kInvalid, To(ProtocolState::Closing),
        To(ProtocolState::Closing), To(ProtocolState::Closed), To(ProtocolState::Closing), To(ProtocolState::Closed)},
    // Processing
    Row{kStay, kStay, To(ProtocolState::WritingResponse), To(ProtocolState::Idle), kStay, To(ProtocolState::Closing),
        To(ProtocolState::Closing), To(ProtocolState::Closed), kStay, To(ProtocolState::Closed)},
    // WritingResponse
    Row{kStay, kStay, kStay, To(ProtocolState::Idle), To(ProtocolState::Processing), To(ProtocolState::Closing),
        To(ProtocolState::Closing), To(ProtocolState::Closed), kStay, To(ProtocolState::Closed)},
    // Closing
    Row{kStay, kInvalid, kInvalid, kStay, kInvalid, kStay, kStay, To(ProtocolState::Closed), kStay,
        To(ProtocolState::Closed)},
    // Closed
    Row{kStay, kInvalid, kInvalid, kStay, kInvalid, kStay, kStay, kStay, kStay, kStay},
}};

}  // namespace detail

constexpr Transition NextProtocolState(ProtocolState state, ConnectionEvent event) noexcept {
  return detail::kTransitions[static_cast<std::size_t>(state)][static_cast<std::size_t>(event)];
}

constexpr std::string_view ProtocolStateName(ProtocolState state) noexcept {
  switch (state) {
    case ProtocolState::Idle:
      return "Idle";
    case ProtocolState::ReadingRequest:
      return "ReadingRequest";
    case ProtocolState::Processing:
      return "Processing";
    case ProtocolState::WritingResponse:
      return "WritingResponse";
    case ProtocolState::Closing:
      return "Closing";
    case ProtocolState::Closed:
      return "Closed";
    default:
      return "Unknown";
  }
}

constexpr std::string_view ConnectionEventName(ConnectionEvent event) noexcept {
  switch (event) {
    case ConnectionEvent::RequestBytes:
      return "RequestBytes";
    case ConnectionEvent::HeadComplete:
      return "HeadComplete";
    case ConnectionEvent::ResponseStarted:
      return "ResponseStarted";
    case ConnectionEvent::ExchangeDone:
      return "ExchangeDone";
    case ConnectionEvent::NextExchange:
      return "NextExchange";
    case ConnectionEvent::CloseAfterResponse:
      return "CloseAfterResponse";
    case ConnectionEvent::ProtocolError:
      return "ProtocolError";
    case ConnectionEvent::PeerClosed:
      return "PeerClosed";
    case ConnectionEvent::Shutdown:
      return "Shutdown";
    case ConnectionEvent::TransportClosed:
      return "TransportClosed";
    default:
      return "Unknown";
  }
}

}  // namespace keelson::internal
