#pragma once

#include "ordersim/domain/candle.hpp"
#include "ordersim/resilience/circuit_breaker.hpp"
#include "ordersim/resilience/retry_policy.hpp"
#include "ordersim/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace ordersim {

// One decoded feed message.
struct CandleMessage {
  std::string symbol;
  domain::Candle candle;
};

// -----------------------------------------------------------------------------
// CandleFeedGateway — ZeroMQ bridge delivering OHLCV bars
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded candles and hands
//         each one to a sink, normally Backtester::onCandle.
//
// @details
// Expected JSON format from the publisher:
//   {
//     "timestamp_ms": 1700000000000,   // bar open time, epoch milliseconds
//     "symbol":       "BTCUSDT",
//     "open": 100.0, "high": 110.0, "low": 95.0, "close": 105.0,
//     "volume": 1234.5
//   }
//
// Malformed payloads are logged, counted in decodeErrors() and skipped. The
// gateway does not validate OHLC consistency; the Backtester rejects bad
// bars as data errors.
//
// Shutdown safety (ZMQ_RCVTIMEO):
//   The SUB socket has a receive timeout, so recv() returns periodically
//   and the stop() flag is checked at least every kRecvTimeoutMs.
//
// Socket failures:
//   A zmq::error_t from recv() is recorded on a CircuitBreaker. While the
//   breaker is open the loop backs off (RetryPolicy schedule) instead of
//   spinning on a broken socket; it probes again once the breaker
//   half-opens.
//
// Thread model:
//   run() blocks the calling thread; call it from a dedicated std::thread.
//   The sink runs on that thread. stop() may be called from any thread.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII) and a copy of the
//   sink.
// -----------------------------------------------------------------------------
class CandleFeedGateway {
 public:
  using CandleSink =
      std::function<void(const std::string& symbol, const domain::Candle&)>;

  explicit CandleFeedGateway(
      CandleSink sink,
      const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~CandleFeedGateway() = default;

  CandleFeedGateway(const CandleFeedGateway&) = delete;
  CandleFeedGateway& operator=(const CandleFeedGateway&) = delete;
  CandleFeedGateway(CandleFeedGateway&&) = delete;
  CandleFeedGateway& operator=(CandleFeedGateway&&) = delete;

  // Blocking receive loop; returns after stop().
  void run();

  void stop();

  bool isRunning() const { return running_.load(); }

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t decodeErrors() const { return decode_errors_.load(); }

  // -------------------------------------------------------------------------
  // decodeCandleMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Parses one feed payload. Usable without a socket.
  //
  // @return std::nullopt (and a log line) on invalid JSON, a missing field
  //         or a field of the wrong type.
  // -------------------------------------------------------------------------
  static std::optional<CandleMessage> decodeCandleMessage(
      const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void handlePayload(const std::string& payload);

  CandleSink sink_;

  LiveTimeProvider clock_;
  CircuitBreaker breaker_{clock_};
  RetryPolicy backoff_;
  std::uint32_t consecutive_errors_{0};

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
};

}  // namespace ordersim
