#include "ordersim/gateway/candle_feed_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <thread>
#include <utility>

namespace ordersim {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
CandleFeedGateway::CandleFeedGateway(CandleSink sink,
                                     const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
  std::cout << "[CandleFeedGateway] Subscribed to " << endpoint << "\n";
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop — call from a dedicated thread
// -----------------------------------------------------------------------------
void CandleFeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    if (!breaker_.allowRequest()) {
      std::this_thread::sleep_for(backoff_.backoffFor(consecutive_errors_));
      continue;
    }

    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      ++consecutive_errors_;
      breaker_.recordFailure();
      std::cerr << "[CandleFeedGateway] recv failed: " << e.what()
                << " (consecutive=" << consecutive_errors_ << ")\n";
      continue;
    }

    if (!result.has_value()) {
      // Timeout. Loop back and re-check running_.
      continue;
    }

    consecutive_errors_ = 0;
    breaker_.recordSuccess();
    handlePayload(msg.to_string());
  }

  std::cout << "[CandleFeedGateway] Stopped after " << received_.load()
            << " candles (" << decode_errors_.load()
            << " undecodable messages)\n";
}

void CandleFeedGateway::stop() { running_.store(false); }

void CandleFeedGateway::handlePayload(const std::string& payload) {
  auto message = decodeCandleMessage(payload);
  if (!message) {
    ++decode_errors_;
    return;
  }
  ++received_;
  sink_(message->symbol, message->candle);
}

// -----------------------------------------------------------------------------
// decodeCandleMessage(): JSON -> CandleMessage
// -----------------------------------------------------------------------------
std::optional<CandleMessage> CandleFeedGateway::decodeCandleMessage(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    CandleMessage message;
    message.symbol = json.at("symbol").get<std::string>();
    message.candle.datetime_ms = json.at("timestamp_ms").get<std::int64_t>();
    message.candle.open = json.at("open").get<double>();
    message.candle.high = json.at("high").get<double>();
    message.candle.low = json.at("low").get<double>();
    message.candle.close = json.at("close").get<double>();
    message.candle.volume = json.at("volume").get<double>();
    return message;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CandleFeedGateway] JSON decode error: " << e.what()
              << " (payload: " << payload << ")\n";
    return std::nullopt;
  }
}

}  // namespace ordersim
