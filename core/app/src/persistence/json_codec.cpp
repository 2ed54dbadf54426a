#include "ordersim/persistence/json_codec.hpp"

#include <optional>
#include <string>

namespace ordersim {
namespace domain {

namespace {

nlohmann::json optionalPrice(const std::optional<double>& price) {
  return price ? nlohmann::json(*price) : nlohmann::json(nullptr);
}

std::optional<double> readOptionalPrice(const nlohmann::json& j,
                                        const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

}  // namespace

void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{
      {"id", order.id},
      {"client_id", order.client_id},
      {"strategy_id", order.strategy_id},
      {"symbol", order.symbol},
      {"side", order.side},
      {"kind", order.kind},
      {"quantity", order.quantity},
      {"limit_price", optionalPrice(order.limit_price)},
      {"stop_price", optionalPrice(order.stop_price)},
      {"time_in_force", order.time_in_force},
      {"expire_at_ms", order.expire_at_ms},
      {"state", order.state},
      {"filled_quantity", order.filled_quantity},
      {"avg_fill_price", order.avg_fill_price},
      {"sequence_no", order.sequence_no},
      {"created_at_ms", order.created_at_ms},
      {"updated_at_ms", order.updated_at_ms},
      {"stop_triggered", order.stop_triggered},
  };
  j["session_day"] = order.session_day.has_value()
                         ? nlohmann::json(*order.session_day)
                         : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, Order& order) {
  j.at("id").get_to(order.id);
  order.client_id = j.value("client_id", std::string{});
  order.strategy_id = j.value("strategy_id", std::string{});
  j.at("symbol").get_to(order.symbol);
  j.at("side").get_to(order.side);
  j.at("kind").get_to(order.kind);
  j.at("quantity").get_to(order.quantity);
  order.limit_price = readOptionalPrice(j, "limit_price");
  order.stop_price = readOptionalPrice(j, "stop_price");
  j.at("time_in_force").get_to(order.time_in_force);
  order.expire_at_ms = j.value("expire_at_ms", std::int64_t{0});
  j.at("state").get_to(order.state);
  order.filled_quantity = j.value("filled_quantity", 0.0);
  order.avg_fill_price = j.value("avg_fill_price", 0.0);
  j.at("sequence_no").get_to(order.sequence_no);
  order.created_at_ms = j.value("created_at_ms", std::int64_t{0});
  order.updated_at_ms = j.value("updated_at_ms", std::int64_t{0});
  order.stop_triggered = j.value("stop_triggered", false);
  if (j.contains("session_day") && !j.at("session_day").is_null()) {
    order.session_day = j.at("session_day").get<std::int64_t>();
  }
}

void to_json(nlohmann::json& j, const Position& position) {
  j = nlohmann::json{
      {"symbol", position.symbol},
      {"quantity", position.quantity},
      {"average_entry_price", position.average_entry_price},
      {"realized_pnl", position.realized_pnl},
      {"total_commission", position.total_commission},
      {"last_price", position.last_price},
      {"opened_at_ms", position.opened_at_ms},
      {"updated_at_ms", position.updated_at_ms},
  };
}

void from_json(const nlohmann::json& j, Position& position) {
  j.at("symbol").get_to(position.symbol);
  j.at("quantity").get_to(position.quantity);
  j.at("average_entry_price").get_to(position.average_entry_price);
  position.realized_pnl = j.value("realized_pnl", 0.0);
  position.total_commission = j.value("total_commission", 0.0);
  position.last_price = j.value("last_price", 0.0);
  position.opened_at_ms = j.value("opened_at_ms", std::int64_t{0});
  position.updated_at_ms = j.value("updated_at_ms", std::int64_t{0});
  position.unrealized_pnl = 0.0;
}

void to_json(nlohmann::json& j, const Candle& candle) {
  j = nlohmann::json{
      {"timestamp_ms", candle.datetime_ms},
      {"open", candle.open},
      {"high", candle.high},
      {"low", candle.low},
      {"close", candle.close},
      {"volume", candle.volume},
  };
}

void from_json(const nlohmann::json& j, Candle& candle) {
  j.at("timestamp_ms").get_to(candle.datetime_ms);
  j.at("open").get_to(candle.open);
  j.at("high").get_to(candle.high);
  j.at("low").get_to(candle.low);
  j.at("close").get_to(candle.close);
  j.at("volume").get_to(candle.volume);
}

}  // namespace domain
}  // namespace ordersim
