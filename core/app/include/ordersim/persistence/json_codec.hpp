#pragma once

#include "ordersim/domain/candle.hpp"
#include "ordersim/domain/order.hpp"
#include "ordersim/domain/position.hpp"

#include <nlohmann/json.hpp>

namespace ordersim {
namespace domain {

// JSON mapping of the domain value types, found by nlohmann::json through
// ADL. Enums are written by name; absent optional prices are written as null.

NLOHMANN_JSON_SERIALIZE_ENUM(Side, {
    {Side::Buy, "Buy"},
    {Side::Sell, "Sell"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderKind, {
    {OrderKind::Market, "Market"},
    {OrderKind::Limit, "Limit"},
    {OrderKind::Stop, "Stop"},
    {OrderKind::StopLimit, "StopLimit"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TimeInForce, {
    {TimeInForce::GTC, "GTC"},
    {TimeInForce::Day, "Day"},
    {TimeInForce::GTD, "GTD"},
    {TimeInForce::IOC, "IOC"},
    {TimeInForce::FOK, "FOK"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderState, {
    {OrderState::New, "New"},
    {OrderState::Working, "Working"},
    {OrderState::PartiallyFilled, "PartiallyFilled"},
    {OrderState::Filled, "Filled"},
    {OrderState::Cancelled, "Cancelled"},
    {OrderState::Rejected, "Rejected"},
    {OrderState::Expired, "Expired"},
})

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const Candle& candle);
void from_json(const nlohmann::json& j, Candle& candle);

}  // namespace domain
}  // namespace ordersim
