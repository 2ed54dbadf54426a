#include "ordersim/persistence/checkpoint.hpp"
#include "ordersim/persistence/json_codec.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace ordersim {

void to_json(nlohmann::json& j, const Checkpoint& checkpoint) {
  j = nlohmann::json{
      {"timestamp_ms", checkpoint.timestamp_ms},
      {"open_orders", checkpoint.open_orders},
      {"positions", checkpoint.positions},
      {"cash", checkpoint.cash},
  };
}

void from_json(const nlohmann::json& j, Checkpoint& checkpoint) {
  j.at("timestamp_ms").get_to(checkpoint.timestamp_ms);
  j.at("open_orders").get_to(checkpoint.open_orders);
  j.at("positions").get_to(checkpoint.positions);
  j.at("cash").get_to(checkpoint.cash);
}

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// save: write-to-temp then rename
// -----------------------------------------------------------------------------
bool CheckpointStore::save(const Checkpoint& checkpoint) const {
  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      std::cerr << "[CheckpointStore] Cannot open " << tmp_path
                << " for writing\n";
      return false;
    }
    out << nlohmann::json(checkpoint).dump(2);
    out.flush();
    if (!out) {
      std::cerr << "[CheckpointStore] Write to " << tmp_path << " failed\n";
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::cerr << "[CheckpointStore] Rename " << tmp_path << " -> " << path_
              << " failed: " << ec.message() << "\n";
    std::filesystem::remove(tmp_path, ec);
    return false;
  }

  std::cout << "[CheckpointStore] Saved checkpoint at "
            << checkpoint.timestamp_ms << " ("
            << checkpoint.open_orders.size() << " open orders, "
            << checkpoint.positions.size() << " positions) to " << path_
            << "\n";
  return true;
}

std::optional<Checkpoint> CheckpointStore::load() const {
  std::ifstream in(path_);
  if (!in) {
    return std::nullopt;
  }

  try {
    nlohmann::json document;
    in >> document;
    return document.get<Checkpoint>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CheckpointStore] Cannot read " << path_ << ": "
              << e.what() << "\n";
    return std::nullopt;
  }
}

bool CheckpointStore::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

CheckpointReconciler::CheckpointReconciler(const CheckpointStore& store)
    : store_(store) {}

const Checkpoint* CheckpointReconciler::checkpoint() {
  if (!loaded_) {
    checkpoint_ = store_.load();
    loaded_ = true;
  }
  return checkpoint_ ? &*checkpoint_ : nullptr;
}

std::vector<domain::Position> CheckpointReconciler::reconcilePositions() {
  const Checkpoint* cp = checkpoint();
  return cp ? cp->positions : std::vector<domain::Position>{};
}

std::vector<domain::Order> CheckpointReconciler::reconcileOrders() {
  const Checkpoint* cp = checkpoint();
  return cp ? cp->open_orders : std::vector<domain::Order>{};
}

std::optional<double> CheckpointReconciler::reconcileCash() {
  const Checkpoint* cp = checkpoint();
  if (cp == nullptr) {
    return std::nullopt;
  }
  return cp->cash;
}

}  // namespace ordersim
