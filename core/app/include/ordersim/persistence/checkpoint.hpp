#pragma once

#include "ordersim/domain/order.hpp"
#include "ordersim/domain/position.hpp"
#include "ordersim/risk/i_reconciler.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ordersim {

// -----------------------------------------------------------------------------
// Checkpoint — resumable state of one Backtester
// -----------------------------------------------------------------------------
// timestamp_ms  bar time of the last processed candle (0 if none)
// open_orders   every Working / PartiallyFilled order, ascending sequence_no
// positions     every position record, ordered by symbol
// cash          cash balance at the checkpoint
// -----------------------------------------------------------------------------
struct Checkpoint {
  std::int64_t timestamp_ms{0};
  std::vector<domain::Order> open_orders;
  std::vector<domain::Position> positions;
  double cash{0.0};
};

void to_json(nlohmann::json& j, const Checkpoint& checkpoint);
void from_json(const nlohmann::json& j, Checkpoint& checkpoint);

// -----------------------------------------------------------------------------
// CheckpointStore — one JSON checkpoint file
// -----------------------------------------------------------------------------
//
// @brief  Saves and loads a Checkpoint as a single atomic unit.
//
// @details
// save() writes "<path>.tmp" and renames it over <path>. A reader therefore
// sees either the previous checkpoint or the new one, never a partial file.
//
// Failures are reported as values and logged on std::cerr: save() returns
// false, load() returns std::nullopt. A missing file is not an error for
// load(); it simply yields std::nullopt.
//
// Thread model:
//   Not synchronized. One store per file, used from one thread.
// -----------------------------------------------------------------------------
class CheckpointStore {
 public:
  explicit CheckpointStore(std::string path);

  bool save(const Checkpoint& checkpoint) const;

  std::optional<Checkpoint> load() const;

  bool exists() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// -----------------------------------------------------------------------------
// CheckpointReconciler — IReconciler backed by a CheckpointStore
// -----------------------------------------------------------------------------
// Loads the checkpoint lazily on first use. Without a readable checkpoint
// every method reports empty state, so restore() starts flat.
// -----------------------------------------------------------------------------
class CheckpointReconciler : public IReconciler {
 public:
  explicit CheckpointReconciler(const CheckpointStore& store);

  std::vector<domain::Position> reconcilePositions() override;
  std::vector<domain::Order> reconcileOrders() override;
  std::optional<double> reconcileCash() override;

 private:
  const Checkpoint* checkpoint();

  const CheckpointStore& store_;
  bool loaded_{false};
  std::optional<Checkpoint> checkpoint_;
};

}  // namespace ordersim
