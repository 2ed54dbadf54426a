#include "ordersim/engine/parallel_runner.hpp"
#include "ordersim/concurrent/thread_safe_queue.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace ordersim {

ParallelRunner::ParallelRunner(const StrategyRegistry& registry,
                               std::size_t workers)
    : registry_(registry),
      workers_(workers != 0
                   ? workers
                   : std::max<std::size_t>(1, std::thread::hardware_concurrency())) {}

std::vector<BacktestResult> ParallelRunner::run(
    const CandleHistory& history,
    const std::vector<BacktestConfig>& configs) const {
  std::vector<BacktestResult> results(configs.size());
  std::vector<std::exception_ptr> errors(configs.size());
  if (configs.empty()) {
    return results;
  }

  ThreadSafeQueue<std::size_t> jobs;
  for (std::size_t i = 0; i < configs.size(); ++i) {
    jobs.push(i);
  }
  jobs.close();

  const std::size_t thread_count = std::min(workers_, configs.size());
  std::cout << "[ParallelRunner] " << configs.size() << " run(s) on "
            << thread_count << " worker(s)\n";

  // Each slot of results/errors is written by exactly one worker.
  auto worker = [&]() {
    while (auto job = jobs.pop()) {
      const std::size_t index = *job;
      try {
        Backtester backtester(configs[index], registry_);
        results[index] = backtester.run(history);
      } catch (...) {
        errors[index] = std::current_exception();
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (errors[i]) {
      std::cerr << "[ParallelRunner] Run " << i << " failed\n";
      std::rethrow_exception(errors[i]);
    }
  }
  return results;
}

}  // namespace ordersim
