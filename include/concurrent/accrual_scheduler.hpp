#ifndef LEDGER_ACCRUAL_SCHEDULER_HPP_
#define LEDGER_ACCRUAL_SCHEDULER_HPP_

#include "interest_accrual_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace ledger {
namespace concurrent {

/**
 * Background thread that runs InterestAccrualEngine::accrueDaily() every
 * `interval`. Because accrual is keyed by calendar date, running more often
 * than once a day only credits accounts that have not been credited yet.
 */
class AccrualScheduler {
 public:
  AccrualScheduler(InterestAccrualEngine& engine, std::chrono::seconds interval);
  ~AccrualScheduler();

  // Non-copyable
  AccrualScheduler(const AccrualScheduler&) = delete;
  AccrualScheduler& operator=(const AccrualScheduler&) = delete;

  /**
   * Start the worker. The first run happens immediately.
   */
  bool start();

  /**
   * Stop the worker and wait for an in-flight run to finish.
   */
  void stop();

  bool isRunning() const { return running_.load(); }

  size_t completedRuns() const { return completed_runs_.load(); }

 private:
  void workerThread();

  InterestAccrualEngine& engine_;
  std::chrono::seconds interval_;
  std::atomic<bool> running_;
  std::atomic<size_t> completed_runs_;
  std::unique_ptr<std::thread> worker_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
};

}  // namespace concurrent
}  // namespace ledger

#endif  // LEDGER_ACCRUAL_SCHEDULER_HPP_
