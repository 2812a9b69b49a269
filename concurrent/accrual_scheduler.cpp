#include "concurrent/accrual_scheduler.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"

namespace ledger {
namespace concurrent {

AccrualScheduler::AccrualScheduler(InterestAccrualEngine& engine, std::chrono::seconds interval)
    : engine_(engine), interval_(interval), running_(false), completed_runs_(0) {
}

AccrualScheduler::~AccrualScheduler() {
  stop();
}

bool AccrualScheduler::start() {
  if (running_) return true;
  if (interval_.count() <= 0) {
    LEDGER_LOG_ERROR("Accrual interval must be positive");
    return false;
  }

  running_ = true;
  worker_ = std::make_unique<std::thread>(&AccrualScheduler::workerThread, this);

  LEDGER_LOG_INFO("Accrual scheduler started, interval " + std::to_string(interval_.count()) +
                  "s");
  return true;
}

void AccrualScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!running_) return;
    running_ = false;
  }
  wake_.notify_all();

  if (worker_ && worker_->joinable()) {
    worker_->join();
  }
  worker_.reset();

  LEDGER_LOG_INFO("Accrual scheduler stopped");
}

void AccrualScheduler::workerThread() {
  while (running_) {
    try {
      engine_.accrueDaily();
    } catch (const LedgerError& e) {
      // Listing failed; nothing was credited. Try again next tick.
      LEDGER_LOG_ERROR(std::string("Scheduled accrual failed: ") + e.kindName() + ": " + e.what());
    }
    completed_runs_.fetch_add(1);

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
  }
}

}  // namespace concurrent
}  // namespace ledger
