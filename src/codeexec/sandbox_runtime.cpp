#include <codeexec/sandbox_runtime.h>

bool JobControl::Arm(std::function<void()> interrupt) {
  std::lock_guard lck(mtx_);
  if (stopped_) return false;
  interrupt_ = std::move(interrupt);
  return true;
}

void JobControl::Disarm() {
  std::lock_guard lck(mtx_);
  interrupt_ = nullptr;
}

void JobControl::Stop() {
  std::lock_guard lck(mtx_);
  if (stopped_) return;
  stopped_ = true;
  if (interrupt_) {
    interrupt_();
    interrupt_ = nullptr;
  }
}

bool JobControl::Stopped() const {
  std::lock_guard lck(mtx_);
  return stopped_;
}
