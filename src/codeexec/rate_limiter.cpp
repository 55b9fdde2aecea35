#include <codeexec/rate_limiter.h>

#include <spdlog/spdlog.h>
#include <codeexec/utils.h>

RateLimitError::RateLimitError(RateLimitReason reason) :
    std::runtime_error(RateLimitReasonDesc(reason)), reason_(reason) {}

size_t RateLimiter::Count_(const std::string& key, Clock::time_point now) {
  auto it = windows_.find(key);
  if (it == windows_.end()) return 0;
  auto& window = it->second;
  const auto start = now - std::chrono::milliseconds(limits_.window_ms);
  while (!window.empty() && window.front() <= start) window.pop_front();
  return window.size();
}

RateLimitReason RateLimiter::Admit(const std::string& user_id, const std::string& project_id,
                                   Clock::time_point now) {
  std::lock_guard lck(mtx_);
  const std::string user_key = "u:" + user_id;
  const std::string project_key = "p:" + project_id;
  if (Count_(user_key, now) >= (size_t)std::max(limits_.per_user, 0)) {
    spdlog::info("Rate limit: user {} exceeded {} per {} ms", user_id, limits_.per_user, limits_.window_ms);
    return RateLimitReason::USER_LIMIT;
  }
  if (!project_id.empty() &&
      Count_(project_key, now) >= (size_t)std::max(limits_.per_project, 0)) {
    spdlog::info("Rate limit: project {} exceeded {} per {} ms",
                 project_id, limits_.per_project, limits_.window_ms);
    return RateLimitReason::PROJECT_LIMIT;
  }
  windows_[user_key].push_back(now);
  if (!project_id.empty()) windows_[project_key].push_back(now);
  return RateLimitReason::ALLOWED;
}

void RateLimiter::Sweep(Clock::time_point now) {
  std::lock_guard lck(mtx_);
  size_t before = windows_.size();
  for (auto it = windows_.begin(); it != windows_.end();) {
    Count_(it->first, now);
    if (it->second.empty()) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
  spdlog::debug("Rate limiter sweep: {} -> {} keys", before, windows_.size());
}

void RateLimiter::SetLimits(const RateLimits& limits) {
  std::lock_guard lck(mtx_);
  limits_ = limits;
}

size_t RateLimiter::TrackedKeys() const {
  std::lock_guard lck(mtx_);
  return windows_.size();
}
