#ifndef INCLUDE_CODEEXEC_RATE_LIMITER_H_
#define INCLUDE_CODEEXEC_RATE_LIMITER_H_

#include <deque>
#include <mutex>
#include <chrono>
#include <string>
#include <stdexcept>
#include <unordered_map>

#include "policy.h"

#define ENUM_RATE_LIMIT_REASON_ \
  X(ALLOWED, "Allowed") \
  X(USER_LIMIT, "User rate limit exceeded") \
  X(PROJECT_LIMIT, "Project rate limit exceeded")
enum class RateLimitReason {
#define X(name, desc) name,
  ENUM_RATE_LIMIT_REASON_
#undef X
};

class RateLimitError : public std::runtime_error {
  RateLimitReason reason_;
 public:
  explicit RateLimitError(RateLimitReason reason);
  RateLimitReason Reason() const { return reason_; }
};

// Sliding-window admission counter keyed by user and by project.
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
 private:
  mutable std::mutex mtx_;
  RateLimits limits_;
  // keys are prefixed with "u:" / "p:"
  std::unordered_map<std::string, std::deque<Clock::time_point>> windows_;

  size_t Count_(const std::string& key, Clock::time_point now);
 public:
  explicit RateLimiter(const RateLimits& limits) : limits_(limits) {}

  // check-and-record; records nothing on rejection
  RateLimitReason Admit(const std::string& user_id, const std::string& project_id,
                        Clock::time_point now = Clock::now());
  // drop expired timestamps and forget empty keys
  void Sweep(Clock::time_point now = Clock::now());
  void SetLimits(const RateLimits& limits);
  size_t TrackedKeys() const;
};

#endif  // INCLUDE_CODEEXEC_RATE_LIMITER_H_
