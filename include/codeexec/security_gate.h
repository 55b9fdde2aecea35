#ifndef INCLUDE_CODEEXEC_SECURITY_GATE_H_
#define INCLUDE_CODEEXEC_SECURITY_GATE_H_

#include <regex>
#include <memory>
#include <stdexcept>

#include "job.h"
#include "policy.h"
#include "runtime_registry.h"

#define ENUM_VALIDATION_ERROR_KIND_ \
  X(EMPTY_CODE) \
  X(MISSING_USER) \
  X(CODE_TOO_LARGE) \
  X(UNSUPPORTED_LANGUAGE) \
  X(BLOCKED_PATTERN) \
  X(INVALID_PATH) \
  X(INVALID_LIMIT) \
  X(INVALID_DEPENDENCY) \
  X(INVALID_ID) \
  X(DUPLICATE_ID)
enum class ValidationErrorKind {
#define X(name) name,
  ENUM_VALIDATION_ERROR_KIND_
#undef X
};

class ValidationError : public std::runtime_error {
  ValidationErrorKind kind_;
 public:
  ValidationError(ValidationErrorKind kind, const std::string& msg) :
      std::runtime_error(msg), kind_(kind) {}
  ValidationErrorKind Kind() const { return kind_; }
};

// Immutable after construction; one instance per policy snapshot.
class SecurityGate {
  struct CompiledPattern {
    std::regex re;
    std::string pattern_class;
  };
  std::shared_ptr<const SecurityPolicy> policy_;
  const RuntimeRegistry& registry_;
  std::map<std::string, std::vector<CompiledPattern>> patterns_;

  void CheckPath_(const std::string& path, const char* what) const;
 public:
  SecurityGate(std::shared_ptr<const SecurityPolicy> policy, const RuntimeRegistry& registry);

  // throws ValidationError
  JobConfig Validate(const ExecutionRequest& request) const;
  const SecurityPolicy& Policy() const { return *policy_; }
};

#endif  // INCLUDE_CODEEXEC_SECURITY_GATE_H_
