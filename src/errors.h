// errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace fsched {

// Malformed request. Carries every violated field, not only the first one.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(std::vector<std::string> violations)
      : std::runtime_error(join(violations)), violations_(std::move(violations)) {}

  const std::vector<std::string>& violations() const { return violations_; }

 private:
  static std::string join(const std::vector<std::string>& v) {
    std::string out = "validation failed:";
    for (const auto& s : v) out += " [" + s + "]";
    return out;
  }
  std::vector<std::string> violations_;
};

// Another schedule-mutating operation holds the tenant lease. Retryable.
class BusyError : public std::runtime_error {
 public:
  explicit BusyError(const std::string& tenant)
      : std::runtime_error("tenant busy: " + tenant), tenant_(tenant) {}
  const std::string& tenant() const { return tenant_; }
  bool retryable() const { return true; }

 private:
  std::string tenant_;
};

class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace fsched
