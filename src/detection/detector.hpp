#ifndef DETECTOR_HPP
#define DETECTOR_HPP

#include "core/finding.hpp"
#include "core/log_entry.hpp"
#include "detection/rule.hpp"

#include <optional>

// One rule bound to its evaluation strategy. The engine calls evaluate once
// per event, in feed order.
class IDetector {
public:
  virtual ~IDetector() = default;

  virtual std::optional<Finding> evaluate(const LogEntry &event) = 0;
  virtual const Rule &rule() const = 0;
};

#endif // DETECTOR_HPP
