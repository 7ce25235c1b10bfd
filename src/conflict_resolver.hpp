#pragma once

#include <functional>
#include <optional>
#include <string>

#include "conflict_detector.hpp"
#include "storage_resolver.hpp"

enum class ConflictResolution { SkipAll, OverrideAll, Cancel };

const char* conflict_resolution_label(ConflictResolution resolution);
// "skip" / "override" / "cancel"; "prompt" and anything else give nullopt.
std::optional<ConflictResolution> parse_conflict_policy(const std::string& text);

// Asked at most once per device per transfer session, with the full report.
class ConflictResolver {
public:
  virtual ~ConflictResolver() = default;
  virtual ConflictResolution request_resolution(const DeviceTarget& device,
                                                const ConflictReport& report) = 0;
};

class FixedConflictPolicy : public ConflictResolver {
public:
  explicit FixedConflictPolicy(ConflictResolution resolution) : resolution_(resolution) {}

  ConflictResolution request_resolution(const DeviceTarget&, const ConflictReport&) override {
    return resolution_;
  }

private:
  ConflictResolution resolution_;
};

// Prints the conflict table and reads one answer. End of input cancels.
class InteractiveConflictPrompt : public ConflictResolver {
public:
  using LineReader = std::function<std::optional<std::string>(const char* prompt)>;

  InteractiveConflictPrompt();
  explicit InteractiveConflictPrompt(LineReader reader);

  ConflictResolution request_resolution(const DeviceTarget& device,
                                        const ConflictReport& report) override;

  static std::optional<ConflictResolution> parse_answer(const std::string& answer);

private:
  LineReader reader_;
};

std::string format_conflict_table(const DeviceTarget& device, const ConflictReport& report);
