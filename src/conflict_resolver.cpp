#include "conflict_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "log.hpp"

namespace {

std::string normalize(std::string value) {
  value.erase(std::remove_if(value.begin(), value.end(),
                             [](unsigned char ch){ return std::isspace(ch); }),
              value.end());
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string human_size(std::optional<uint64_t> bytes) {
  if(!bytes) return "?";
  static const char* units[] = {"B", "KB", "MB", "GB"};
  double value = static_cast<double>(*bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
  return out.str();
}

std::optional<std::string> read_terminal_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  std::free(line);
  return result;
#else
  std::cout << prompt << std::flush;
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

} // namespace

const char* conflict_resolution_label(ConflictResolution resolution) {
  switch(resolution) {
    case ConflictResolution::SkipAll: return "skip";
    case ConflictResolution::OverrideAll: return "override";
    case ConflictResolution::Cancel: return "cancel";
  }
  return "unknown";
}

std::optional<ConflictResolution> parse_conflict_policy(const std::string& text) {
  auto value = normalize(text);
  if(value == "skip") return ConflictResolution::SkipAll;
  if(value == "override") return ConflictResolution::OverrideAll;
  if(value == "cancel") return ConflictResolution::Cancel;
  return std::nullopt;
}

std::string format_conflict_table(const DeviceTarget& device, const ConflictReport& report) {
  std::size_t width = 8;
  for(const auto& conflict : report.conflicts) {
    width = std::max(width, conflict.filename.size());
  }
  std::ostringstream out;
  out << report.conflicts.size() << " file(s) already exist on " << device.serial
      << " (" << device_role_label(device.role) << ", " << device.base_path << "):\n";
  out << "  " << std::left << std::setw(static_cast<int>(width)) << "File"
      << "  " << std::setw(8) << "Class"
      << "  " << std::setw(10) << "Local"
      << "  " << "Remote" << "\n";
  for(const auto& conflict : report.conflicts) {
    out << "  " << std::left << std::setw(static_cast<int>(width)) << conflict.filename
        << "  " << std::setw(8) << asset_class_label(conflict.asset_class)
        << "  " << std::setw(10) << human_size(conflict.local_size)
        << "  " << human_size(conflict.remote_size) << "\n";
  }
  return out.str();
}

InteractiveConflictPrompt::InteractiveConflictPrompt()
  : reader_(read_terminal_line) {}

InteractiveConflictPrompt::InteractiveConflictPrompt(LineReader reader)
  : reader_(reader ? std::move(reader) : LineReader(read_terminal_line)) {}

std::optional<ConflictResolution> InteractiveConflictPrompt::parse_answer(const std::string& answer) {
  auto value = normalize(answer);
  if(value == "s" || value == "skip" || value == "skipall") return ConflictResolution::SkipAll;
  if(value == "o" || value == "override" || value == "overrideall" || value == "overwrite") {
    return ConflictResolution::OverrideAll;
  }
  if(value == "c" || value == "cancel") return ConflictResolution::Cancel;
  return std::nullopt;
}

ConflictResolution InteractiveConflictPrompt::request_resolution(const DeviceTarget& device,
                                                                 const ConflictReport& report) {
  print_out(nullptr, "{}", format_conflict_table(device, report));
  for(;;) {
    auto line = reader_("[s]kip all, [o]verride all, [c]ancel device: ");
    if(!line) {
      print_err(nullptr, "No answer, cancelling transfer to {}", device.serial);
      return ConflictResolution::Cancel;
    }
    if(auto answer = parse_answer(*line)) return *answer;
    print_err(nullptr, "Please answer s, o or c");
  }
}
