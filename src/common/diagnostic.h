#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace seqlogic {

enum class DiagSeverity : uint8_t {
  Note,
  Warning,
  Error,
  Fatal,
};

struct Diagnostic {
  DiagSeverity severity = DiagSeverity::Error;
  std::string component;
  std::string message;
};

struct DiagConfig {
  bool warnings_as_errors = false;
  // Echo target for every diagnostic. Null records without echoing.
  std::ostream* sink = &std::cerr;
};

class DiagEngine {
 public:
  DiagEngine() = default;
  explicit DiagEngine(DiagConfig config) : config_(config) {}

  void Note(std::string component, std::string msg);
  void Warning(std::string component, std::string msg);
  void Error(std::string component, std::string msg);
  void Fatal(std::string component, std::string msg);

  uint32_t error_count() const { return error_count_; }
  uint32_t warning_count() const { return warning_count_; }
  bool has_errors() const { return error_count_ > 0; }

  const std::vector<Diagnostic>& diagnostics() const { return diags_; }

  void set_warnings_as_errors(bool val) { config_.warnings_as_errors = val; }

 private:
  void Emit(DiagSeverity sev, std::string component, std::string msg);

  DiagConfig config_;
  std::vector<Diagnostic> diags_;
  uint32_t error_count_ = 0;
  uint32_t warning_count_ = 0;
};

const char* SeverityLabel(DiagSeverity sev);

}  // namespace seqlogic
