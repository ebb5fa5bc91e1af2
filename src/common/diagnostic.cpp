#include "common/diagnostic.h"

#include <format>

namespace seqlogic {

const char* SeverityLabel(DiagSeverity sev) {
  switch (sev) {
    case DiagSeverity::Note:
      return "note";
    case DiagSeverity::Warning:
      return "warning";
    case DiagSeverity::Error:
      return "error";
    case DiagSeverity::Fatal:
      return "fatal error";
  }
  return "unknown";
}

void DiagEngine::Note(std::string component, std::string msg) {
  Emit(DiagSeverity::Note, std::move(component), std::move(msg));
}

void DiagEngine::Warning(std::string component, std::string msg) {
  if (config_.warnings_as_errors) {
    Emit(DiagSeverity::Error, std::move(component), std::move(msg));
    return;
  }
  Emit(DiagSeverity::Warning, std::move(component), std::move(msg));
}

void DiagEngine::Error(std::string component, std::string msg) {
  Emit(DiagSeverity::Error, std::move(component), std::move(msg));
}

void DiagEngine::Fatal(std::string component, std::string msg) {
  Emit(DiagSeverity::Fatal, std::move(component), std::move(msg));
}

void DiagEngine::Emit(DiagSeverity sev, std::string component,
                      std::string msg) {
  if (sev == DiagSeverity::Error || sev == DiagSeverity::Fatal) {
    ++error_count_;
  } else if (sev == DiagSeverity::Warning) {
    ++warning_count_;
  }

  if (config_.sink != nullptr) {
    *config_.sink << std::format("{}: {}: {}\n", component,
                                 SeverityLabel(sev), msg);
  }

  diags_.push_back({sev, std::move(component), std::move(msg)});
}

}  // namespace seqlogic
