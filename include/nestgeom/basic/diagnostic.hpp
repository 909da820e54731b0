// nestgeom/basic/diagnostic.hpp - Diagnostics collected by tooling
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nestgeom
{

class NestError;

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E002"
  std::string message;
  std::string context;  // e.g., "tally 'pin_flux'" or a file name

  std::optional<std::string> help_message;
};

class DiagnosticBag;

/**
 * Builds a diagnostic with a fluent interface and registers it in the bag
 * when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_context(std::string context);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(std::string message);
  DiagnosticBuilder report_warning(std::string message);
  DiagnosticBuilder report_note(std::string message);

  /// Report a library error, carrying over its code.
  DiagnosticBuilder report(const NestError & error);

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;

  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace nestgeom
