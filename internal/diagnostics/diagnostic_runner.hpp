#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace portwatch::diagnostics {

struct DiagnosticOptions {
  std::string               command = "witr";
  std::chrono::milliseconds timeout{2000};
  std::size_t               max_output_bytes = 64 * 1024;
};

struct DiagnosticResult {
  std::string output;
  bool        error     = false;
  bool        timed_out = false;
  int         exit_code = -1; // -1 when the child did not exit normally
};

/*
  Runs the external inspection tool for one port.

  The tool is exec'd directly (no shell) with "--port <port>", stdout and
  stderr are merged, and the child is killed once the timeout expires.
  Every failure, including a missing binary, comes back as a result with
  error set; Inspect() never throws.
*/
class DiagnosticRunner {
 public:
  explicit DiagnosticRunner(DiagnosticOptions options);

  DiagnosticResult Inspect(uint16_t port) const;

  const DiagnosticOptions& Options() const {
    return options_;
  }

 private:
  DiagnosticResult Execute(const std::vector<std::string>& argv) const;

  DiagnosticOptions options_;
};

} // namespace portwatch::diagnostics
