#include "internal/diagnostics/diagnostic_runner.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

namespace fs = std::filesystem;

using portwatch::diagnostics::DiagnosticOptions;
using portwatch::diagnostics::DiagnosticRunner;

fs::path WriteScript(const std::string& name, const std::string& body) {
  const auto dir = fs::temp_directory_path() / "portwatch_diagnostic_tests";
  fs::create_directories(dir);

  const auto path = dir / name;
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\n" << body << "\n";
  }
  fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read);
  return path;
}

DiagnosticOptions Options(const std::string& command) {
  DiagnosticOptions options;
  options.command = command;
  options.timeout = std::chrono::milliseconds(2000);
  return options;
}

void TestPassesPortAndCapturesOutput() {
  DiagnosticRunner runner(Options("echo"));
  const auto       result = runner.Inspect(8080);
  assert(!result.error);
  assert(!result.timed_out);
  assert(result.exit_code == 0);
  assert(result.output == "--port 8080\n");
}

void TestStderrIsMerged() {
  const auto script = WriteScript("stderr.sh", "echo out\necho err 1>&2");
  DiagnosticRunner runner(Options(script.string()));
  const auto       result = runner.Inspect(22);
  assert(!result.error);
  assert(result.output.find("out") != std::string::npos);
  assert(result.output.find("err") != std::string::npos);
}

void TestMissingBinary() {
  DiagnosticRunner runner(Options("portwatch-no-such-inspector"));
  const auto       result = runner.Inspect(22);
  assert(result.error);
  assert(result.output == "portwatch-no-such-inspector not found on path");
}

void TestNonZeroExitIsAnError() {
  const auto script = WriteScript("fails.sh", "echo partial\nexit 3");
  DiagnosticRunner runner(Options(script.string()));
  const auto       result = runner.Inspect(22);
  assert(result.error);
  assert(result.exit_code == 3);
  assert(result.output == "partial\n\nError: exit status 3");
}

void TestTimeoutFailsClosed() {
  const auto script = WriteScript("hangs.sh", "echo started\nexec sleep 30");

  auto options    = Options(script.string());
  options.timeout = std::chrono::milliseconds(300);
  DiagnosticRunner runner(options);

  const auto started = std::chrono::steady_clock::now();
  const auto result  = runner.Inspect(22);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(result.error);
  assert(result.timed_out);
  assert(result.output.find("timed out after 300 ms") != std::string::npos);
  assert(elapsed < std::chrono::seconds(10));
}

void TestOutputIsCapped() {
  const auto script = WriteScript("chatty.sh", "head -c 100000 /dev/zero | tr '\\000' x");

  auto options             = Options(script.string());
  options.max_output_bytes = 1024;
  DiagnosticRunner runner(options);

  const auto result = runner.Inspect(22);
  assert(!result.error);
  assert(result.output.size() == 1024 + std::string("\n[output truncated]").size());
  assert(result.output.compare(0, 4, "xxxx") == 0);
  assert(result.output.find("[output truncated]") != std::string::npos);
}

} // namespace

int main() {
  TestPassesPortAndCapturesOutput();
  TestStderrIsMerged();
  TestMissingBinary();
  TestNonZeroExitIsAnError();
  TestTimeoutFailsClosed();
  TestOutputIsCapped();

  std::cout << "portwatch_unit_diagnostic_runner: pass\n";
  return 0;
}
