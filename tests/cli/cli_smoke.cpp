#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct CapturedRun {
  int exit_code = 0;
  std::string out;
  std::string err;
};

CapturedRun Run(const std::vector<std::string>& args) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = hwbridge::tests::common::DispatchArgs(args);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  return {exit_code, captured_out.str(), captured_err.str()};
}

void WriteFile(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary);
  out << text;
}

void ExpectExit(const CapturedRun& run, int expected, const std::string& label) {
  if (run.exit_code != expected) {
    hwbridge::tests::common::Fail(label + ": expected exit " + std::to_string(expected) +
                                  ", got " + std::to_string(run.exit_code) + "\nstderr: " +
                                  run.err);
  }
}

} // namespace

int main() {
  using hwbridge::tests::common::AssertContains;

  const fs::path temp_root = hwbridge::tests::common::CreateUniqueTempDir("hwbridge-cli-smoke");

  {
    const CapturedRun run = Run({"hwbridge", "version"});
    ExpectExit(run, 0, "version");
    AssertContains(run.out, "hwbridge 1.0.0");
  }
  {
    const CapturedRun run = Run({"hwbridge"});
    ExpectExit(run, 2, "no subcommand");
    AssertContains(run.err, "usage:");
  }
  {
    const CapturedRun run = Run({"hwbridge", "frobnicate"});
    ExpectExit(run, 2, "unknown subcommand");
    AssertContains(run.err, "unknown subcommand: frobnicate");
  }

  // init-config writes a config that validates, and refuses to clobber it.
  const fs::path config_path = temp_root / "config.json";
  {
    const CapturedRun run = Run({"hwbridge", "init-config", config_path.string()});
    ExpectExit(run, 0, "init-config");
    AssertContains(run.out, "wrote:");
    AssertContains(hwbridge::tests::common::ReadFileToString(config_path), "\"allowedOrigins\"");
  }
  {
    const CapturedRun run = Run({"hwbridge", "init-config", config_path.string()});
    ExpectExit(run, 1, "init-config overwrite");
    AssertContains(run.err, "refusing to overwrite");
  }
  {
    const CapturedRun run = Run({"hwbridge", "validate-config", config_path.string()});
    ExpectExit(run, 0, "validate-config");
    AssertContains(run.out, "valid: ");
  }
  {
    const CapturedRun run =
        Run({"hwbridge", "validate-config", (temp_root / "missing.json").string()});
    ExpectExit(run, 1, "validate-config missing");
    AssertContains(run.err, "config file not found");
  }

  // Every problem is listed with its path.
  const fs::path bad_config = temp_root / "bad.json";
  WriteFile(bad_config, "{\n"
                        "  \"useTls\": true,\n"
                        "  \"logLevel\": \"chatty\",\n"
                        "  \"colour\": \"blue\"\n"
                        "}\n");
  {
    const CapturedRun run = Run({"hwbridge", "validate-config", bad_config.string()});
    ExpectExit(run, 10, "validate-config invalid");
    AssertContains(run.err, "invalid config:");
    AssertContains(run.err, "certPath:");
    AssertContains(run.err, "logLevel:");
    AssertContains(run.err, "colour: unknown key");
  }
  {
    const CapturedRun run = Run({"hwbridge", "serve", "--config", bad_config.string()});
    ExpectExit(run, 10, "serve invalid config");
  }
  {
    const CapturedRun run = Run({"hwbridge", "serve", "--port", "99999"});
    ExpectExit(run, 2, "serve bad port");
    AssertContains(run.err, "--port must be an integer");
  }
  {
    const CapturedRun run = Run({"hwbridge", "serve", "--log-level", "loud"});
    ExpectExit(run, 2, "serve bad log level");
  }

  // call: usage errors before dialing, connection failures after.
  {
    const CapturedRun run = Run({"hwbridge", "call"});
    ExpectExit(run, 2, "call without method");
  }
  {
    const CapturedRun run = Run({"hwbridge", "call", "system.getInfo", "{not json"});
    ExpectExit(run, 2, "call bad params");
    AssertContains(run.err, "params-json is not valid JSON");
  }
  {
    const CapturedRun run = Run({"hwbridge", "call", "system.getInfo", "--url",
                                 "ws://127.0.0.1:1", "--timeout-ms", "1000"});
    ExpectExit(run, 30, "call unreachable gateway");
  }
  {
    const CapturedRun run =
        Run({"hwbridge", "call", "system.getInfo", "--url", "http://127.0.0.1:1"});
    ExpectExit(run, 30, "call bad url scheme");
  }

  hwbridge::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}
