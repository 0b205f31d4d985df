#ifndef AGENTWATCH_TESTS_COMMON_CLI_DISPATCH_HPP_
#define AGENTWATCH_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "agentwatch/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace agentwatch::tests::common {

struct CliResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Runs one `agentwatch` invocation in-process with stdout and stderr captured.
// `argv_storage` excludes the program name.
inline CliResult RunCli(const std::vector<std::string>& argv_storage) {
  std::vector<std::string> args = {"agentwatch"};
  args.insert(args.end(), argv_storage.begin(), argv_storage.end());

  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = agentwatch::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);

  return CliResult{
      .exit_code = exit_code,
      .out = captured_out.str(),
      .err = captured_err.str(),
  };
}

} // namespace agentwatch::tests::common

#endif // AGENTWATCH_TESTS_COMMON_CLI_DISPATCH_HPP_
