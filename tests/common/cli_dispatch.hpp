#ifndef RECSYNC_TESTS_COMMON_CLI_DISPATCH_HPP_
#define RECSYNC_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "recsync/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace recsync::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return recsync::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs the router with stdout/stderr redirected into strings.
inline int DispatchWithCapturedOutput(const std::vector<std::string>& argv_storage,
                                      std::string& stdout_text, std::string& stderr_text) {
  std::ostringstream captured_cout;
  std::ostringstream captured_cerr;
  std::streambuf* original_cout = std::cout.rdbuf(captured_cout.rdbuf());
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());
  const int exit_code = DispatchArgs(argv_storage);
  std::cout.rdbuf(original_cout);
  std::cerr.rdbuf(original_cerr);

  stdout_text = captured_cout.str();
  stderr_text = captured_cerr.str();
  return exit_code;
}

} // namespace recsync::tests::common

#endif // RECSYNC_TESTS_COMMON_CLI_DISPATCH_HPP_
