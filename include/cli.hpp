#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace pfv {

constexpr int kExitPass = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitFail = 2;

// Runs `pfverify` over `args` (program name excluded). Reports go to `out`,
// diagnostics and the optional audit line to `err`. Returns the exit code:
// kExitPass, kExitFail, or kExitInvalid for rejected input.
int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace pfv
