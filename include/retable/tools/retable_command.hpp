#pragma once

#include <iosfwd>

namespace retable::tools {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitParseError = 1;
inline constexpr int kExitUsageError = 2;

// Runs the retable command line. The rewritten SQL goes to `out`; diagnostics,
// warnings and the --log-json report go to `err`. SQL is read from `in` when
// neither --sql nor --file is given. Returns the process exit code.
int run_retable_command(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace retable::tools
