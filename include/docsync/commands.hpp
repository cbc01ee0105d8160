#pragma once

// docsync/commands.hpp — CLI command bodies that do not need argv.
//
// Each command writes its report to the given streams and returns the process
// exit code, so the CLI and the tests drive the same code.

#include <iosfwd>
#include <string>

namespace docsync {

// "VERIFIED: ok" plus the claim count on out (exit 0). Any failure is one
// "FAILED: <reason>" line on err (exit 1): pack not found, structural decode
// error, or a verify() failure.
int verify_command(const std::string& pack_path, std::ostream& out, std::ostream& err);

}  // namespace docsync
