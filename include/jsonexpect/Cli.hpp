/**
 * @file Cli.hpp
 * @brief Command-line front end
 *
 * ```
 * jsonexpect EXPECTED ACTUAL [options]
 * ```
 *
 * EXPECTED and ACTUAL are .json or .toml documents; any other file is
 * read as text (JSON if it parses, a string otherwise).
 *
 * Option sources are applied in this order, later ones overriding:
 * --mode, then --rules, then the per-path flags, then --element-count.
 *
 * Exit codes: 0 documents match, 1 mismatch, 2 usage or input error.
 */

#ifndef JSONEXPECT_CLI_HPP
#define JSONEXPECT_CLI_HPP

#include <ostream>

namespace jsonexpect {

constexpr int kExitMatch = 0;
constexpr int kExitMismatch = 1;
constexpr int kExitError = 2;

/**
 * @brief Run the command line tool
 *
 * @param argc Argument count, including the program name
 * @param argv Arguments
 * @param out Stream for results
 * @param err Stream for diagnostics
 * @return Process exit code
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace jsonexpect

#endif // JSONEXPECT_CLI_HPP
