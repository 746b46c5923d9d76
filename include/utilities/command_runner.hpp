#ifndef SITEBLOCKER_COMMAND_RUNNER_HPP
#define SITEBLOCKER_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

namespace siteblocker {

/**
 * @brief Outcome of one child process.
 */
struct CommandResult {
  int exitCode = -1;  ///< Exit status, or 128 + signal when killed.
  std::string output; ///< Combined stdout and stderr.
  bool spawned = false; ///< False when the program could not be started.
};

/**
 * @brief Runs external programs from an argument vector.
 *
 * The vector is handed to exec directly; nothing is interpreted by a shell
 * unless the caller names one as the program.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CommandResult run(const std::vector<std::string> &argv) = 0;
};

/** fork/execvp based runner that blocks until the child exits. */
class PosixCommandRunner : public CommandRunner {
public:
  CommandResult run(const std::vector<std::string> &argv) override;
};

/**
 * @brief Quote @p value for safe interpolation into a POSIX sh script.
 *
 * The result is wrapped in single quotes; embedded single quotes become
 * '\''.
 */
std::string shellQuote(const std::string &value);

/**
 * @brief Build the argv that runs @p script under `/bin/sh -c`.
 *
 * @p prefix (for example {"pkexec"}) is placed in front so the whole
 * script runs behind a single elevation prompt. An empty prefix runs the
 * script directly.
 */
std::vector<std::string> shellScriptArgv(const std::vector<std::string> &prefix,
                                         const std::string &script);

} // namespace siteblocker

#endif // SITEBLOCKER_COMMAND_RUNNER_HPP
