#include "utilities/command_runner.hpp"
#include "utilities/logger.h"

#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace siteblocker {

std::string shellQuote(const std::string &value) {
  std::string quoted = "'";
  for (char ch : value) {
    if (ch == '\'')
      quoted += "'\\''";
    else
      quoted.push_back(ch);
  }
  quoted += "'";
  return quoted;
}

std::vector<std::string> shellScriptArgv(const std::vector<std::string> &prefix,
                                         const std::string &script) {
  std::vector<std::string> argv(prefix);
  argv.push_back("/bin/sh");
  argv.push_back("-c");
  argv.push_back(script);
  return argv;
}

CommandResult PosixCommandRunner::run(const std::vector<std::string> &argv) {
  CommandResult result;
  if (argv.empty()) {
    result.output = "empty command";
    return result;
  }

  int fds[2];
  if (pipe(fds) != 0) {
    result.output = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    args.push_back(const_cast<char *>(arg.c_str()));
  args.push_back(nullptr);

  pid_t child = fork();
  if (child < 0) {
    result.output = std::string("fork failed: ") + std::strerror(errno);
    close(fds[0]);
    close(fds[1]);
    return result;
  }

  if (child == 0) {
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    close(fds[0]);
    close(fds[1]);
    execvp(args[0], args.data());
    const char *msg = "exec failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, std::strlen(msg));
    (void)ignored;
    _exit(127);
  }

  close(fds[1]);
  char buffer[4096];
  for (;;) {
    ssize_t n = read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      result.output.append(buffer, static_cast<std::size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  close(fds[0]);

  int status = 0;
  while (waitpid(child, &status, 0) < 0) {
    if (errno != EINTR) {
      result.output += std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }

  result.spawned = true;
  if (WIFEXITED(status))
    result.exitCode = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exitCode = 128 + WTERMSIG(status);

  Logger::debugf("Command %s exited with %d", argv[0].c_str(), result.exitCode);
  return result;
}

} // namespace siteblocker
