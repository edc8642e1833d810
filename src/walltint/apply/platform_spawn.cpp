#include "walltint/apply/platform_spawn.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace walltint::apply
{

  ProcessResult runAndWait(const std::string &exePath, const std::vector<std::string> &args,
                           std::string *outError)
  {
    ProcessResult res;

    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(exePath.c_str()));
    for (const auto &a : args)
      argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
      if (outError)
        *outError = std::string("fork failed: ") + std::strerror(errno);
      return res;
    }

    if (pid == 0)
    {
      // Child
      int devNull = ::open("/dev/null", O_RDONLY);
      if (devNull >= 0)
      {
        ::dup2(devNull, STDIN_FILENO);
        ::close(devNull);
      }
      ::execv(exePath.c_str(), argv.data());
      _exit(127);
    }

    // Parent
    res.started = true;
    int status = 0;
    for (;;)
    {
      pid_t r = ::waitpid(pid, &status, 0);
      if (r == pid)
        break;
      if (r < 0 && errno == EINTR)
        continue;
      if (outError)
        *outError = std::string("waitpid failed: ") + std::strerror(errno);
      return res;
    }

    if (WIFEXITED(status))
    {
      res.exitCode = WEXITSTATUS(status);
      if (res.exitCode == 127 && outError)
        *outError = "could not execute " + exePath;
    }
    else if (outError)
    {
      *outError = exePath + " terminated by a signal";
    }
    return res;
  }

} // namespace walltint::apply
