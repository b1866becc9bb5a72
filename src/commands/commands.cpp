/**
 * @file commands.cpp
 * @brief User commands run alongside each notification
 */

#include "commands.hpp"

#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <Drac++/Utils/Logging.hpp>

extern char** environ;

using namespace draconis::utils::error;
using enum DracErrorCode;

namespace mpris_notifier::commands {
  SpawnRunner::~SpawnRunner() {
    reapFinished();
    if (!m_children.empty())
      debug_log("{} command(s) still running at shutdown", m_children.size());
  }

  auto SpawnRunner::reapFinished() -> void {
    std::erase_if(m_children, [](const pid_t pid) -> bool {
      i32         status = 0;
      const pid_t reaped = waitpid(pid, &status, WNOHANG);

      if (reaped == 0)
        return false;

      if (reaped == pid && WIFEXITED(status) && WEXITSTATUS(status) != 0)
        debug_log("Command (pid {}) exited with status {}", pid, WEXITSTATUS(status));
      else if (reaped == pid && WIFSIGNALED(status))
        debug_log("Command (pid {}) killed by signal {}", pid, WTERMSIG(status));

      // Reaped, or no longer our child.
      return true;
    });
  }

  auto SpawnRunner::run(const Vec<String>& argv) -> Result<> {
    reapFinished();

    if (argv.empty() || argv.front().empty())
      ERR(InvalidArgument, "Empty command");

    // posix_spawnp wants mutable strings.
    Vec<String> owned = argv;
    Vec<char*>  args;
    args.reserve(owned.size() + 1);
    for (String& arg : owned)
      args.push_back(arg.data());
    args.push_back(nullptr);

    pid_t     pid    = 0;
    const i32 result = posix_spawnp(&pid, args.front(), nullptr, nullptr, args.data(), environ);
    if (result != 0)
      ERR_FMT(PlatformSpecific, "Failed to start '{}': {}", argv.front(), std::strerror(result));

    debug_log("Started '{}' (pid {})", argv.front(), pid);
    m_children.push_back(pid);
    return {};
  }

  auto SpawnRunner::runningCount() -> usize {
    reapFinished();
    return m_children.size();
  }
} // namespace mpris_notifier::commands
