/**
 * @file commands.hpp
 * @brief User commands run alongside each notification
 *
 * @details Commands are started with posix_spawnp and never waited on. Each
 * call to run() first reaps the children that have already exited, so the
 * dispatch loop never blocks on a slow or hung program.
 */

#pragma once

#include <sys/types.h>

#include <Drac++/Utils/Error.hpp>

#include "../notifier_types.hpp"

namespace mpris_notifier::commands {
  /**
   * @brief Starts external programs
   */
  class ICommandRunner {
   public:
    ICommandRunner()                                         = default;
    virtual ~ICommandRunner()                                = default;
    ICommandRunner(const ICommandRunner&)                    = delete;
    auto operator=(const ICommandRunner&) -> ICommandRunner& = delete;
    ICommandRunner(ICommandRunner&&)                         = default;
    auto operator=(ICommandRunner&&) -> ICommandRunner&      = default;

    /**
     * @brief Starts `argv[0]` (looked up in PATH) with the remaining arguments
     * @return An error if the program could not be started
     */
    virtual auto run(const Vec<String>& argv) -> Result<> = 0;
  };

  /**
   * @brief Fire-and-forget runner backed by posix_spawnp
   */
  class SpawnRunner : public ICommandRunner {
    Vec<pid_t> m_children;

    auto reapFinished() -> void;

   public:
    SpawnRunner() = default;
    ~SpawnRunner() override;

    SpawnRunner(const SpawnRunner&)                    = delete;
    auto operator=(const SpawnRunner&) -> SpawnRunner& = delete;
    SpawnRunner(SpawnRunner&&)                         = delete;
    auto operator=(SpawnRunner&&) -> SpawnRunner&      = delete;

    auto run(const Vec<String>& argv) -> Result<> override;

    /**
     * @brief Number of started children that have not been reaped yet
     */
    [[nodiscard]] auto runningCount() -> usize;
  };
} // namespace mpris_notifier::commands
