#pragma once

#include <backend/process/process_supervisor.hpp>

#include <csignal>
#include <memory>
#include <optional>
#include <vector>

/**
 * @brief Catches termination signals while it exists and passes them on to the supervisor.
 *
 * The program is not killed by these signals, so running operations return normally and their scratch and
 * command files are cleaned up.
 */
class InterruptWatcher
{
  public:
    explicit InterruptWatcher(
        std::shared_ptr<ProcessSupervisor> supervisor,
        std::vector<int> const& signals = {SIGINT, SIGTERM});
    ~InterruptWatcher();
    InterruptWatcher(InterruptWatcher const&) = delete;
    InterruptWatcher& operator=(InterruptWatcher const&) = delete;
    InterruptWatcher(InterruptWatcher&&) = delete;
    InterruptWatcher& operator=(InterruptWatcher&&) = delete;

    /**
     * @return The first signal that was caught, if any.
     */
    std::optional<int> received() const;

  private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};
