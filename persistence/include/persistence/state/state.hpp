#pragma once

#include <log/level.hpp>
#include <persistence/state_core.hpp>

#include <persistence/state/runner_options.hpp>
#include <persistence/state/installer_options.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct State
    {
        RunnerOptions runnerOptions{};
        InstallerOptions installerOptions{};
        Log::Level logLevel{Log::Level::Info};
        std::optional<std::string> logFile{std::nullopt};

        /**
         * @brief Returns a copy where every unset option is filled from the built in defaults.
         */
        State fullyResolve() const;
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
