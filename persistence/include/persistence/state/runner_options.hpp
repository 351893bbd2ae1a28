#pragma once

#include <persistence/state_core.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace Persistence
{
    struct RunnerOptions
    {
        std::optional<std::string> toolPath{std::nullopt};
        std::optional<std::string> scratchDirectory{std::nullopt};
        std::optional<bool> simplifiedOutput{std::nullopt};

        // Report intervals in seconds.
        std::optional<int> copyReportInterval{std::nullopt};
        std::optional<int> syncReportInterval{std::nullopt};
        std::optional<int> runReportInterval{std::nullopt};
        std::optional<int> listReportInterval{std::nullopt};

        void useDefaultsFrom(RunnerOptions const& other);

        static RunnerOptions defaults();
    };
    void to_json(nlohmann::json& j, RunnerOptions const& options);
    void from_json(nlohmann::json const& j, RunnerOptions& options);
}
