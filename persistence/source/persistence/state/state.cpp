#include <persistence/state/state.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["runnerOptions"] = state.runnerOptions;
        j["installerOptions"] = state.installerOptions;
        j["logLevel"] = Log::levelToString(state.logLevel);
        TO_JSON_OPTIONAL(j, state, logFile);
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("runnerOptions"))
            j.at("runnerOptions").get_to(state.runnerOptions);

        if (j.contains("installerOptions"))
            j.at("installerOptions").get_to(state.installerOptions);

        if (j.contains("logLevel"))
            state.logLevel = Log::levelFromString(j.at("logLevel").get<std::string>());

        FROM_JSON_OPTIONAL(j, state, logFile);
    }

    State State::fullyResolve() const
    {
        State resolved{*this};
        resolved.runnerOptions.useDefaultsFrom(RunnerOptions::defaults());
        resolved.installerOptions.useDefaultsFrom(InstallerOptions::defaults());
        return resolved;
    }
}
