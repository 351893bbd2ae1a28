#include <persistence/state/runner_options.hpp>
#include <persistence/paths.hpp>

#include <filesystem>

namespace Persistence
{
    void RunnerOptions::useDefaultsFrom(RunnerOptions const& other)
    {
        if (!toolPath)
            toolPath = other.toolPath;
        if (!scratchDirectory)
            scratchDirectory = other.scratchDirectory;
        if (!simplifiedOutput)
            simplifiedOutput = other.simplifiedOutput;
        if (!copyReportInterval)
            copyReportInterval = other.copyReportInterval;
        if (!syncReportInterval)
            syncReportInterval = other.syncReportInterval;
        if (!runReportInterval)
            runReportInterval = other.runReportInterval;
        if (!listReportInterval)
            listReportInterval = other.listReportInterval;
    }

    RunnerOptions RunnerOptions::defaults()
    {
        return RunnerOptions{
            .toolPath = (homeDirectory() / "s5cmd").string(),
            .scratchDirectory = std::filesystem::temp_directory_path().string(),
            .simplifiedOutput = true,
            .copyReportInterval = 10,
            .syncReportInterval = 10,
            .runReportInterval = 5,
            .listReportInterval = 5,
        };
    }

    void to_json(nlohmann::json& j, RunnerOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, toolPath);
        TO_JSON_OPTIONAL(j, options, scratchDirectory);
        TO_JSON_OPTIONAL(j, options, simplifiedOutput);
        TO_JSON_OPTIONAL(j, options, copyReportInterval);
        TO_JSON_OPTIONAL(j, options, syncReportInterval);
        TO_JSON_OPTIONAL(j, options, runReportInterval);
        TO_JSON_OPTIONAL(j, options, listReportInterval);
    }
    void from_json(nlohmann::json const& j, RunnerOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, toolPath);
        FROM_JSON_OPTIONAL(j, options, scratchDirectory);
        FROM_JSON_OPTIONAL(j, options, simplifiedOutput);
        FROM_JSON_OPTIONAL(j, options, copyReportInterval);
        FROM_JSON_OPTIONAL(j, options, syncReportInterval);
        FROM_JSON_OPTIONAL(j, options, runReportInterval);
        FROM_JSON_OPTIONAL(j, options, listReportInterval);
    }
}
