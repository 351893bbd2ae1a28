#include <frontend/components/progress_bar.hpp>

#include <backend/download/http_downloader.hpp>
#include <backend/process/interrupt_watcher.hpp>
#include <backend/process/process_supervisor.hpp>
#include <backend/tool/http_tool_installer.hpp>
#include <backend/tool/tool_resolver.hpp>
#include <backend/transfer/transfer_runner.hpp>
#include <log/log.hpp>
#include <persistence/paths.hpp>
#include <persistence/state_holder.hpp>
#include <utility/algorithm/string.hpp>
#include <utility/format_bytes.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <exception>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{
    std::expected<std::vector<std::string>, SharedData::TransferError> readLocatorList(std::string const& path)
    {
        std::ifstream reader{path};
        if (!reader)
        {
            return std::unexpected(SharedData::TransferError{
                .type = SharedData::TransferErrorType::InvalidLocator,
                .extraInfo = "Cannot read list file '" + path + "'",
            });
        }

        std::vector<std::string> locators{};
        for (std::string line; std::getline(reader, line);)
        {
            const auto trimmed = Utility::Algorithm::trim(line);
            if (!trimmed.empty() && !trimmed.starts_with('#'))
                locators.emplace_back(trimmed);
        }
        return locators;
    }

    void printListing(SharedData::Listing const& listing, bool human)
    {
        for (auto const& [path, entry] : listing)
        {
            fmt::print(
                "{}  {:>12}  {}\n",
                entry.timestamp,
                human ? Utility::formatBytes(entry.size) : std::to_string(entry.size),
                path);
        }
    }

    Persistence::State loadState(std::filesystem::path const& configPath)
    {
        Persistence::StateHolder holder{configPath};
        holder.load([](bool success, Persistence::StateHolder& loaded) {
            if (!success)
                Log::warn("Could not load configuration from '{}', using defaults.", loaded.path().string());
        });
        return holder.stateCache().fullyResolve();
    }
}

int main(int argc, char** argv)
{
    CLI::App app{"Bulk transfers between local storage, object storage and http through s5cmd.", "s5run"};
    app.require_subcommand(1);

    std::string configPath = Persistence::defaultConfigPath().string();
    std::string logLevel{};
    bool noProgress = false;
    int interval = 0;

    app.add_option("--config", configPath, "Configuration file");
    auto* logLevelOption =
        app.add_option("--log-level", logLevel, "trace, debug, info, warning, error, critical or off")
            ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}));
    app.add_flag("--no-progress", noProgress, "Pass the tool output through instead of showing progress");
    auto* intervalOption =
        app.add_option("--interval", interval, "Progress report interval in seconds for every operation")
            ->check(CLI::PositiveNumber);

    std::string source{};
    std::string destination{};

    CLI::App* copyCommand = app.add_subcommand("cp", "Copy a single file or object");
    copyCommand->add_option("source", source, "Local path, s3:// uri or http(s) url")->required();
    copyCommand->add_option("destination", destination, "Local path or s3:// uri")->required();

    CLI::App* moveCommand = app.add_subcommand("mv", "Move between local storage and object storage");
    moveCommand->add_option("source", source, "Local path or s3:// uri")->required();
    moveCommand->add_option("destination", destination, "Local path or s3:// uri")->required();

    CLI::App* syncCommand = app.add_subcommand("sync", "Synchronize a folder or prefix");
    syncCommand->add_option("source", source, "Local directory or s3:// prefix")->required();
    syncCommand->add_option("destination", destination, "Local directory or s3:// prefix")->required();

    std::string listFile{};
    std::vector<std::string> uris{};
    CLI::App* downloadCommand = app.add_subcommand("download", "Download many objects into one directory");
    downloadCommand->add_option("destination", destination, "Target directory")->required();
    downloadCommand->add_option("uris", uris, "s3:// uris to download");
    downloadCommand->add_option("--list", listFile, "File with one s3:// uri per line")->check(CLI::ExistingFile);

    std::string commandFile{};
    CLI::App* runCommand = app.add_subcommand("run", "Run an s5cmd command file");
    runCommand->add_option("command-file", commandFile, "Local path, s3:// uri or http(s) url")->required();

    std::string listUri{};
    bool human = false;
    CLI::App* listCommand = app.add_subcommand("ls", "List objects below an s3:// uri");
    listCommand->add_option("uri", listUri, "s3:// uri")->required();
    listCommand->add_flag("--human", human, "Human readable sizes");

    CLI11_PARSE(app, argc, argv);

    try
    {
        auto state = loadState(configPath);

        Log::setup(Log::LoggerOptions{
            .level = logLevelOption->count() > 0 ? Log::levelFromString(logLevel) : state.logLevel,
            .logFile = state.logFile ? std::optional<std::filesystem::path>{Persistence::expandHome(*state.logFile)}
                                     : std::nullopt,
        });

        auto options = TransferRunner::Options::fromRunnerOptions(state.runnerOptions);
        if (noProgress)
            options.simplifiedOutput = false;
        if (intervalOption->count() > 0)
        {
            options.copyReportInterval = std::chrono::seconds{interval};
            options.syncReportInterval = std::chrono::seconds{interval};
            options.runReportInterval = std::chrono::seconds{interval};
            options.listReportInterval = std::chrono::seconds{interval};
        }

        auto downloader = std::make_shared<HttpDownloader>();
        auto installer = std::make_shared<HttpToolInstaller>(downloader, state.installerOptions);
        auto resolver = ToolResolver::shared(Persistence::expandHome(*state.runnerOptions.toolPath), installer);

        std::optional<ProgressBar> progressBar{};
        const auto showProgress = [&](std::chrono::seconds reportInterval, std::string description) {
            if (options.simplifiedOutput)
                progressBar.emplace(ProgressBar::Settings{
                    .description = std::move(description),
                    .reportInterval = reportInterval,
                });
        };

        auto supervisor = std::make_shared<ProcessSupervisor>(resolver);
        InterruptWatcher interruptWatcher{supervisor};

        TransferRunner runner{
            supervisor,
            downloader,
            options,
            [&progressBar](SharedData::ProgressSample const& sample) {
                if (progressBar)
                    progressBar->update(sample);
            },
        };

        std::expected<void, SharedData::TransferError> result{};
        if (app.got_subcommand(copyCommand))
        {
            showProgress(options.copyReportInterval, "running s5cmd");
            result = runner.copy(source, destination);
        }
        else if (app.got_subcommand(moveCommand))
        {
            showProgress(options.copyReportInterval, "running s5cmd");
            result = runner.move(source, destination);
        }
        else if (app.got_subcommand(syncCommand))
        {
            showProgress(options.syncReportInterval, "running s5cmd");
            result = runner.sync(source, destination);
        }
        else if (app.got_subcommand(downloadCommand))
        {
            if (!listFile.empty())
            {
                auto listed = readLocatorList(listFile);
                if (!listed.has_value())
                {
                    Log::error("{}", listed.error().toString());
                    return 1;
                }
                uris.insert(uris.end(), listed->begin(), listed->end());
            }
            showProgress(options.runReportInterval, "running s5cmd");
            result = runner.downloadList(uris, destination);
        }
        else if (app.got_subcommand(runCommand))
        {
            showProgress(options.runReportInterval, "running s5cmd");
            result = runner.runCommandFile(commandFile);
        }
        else if (app.got_subcommand(listCommand))
        {
            showProgress(options.listReportInterval, "listing objects");
            auto listing = runner.list(listUri);
            if (listing.has_value())
                printListing(*listing, human);
            else
                result = std::unexpected(listing.error());
        }

        if (const auto signal = interruptWatcher.received())
        {
            Log::error("Interrupted by signal {}.", *signal);
            Log::flush();
            return 128 + *signal;
        }
        if (!result.has_value())
        {
            Log::error("{}", result.error().toString());
            Log::flush();
            return 1;
        }
        Log::flush();
        return 0;
    }
    catch (std::exception const& exc)
    {
        Log::critical("s5run failed: {}", exc.what());
        Log::flush();
        return 1;
    }
}
