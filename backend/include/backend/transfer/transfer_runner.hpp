#pragma once

#include <backend/download/downloader.hpp>
#include <backend/process/process_supervisor.hpp>
#include <backend/transfer/scratch_file.hpp>
#include <persistence/state/runner_options.hpp>
#include <shared_data/listing_record.hpp>
#include <shared_data/locator.hpp>
#include <shared_data/progress_sample.hpp>
#include <shared_data/transfer_error.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief The user facing transfer operations. Validates and normalizes inputs, then drives the transfer tool.
 */
class TransferRunner
{
  public:
    using ProgressSink = std::function<void(SharedData::ProgressSample const&)>;

    struct Options
    {
        std::filesystem::path scratchDirectory{std::filesystem::temp_directory_path()};
        /// Capture the tool output and report sampled progress instead of passing the output through.
        bool simplifiedOutput{true};
        std::chrono::seconds copyReportInterval{10};
        std::chrono::seconds syncReportInterval{10};
        std::chrono::seconds runReportInterval{5};
        std::chrono::seconds listReportInterval{5};

        /**
         * @param options Must be fully resolved.
         */
        static Options fromRunnerOptions(Persistence::RunnerOptions const& options);
    };

    TransferRunner(
        std::shared_ptr<ProcessSupervisor> supervisor,
        std::shared_ptr<Downloader> downloader,
        Options options,
        ProgressSink progressSink = {});

    /**
     * @brief Copies a single source to a destination. An http(s) source is downloaded into the scratch directory
     * first and then uploaded (object storage destination) or moved (local destination).
     */
    std::expected<void, SharedData::TransferError> copy(std::string const& source, std::string const& destination);

    /**
     * @brief Moves between local storage and object storage, or within object storage.
     *
     * @return UnsupportedOperation for local to local moves and http(s) endpoints.
     */
    std::expected<void, SharedData::TransferError> move(std::string const& source, std::string const& destination);

    std::expected<void, SharedData::TransferError> sync(std::string const& source, std::string const& destination);

    /**
     * @brief Downloads all sources into one directory through a generated command file.
     * The command file is removed afterwards, whatever the outcome.
     */
    std::expected<void, SharedData::TransferError>
    downloadList(std::vector<std::string> const& sources, std::string const& destinationDirectory);

    /**
     * @brief Runs an existing command file. Object storage and http(s) command files are fetched into the scratch
     * directory first.
     */
    std::expected<void, SharedData::TransferError> runCommandFile(std::string const& commandFileLocator);

    std::expected<SharedData::Listing, SharedData::TransferError> list(std::string const& uri);

    Options const& options() const;

  private:
    std::expected<void, SharedData::TransferError> supervise(
        std::vector<std::string> const& arguments,
        std::optional<std::uint64_t> expectedTotal,
        std::chrono::seconds reportInterval);

    std::expected<ScratchFile, SharedData::TransferError> materialize(SharedData::Locator const& locator);

  private:
    std::shared_ptr<ProcessSupervisor> supervisor_;
    std::shared_ptr<Downloader> downloader_;
    Options options_;
    ProgressSink progressSink_;
};
