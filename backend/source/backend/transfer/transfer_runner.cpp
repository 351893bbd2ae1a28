#include <backend/transfer/transfer_runner.hpp>
#include <backend/transfer/command_file.hpp>
#include <backend/transfer/listing_parser.hpp>
#include <backend/transfer/locator_normalization.hpp>
#include <backend/transfer/progress_aggregator.hpp>

#include <log/log.hpp>
#include <persistence/paths.hpp>
#include <shared_data/transfer_request.hpp>
#include <utility/visit_overloaded.hpp>

#include <system_error>

using SharedData::TransferError;
using SharedData::TransferErrorType;

namespace
{
    TransferError unsupported(std::string info)
    {
        return TransferError{
            .type = TransferErrorType::UnsupportedOperation,
            .extraInfo = std::move(info),
        };
    }

    /// The tool exits non zero with this diagnostic when a prefix has no objects.
    bool isNothingFoundDiagnostic(std::string const& line)
    {
        return line.starts_with("ERROR") && line.find("no object found") != std::string::npos;
    }

    /// Moves a file, falling back to copy and remove across filesystems.
    std::expected<void, TransferError>
    moveFile(std::filesystem::path const& from, std::filesystem::path const& to)
    {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (!ec)
            return {};

        Log::debug("TransferRunner: rename '{}' -> '{}' failed ({}), copying.", from.string(), to.string(), ec.message());
        ec.clear();
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            return std::unexpected(TransferError{
                .type = TransferErrorType::DownloadError,
                .extraInfo = "Could not move '" + from.string() + "' to '" + to.string() + "': " + ec.message(),
            });
        }
        std::filesystem::remove(from, ec);
        if (ec)
            Log::warn("TransferRunner: could not remove '{}' after copying: {}", from.string(), ec.message());
        return {};
    }
}

TransferRunner::Options TransferRunner::Options::fromRunnerOptions(Persistence::RunnerOptions const& options)
{
    Options result{};
    if (options.scratchDirectory)
        result.scratchDirectory = Persistence::expandHome(*options.scratchDirectory);
    if (options.simplifiedOutput)
        result.simplifiedOutput = *options.simplifiedOutput;
    if (options.copyReportInterval)
        result.copyReportInterval = std::chrono::seconds{*options.copyReportInterval};
    if (options.syncReportInterval)
        result.syncReportInterval = std::chrono::seconds{*options.syncReportInterval};
    if (options.runReportInterval)
        result.runReportInterval = std::chrono::seconds{*options.runReportInterval};
    if (options.listReportInterval)
        result.listReportInterval = std::chrono::seconds{*options.listReportInterval};
    return result;
}

TransferRunner::TransferRunner(
    std::shared_ptr<ProcessSupervisor> supervisor,
    std::shared_ptr<Downloader> downloader,
    Options options,
    ProgressSink progressSink)
    : supervisor_{std::move(supervisor)}
    , downloader_{std::move(downloader)}
    , options_{std::move(options)}
    , progressSink_{std::move(progressSink)}
{}

TransferRunner::Options const& TransferRunner::options() const
{
    return options_;
}

std::expected<void, TransferError> TransferRunner::supervise(
    std::vector<std::string> const& arguments,
    std::optional<std::uint64_t> expectedTotal,
    std::chrono::seconds reportInterval)
{
    if (!options_.simplifiedOutput)
        return supervisor_->run(arguments);

    auto process = supervisor_->launch(arguments, true);
    if (!process.has_value())
        return std::unexpected(process.error());

    ProgressAggregator aggregator{
        **process,
        ProgressAggregator::Options{
            .expectedTotal = expectedTotal,
            .reportInterval = reportInterval,
        },
    };
    const auto exitCode = aggregator.run(progressSink_);
    if (!exitCode.has_value())
        return std::unexpected(exitCode.error());

    return supervisor_->finish(*exitCode, arguments.front());
}

std::expected<ScratchFile, TransferError> TransferRunner::materialize(SharedData::Locator const& locator)
{
    const auto baseName = SharedData::locatorBaseName(locator);
    if (baseName.empty())
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::InvalidLocator,
            .extraInfo = "'" + SharedData::locatorString(locator) + "' does not name a file",
        });
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.scratchDirectory, ec);
    const auto localPath = options_.scratchDirectory / baseName;

    return Utility::visitOverloaded(
        locator,
        [&](SharedData::LocalLocator const& local) -> std::expected<ScratchFile, TransferError> {
            return std::unexpected(TransferError{
                .type = TransferErrorType::ImplementationError,
                .extraInfo = "Local file '" + local.path + "' needs no materialization",
            });
        },
        [&](SharedData::ObjectStorageLocator const& objectStorage) -> std::expected<ScratchFile, TransferError> {
            if (auto result = supervisor_->run({"cp", objectStorage.uri, localPath.string()}); !result.has_value())
            {
                std::filesystem::remove(localPath, ec);
                if (result.error().type == TransferErrorType::Interrupted)
                    return std::unexpected(result.error());
                return std::unexpected(TransferError{
                    .type = TransferErrorType::DownloadError,
                    .exitCode = result.error().exitCode,
                    .extraInfo = "Fetching '" + objectStorage.uri + "' failed: " + result.error().toString(),
                });
            }
            return ScratchFile{localPath};
        },
        [&](SharedData::RemoteLocator const& remote) -> std::expected<ScratchFile, TransferError> {
            if (auto result = downloader_->download(remote.url, localPath); !result.has_value())
                return std::unexpected(result.error());
            return ScratchFile{localPath};
        });
}

std::expected<void, TransferError> TransferRunner::copy(std::string const& source, std::string const& destination)
{
    const auto sourceLocator = SharedData::classifyLocator(source);
    const auto destinationLocator = SharedData::classifyLocator(destination);

    if (SharedData::isRemote(destinationLocator))
        return std::unexpected(unsupported("Cannot copy to an http(s) destination"));

    if (!SharedData::isRemote(sourceLocator))
    {
        if (auto advisory = fileNameUploadAdvisory(source, destination))
            Log::warn("{}", *advisory);
        return supervise({"cp", source, destination}, std::nullopt, options_.copyReportInterval);
    }

    auto downloaded = materialize(sourceLocator);
    if (!downloaded.has_value())
        return std::unexpected(downloaded.error());

    const auto localSource = downloaded->path().string();
    if (auto advisory = fileNameUploadAdvisory(localSource, destination))
        Log::warn("{}", *advisory);

    if (SharedData::isObjectStorage(destinationLocator))
    {
        auto result = supervise({"cp", localSource, destination}, std::nullopt, options_.copyReportInterval);
        if (!result.has_value())
        {
            Log::warn("TransferRunner: upload failed, downloaded file kept at '{}'.", localSource);
            downloaded->release();
        }
        return result;
    }

    std::filesystem::path target{destination};
    std::error_code ec;
    if (destination.ends_with('/') || std::filesystem::is_directory(target, ec))
    {
        std::filesystem::create_directories(target, ec);
        target /= downloaded->path().filename();
    }

    if (auto result = moveFile(downloaded->path(), target); !result.has_value())
        return std::unexpected(result.error());
    downloaded->release();

    Log::info("TransferRunner: moved downloaded file to '{}'.", target.string());
    return {};
}

std::expected<void, TransferError> TransferRunner::move(std::string const& source, std::string const& destination)
{
    const auto sourceLocator = SharedData::classifyLocator(source);
    const auto destinationLocator = SharedData::classifyLocator(destination);

    if (SharedData::isRemote(sourceLocator) || SharedData::isRemote(destinationLocator))
        return std::unexpected(unsupported("Cannot move from or to an http(s) location"));
    if (SharedData::isLocal(sourceLocator) && SharedData::isLocal(destinationLocator))
        return std::unexpected(unsupported("Moving between two local paths is not supported"));

    return supervise({"mv", source, destination}, std::nullopt, options_.copyReportInterval);
}

std::expected<void, TransferError> TransferRunner::sync(std::string const& source, std::string const& destination)
{
    const auto endpoints = normalizeSyncEndpoints({.source = source, .destination = destination});
    return supervise({"sync", endpoints.source, endpoints.destination}, std::nullopt, options_.syncReportInterval);
}

std::expected<void, TransferError>
TransferRunner::downloadList(std::vector<std::string> const& sources, std::string const& destinationDirectory)
{
    auto batch = SharedData::TransferBatch::intoDirectory(sources, destinationDirectory);
    if (!batch.has_value())
        return std::unexpected(batch.error());

    auto commandFile = CommandFile::generate(*batch, options_.scratchDirectory);
    if (!commandFile.has_value())
        return std::unexpected(commandFile.error());

    if (!options_.simplifiedOutput)
    {
        Log::info("Generated command file: {}", commandFile->path().string());
        Log::info("Downloading {} files to {}", batch->size(), destinationDirectory);
    }

    auto result = supervise({"run", commandFile->path().string()}, batch->size(), options_.runReportInterval);

    if (!options_.simplifiedOutput && result.has_value())
        Log::info("Downloaded {} files to {}", batch->size(), destinationDirectory);
    return result;
}

std::expected<void, TransferError> TransferRunner::runCommandFile(std::string const& commandFileLocator)
{
    const auto locator = SharedData::classifyLocator(commandFileLocator);

    ScratchFile materialized{};
    std::string localPath = commandFileLocator;
    if (SharedData::isLocal(locator))
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(commandFileLocator, ec))
        {
            return std::unexpected(TransferError{
                .type = TransferErrorType::InvalidLocator,
                .extraInfo = "Command file '" + commandFileLocator + "' does not exist",
            });
        }
    }
    else
    {
        auto fetched = materialize(locator);
        if (!fetched.has_value())
            return std::unexpected(fetched.error());
        materialized = std::move(*fetched);
        localPath = materialized.path().string();
    }

    return supervise({"run", localPath}, std::nullopt, options_.runReportInterval);
}

std::expected<SharedData::Listing, TransferError> TransferRunner::list(std::string const& uri)
{
    if (!SharedData::isObjectStorage(SharedData::classifyLocator(uri)))
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::InvalidLocator,
            .extraInfo = "Only object storage locations can be listed, got '" + uri + "'",
        });
    }

    auto process = supervisor_->launch({"ls", uri}, true);
    if (!process.has_value())
        return std::unexpected(process.error());

    ListingParser parser{**process, ListingParser::Options{.reportInterval = options_.listReportInterval}};
    auto listing = parser.parse(progressSink_);
    if (!listing.has_value())
        return std::unexpected(listing.error());

    const auto exitCode = parser.exitCode().value_or(-1);
    if (exitCode != 0 && !supervisor_->interrupted() && parser.records() == 0 &&
        isNothingFoundDiagnostic(parser.lastSkippedLine()))
    {
        Log::warn("Nothing to list at '{}': {}", uri, parser.lastSkippedLine());
        return SharedData::Listing{};
    }

    if (auto result = supervisor_->finish(exitCode, "ls"); !result.has_value())
        return std::unexpected(result.error());
    return listing;
}
