#include <backend/transfer/command_file.hpp>
#include <backend/transfer/fingerprint.hpp>

#include <log/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <memory>
#include <system_error>

using SharedData::TransferError;
using SharedData::TransferErrorType;

namespace
{
    constexpr int maxNameAttempts = 100;

    TransferError commandFileError(std::string info)
    {
        return TransferError{
            .type = TransferErrorType::CommandFileError,
            .extraInfo = std::move(info),
        };
    }
}

CommandFile::CommandFile(ScratchFile file, std::size_t lineCount, std::string fingerprint)
    : file_{std::move(file)}
    , lineCount_{lineCount}
    , fingerprint_{std::move(fingerprint)}
{}

std::string CommandFile::commandLine(SharedData::TransferRequest const& request)
{
    std::string_view directory = SharedData::locatorString(request.destination());
    while (directory.size() > 1 && directory.back() == '/')
        directory.remove_suffix(1);

    return fmt::format(
        "cp {} {}/{}\n",
        SharedData::locatorString(request.source()),
        directory,
        SharedData::locatorBaseName(request.source()));
}

std::string CommandFile::fileName(std::string_view timestamp, std::string_view fingerprint, int attempt)
{
    if (attempt == 0)
        return fmt::format("s5cmd_commands_{}_{}.txt", timestamp, fingerprint);
    return fmt::format("s5cmd_commands_{}_{}_{}.txt", timestamp, fingerprint, attempt);
}

std::expected<CommandFile, TransferError>
CommandFile::generate(SharedData::TransferBatch const& batch, std::filesystem::path const& scratchDirectory)
{
    auto fingerprint = batchFingerprint(batch.sourceStrings());
    if (!fingerprint.has_value())
        return std::unexpected(fingerprint.error());

    std::error_code ec;
    std::filesystem::create_directories(scratchDirectory, ec);
    if (ec)
        return std::unexpected(commandFileError("Cannot create scratch directory: " + ec.message()));

    const auto timestamp = fmt::format("{:%Y%m%d-%H%M%S}", fmt::localtime(std::time(nullptr)));

    std::unique_ptr<std::FILE, decltype(&std::fclose)> stream{nullptr, &std::fclose};
    std::filesystem::path path;
    for (int attempt = 0; attempt != maxNameAttempts && !stream; ++attempt)
    {
        path = scratchDirectory / fileName(timestamp, *fingerprint, attempt);
        // "x": fail if the file exists.
        stream.reset(std::fopen(path.c_str(), "wx"));
        if (!stream && errno != EEXIST)
        {
            return std::unexpected(
                commandFileError(fmt::format("Cannot create '{}': {}", path.string(), std::strerror(errno))));
        }
    }
    if (!stream)
        return std::unexpected(commandFileError("No free command file name in " + scratchDirectory.string()));

    ScratchFile file{path};
    for (auto const& request : batch.requests())
    {
        const auto line = commandLine(request);
        if (std::fwrite(line.data(), 1, line.size(), stream.get()) != line.size())
            return std::unexpected(commandFileError("Writing '" + path.string() + "' failed"));
    }
    if (std::fclose(stream.release()) != 0)
        return std::unexpected(commandFileError("Closing '" + path.string() + "' failed"));

    Log::info("CommandFile: generated '{}' with {} commands.", path.string(), batch.size());
    return CommandFile{std::move(file), batch.size(), std::move(*fingerprint)};
}

std::filesystem::path const& CommandFile::path() const
{
    return file_.path();
}

std::size_t CommandFile::lineCount() const
{
    return lineCount_;
}

std::string const& CommandFile::fingerprint() const
{
    return fingerprint_;
}
