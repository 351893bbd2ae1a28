#pragma once

#include <backend/transfer/scratch_file.hpp>
#include <shared_data/transfer_error.hpp>
#include <shared_data/transfer_request.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

/**
 * @brief A batch file for the transfer tool's "run" subcommand. Lives in the scratch directory and is removed when
 * the object is destroyed, so it never outlives the run that created it.
 */
class CommandFile
{
  public:
    /**
     * @brief Writes one "cp <source> <directory>/<base name>" line per request, in order.
     *
     * The file is named s5cmd_commands_<local time>_<fingerprint>.txt and created exclusively. A numbered suffix is
     * added when that name is taken.
     *
     * @return EmptyInput, CommandFileError
     */
    static std::expected<CommandFile, SharedData::TransferError>
    generate(SharedData::TransferBatch const& batch, std::filesystem::path const& scratchDirectory);

    static std::string commandLine(SharedData::TransferRequest const& request);
    static std::string fileName(std::string_view timestamp, std::string_view fingerprint, int attempt = 0);

    std::filesystem::path const& path() const;
    std::size_t lineCount() const;
    std::string const& fingerprint() const;

  private:
    CommandFile(ScratchFile file, std::size_t lineCount, std::string fingerprint);

  private:
    ScratchFile file_;
    std::size_t lineCount_;
    std::string fingerprint_;
};
