#pragma once

#include <backend/process/process_output.hpp>
#include <backend/transfer/progress_clock.hpp>
#include <shared_data/listing_record.hpp>
#include <shared_data/progress_sample.hpp>
#include <shared_data/transfer_error.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Builds a listing from the output of the transfer tool's "ls" subcommand.
 *
 * Lines look like "YYYY/MM/DD HH:MM:SS <size> <path>" where the path is the rest of the line and may contain spaces.
 * Other lines are skipped. Progress is reported with the same throttling as ProgressAggregator and only counts
 * records.
 */
class ListingParser
{
  public:
    struct Options
    {
        std::chrono::milliseconds reportInterval{std::chrono::seconds{5}};
        ProgressClock clock{steadyProgressClock()};
    };

    ListingParser(IProcessOutput& output, Options options);

    static std::optional<SharedData::ListingRecord> parseLine(std::string_view line);

    /**
     * @brief Drains the stream and waits for the process. An empty listing is not an error.
     *
     * @return StreamReadError if the stream could not be read to the end.
     */
    std::expected<SharedData::Listing, SharedData::TransferError>
    parse(std::function<void(SharedData::ProgressSample const&)> const& onProgress = {});

    std::optional<int> exitCode() const;

    /// Number of record lines read by parse, including repeated paths.
    std::uint64_t records() const;

    /// The most recent line that was not a record, usually a diagnostic of the tool. Empty if there was none.
    std::string const& lastSkippedLine() const;

  private:
    IProcessOutput* output_;
    Options options_;
    std::optional<int> exitCode_;
    std::uint64_t records_;
    std::string lastSkippedLine_;
};
