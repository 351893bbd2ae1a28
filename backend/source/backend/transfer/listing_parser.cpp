#include <backend/transfer/listing_parser.hpp>

#include <log/log.hpp>
#include <utility/algorithm/string.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>

using SharedData::Listing;
using SharedData::ListingEntry;
using SharedData::ListingRecord;
using SharedData::ProgressSample;
using SharedData::TransferError;

namespace
{
    constexpr std::string_view timestampShape = "dddd/dd/dd dd:dd:dd";

    bool isDigit(char c)
    {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    bool matchesTimestamp(std::string_view text)
    {
        if (text.size() < timestampShape.size())
            return false;
        for (std::size_t i = 0; i != timestampShape.size(); ++i)
        {
            if (timestampShape[i] == 'd' ? !isDigit(text[i]) : text[i] != timestampShape[i])
                return false;
        }
        return true;
    }

    std::size_t skipSpaces(std::string_view text, std::size_t pos)
    {
        while (pos < text.size() && Utility::Algorithm::isSpace(text[pos]))
            ++pos;
        return pos;
    }
}

ListingParser::ListingParser(IProcessOutput& output, Options options)
    : output_{&output}
    , options_{std::move(options)}
    , exitCode_{std::nullopt}
    , records_{0}
    , lastSkippedLine_{}
{}

std::optional<ListingRecord> ListingParser::parseLine(std::string_view line)
{
    line = Utility::Algorithm::trim(line);
    if (!matchesTimestamp(line))
        return std::nullopt;

    std::size_t pos = timestampShape.size();
    const auto sizeBegin = skipSpaces(line, pos);
    if (sizeBegin == pos)
        return std::nullopt;

    pos = sizeBegin;
    while (pos < line.size() && isDigit(line[pos]))
        ++pos;
    if (pos == sizeBegin)
        return std::nullopt;

    std::uint64_t size = 0;
    const auto [end, ec] = std::from_chars(line.data() + sizeBegin, line.data() + pos, size);
    if (ec != std::errc{} || end != line.data() + pos)
        return std::nullopt;

    const auto pathBegin = skipSpaces(line, pos);
    if (pathBegin == pos || pathBegin == line.size())
        return std::nullopt;

    return ListingRecord{
        .path = std::string{line.substr(pathBegin)},
        .size = size,
        .timestamp = std::string{line.substr(0, timestampShape.size())},
    };
}

std::expected<Listing, TransferError>
ListingParser::parse(std::function<void(ProgressSample const&)> const& onProgress)
{
    Listing listing{};
    std::uint64_t pending = 0;
    std::uint64_t recorded = 0;
    bool exitObserved = false;
    auto lastReport = options_.clock();

    const auto report = [&](std::chrono::steady_clock::time_point now, bool isFinal) {
        if (onProgress)
        {
            onProgress(ProgressSample{
                .lines = pending,
                .timestamp = now,
                .total = std::nullopt,
                .cumulative = recorded,
                .isFinal = isFinal,
            });
        }
        pending = 0;
        lastReport = now;
    };

    while (true)
    {
        auto line = output_->readLine();
        if (!line.has_value())
        {
            Log::error("ListingParser: {}", line.error().toString());
            if (const auto waited = output_->wait(); waited.has_value())
                exitCode_ = *waited;
            else
                Log::warn("ListingParser: waiting after read failure failed: {}", waited.error().toString());
            return std::unexpected(line.error());
        }
        if (!line->has_value())
            break;

        auto record = parseLine(**line);
        if (!record)
        {
            Log::trace("ListingParser: skipping '{}'.", **line);
            lastSkippedLine_ = std::move(**line);
            continue;
        }

        listing.insert_or_assign(
            std::move(record->path), ListingEntry{.size = record->size, .timestamp = std::move(record->timestamp)});
        ++pending;
        ++recorded;

        const auto now = options_.clock();
        if (now - lastReport >= options_.reportInterval)
            report(now, false);
        else if (!exitObserved && output_->hasExited())
        {
            exitObserved = true;
            report(now, false);
        }
    }

    report(options_.clock(), true);
    records_ = recorded;

    const auto exitCode = output_->wait();
    if (!exitCode.has_value())
        return std::unexpected(exitCode.error());
    exitCode_ = *exitCode;

    Log::debug("ListingParser: {} records, {} distinct paths.", recorded, listing.size());
    return listing;
}

std::optional<int> ListingParser::exitCode() const
{
    return exitCode_;
}

std::uint64_t ListingParser::records() const
{
    return records_;
}

std::string const& ListingParser::lastSkippedLine() const
{
    return lastSkippedLine_;
}
