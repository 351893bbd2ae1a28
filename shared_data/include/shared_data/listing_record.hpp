#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace SharedData
{
    struct ListingEntry
    {
        std::uint64_t size{0};
        // YYYY/MM/DD HH:MM:SS as printed by the transfer tool.
        std::string timestamp{};

        friend bool operator==(ListingEntry const&, ListingEntry const&) = default;
    };

    struct ListingRecord
    {
        std::string path{};
        std::uint64_t size{0};
        std::string timestamp{};

        friend bool operator==(ListingRecord const&, ListingRecord const&) = default;
    };

    /// path -> (size, timestamp). A path listed twice keeps the later entry.
    using Listing = std::map<std::string, ListingEntry>;
}
