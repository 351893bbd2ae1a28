#include <backend/transfer/fingerprint.hpp>

#include <utility/algorithm/string.hpp>
#include <utility/digest.hpp>

#include <fmt/format.h>

#include <cstddef>

using SharedData::TransferError;
using SharedData::TransferErrorType;

std::expected<std::string, TransferError> batchFingerprint(std::vector<std::string> const& sources)
{
    if (sources.empty())
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::EmptyInput,
            .extraInfo = "Cannot fingerprint an empty list of sources",
        });
    }

    // Lengths are in code points, not bytes.
    const auto length = [](std::string const& source) {
        return Utility::Algorithm::codePointCount(source);
    };

    std::size_t totalLength = 0;
    for (auto const& source : sources)
        totalLength += length(source);

    const auto identity = fmt::format(
        "{}-{}-{}-{}-{}",
        sources.size(),
        length(sources.front()),
        length(sources.back()),
        length(sources[sources.size() / 2]),
        totalLength);

    return Utility::md5Hex(identity).substr(0, 8);
}
