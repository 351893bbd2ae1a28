#include <backend/transfer/locator_normalization.hpp>

#include <log/log.hpp>
#include <shared_data/locator.hpp>

#include <filesystem>
#include <system_error>

SyncEndpoints normalizeSyncEndpoints(SyncEndpoints endpoints)
{
    const auto source = SharedData::classifyLocator(endpoints.source);
    const auto destination = SharedData::classifyLocator(endpoints.destination);

    if (SharedData::isLocal(source) && !endpoints.source.ends_with('/'))
    {
        std::error_code ec;
        if (std::filesystem::is_directory(endpoints.source, ec))
        {
            Log::warn("Local source directory does not end with a slash, syncing its contents.");
            endpoints.source += '/';
            Log::warn("Adjusted source path: {}", endpoints.source);
        }
    }

    if (SharedData::isObjectStorage(source) && !endpoints.source.ends_with("/*"))
    {
        Log::warn("Object storage source does not end with a pattern.");
        while (endpoints.source.ends_with('/'))
            endpoints.source.pop_back();
        endpoints.source += "/*";
        Log::warn("Adjusted source path: {}", endpoints.source);
    }

    if (SharedData::isObjectStorage(destination) && !endpoints.destination.ends_with('/'))
    {
        Log::warn("Object storage destination does not end with a slash.");
        endpoints.destination += '/';
        Log::warn("Adjusted destination path: {}", endpoints.destination);
    }

    return endpoints;
}

std::optional<std::string> fileNameUploadAdvisory(std::string const& source, std::string const& destination)
{
    if (destination.ends_with('/'))
        return std::nullopt;

    std::error_code ec;
    const std::filesystem::path sourcePath{source};
    if (!std::filesystem::is_regular_file(sourcePath, ec) || !sourcePath.has_extension())
        return std::nullopt;

    return "'" + source + "' is being uploaded as a file named '" + destination + "' instead of into a folder.";
}
