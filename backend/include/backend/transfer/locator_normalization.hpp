#pragma once

#include <optional>
#include <string>

struct SyncEndpoints
{
    std::string source;
    std::string destination;

    friend bool operator==(SyncEndpoints const&, SyncEndpoints const&) = default;
};

/**
 * @brief Adjusts sync endpoints to the transfer tool's conventions and logs an advisory for every change.
 *
 * - An existing local directory source gets a trailing '/'.
 * - An object storage source gets a trailing slash-star wildcard (replacing trailing slashes).
 * - An object storage destination gets a trailing '/'.
 *
 * Normalizing an already normalized pair changes nothing.
 */
SyncEndpoints normalizeSyncEndpoints(SyncEndpoints endpoints);

/**
 * @brief Returns an advisory message when copying source to destination would create an object named like the
 * destination instead of placing the file into a folder.
 */
std::optional<std::string> fileNameUploadAdvisory(std::string const& source, std::string const& destination);
