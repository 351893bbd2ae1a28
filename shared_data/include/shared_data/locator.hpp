#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace SharedData
{
    /// A path on the local filesystem.
    struct LocalLocator
    {
        std::string path;
    };

    /// An object storage uri of the form s3://bucket/key.
    struct ObjectStorageLocator
    {
        std::string uri;
    };

    /// An http(s) url that must be downloaded before it can take part in a transfer.
    struct RemoteLocator
    {
        std::string url;
    };

    using Locator = std::variant<LocalLocator, ObjectStorageLocator, RemoteLocator>;

    constexpr std::string_view objectStorageScheme = "s3://";

    /**
     * @brief Decides which kind of endpoint the string describes. Everything that is neither an object storage uri
     * nor an http(s) url is considered a local path.
     */
    Locator classifyLocator(std::string_view locator);

    /**
     * @brief Returns the original string the locator was made from.
     */
    std::string const& locatorString(Locator const& locator);

    /**
     * @brief Final path segment of the locator. Query and fragment of urls are ignored.
     */
    std::string locatorBaseName(Locator const& locator);

    std::string_view locatorKindName(Locator const& locator);

    inline bool isLocal(Locator const& locator)
    {
        return std::holds_alternative<LocalLocator>(locator);
    }
    inline bool isObjectStorage(Locator const& locator)
    {
        return std::holds_alternative<ObjectStorageLocator>(locator);
    }
    inline bool isRemote(Locator const& locator)
    {
        return std::holds_alternative<RemoteLocator>(locator);
    }
}
