#include <shared_data/locator.hpp>

#include <utility/algorithm/string.hpp>
#include <utility/visit_overloaded.hpp>

namespace SharedData
{
    namespace
    {
        std::string_view urlPath(std::string_view url)
        {
            if (const auto schemeEnd = url.find("://"); schemeEnd != std::string_view::npos)
                url.remove_prefix(schemeEnd + 3);

            const auto pathBegin = url.find('/');
            if (pathBegin == std::string_view::npos)
                return {};
            url.remove_prefix(pathBegin);

            if (const auto end = url.find_first_of("?#"); end != std::string_view::npos)
                url = url.substr(0, end);
            return url;
        }
    }

    Locator classifyLocator(std::string_view locator)
    {
        if (locator.starts_with(objectStorageScheme))
            return ObjectStorageLocator{std::string{locator}};
        if (locator.starts_with("http://") || locator.starts_with("https://"))
            return RemoteLocator{std::string{locator}};
        return LocalLocator{std::string{locator}};
    }

    std::string const& locatorString(Locator const& locator)
    {
        return Utility::visitOverloaded(
            locator,
            [](LocalLocator const& local) -> std::string const& {
                return local.path;
            },
            [](ObjectStorageLocator const& objectStorage) -> std::string const& {
                return objectStorage.uri;
            },
            [](RemoteLocator const& remote) -> std::string const& {
                return remote.url;
            });
    }

    std::string locatorBaseName(Locator const& locator)
    {
        return Utility::visitOverloaded(
            locator,
            [](LocalLocator const& local) {
                return std::string{Utility::Algorithm::lastSegment(local.path)};
            },
            [](ObjectStorageLocator const& objectStorage) {
                return std::string{Utility::Algorithm::lastSegment(objectStorage.uri)};
            },
            [](RemoteLocator const& remote) {
                return std::string{Utility::Algorithm::lastSegment(urlPath(remote.url))};
            });
    }

    std::string_view locatorKindName(Locator const& locator)
    {
        return Utility::visitOverloaded(
            locator,
            [](LocalLocator const&) -> std::string_view {
                return "local";
            },
            [](ObjectStorageLocator const&) -> std::string_view {
                return "object storage";
            },
            [](RemoteLocator const&) -> std::string_view {
                return "remote";
            });
    }
}
