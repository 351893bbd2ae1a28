#include <shared_data/transfer_request.hpp>

#include <utility>

namespace SharedData
{
    TransferRequest::TransferRequest(Locator source, Locator destination)
        : source_{std::move(source)}
        , destination_{std::move(destination)}
    {}

    TransferRequest::TransferRequest(std::string_view source, std::string_view destination)
        : source_{classifyLocator(source)}
        , destination_{classifyLocator(destination)}
    {}

    TransferBatch::TransferBatch(std::vector<TransferRequest> requests)
        : requests_{std::move(requests)}
    {}

    std::expected<TransferBatch, TransferError> TransferBatch::create(std::vector<TransferRequest> requests)
    {
        if (requests.empty())
        {
            return std::unexpected(TransferError{
                .type = TransferErrorType::EmptyInput,
                .extraInfo = "A transfer batch needs at least one request",
            });
        }
        return TransferBatch{std::move(requests)};
    }

    std::expected<TransferBatch, TransferError>
    TransferBatch::intoDirectory(std::vector<std::string> const& sources, std::string const& destinationDirectory)
    {
        std::vector<TransferRequest> requests{};
        requests.reserve(sources.size());
        for (auto const& source : sources)
            requests.emplace_back(source, destinationDirectory);
        return create(std::move(requests));
    }

    std::vector<std::string> TransferBatch::sourceStrings() const
    {
        std::vector<std::string> result{};
        result.reserve(requests_.size());
        for (auto const& request : requests_)
            result.push_back(locatorString(request.source()));
        return result;
    }
}
