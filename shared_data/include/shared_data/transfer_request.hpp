#pragma once

#include <shared_data/locator.hpp>
#include <shared_data/transfer_error.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace SharedData
{
    class TransferRequest
    {
      public:
        TransferRequest(Locator source, Locator destination);
        TransferRequest(std::string_view source, std::string_view destination);

        Locator const& source() const
        {
            return source_;
        }

        Locator const& destination() const
        {
            return destination_;
        }

      private:
        Locator source_;
        Locator destination_;
    };

    /**
     * @brief A non empty, ordered list of transfer requests. Owns no resources.
     */
    class TransferBatch
    {
      public:
        /**
         * @brief Fails with EmptyInput when requests is empty.
         */
        static std::expected<TransferBatch, TransferError> create(std::vector<TransferRequest> requests);

        /**
         * @brief Creates a batch where every source is transferred into the same destination directory.
         */
        static std::expected<TransferBatch, TransferError>
        intoDirectory(std::vector<std::string> const& sources, std::string const& destinationDirectory);

        std::vector<TransferRequest> const& requests() const
        {
            return requests_;
        }

        std::size_t size() const
        {
            return requests_.size();
        }

        std::vector<std::string> sourceStrings() const;

      private:
        explicit TransferBatch(std::vector<TransferRequest> requests);

      private:
        std::vector<TransferRequest> requests_;
    };
}
