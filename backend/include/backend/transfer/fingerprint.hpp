#pragma once

#include <shared_data/transfer_error.hpp>

#include <expected>
#include <string>
#include <vector>

/**
 * @brief Derives a short identifier from a list of source locators.
 *
 * Only the count and a few lengths enter the digest, so different batches can share a fingerprint. It is a file
 * naming aid, not a content hash.
 *
 * @return 8 lower case hex characters or EmptyInput.
 */
std::expected<std::string, SharedData::TransferError> batchFingerprint(std::vector<std::string> const& sources);
