#pragma once

#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief Computes the MD5 digest of the input and returns it as 32 lower case hex characters.
     * Not meant for anything security related.
     *
     * @throws std::runtime_error if the digest context cannot be created.
     */
    std::string md5Hex(std::string_view input);
}
