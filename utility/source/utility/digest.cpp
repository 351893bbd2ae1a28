#include <utility/digest.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace Utility
{
    std::string md5Hex(std::string_view input)
    {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
        if (!context)
            throw std::runtime_error("Could not create digest context.");

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digestLength = 0;

        if (EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1 ||
            EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
            EVP_DigestFinal_ex(context.get(), digest.data(), &digestLength) != 1)
        {
            throw std::runtime_error("MD5 digest computation failed.");
        }

        std::string result;
        result.reserve(digestLength * 2);
        for (unsigned int i = 0; i < digestLength; ++i)
            result += fmt::format("{:02x}", digest[i]);
        return result;
    }
}
