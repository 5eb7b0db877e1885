#pragma once
#include <limits>
#include <string>
#include <string_view>
#include <openssl/bio.h>

#include <ecsuite/crypto/pointers.hpp>
#include <ecsuite/crypto/exception.hpp>

namespace ecsuite::crypto
{

class BioTraits
{
public:
    static inline BioPtr createMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_mem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    /// @brief Creates a read-only BIO over @p data without copying it.
    static inline BioPtr createMemoryReader(const uint8_t* data, size_t size)
    {
        constexpr size_t limit = std::numeric_limits<int>::max();
        ThrowIfTrue(size > limit, "input too large");
        BioPtr bio{BIO_new_mem_buf(data, static_cast<int>(size))};
        ThrowIfTrue(bio == nullptr);
        return bio;
    }

    static inline BioPtr createMemoryReader(std::string_view text)
    {
        return createMemoryReader(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    static inline std::string getMemoryDataAsString(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(length < 0 || (length > 0 && data == nullptr), "invalid pointer");
        return std::string(data, length);
    }
};

} // namespace ecsuite::crypto
