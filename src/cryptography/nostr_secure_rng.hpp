#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nrelay
{
namespace cryptography
{

class NostrSecureRng
{
public:

    /**
     * @brief Fills the given buffer with secure random bytes.
     * @param buffer The buffer to fill with random bytes.
     * @param length The number of bytes to fill.
     * @throws `std::runtime_error` if OpenSSL cannot produce random bytes.
     */
    static void fill(void* buffer, size_t length);

    /*
     * @brief Fills the given vector with secure random bytes.
     * @param buffer The vector to fill with random bytes.
     */
    static inline void fill(std::vector<uint8_t>& buffer)
    {
        fill(buffer.data(), buffer.size());
    }

    /*
     * @brief Generates a lowercase hex token from `byteCount` secure random bytes.
     */
    static std::string token(size_t byteCount = 32);

    /*
     * @brief Securley zeroes out the given buffer.
     * @param buffer A pointer to the buffer to zero out.
     * @param length The number of bytes to zero out.
     */
    static void zero(void* buffer, size_t length);

    /*
     * @brief Securley zeroes out the given vector.
     * @param buffer The vector to zero out.
     */
    static inline void zero(std::vector<uint8_t>& buffer)
    {
        zero(buffer.data(), buffer.size());
    }
};

} // namespace cryptography
} // namespace nrelay
