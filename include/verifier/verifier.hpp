#pragma once

#include "data/data.hpp"

namespace nrelay
{
namespace verifier
{
/**
 * @brief An interface for validating incoming Nostr events.
 */
class IEventVerifier
{
public:
    virtual ~IEventVerifier() = default;

    /**
     * @brief Checks that the event is well formed, that its ID is the hash of its data, and that
     * its signature was made over the ID by the key in `pubkey`.
     * @returns True if every check passes, false otherwise.
     * @remark Implementations fail closed and never throw.
     */
    virtual bool verify(const data::Event& event) = 0;
};
} // namespace verifier
} // namespace nrelay
