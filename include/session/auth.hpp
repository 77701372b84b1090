#pragma once

#include <chrono>
#include <string>

#include "data/data.hpp"
#include "session/connection.hpp"

namespace nrelay
{
namespace session
{
class Challenge
{
public:
    /**
     * @brief Issues a fresh challenge and records it on the connection, replacing any previous
     * one.
     * @returns The challenge string to send to the client.
     */
    static std::string issue(Connection& connection, std::chrono::system_clock::time_point now);

    /**
     * @brief Validates a NIP-42 authentication event against an outstanding challenge.
     * @param event The AUTH event.  Its signature must already have been verified.
     * @param auth The challenge issued to the connection.
     * @param url The relay URL of the connection.
     * @param timeout How long a challenge remains valid after it is issued.
     * @param now The current time.
     * @returns True if the event has the client authentication kind, the challenge has not
     * expired, and the event's `challenge` and `relay` tags match the session.
     */
    static bool validate(
        const data::Event& event,
        const AuthSession& auth,
        const std::string& url,
        std::chrono::seconds timeout,
        std::chrono::system_clock::time_point now);
};

/**
 * @brief Normalizes a relay URL so that equivalent spellings compare equal.
 * @remark The scheme defaults to `wss`, `http` and `https` map to `ws` and `wss`, the scheme and
 * host are lowercased, default ports are dropped, repeated and trailing slashes in the path are
 * removed, and any fragment is discarded.
 */
std::string normalizeUrl(const std::string& url);
} // namespace session
} // namespace nrelay
