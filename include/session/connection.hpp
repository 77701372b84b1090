#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>

namespace nrelay
{
namespace session
{
/**
 * @brief An outstanding NIP-42 authentication challenge.
 */
struct AuthSession
{
    std::string challenge; ///< Unguessable one-time token sent to the client.
    std::chrono::system_clock::time_point challengedAt; ///< When the challenge was issued.
};

/**
 * @brief Per-connection session state.
 * @remark A connection record is owned by the relay service and only mutated while handling a
 * frame received on that connection.
 */
struct Connection
{
    std::string id; ///< Opaque connection ID.
    std::optional<std::string> ipAddress; ///< Client network address, if known.
    std::string url; ///< Relay URL the client connected to, used to bind AUTH events.
    std::optional<AuthSession> auth; ///< The most recently issued challenge.
    std::unordered_set<std::string> pubkeys; ///< Pubkeys the client has authenticated as.

    bool isAuthenticatedAs(const std::string& pubkey) const
    {
        return this->pubkeys.find(pubkey) != this->pubkeys.end();
    };
};
} // namespace session
} // namespace nrelay
