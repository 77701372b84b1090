#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace nrelay
{
namespace config
{
/**
 * @brief Relay limits and policy flags, as advertised in the `limitation` object of the NIP-11
 * relay information document.
 */
struct Limitation
{
    int maxSubscriptions = 20; ///< Maximum number of open subscriptions per connection.
    int maxFilters = 10; ///< Maximum number of filters per subscription.
    int maxLimit = 500; ///< Upper bound applied to the `limit` of a filter.
    int maxSubidLength = 50; ///< Maximum length of a subscription ID.
    bool authRequired = false; ///< Whether every client must authenticate.
    bool restrictedWrites = true; ///< Whether only registered pubkeys may publish.
};

/**
 * @brief Process configuration of the relay.
 * @remark Every key is optional.  Keys missing from the configuration file keep their defaults.
 */
struct RelayConfig
{
    nlohmann::json nip11; ///< Descriptive fields of the relay information document.
    Limitation limitation;
    std::chrono::seconds authTimeout{ 600 }; ///< Lifetime of an AUTH challenge.
    int authLimit = 5; ///< Maximum number of pubkeys one connection may authenticate as.
    int defaultLimit = 50; ///< Query limit used when a filter has none.
    std::chrono::seconds pruneInterval{ 300 }; ///< Period of the stale subscription sweep.
    std::string database = "nrelay.sqlite"; ///< Path of the SQLite database.
    std::uint16_t port = 7447;
    int threads = 4; ///< Number of threads running the WebSocket server.
    std::optional<std::string> serviceUrl; ///< Public relay URL, when it differs from the request URL.

    RelayConfig();

    /**
     * @brief Reads the configuration from a JSON object laid out like the relay information
     * document, with relay settings beside the `nip11` block.
     * @throws `std::invalid_argument` if a present key has the wrong type.
     */
    static RelayConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Reads the configuration from a JSON file.
     * @throws `std::invalid_argument` if the file cannot be read or parsed.
     */
    static RelayConfig fromFile(const std::string& path);

    /**
     * @brief Builds the NIP-11 relay information document served over HTTP.
     */
    nlohmann::json informationDocument() const;
};
} // namespace config
} // namespace nrelay
