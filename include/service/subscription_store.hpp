#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "data/data.hpp"

namespace nrelay
{
namespace service
{
///< A connection's subscriptions, keyed by subscription ID.
typedef std::unordered_map<std::string, std::vector<data::Filters>> SubscriptionMap;

/**
 * @brief The live subscriptions of every connection, keyed by connection ID.
 * @remark All methods are thread-safe.  Readers receive copies, so filters can be matched
 * without holding the store's lock.
 */
class SubscriptionStore
{
public:
    /**
     * @brief Registers a subscription on a connection, replacing any subscription with the same ID.
     * @param maxSubscriptions The maximum number of subscriptions the connection may hold.
     * @returns False if the connection would exceed `maxSubscriptions` or the store is suspended,
     * in which case nothing is changed.
     */
    bool put(
        const std::string& connectionId,
        const std::string& subscriptionId,
        std::vector<data::Filters> filters,
        std::size_t maxSubscriptions);

    /**
     * @brief Removes a single subscription.
     * @returns True if the subscription existed.
     */
    bool remove(const std::string& connectionId, const std::string& subscriptionId);

    /**
     * @brief Removes every subscription of the given connection.
     */
    void removeConnection(const std::string& connectionId);

    SubscriptionMap get(const std::string& connectionId) const;

    std::unordered_map<std::string, SubscriptionMap> snapshot() const;

    /**
     * @brief Removes every subscription of every connection and refuses new ones until `resume`
     * is called.
     * @returns The subscriptions that were removed.
     */
    std::unordered_map<std::string, SubscriptionMap> suspend();

    void resume();

    bool isSuspended() const;

    /**
     * @brief Discards the subscriptions of connections that are no longer open.
     * @param liveConnectionIds The IDs of the currently open connections.
     * @param limit The maximum number of connection entries examined in one pass.
     * @returns The number of connection entries removed.
     */
    std::size_t prune(const std::unordered_set<std::string>& liveConnectionIds, std::size_t limit);

private:
    mutable std::mutex _propertyMutex;

    std::unordered_map<std::string, SubscriptionMap> _subscriptions;

    bool _suspended = false;
};
} // namespace service
} // namespace nrelay
