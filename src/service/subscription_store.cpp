#include "service/subscription_store.hpp"

using namespace nrelay::data;
using namespace nrelay::service;
using namespace std;

bool SubscriptionStore::put(
    const string& connectionId,
    const string& subscriptionId,
    vector<Filters> filters,
    size_t maxSubscriptions)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    if (this->_suspended)
    {
        return false;
    }

    SubscriptionMap& subscriptions = this->_subscriptions[connectionId];
    bool isReplacement = subscriptions.find(subscriptionId) != subscriptions.end();
    if (!isReplacement && subscriptions.size() + 1 > maxSubscriptions)
    {
        if (subscriptions.empty())
        {
            this->_subscriptions.erase(connectionId);
        }
        return false;
    }

    subscriptions[subscriptionId] = move(filters);
    return true;
};

bool SubscriptionStore::remove(const string& connectionId, const string& subscriptionId)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_subscriptions.find(connectionId);
    if (it == this->_subscriptions.end())
    {
        return false;
    }

    bool removed = it->second.erase(subscriptionId) > 0;
    if (it->second.empty())
    {
        this->_subscriptions.erase(it);
    }

    return removed;
};

void SubscriptionStore::removeConnection(const string& connectionId)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_subscriptions.erase(connectionId);
};

SubscriptionMap SubscriptionStore::get(const string& connectionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_subscriptions.find(connectionId);
    if (it == this->_subscriptions.end())
    {
        return SubscriptionMap();
    }

    return it->second;
};

unordered_map<string, SubscriptionMap> SubscriptionStore::snapshot() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_subscriptions;
};

unordered_map<string, SubscriptionMap> SubscriptionStore::suspend()
{
    lock_guard<mutex> lock(this->_propertyMutex);

    this->_suspended = true;
    unordered_map<string, SubscriptionMap> removed;
    removed.swap(this->_subscriptions);

    return removed;
};

void SubscriptionStore::resume()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_suspended = false;
};

bool SubscriptionStore::isSuspended() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_suspended;
};

size_t SubscriptionStore::prune(const unordered_set<string>& liveConnectionIds, size_t limit)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    size_t examined = 0;
    size_t deleted = 0;
    for (auto it = this->_subscriptions.begin(); it != this->_subscriptions.end() && examined < limit; examined++)
    {
        if (liveConnectionIds.find(it->first) != liveConnectionIds.end())
        {
            it++;
            continue;
        }

        it = this->_subscriptions.erase(it);
        deleted++;
    }

    return deleted;
};
