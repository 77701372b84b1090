#include <algorithm>

#include "protocol/messages.hpp"
#include "service/broadcaster.hpp"
#include "internal/logging.hpp"

using namespace nrelay::data;
using namespace nrelay::server;
using namespace nrelay::service;
using namespace std;

namespace messages = nrelay::protocol::messages;

Broadcaster::Broadcaster(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketServer> server,
    shared_ptr<ConnectionRegistry> connections,
    shared_ptr<SubscriptionStore> subscriptions)
: _server(server), _connections(connections), _subscriptions(subscriptions)
{
    nrelay::internal::initLogging(appender.get());
};

size_t Broadcaster::broadcast(const Event& event)
{
    auto liveConnectionIds = this->_connections->ids();
    auto subscriptionsByConnection = this->_subscriptions->snapshot();

    size_t sentCount = 0;
    for (const auto& [connectionId, subscriptions] : subscriptionsByConnection)
    {
        if (liveConnectionIds.find(connectionId) == liveConnectionIds.end())
        {
            continue;
        }

        for (const auto& [subscriptionId, filters] : subscriptions)
        {
            bool isMatch = any_of(filters.begin(), filters.end(), [&event](const Filters& filter)
            {
                return filter.matches(event);
            });
            if (!isMatch)
            {
                continue;
            }

            auto [id, success] = this->_server->send(messages::event(subscriptionId, event), connectionId);
            if (!success)
            {
                PLOG_WARNING << "Failed to deliver event " << event.id << " to connection " << id;
                continue;
            }
            sentCount++;
        }
    }

    PLOG_DEBUG << "Broadcast event " << event.id << " to " << sentCount << " subscriptions.";
    return sentCount;
};
