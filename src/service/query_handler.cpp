#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "protocol/messages.hpp"
#include "service/query_handler.hpp"
#include "internal/logging.hpp"

using namespace nlohmann;
using namespace nrelay::config;
using namespace nrelay::data;
using namespace nrelay::repository;
using namespace nrelay::server;
using namespace nrelay::service;
using namespace std;

namespace messages = nrelay::protocol::messages;

QueryHandler::QueryHandler(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketServer> server,
    shared_ptr<IEventRepository> repository,
    shared_ptr<SubscriptionStore> subscriptions,
    Limitation limitation)
: _server(server), _repository(repository), _subscriptions(subscriptions), _limitation(limitation)
{
    nrelay::internal::initLogging(appender.get());
};

void QueryHandler::handleRequest(const string& connectionId, const string& subscriptionId, const json& filters)
{
    if (subscriptionId.length() > static_cast<size_t>(this->_limitation.maxSubidLength))
    {
        PLOG_DEBUG << "Subscription ID too long on connection " << connectionId;
        this->_sendClosed(connectionId, subscriptionId, "unsupported: too long subscription id");
        return;
    }

    if (filters.size() > static_cast<size_t>(this->_limitation.maxFilters))
    {
        this->_sendClosed(connectionId, subscriptionId, "unsupported: too many filters");
        return;
    }

    vector<Filters> parsedFilters;
    try
    {
        for (const auto& filter : filters)
        {
            parsedFilters.push_back(Filters::fromJson(filter));
        }
    }
    catch (const invalid_argument& ia)
    {
        PLOG_DEBUG << "Unsupported filter in subscription " << subscriptionId << ": " << ia.what();
        this->_sendClosed(connectionId, subscriptionId, "unsupported: filters contain unsupported elements");
        return;
    }

    bool registered = this->_subscriptions->put(
        connectionId,
        subscriptionId,
        parsedFilters,
        static_cast<size_t>(this->_limitation.maxSubscriptions));
    if (!registered && this->_subscriptions->isSuspended())
    {
        this->_sendClosed(connectionId, subscriptionId, "error: closed due to maintenance");
        return;
    }
    if (!registered)
    {
        PLOG_DEBUG << "Too many subscriptions on connection " << connectionId;
        this->_sendClosed(connectionId, subscriptionId, "unsupported: too many subscriptions");
        return;
    }

    vector<Event> events;
    try
    {
        unordered_set<string> seenIds;
        for (const Filters& filter : parsedFilters)
        {
            for (Event& event : this->_repository->find(filter))
            {
                if (seenIds.insert(event.id).second)
                {
                    events.push_back(move(event));
                }
            }
        }
    }
    catch (const RepositoryError& re)
    {
        PLOG_ERROR << "Failed to query events for subscription " << subscriptionId << ": " << re.what();
        this->_subscriptions->remove(connectionId, subscriptionId);
        this->_sendClosed(connectionId, subscriptionId, "error: could not query events");
        return;
    }

    sort(events.begin(), events.end(), [](const Event& a, const Event& b)
    {
        if (a.createdAt != b.createdAt)
        {
            return a.createdAt > b.createdAt;
        }
        return a.id < b.id;
    });

    for (const Event& event : events)
    {
        if (!this->_send(connectionId, messages::event(subscriptionId, event)))
        {
            return;
        }
    }
    this->_send(connectionId, messages::eose(subscriptionId));

    PLOG_DEBUG << "Sent " << events.size() << " stored events for subscription " << subscriptionId;
};

void QueryHandler::handleClose(const string& connectionId, const string& subscriptionId)
{
    this->_subscriptions->remove(connectionId, subscriptionId);
};

void QueryHandler::_sendClosed(const string& connectionId, const string& subscriptionId, const string& message)
{
    this->_send(connectionId, messages::closed(subscriptionId, message));
};

bool QueryHandler::_send(const string& connectionId, const string& message)
{
    auto [id, success] = this->_server->send(message, connectionId);
    if (!success)
    {
        PLOG_WARNING << "Failed to send a query response to connection " << id;
    }

    return success;
};
