#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <plog/Init.h>
#include <plog/Log.h>

#include "config/relay_config.hpp"
#include "repository/event_repository.hpp"
#include "server/web_socket_server.hpp"
#include "service/subscription_store.hpp"

namespace nrelay
{
namespace service
{
/**
 * @brief Handles REQ and CLOSE messages: registers subscriptions and answers them with stored
 * events.
 */
class QueryHandler
{
public:
    QueryHandler(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<server::IWebSocketServer> server,
        std::shared_ptr<repository::IEventRepository> repository,
        std::shared_ptr<SubscriptionStore> subscriptions,
        config::Limitation limitation);

    /**
     * @brief Opens or replaces a subscription and sends the matching stored events followed by
     * EOSE.
     * @param filters The raw filter objects of the REQ message.
     * @remark Requests that exceed the relay's limits or contain unsupported filters are refused
     * with a CLOSED message and register nothing.  The subscription is registered before the
     * stored events are queried, so events accepted during the query are delivered live.
     */
    void handleRequest(
        const std::string& connectionId,
        const std::string& subscriptionId,
        const nlohmann::json& filters);

    /**
     * @brief Closes a subscription.  Unknown subscription IDs are ignored.
     */
    void handleClose(const std::string& connectionId, const std::string& subscriptionId);

private:
    std::shared_ptr<server::IWebSocketServer> _server;
    std::shared_ptr<repository::IEventRepository> _repository;
    std::shared_ptr<SubscriptionStore> _subscriptions;
    config::Limitation _limitation;

    void _sendClosed(const std::string& connectionId, const std::string& subscriptionId, const std::string& message);

    bool _send(const std::string& connectionId, const std::string& message);
};
} // namespace service
} // namespace nrelay
