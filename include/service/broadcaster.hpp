#pragma once

#include <cstddef>
#include <memory>

#include <plog/Init.h>
#include <plog/Log.h>

#include "data/data.hpp"
#include "server/web_socket_server.hpp"
#include "service/connection_registry.hpp"
#include "service/subscription_store.hpp"

namespace nrelay
{
namespace service
{
/**
 * @brief Delivers newly accepted events to the live subscriptions they match.
 */
class Broadcaster
{
public:
    Broadcaster(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<server::IWebSocketServer> server,
        std::shared_ptr<ConnectionRegistry> connections,
        std::shared_ptr<SubscriptionStore> subscriptions);

    /**
     * @brief Sends the event once to every subscription of every open connection that has a
     * filter matching it, including the subscriptions of the connection that published it.
     * @returns The number of frames successfully sent.
     * @remark A failed send is logged and skipped.
     */
    std::size_t broadcast(const data::Event& event);

private:
    std::shared_ptr<server::IWebSocketServer> _server;
    std::shared_ptr<ConnectionRegistry> _connections;
    std::shared_ptr<SubscriptionStore> _subscriptions;
};
} // namespace service
} // namespace nrelay
