#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <plog/Init.h>
#include <plog/Log.h>

#include "config/relay_config.hpp"
#include "repository/event_repository.hpp"
#include "server/web_socket_server.hpp"
#include "service/broadcaster.hpp"
#include "service/connection_registry.hpp"
#include "service/event_ingester.hpp"
#include "service/query_handler.hpp"
#include "service/subscription_store.hpp"
#include "session/connection.hpp"
#include "verifier/verifier.hpp"

namespace nrelay
{
namespace service
{
/**
 * @brief Counts of the relay's live state.
 */
struct Metrics
{
    std::size_t connections; ///< Open connections.
    std::size_t subscriptions; ///< Subscriptions held by open connections.
    std::size_t filters; ///< Filters across those subscriptions.
};

/**
 * @brief The relay controller.  Owns the session of every connection and dispatches client
 * messages to the ingestion, query, and authentication handlers.
 */
class RelayService
{
public:
    typedef std::function<std::chrono::system_clock::time_point()> Clock;

    ///< The maximum number of connection entries examined by one prune pass.
    static constexpr std::size_t PRUNE_LIMIT = 2000;

    RelayService(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<server::IWebSocketServer> server,
        std::shared_ptr<verifier::IEventVerifier> verifier,
        std::shared_ptr<repository::IEventRepository> repository,
        std::shared_ptr<repository::IAccountRegistry> accounts,
        config::RelayConfig config,
        Clock clock = std::chrono::system_clock::now);

    ~RelayService();

    /**
     * @brief Attaches the relay to the server, schedules the prune sweep, and starts the server.
     * @throws `std::runtime_error` if the server cannot listen on the configured port.
     */
    void start();

    void stop();

    /**
     * @brief Puts the relay into maintenance.
     * @remark Every subscription is closed, every client is notified and disconnected, and new
     * connections are refused until maintenance is disabled.
     */
    void enableMaintenance();

    void disableMaintenance();

    bool isInMaintenance() const;

    /**
     * @brief Discards subscription state left behind by connections that are no longer open.
     * @returns The number of connection entries removed.
     * @remark At most `PRUNE_LIMIT` entries are examined per call.
     */
    std::size_t prune();

    Metrics metrics() const;

private:
    std::shared_ptr<server::IWebSocketServer> _server;
    std::shared_ptr<verifier::IEventVerifier> _verifier;
    std::shared_ptr<repository::IAccountRegistry> _accounts;
    config::RelayConfig _config;
    Clock _clock;

    std::shared_ptr<ConnectionRegistry> _connections;
    std::shared_ptr<SubscriptionStore> _subscriptions;
    std::unique_ptr<EventIngester> _ingester;
    std::unique_ptr<Broadcaster> _broadcaster;
    std::unique_ptr<QueryHandler> _queryHandler;

    std::atomic<bool> _maintenance = false;

    void _onOpen(const server::ConnectionInfo& info);

    void _onMessage(const std::string& connectionId, const std::string& message);

    void _onClose(const std::string& connectionId);

    void _handleEvent(session::Connection& connection, const nlohmann::json& message);

    void _handleRequest(session::Connection& connection, const nlohmann::json& message);

    void _handleClose(session::Connection& connection, const nlohmann::json& message);

    void _handleAuth(session::Connection& connection, const nlohmann::json& message);

    void _send(const std::string& connectionId, const std::string& message);
};
} // namespace service
} // namespace nrelay
