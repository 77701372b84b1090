#include <stdexcept>

#include "data/data.hpp"
#include "protocol/messages.hpp"
#include "service/relay_service.hpp"
#include "session/auth.hpp"
#include "internal/logging.hpp"

using namespace nlohmann;
using namespace nrelay::config;
using namespace nrelay::data;
using namespace nrelay::repository;
using namespace nrelay::server;
using namespace nrelay::service;
using namespace nrelay::session;
using namespace nrelay::verifier;
using namespace std;

namespace messages = nrelay::protocol::messages;

RelayService::RelayService(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketServer> server,
    shared_ptr<IEventVerifier> verifier,
    shared_ptr<IEventRepository> repository,
    shared_ptr<IAccountRegistry> accounts,
    RelayConfig config,
    Clock clock)
: _server(server), _verifier(verifier), _accounts(accounts), _config(config), _clock(clock)
{
    nrelay::internal::initLogging(appender.get());

    this->_connections = make_shared<ConnectionRegistry>();
    this->_subscriptions = make_shared<SubscriptionStore>();
    this->_ingester = make_unique<EventIngester>(appender, verifier, repository, config.limitation);
    this->_broadcaster = make_unique<Broadcaster>(appender, server, this->_connections, this->_subscriptions);
    this->_queryHandler = make_unique<QueryHandler>(
        appender,
        server,
        repository,
        this->_subscriptions,
        config.limitation);

    this->_server->receive(
        [this]() { return !this->_maintenance; },
        [this](const ConnectionInfo& info) { this->_onOpen(info); },
        [this](const string& connectionId, const string& message) { this->_onMessage(connectionId, message); },
        [this](const string& connectionId) { this->_onClose(connectionId); });
};

RelayService::~RelayService()
{
    this->stop();
};

void RelayService::start()
{
    this->_server->setInformationDocument(this->_config.informationDocument().dump());
    this->_server->start(this->_config.port, this->_config.threads);
    this->_server->schedule(this->_config.pruneInterval, [this]()
    {
        size_t deleted = this->prune();
        if (deleted > 0)
        {
            PLOG_INFO << "Pruned subscriptions of " << deleted << " closed connections.";
        }
    });

    PLOG_INFO << "Relay started on port " << this->_config.port;
};

void RelayService::stop()
{
    this->_server->stop();
};

#pragma region Maintenance

void RelayService::enableMaintenance()
{
    PLOG_INFO << "Enabling maintenance.";

    this->_maintenance = true;
    auto removed = this->_subscriptions->suspend();

    for (const string& connectionId : this->_connections->ids())
    {
        auto it = removed.find(connectionId);
        if (it != removed.end())
        {
            for (const auto& [subscriptionId, filters] : it->second)
            {
                this->_send(connectionId, messages::closed(subscriptionId, "error: closed due to maintenance"));
            }
        }

        this->_send(connectionId, messages::notice("disconnected due to maintenance"));
        this->_server->closeConnection(connectionId, "maintenance");
    }
};

void RelayService::disableMaintenance()
{
    PLOG_INFO << "Disabling maintenance.";
    this->_maintenance = false;
    this->_subscriptions->resume();
};

bool RelayService::isInMaintenance() const
{
    return this->_maintenance;
};

#pragma endregion

size_t RelayService::prune()
{
    auto liveConnectionIds = this->_connections->ids();
    size_t deleted = this->_subscriptions->prune(liveConnectionIds, PRUNE_LIMIT);

    PLOG_DEBUG << "Prune removed " << deleted << " entries with " << liveConnectionIds.size() << " open connections.";
    return deleted;
};

Metrics RelayService::metrics() const
{
    auto liveConnectionIds = this->_connections->ids();
    auto subscriptionsByConnection = this->_subscriptions->snapshot();

    Metrics metrics{ liveConnectionIds.size(), 0, 0 };
    for (const auto& [connectionId, subscriptions] : subscriptionsByConnection)
    {
        if (liveConnectionIds.find(connectionId) == liveConnectionIds.end())
        {
            continue;
        }

        metrics.subscriptions += subscriptions.size();
        for (const auto& [subscriptionId, filters] : subscriptions)
        {
            metrics.filters += filters.size();
        }
    }

    return metrics;
};

#pragma region Connection Handlers

void RelayService::_onOpen(const ConnectionInfo& info)
{
    auto connection = make_shared<Connection>();
    connection->id = info.id;
    connection->ipAddress = info.ipAddress;
    connection->url = this->_config.serviceUrl.value_or(info.url);

    string challenge;
    if (this->_config.limitation.authRequired)
    {
        challenge = Challenge::issue(*connection, this->_clock());
    }

    this->_connections->add(connection);

    if (!challenge.empty())
    {
        this->_send(connection->id, messages::auth(challenge));
    }
};

void RelayService::_onMessage(const string& connectionId, const string& message)
{
    auto connection = this->_connections->find(connectionId);
    if (connection == nullptr)
    {
        PLOG_WARNING << "Received a message on unknown connection " << connectionId;
        return;
    }

    json jMessage;
    try
    {
        jMessage = json::parse(message);
    }
    catch (const json::parse_error& pe)
    {
        PLOG_DEBUG << "Unparseable message on connection " << connectionId << ": " << pe.what();
        this->_send(connectionId, messages::notice("invalid: message is not JSON"));
        return;
    }

    if (!jMessage.is_array() || jMessage.empty() || !jMessage[0].is_string())
    {
        this->_send(connectionId, messages::notice("invalid: message must be a JSON array with a type"));
        return;
    }

    string messageType = jMessage[0];
    try
    {
        if (messageType == "EVENT")
        {
            this->_handleEvent(*connection, jMessage);
        }
        else if (messageType == "REQ")
        {
            this->_handleRequest(*connection, jMessage);
        }
        else if (messageType == "CLOSE")
        {
            this->_handleClose(*connection, jMessage);
        }
        else if (messageType == "AUTH")
        {
            this->_handleAuth(*connection, jMessage);
        }
        else
        {
            this->_send(connectionId, messages::notice("invalid: unknown message type " + messageType));
        }
    }
    catch (const invalid_argument& ia)
    {
        PLOG_WARNING << "Invalid " << messageType << " message on connection " << connectionId << ": " << ia.what();
        this->_send(connectionId, messages::notice(string("invalid: ") + ia.what()));
    }
    catch (const RepositoryError& re)
    {
        PLOG_ERROR << "Storage failure handling " << messageType << " on connection " << connectionId << ": " << re.what();
        this->_send(connectionId, messages::notice("error: internal storage failure"));
    }
    catch (const json::exception& je)
    {
        PLOG_WARNING << "Malformed " << messageType << " message on connection " << connectionId << ": " << je.what();
        this->_send(connectionId, messages::notice("invalid: malformed " + messageType + " message"));
    }
};

void RelayService::_onClose(const string& connectionId)
{
    this->_connections->remove(connectionId);
    this->_subscriptions->removeConnection(connectionId);
};

#pragma endregion

#pragma region Message Handlers

void RelayService::_handleEvent(Connection& connection, const json& message)
{
    if (message.size() < 2)
    {
        throw invalid_argument("EVENT message requires an event.");
    }

    Event event = Event::fromJson(message[1]);
    IngestResult result = this->_ingester->ingest(event, connection, this->_clock());

    if (result.challenge)
    {
        this->_send(connection.id, messages::auth(*result.challenge));
    }
    this->_send(connection.id, messages::ok(event.id, result.accepted, result.message));

    if (result.broadcast)
    {
        this->_broadcaster->broadcast(event);
    }
};

void RelayService::_handleRequest(Connection& connection, const json& message)
{
    if (message.size() < 2 || !message[1].is_string())
    {
        throw invalid_argument("REQ message requires a subscription ID.");
    }

    json filters = json::array();
    for (size_t i = 2; i < message.size(); i++)
    {
        filters.push_back(message[i]);
    }

    this->_queryHandler->handleRequest(connection.id, message[1].get<string>(), filters);
};

void RelayService::_handleClose(Connection& connection, const json& message)
{
    if (message.size() < 2 || !message[1].is_string())
    {
        throw invalid_argument("CLOSE message requires a subscription ID.");
    }

    this->_queryHandler->handleClose(connection.id, message[1].get<string>());
};

void RelayService::_handleAuth(Connection& connection, const json& message)
{
    if (message.size() < 2)
    {
        throw invalid_argument("AUTH message requires an event.");
    }

    Event event = Event::fromJson(message[1]);

    if (connection.isAuthenticatedAs(event.pubkey))
    {
        this->_send(connection.id, messages::ok(event.id, true, "duplicate: already authenticated"));
        return;
    }

    size_t authLimit = static_cast<size_t>(this->_config.authLimit);
    if (connection.pubkeys.size() >= authLimit)
    {
        PLOG_DEBUG << "Too many authentications on connection " << connection.id;
        this->_send(
            connection.id,
            messages::notice("rate-limited: too many authentications (> " + to_string(authLimit) + ")"));
        return;
    }

    bool isValid = connection.auth.has_value()
        && this->_verifier->verify(event)
        && Challenge::validate(event, *connection.auth, connection.url, this->_config.authTimeout, this->_clock());
    if (!isValid)
    {
        PLOG_DEBUG << "Invalid AUTH event " << event.id << " on connection " << connection.id;
        this->_send(connection.id, messages::ok(event.id, false, "invalid: auth"));
        return;
    }

    const Limitation& limitation = this->_config.limitation;
    if ((limitation.authRequired || limitation.restrictedWrites) && !this->_accounts->isRegistered(event.pubkey))
    {
        PLOG_DEBUG << "Unregistered pubkey " << event.pubkey << " attempted to authenticate.";
        this->_send(connection.id, messages::ok(event.id, false, "restricted: required to register"));
        return;
    }

    connection.pubkeys.insert(event.pubkey);
    PLOG_INFO << "Connection " << connection.id << " authenticated as " << event.pubkey;
    this->_send(connection.id, messages::ok(event.id, true, ""));
};

#pragma endregion

void RelayService::_send(const string& connectionId, const string& message)
{
    auto [id, success] = this->_server->send(message, connectionId);
    if (!success)
    {
        PLOG_WARNING << "Failed to send message to connection " << id;
    }
};
