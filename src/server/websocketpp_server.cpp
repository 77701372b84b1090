#include <algorithm>

#include "server/websocketpp_server.hpp"
#include "hex.hpp"
#include "internal/logging.hpp"

using namespace nrelay::server;
using namespace std;

using websocketpp::connection_hdl;
using websocketpp::lib::error_code;

WebsocketppServer::WebsocketppServer(shared_ptr<plog::IAppender> appender)
{
    nrelay::internal::initLogging(appender.get());

    this->_server.clear_access_channels(websocketpp::log::alevel::all);
    this->_server.clear_error_channels(websocketpp::log::elevel::all);
    this->_server.set_error_channels(websocketpp::log::elevel::warn | websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);
    this->_server.init_asio();
    this->_server.set_reuse_addr(true);

    this->_server.set_validate_handler([this](connection_hdl handle) { return this->_onValidate(handle); });
    this->_server.set_open_handler([this](connection_hdl handle) { this->_onOpen(handle); });
    this->_server.set_message_handler([this](connection_hdl handle, websocketpp_server::message_ptr message)
    {
        this->_onMessage(handle, message);
    });
    this->_server.set_close_handler([this](connection_hdl handle) { this->_onClose(handle); });
    this->_server.set_http_handler([this](connection_hdl handle) { this->_onHttp(handle); });
};

WebsocketppServer::~WebsocketppServer()
{
    this->stop();
};

void WebsocketppServer::start(uint16_t port, int threadCount)
{
    error_code error;
    this->_server.listen(port, error);
    if (error)
    {
        PLOG_ERROR << "Failed to listen on port " << port << ": " << error.message();
        throw runtime_error("WebsocketppServer: " + error.message());
    }

    this->_server.start_accept(error);
    if (error)
    {
        PLOG_ERROR << "Failed to accept connections: " << error.message();
        throw runtime_error("WebsocketppServer: " + error.message());
    }

    this->_running = true;
    for (int i = 0; i < threadCount; i++)
    {
        this->_threads.emplace_back([this]() { this->_server.run(); });
    }

    PLOG_INFO << "Listening on port " << port << " with " << threadCount << " threads.";
};

void WebsocketppServer::stop()
{
    if (!this->_running)
    {
        return;
    }
    this->_running = false;

    PLOG_INFO << "Stopping the WebSocket server.";

    error_code error;
    this->_server.stop_listening(error);

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (auto& timer : this->_timers)
        {
            timer->cancel();
        }
        this->_timers.clear();

        for (auto& [id, handle] : this->_connectionHandles)
        {
            this->_server.close(handle, websocketpp::close::status::going_away, "relay shutting down", error);
        }
    }

    this->_server.stop();
    for (thread& serverThread : this->_threads)
    {
        if (serverThread.joinable())
        {
            serverThread.join();
        }
    }
    this->_threads.clear();
};

void WebsocketppServer::receive(
    function<bool()> admissionHandler,
    function<void(const ConnectionInfo&)> openHandler,
    function<void(const string&, const string&)> messageHandler,
    function<void(const string&)> closeHandler)
{
    this->_admissionHandler = admissionHandler;
    this->_openHandler = openHandler;
    this->_messageHandler = messageHandler;
    this->_closeHandler = closeHandler;
};

void WebsocketppServer::setInformationDocument(string document)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_informationDocument = document;
};

tuple<string, bool> WebsocketppServer::send(string message, string connectionId)
{
    error_code error;

    // Make sure the connection isn't closed from under us.
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connectionHandles.find(connectionId);
    if (it == this->_connectionHandles.end())
    {
        return make_tuple(connectionId, false);
    }

    this->_server.send(it->second, message, websocketpp::frame::opcode::text, error);
    if (error)
    {
        PLOG_WARNING << "Failed to send to connection " << connectionId << ": " << error.message();
        return make_tuple(connectionId, false);
    }

    return make_tuple(connectionId, true);
};

void WebsocketppServer::closeConnection(string connectionId, string reason)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_connectionHandles.find(connectionId);
    if (it == this->_connectionHandles.end())
    {
        return;
    }

    error_code error;
    this->_server.close(it->second, websocketpp::close::status::going_away, reason, error);
    if (error)
    {
        PLOG_WARNING << "Failed to close connection " << connectionId << ": " << error.message();
    }
};

void WebsocketppServer::schedule(chrono::seconds interval, function<void()> task)
{
    this->_armTimer(interval, task);
};

string WebsocketppServer::publicUrl(const string& requestUri, const string& forwardedProto)
{
    size_t schemeEnd = requestUri.find("://");
    string location = schemeEnd == string::npos ? requestUri : requestUri.substr(schemeEnd + 3);

    string proto = nrelay::encoding::toLower(forwardedProto.substr(0, forwardedProto.find(',')));
    proto.erase(0, proto.find_first_not_of(' '));
    proto.erase(proto.find_last_not_of(' ') + 1);

    string scheme = proto == "http" || proto == "ws" ? "ws" : "wss";
    return scheme + "://" + location;
};

bool WebsocketppServer::_onValidate(connection_hdl handle)
{
    if (!this->_admissionHandler || this->_admissionHandler())
    {
        return true;
    }

    auto connection = this->_server.get_con_from_hdl(handle);
    connection->set_status(websocketpp::http::status_code::service_unavailable);
    connection->append_header("Retry-After", to_string(RETRY_AFTER_SECONDS));

    PLOG_INFO << "Refused connection from " << connection->get_remote_endpoint() << " during maintenance.";
    return false;
};

void WebsocketppServer::_onOpen(connection_hdl handle)
{
    auto connection = this->_server.get_con_from_hdl(handle);

    ConnectionInfo info;
    info.url = publicUrl(connection->get_uri()->str(), connection->get_request_header("X-Forwarded-Proto"));

    string forwardedFor = connection->get_request_header("CF-Connecting-IP");
    if (forwardedFor.empty())
    {
        forwardedFor = connection->get_request_header("X-Forwarded-For");
        forwardedFor = forwardedFor.substr(0, forwardedFor.find(','));
    }
    info.ipAddress = forwardedFor.empty() ? connection->get_remote_endpoint() : forwardedFor;

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        info.id = this->_uuidGenerator.getUUID().str();
        this->_connectionHandles[info.id] = handle;
        this->_connectionIds[handle] = info.id;
    }

    PLOG_DEBUG << "Opened connection " << info.id << " from " << *info.ipAddress;

    if (this->_openHandler)
    {
        this->_openHandler(info);
    }
};

void WebsocketppServer::_onMessage(connection_hdl handle, websocketpp_server::message_ptr message)
{
    if (message->get_opcode() != websocketpp::frame::opcode::text)
    {
        return;
    }

    auto connectionId = this->_findConnectionId(handle);
    if (!connectionId || !this->_messageHandler)
    {
        return;
    }

    this->_messageHandler(*connectionId, message->get_payload());
};

void WebsocketppServer::_onClose(connection_hdl handle)
{
    optional<string> connectionId;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_connectionIds.find(handle);
        if (it != this->_connectionIds.end())
        {
            connectionId = it->second;
            this->_connectionHandles.erase(it->second);
            this->_connectionIds.erase(it);
        }
    }

    if (!connectionId)
    {
        return;
    }

    PLOG_DEBUG << "Closed connection " << *connectionId;

    if (this->_closeHandler)
    {
        this->_closeHandler(*connectionId);
    }
};

void WebsocketppServer::_onHttp(connection_hdl handle)
{
    auto connection = this->_server.get_con_from_hdl(handle);
    connection->append_header("Access-Control-Allow-Origin", "*");

    string accept = connection->get_request_header("Accept");
    if (accept.find("application/nostr+json") != string::npos)
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        connection->set_status(websocketpp::http::status_code::ok);
        connection->append_header("Content-Type", "application/nostr+json");
        connection->set_body(this->_informationDocument);
        return;
    }

    connection->set_status(websocketpp::http::status_code::ok);
    connection->append_header("Content-Type", "text/plain");
    connection->set_body("Please use a Nostr client to connect.");
};

optional<string> WebsocketppServer::_findConnectionId(connection_hdl handle)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connectionIds.find(handle);
    if (it == this->_connectionIds.end())
    {
        return nullopt;
    }

    return it->second;
};

void WebsocketppServer::_armTimer(chrono::seconds interval, function<void()> task)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    if (!this->_running)
    {
        return;
    }

    auto milliseconds = chrono::duration_cast<chrono::milliseconds>(interval).count();
    auto timer = this->_server.set_timer(milliseconds, [this, interval, task](const error_code& error)
    {
        if (error)
        {
            return;
        }

        task();
        this->_armTimer(interval, task);
    });
    this->_timers.erase(
        remove_if(this->_timers.begin(), this->_timers.end(), [](const websocketpp_server::timer_ptr& armed)
        {
            return armed->expiry() <= chrono::steady_clock::now();
        }),
        this->_timers.end());
    this->_timers.push_back(timer);
};
