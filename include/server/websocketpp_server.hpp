#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>
#include <uuid_v4.h>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "web_socket_server.hpp"

namespace nrelay
{
namespace server
{
/**
 * @brief An implementation of the `IWebSocketServer` interface that uses the WebSocket++ library.
 * @remark TLS is expected to be terminated by a reverse proxy in front of the relay.
 */
class WebsocketppServer : public IWebSocketServer
{
public:
    WebsocketppServer(std::shared_ptr<plog::IAppender> appender);

    ~WebsocketppServer() override;

    void start(std::uint16_t port, int threadCount) override;

    void stop() override;

    void receive(
        std::function<bool()> admissionHandler,
        std::function<void(const ConnectionInfo&)> openHandler,
        std::function<void(const std::string&, const std::string&)> messageHandler,
        std::function<void(const std::string&)> closeHandler) override;

    void setInformationDocument(std::string document) override;

    std::tuple<std::string, bool> send(std::string message, std::string connectionId) override;

    void closeConnection(std::string connectionId, std::string reason) override;

    void schedule(std::chrono::seconds interval, std::function<void()> task) override;

    /**
     * @brief Rewrites a request URI into the URL clients use to reach the relay.
     * @param forwardedProto The `X-Forwarded-Proto` header sent by the reverse proxy, if any.
     * @remark The scheme is `ws` only when the proxy reports a plain `http` or `ws` request.
     * Otherwise it is `wss`, since TLS is terminated before the request reaches the relay.
     */
    static std::string publicUrl(const std::string& requestUri, const std::string& forwardedProto);

private:
    typedef websocketpp::server<websocketpp::config::asio> websocketpp_server;
    typedef std::map<websocketpp::connection_hdl, std::string, std::owner_less<websocketpp::connection_hdl>> connection_id_map;

    ///< Seconds a client refused during maintenance is asked to wait before retrying.
    static constexpr int RETRY_AFTER_SECONDS = 3600;

    websocketpp_server _server;
    std::vector<std::thread> _threads;
    std::atomic<bool> _running = false;

    ///< A mutex to protect the connection maps, timers, and ID generator.
    std::mutex _propertyMutex;
    std::unordered_map<std::string, websocketpp::connection_hdl> _connectionHandles;
    connection_id_map _connectionIds;
    std::vector<websocketpp_server::timer_ptr> _timers;
    UUIDv4::UUIDGenerator<std::mt19937_64> _uuidGenerator;
    std::string _informationDocument;

    std::function<bool()> _admissionHandler;
    std::function<void(const ConnectionInfo&)> _openHandler;
    std::function<void(const std::string&, const std::string&)> _messageHandler;
    std::function<void(const std::string&)> _closeHandler;

    bool _onValidate(websocketpp::connection_hdl handle);

    void _onOpen(websocketpp::connection_hdl handle);

    void _onMessage(websocketpp::connection_hdl handle, websocketpp_server::message_ptr message);

    void _onClose(websocketpp::connection_hdl handle);

    void _onHttp(websocketpp::connection_hdl handle);

    std::optional<std::string> _findConnectionId(websocketpp::connection_hdl handle);

    void _armTimer(std::chrono::seconds interval, std::function<void()> task);
};
} // namespace server
} // namespace nrelay
