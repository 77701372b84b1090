#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>

namespace nrelay
{
namespace server
{
/**
 * @brief Transport details of an accepted connection.
 */
struct ConnectionInfo
{
    std::string id; ///< Unique ID assigned by the server.
    std::optional<std::string> ipAddress; ///< Client address, from a proxy header if present.
    std::string url; ///< WebSocket URL the client requested.
};

/**
 * @brief An interface for a WebSocket server that accepts Nostr client connections.
 */
class IWebSocketServer
{
public:
    virtual ~IWebSocketServer() = default;

    /**
     * @brief Starts accepting connections.
     * @param port The TCP port to listen on.
     * @param threadCount The number of threads that run the server's event loop.
     * @remark Handlers must be attached with `receive` before the server is started.
     */
    virtual void start(std::uint16_t port, int threadCount) = 0;

    /**
     * @brief Stops accepting connections, closes every open connection, and joins the server
     * threads.
     */
    virtual void stop() = 0;

    /**
     * @brief Attaches the handlers the server invokes for connection events.
     * @param admissionHandler Invoked for each WebSocket upgrade request.  Returning false refuses
     * the connection with a 503 response and a retry hint.
     * @param openHandler Invoked once a connection is established.
     * @param messageHandler Invoked with the connection ID and payload of each text message.
     * Messages from one connection are delivered one at a time, in order.
     * @param closeHandler Invoked with the connection ID once a connection is closed.
     */
    virtual void receive(
        std::function<bool()> admissionHandler,
        std::function<void(const ConnectionInfo&)> openHandler,
        std::function<void(const std::string&, const std::string&)> messageHandler,
        std::function<void(const std::string&)> closeHandler) = 0;

    /**
     * @brief Sets the NIP-11 document returned to plain HTTP requests that accept
     * `application/nostr+json`.
     */
    virtual void setInformationDocument(std::string document) = 0;

    /**
     * @brief Sends the given message to the given connection.
     * @returns A tuple indicating the connection ID and whether the message was successfully
     * sent.
     */
    virtual std::tuple<std::string, bool> send(std::string message, std::string connectionId) = 0;

    /**
     * @brief Closes the given connection.
     */
    virtual void closeConnection(std::string connectionId, std::string reason) = 0;

    /**
     * @brief Runs the task on the server's event loop every `interval` until the server stops.
     */
    virtual void schedule(std::chrono::seconds interval, std::function<void()> task) = 0;
};
} // namespace server
} // namespace nrelay
