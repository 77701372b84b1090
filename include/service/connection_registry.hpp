#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "session/connection.hpp"

namespace nrelay
{
namespace service
{
/**
 * @brief The session records of the connections that are currently open.
 * @remark The registry only guards its map.  A record it hands out is mutated solely by the
 * handler of the connection it belongs to.
 */
class ConnectionRegistry
{
public:
    void add(std::shared_ptr<session::Connection> connection);

    void remove(const std::string& connectionId);

    /**
     * @returns The connection record, or `nullptr` if the connection is not open.
     */
    std::shared_ptr<session::Connection> find(const std::string& connectionId) const;

    std::unordered_set<std::string> ids() const;

private:
    mutable std::mutex _propertyMutex;

    std::unordered_map<std::string, std::shared_ptr<session::Connection>> _connections;
};
} // namespace service
} // namespace nrelay
