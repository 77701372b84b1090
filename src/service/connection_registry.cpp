#include "service/connection_registry.hpp"

using namespace nrelay::service;
using namespace nrelay::session;
using namespace std;

void ConnectionRegistry::add(shared_ptr<Connection> connection)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_connections[connection->id] = connection;
};

void ConnectionRegistry::remove(const string& connectionId)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_connections.erase(connectionId);
};

shared_ptr<Connection> ConnectionRegistry::find(const string& connectionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_connections.find(connectionId);
    if (it == this->_connections.end())
    {
        return nullptr;
    }

    return it->second;
};

unordered_set<string> ConnectionRegistry::ids() const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    unordered_set<string> ids;
    for (const auto& [id, connection] : this->_connections)
    {
        ids.insert(id);
    }

    return ids;
};
