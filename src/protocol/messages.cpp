#include "protocol/messages.hpp"

using namespace nlohmann;
using namespace std;

namespace nrelay
{
namespace protocol
{
namespace messages
{
string ok(const string& eventId, bool accepted, const string& message)
{
    return json::array({ "OK", eventId, accepted, message }).dump();
};

string event(const string& subscriptionId, const data::Event& event)
{
    json jEvent = event;
    return json::array({ "EVENT", subscriptionId, jEvent }).dump();
};

string eose(const string& subscriptionId)
{
    return json::array({ "EOSE", subscriptionId }).dump();
};

string closed(const string& subscriptionId, const string& message)
{
    return json::array({ "CLOSED", subscriptionId, message }).dump();
};

string notice(const string& message)
{
    return json::array({ "NOTICE", message }).dump();
};

string auth(const string& challenge)
{
    return json::array({ "AUTH", challenge }).dump();
};
} // namespace messages
} // namespace protocol
} // namespace nrelay
