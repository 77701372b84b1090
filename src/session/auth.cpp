#include <algorithm>
#include <sstream>
#include <vector>

#include "session/auth.hpp"
#include "hex.hpp"
#include "../cryptography/nostr_secure_rng.hpp"

using namespace std;
using namespace nrelay::cryptography;
using namespace nrelay::data;
using namespace nrelay::session;

string Challenge::issue(Connection& connection, chrono::system_clock::time_point now)
{
    string challenge = NostrSecureRng::token();
    connection.auth = AuthSession{ challenge, now };

    return challenge;
};

bool Challenge::validate(
    const Event& event,
    const AuthSession& auth,
    const string& url,
    chrono::seconds timeout,
    chrono::system_clock::time_point now)
{
    if (event.kind != CLIENT_AUTH_KIND)
    {
        return false;
    }

    if (auth.challengedAt + timeout < now)
    {
        return false;
    }

    auto challenges = event.tagValues("challenge");
    if (challenges.empty() || challenges.front() != auth.challenge)
    {
        return false;
    }

    auto relays = event.tagValues("relay");
    if (relays.empty() || normalizeUrl(relays.front()) != normalizeUrl(url))
    {
        return false;
    }

    return true;
};

namespace nrelay
{
namespace session
{
string normalizeUrl(const string& url)
{
    size_t start = url.find_first_not_of(" \t\r\n");
    size_t end = url.find_last_not_of(" \t\r\n");
    if (start == string::npos)
    {
        return string();
    }
    string value = url.substr(start, end - start + 1);

    size_t schemeEnd = value.find("://");
    if (schemeEnd == string::npos)
    {
        value = "wss://" + value;
        schemeEnd = 3;
    }

    string scheme = encoding::toLower(value.substr(0, schemeEnd));
    string rest = value.substr(schemeEnd + 3);

    if (scheme == "http")
    {
        scheme = "ws";
    }
    else if (scheme == "https")
    {
        scheme = "wss";
    }

    size_t fragmentStart = rest.find('#');
    if (fragmentStart != string::npos)
    {
        rest = rest.substr(0, fragmentStart);
    }

    size_t authorityEnd = rest.find_first_of("/?");
    string authority = rest.substr(0, authorityEnd);
    string remainder = authorityEnd == string::npos ? string() : rest.substr(authorityEnd);

    // Userinfo is case-sensitive; only the host and port are normalized.
    string userinfo;
    size_t at = authority.rfind('@');
    if (at != string::npos)
    {
        userinfo = authority.substr(0, at + 1);
        authority = authority.substr(at + 1);
    }

    string host = authority;
    string port;
    size_t colon = authority.rfind(':');
    size_t bracket = authority.rfind(']');
    if (colon != string::npos && (bracket == string::npos || colon > bracket))
    {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    host = encoding::toLower(host);

    if ((scheme == "ws" && port == "80") || (scheme == "wss" && port == "443"))
    {
        port.clear();
    }

    size_t queryStart = remainder.find('?');
    string path = remainder.substr(0, queryStart);
    string query = queryStart == string::npos ? string() : remainder.substr(queryStart + 1);

    string collapsed;
    for (char c : path)
    {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/')
        {
            continue;
        }
        collapsed.push_back(c);
    }
    if (!collapsed.empty() && collapsed.back() == '/')
    {
        collapsed.pop_back();
    }

    vector<string> params;
    stringstream queryStream(query);
    string param;
    while (getline(queryStream, param, '&'))
    {
        if (!param.empty())
        {
            params.push_back(param);
        }
    }
    sort(params.begin(), params.end());

    stringstream ss;
    ss << scheme << "://" << userinfo << host;
    if (!port.empty())
    {
        ss << ":" << port;
    }
    ss << collapsed;
    for (size_t i = 0; i < params.size(); i++)
    {
        ss << (i == 0 ? "?" : "&") << params[i];
    }

    return ss.str();
};
} // namespace session
} // namespace nrelay
