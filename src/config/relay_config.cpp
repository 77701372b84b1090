#include <fstream>
#include <stdexcept>

#include "config/relay_config.hpp"

using namespace nlohmann;
using namespace nrelay::config;
using namespace std;

template<typename T>
static void _read(const json& j, const string& key, T& target)
{
    if (!j.contains(key) || j[key].is_null())
    {
        return;
    }

    try
    {
        target = j[key].get<T>();
    }
    catch (const json::type_error& te)
    {
        throw invalid_argument("RelayConfig: Invalid value for " + key + ": " + te.what());
    }
};

RelayConfig::RelayConfig()
{
    this->nip11 = {
        { "name", "nrelay" },
        { "description", "" },
        { "pubkey", "" },
        { "contact", "" },
        { "supported_nips", json::array({ 1, 9, 11, 42, 70 }) },
        { "software", "nrelay" },
        { "version", "0.1.0" }
    };
};

RelayConfig RelayConfig::fromJson(const json& j)
{
    if (!j.is_object())
    {
        throw invalid_argument("RelayConfig: The configuration must be a JSON object.");
    }

    RelayConfig config;

    if (j.contains("nip11"))
    {
        const json& nip11 = j["nip11"];
        if (!nip11.is_object())
        {
            throw invalid_argument("RelayConfig: The nip11 field must be an object.");
        }

        for (auto& [key, value] : nip11.items())
        {
            if (key != "limitation")
            {
                config.nip11[key] = value;
            }
        }

        if (nip11.contains("limitation"))
        {
            const json& limitation = nip11["limitation"];
            _read(limitation, "max_subscriptions", config.limitation.maxSubscriptions);
            _read(limitation, "max_filters", config.limitation.maxFilters);
            _read(limitation, "max_limit", config.limitation.maxLimit);
            _read(limitation, "max_subid_length", config.limitation.maxSubidLength);
            _read(limitation, "auth_required", config.limitation.authRequired);
            _read(limitation, "restricted_writes", config.limitation.restrictedWrites);
        }
    }

    long authTimeout = config.authTimeout.count();
    _read(j, "auth_timeout", authTimeout);
    config.authTimeout = chrono::seconds(authTimeout);

    long pruneInterval = config.pruneInterval.count();
    _read(j, "prune_interval", pruneInterval);
    config.pruneInterval = chrono::seconds(pruneInterval);

    _read(j, "auth_limit", config.authLimit);
    _read(j, "default_limit", config.defaultLimit);
    _read(j, "database", config.database);
    _read(j, "port", config.port);
    _read(j, "threads", config.threads);

    string serviceUrl;
    _read(j, "service_url", serviceUrl);
    if (!serviceUrl.empty())
    {
        config.serviceUrl = serviceUrl;
    }

    if (config.limitation.maxLimit < 1 || config.defaultLimit < 1 || config.threads < 1)
    {
        throw invalid_argument("RelayConfig: max_limit, default_limit, and threads must be positive.");
    }

    return config;
};

RelayConfig RelayConfig::fromFile(const string& path)
{
    ifstream file(path);
    if (!file.is_open())
    {
        throw invalid_argument("RelayConfig: Unable to open configuration file " + path);
    }

    json j;
    try
    {
        file >> j;
    }
    catch (const json::parse_error& pe)
    {
        throw invalid_argument("RelayConfig: Unable to parse " + path + ": " + pe.what());
    }

    return RelayConfig::fromJson(j);
};

json RelayConfig::informationDocument() const
{
    json document = this->nip11;
    document["limitation"] = {
        { "max_subscriptions", this->limitation.maxSubscriptions },
        { "max_filters", this->limitation.maxFilters },
        { "max_limit", this->limitation.maxLimit },
        { "max_subid_length", this->limitation.maxSubidLength },
        { "auth_required", this->limitation.authRequired },
        { "restricted_writes", this->limitation.restrictedWrites }
    };

    return document;
};
