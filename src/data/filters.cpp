#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "data/data.hpp"
#include "hex.hpp"

using namespace nlohmann;
using namespace nrelay::data;
using namespace std;

namespace nrelay
{
namespace data
{
const vector<string> INDEXED_TAG_NAMES = { "a", "d", "e", "g", "i", "k", "l", "p", "q", "r", "t" };

const vector<string> HEX_TAG_NAMES = { "e", "p" };

bool isIndexedTag(const string& name)
{
    return find(INDEXED_TAG_NAMES.begin(), INDEXED_TAG_NAMES.end(), name) != INDEXED_TAG_NAMES.end();
};

bool isHexTag(const string& name)
{
    return find(HEX_TAG_NAMES.begin(), HEX_TAG_NAMES.end(), name) != HEX_TAG_NAMES.end();
};
} // namespace data
} // namespace nrelay

static vector<string> _parseHexValues(const string& key, const json& values)
{
    if (!values.is_array())
    {
        throw invalid_argument("Filters::fromJson: The " + key + " field must be an array.");
    }

    vector<string> parsed;
    for (const auto& value : values)
    {
        if (!value.is_string() || !nrelay::encoding::isHex(value.get<string>(), 64))
        {
            throw invalid_argument("Filters::fromJson: The " + key + " field must contain 64-character hex strings.");
        }
        parsed.push_back(nrelay::encoding::toLower(value.get<string>()));
    }

    return parsed;
};

static vector<string> _parseStringValues(const string& key, const json& values)
{
    if (!values.is_array() || !all_of(values.begin(), values.end(), [](const json& v) { return v.is_string(); }))
    {
        throw invalid_argument("Filters::fromJson: The " + key + " field must be an array of strings.");
    }

    return values.get<vector<string>>();
};

static time_t _parseTimestamp(const string& key, const json& value)
{
    if (!value.is_number_integer() || value.get<int64_t>() < 0)
    {
        throw invalid_argument("Filters::fromJson: The " + key + " field must be a non-negative integer.");
    }

    return value.get<time_t>();
};

Filters Filters::fromJson(const json& j)
{
    if (!j.is_object())
    {
        throw invalid_argument("Filters::fromJson: A filter must be a JSON object.");
    }

    Filters filters;
    for (auto& [key, value] : j.items())
    {
        if (key == "ids")
        {
            filters.ids = _parseHexValues(key, value);
        }
        else if (key == "authors")
        {
            filters.authors = _parseHexValues(key, value);
        }
        else if (key == "kinds")
        {
            if (!value.is_array())
            {
                throw invalid_argument("Filters::fromJson: The kinds field must be an array.");
            }

            vector<int> kinds;
            for (const auto& kind : value)
            {
                if (!kind.is_number_integer() || kind.get<int64_t>() < 0 || kind.get<int64_t>() > 65535)
                {
                    throw invalid_argument("Filters::fromJson: The kinds field must contain kind numbers.");
                }
                kinds.push_back(kind.get<int>());
            }
            filters.kinds = kinds;
        }
        else if (key == "since")
        {
            filters.since = _parseTimestamp(key, value);
        }
        else if (key == "until")
        {
            filters.until = _parseTimestamp(key, value);
        }
        else if (key == "limit")
        {
            if (!value.is_number_integer() || value.get<int64_t>() < 0)
            {
                throw invalid_argument("Filters::fromJson: The limit field must be a non-negative integer.");
            }
            filters.limit = static_cast<int>(min<int64_t>(value.get<int64_t>(), INT32_MAX));
        }
        else if (key.length() == 2 && key[0] == '#' && isIndexedTag(key.substr(1)))
        {
            string name = key.substr(1);
            filters.tags[name] = isHexTag(name)
                ? _parseHexValues(key, value)
                : _parseStringValues(key, value);
        }
        else
        {
            throw invalid_argument("Filters::fromJson: Unsupported filter key " + key + ".");
        }
    }

    return filters;
};

bool Filters::matches(const Event& event) const
{
    if (this->ids && find(this->ids->begin(), this->ids->end(), event.id) == this->ids->end())
    {
        return false;
    }

    if (this->authors && find(this->authors->begin(), this->authors->end(), event.pubkey) == this->authors->end())
    {
        return false;
    }

    if (this->kinds && find(this->kinds->begin(), this->kinds->end(), event.kind) == this->kinds->end())
    {
        return false;
    }

    if (this->since && event.createdAt < *this->since)
    {
        return false;
    }

    if (this->until && event.createdAt > *this->until)
    {
        return false;
    }

    for (const auto& [name, values] : this->tags)
    {
        bool hexTag = isHexTag(name);
        bool tagMatches = any_of(event.tags.begin(), event.tags.end(), [&](const vector<string>& tag)
        {
            if (tag.size() < 2 || tag[0] != name)
            {
                return false;
            }

            string value = hexTag ? nrelay::encoding::toLower(tag[1]) : tag[1];
            return find(values.begin(), values.end(), value) != values.end();
        });

        if (!tagMatches)
        {
            return false;
        }
    }

    return true;
};

bool Filters::isIdLookup() const
{
    return this->ids.has_value()
        && !this->authors
        && !this->kinds
        && this->tags.empty()
        && !this->since
        && !this->until;
};

json Filters::toJson() const
{
    json j = json::object();
    if (this->ids)
    {
        j["ids"] = *this->ids;
    }
    if (this->authors)
    {
        j["authors"] = *this->authors;
    }
    if (this->kinds)
    {
        j["kinds"] = *this->kinds;
    }
    for (const auto& [name, values] : this->tags)
    {
        j["#" + name] = values;
    }
    if (this->since)
    {
        j["since"] = *this->since;
    }
    if (this->until)
    {
        j["until"] = *this->until;
    }
    if (this->limit)
    {
        j["limit"] = *this->limit;
    }

    return j;
};
