#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "data/data.hpp"
#include "hex.hpp"

using namespace nlohmann;
using namespace nrelay::data;
using namespace std;

namespace nrelay
{
namespace data
{
EventKind classifyKind(int kind)
{
    if (kind == DELETION_KIND)
    {
        return EventKind::Deletion;
    }
    if (kind == 0 || kind == 3 || (kind >= 10000 && kind < 20000))
    {
        return EventKind::Replaceable;
    }
    if (kind >= 20000 && kind < 30000)
    {
        return EventKind::Ephemeral;
    }
    if (kind >= 30000 && kind < 40000)
    {
        return EventKind::Addressable;
    }
    return EventKind::Regular;
};

bool supersedes(const EventVersion& candidate, const EventVersion& current)
{
    if (candidate.createdAt != current.createdAt)
    {
        return candidate.createdAt > current.createdAt;
    }

    // Byte-wise comparison of lowercase hex preserves the byte order of the raw IDs.
    return candidate.id.compare(current.id) < 0;
};

void to_json(json& j, const Event& event)
{
    j = {
        { "id", event.id },
        { "pubkey", event.pubkey },
        { "created_at", event.createdAt },
        { "kind", event.kind },
        { "tags", event.tags },
        { "content", event.content },
        { "sig", event.sig },
    };
};

void from_json(const json& j, Event& event)
{
    event = Event::fromJson(j);
};
} // namespace data
} // namespace nrelay

string Event::serialize() const
{
    json j = *this;
    return j.dump();
};

Event Event::fromString(string jstr)
{
    json j;
    try
    {
        j = json::parse(jstr);
    }
    catch (const json::parse_error& pe)
    {
        throw invalid_argument(string("Event::fromString: ") + pe.what());
    }

    return Event::fromJson(j);
};

Event Event::fromJson(json j)
{
    if (!j.is_object())
    {
        throw invalid_argument("Event::fromJson: An event must be a JSON object.");
    }

    const json& createdAt = j.contains("created_at") ? j["created_at"] : json();
    const json& kind = j.contains("kind") ? j["kind"] : json();
    if (!createdAt.is_number_integer() || !kind.is_number_integer())
    {
        throw invalid_argument("Event::fromJson: The created_at and kind fields must be integers.");
    }
    if (kind.get<int64_t>() < 0 || kind.get<int64_t>() > 65535)
    {
        throw invalid_argument("Event::fromJson: The kind must be in the range 0-65535.");
    }

    Event event;
    try
    {
        event.id = j.at("id").get<string>();
        event.pubkey = j.at("pubkey").get<string>();
        event.createdAt = createdAt.get<time_t>();
        event.kind = kind.get<int>();
        event.tags = j.at("tags").get<vector<vector<string>>>();
        event.content = j.at("content").get<string>();
        event.sig = j.at("sig").get<string>();
    }
    catch (const json::type_error& te)
    {
        throw invalid_argument(string("Event::fromJson: ") + te.what());
    }
    catch (const json::out_of_range& oor)
    {
        throw invalid_argument(string("Event::fromJson: ") + oor.what());
    }

    return event;
};

string Event::computeId() const
{
    string serializedData;
    try
    {
        json arr = json::array({ 0, this->pubkey, this->createdAt, this->kind, this->tags, this->content });
        serializedData = arr.dump();
    }
    catch (const json::type_error&)
    {
        // The content or a tag is not valid UTF-8.
        return string();
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (EVP_Digest(serializedData.c_str(), serializedData.length(), hash, NULL, EVP_sha256(), NULL) != 1)
    {
        return string();
    }

    return encoding::toHex(hash, SHA256_DIGEST_LENGTH);
};

bool Event::isWellFormed() const
{
    bool hasId = encoding::isHex(this->id, 64, true);
    bool hasPubkey = encoding::isHex(this->pubkey, 64, true);
    bool hasSig = encoding::isHex(this->sig, 128, true);
    bool hasCreatedAt = this->createdAt >= 0;
    bool hasKind = this->kind >= 0 && this->kind <= 65535;

    return hasId && hasPubkey && hasSig && hasCreatedAt && hasKind;
};

EventKind Event::classify() const
{
    return classifyKind(this->kind);
};

EventVersion Event::version() const
{
    return EventVersion{ this->id, this->createdAt };
};

bool Event::isProtected() const
{
    return any_of(this->tags.begin(), this->tags.end(), [](const vector<string>& tag)
    {
        return tag.size() >= 1 && tag[0] == "-";
    });
};

optional<string> Event::identifier() const
{
    for (const auto& tag : this->tags)
    {
        if (tag.size() >= 2 && tag[0] == "d")
        {
            return tag[1];
        }
    }

    return nullopt;
};

vector<string> Event::tagValues(const string& name) const
{
    vector<string> values;
    for (const auto& tag : this->tags)
    {
        if (tag.size() >= 2 && tag[0] == name)
        {
            values.push_back(tag[1]);
        }
    }

    return values;
};

bool Event::operator==(const Event& other) const
{
    return this->id == other.id;
};
