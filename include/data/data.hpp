#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace nrelay
{
namespace data
{
/**
 * @brief Storage and delivery class of an event, determined solely by its kind number.
 */
enum class EventKind
{
    Regular,
    Replaceable,
    Addressable,
    Ephemeral,
    Deletion
};

///< Kind number of NIP-09 deletion requests.
constexpr int DELETION_KIND = 5;

///< Kind number of NIP-42 client authentication events.
constexpr int CLIENT_AUTH_KIND = 22242;

/**
 * @brief Classifies the given kind number according to NIP-01 and NIP-09.
 */
EventKind classifyKind(int kind);

/**
 * @brief The version of a logical replaceable or addressable object held by an event.
 */
struct EventVersion
{
    std::string id; ///< Event ID of this version.
    std::time_t createdAt; ///< Creation timestamp of this version.
};

/**
 * @brief Applies the latest-wins rule to two versions of the same logical object.
 * @returns True if `candidate` should replace `current`, false otherwise.
 * @remark The newer `createdAt` wins.  When the timestamps are equal the lexicographically
 * smaller ID wins, so the outcome does not depend on the order in which versions arrive.  A
 * version never supersedes itself.
 */
bool supersedes(const EventVersion& candidate, const EventVersion& current);

/**
 * @brief A Nostr event.
 * @remark All data transmitted over the Nostr protocol is encoded in JSON blobs.  This struct
 * is common to every Nostr event kind.  The significance of each event is determined by the
 * `tags` and `content` fields.
*/
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt; ///< Unix timestamp of the event creation.
    int kind; ///< Event kind.
    std::vector<std::vector<std::string>> tags; ///< Arbitrary event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Event signature created with the private key of the event creator.

    /**
     * @brief Serializes the event to a JSON object.
     * @returns A stringified JSON object representing the event.
     */
    std::string serialize() const;

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `std::invalid_argument` if the string is not a structurally valid event.
     */
    static Event fromString(std::string jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @throws `std::invalid_argument` if a field is missing or has the wrong type.
     */
    static Event fromJson(nlohmann::json j);

    /**
     * @brief Computes the ID the event should carry.
     * @return The 32-bytes lowercase hex-encoded sha256 of the canonical serialization
     * `[0, pubkey, created_at, kind, tags, content]`, or an empty string if the event data cannot
     * be serialized.
     */
    std::string computeId() const;

    /**
     * @brief Checks field lengths, hex encoding, kind range, and tag shape.
     * @remark This does not check the ID or the signature.
     */
    bool isWellFormed() const;

    EventKind classify() const;

    EventVersion version() const;

    /**
     * @brief Indicates whether the event carries the NIP-70 `["-"]` protected marker.
     */
    bool isProtected() const;

    /**
     * @brief Finds the `d` tag value that identifies an addressable event.
     * @returns The value of the first `d` tag that has one.  An empty string is a valid
     * identifier, distinct from a missing `d` tag.
     */
    std::optional<std::string> identifier() const;

    /**
     * @brief Collects the values of every tag with the given name, in order.
     */
    std::vector<std::string> tagValues(const std::string& name) const;

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.
     */
    bool operator==(const Event& other) const;
};

void to_json(nlohmann::json& j, const Event& event);

void from_json(const nlohmann::json& j, Event& event);

///< Tag letters the relay indexes and accepts in `#<letter>` filter keys.
extern const std::vector<std::string> INDEXED_TAG_NAMES;

///< Indexed tag letters whose values are 32-byte hex identifiers.
extern const std::vector<std::string> HEX_TAG_NAMES;

bool isIndexedTag(const std::string& name);

bool isHexTag(const std::string& name);

/**
 * @brief A single filter of a subscription request.
 * @remark Every field is optional.  A field that is absent imposes no constraint, while a field
 * that is present but empty matches nothing.  Hex values are normalized to lowercase when the
 * filter is parsed.
 */
struct Filters
{
    std::optional<std::vector<std::string>> ids; ///< Event IDs.
    std::optional<std::vector<std::string>> authors; ///< Event author pubkeys.
    std::optional<std::vector<int>> kinds; ///< Kind numbers.
    std::unordered_map<std::string, std::vector<std::string>> tags; ///< Tag letters mapped to lists of tag values.
    std::optional<std::time_t> since; ///< Unix timestamp.  Matching events are at least this new.
    std::optional<std::time_t> until; ///< Unix timestamp.  Matching events are at least this old.
    std::optional<int> limit; ///< The maximum number of stored events to return on the initial query.

    /**
     * @brief Parses a filter from a REQ message.
     * @throws `std::invalid_argument` if the filter contains a key the relay does not support or a
     * value of the wrong shape.
     */
    static Filters fromJson(const nlohmann::json& j);

    /**
     * @brief Determines whether the given event satisfies every present field of the filter.
     * @remark The `limit` field only applies to stored-event queries and is ignored here.
     */
    bool matches(const Event& event) const;

    /**
     * @brief Indicates whether `ids` is the only constraint, so the filter can be answered with
     * point lookups.
     */
    bool isIdLookup() const;

    nlohmann::json toJson() const;
};
} // namespace data
} // namespace nrelay
