#pragma once

#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "data/data.hpp"

namespace nrelay
{
namespace repository
{
/**
 * @brief Raised when the storage backend fails.
 */
class RepositoryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Information about how an event reached the relay, stored alongside it.
 */
struct EventMetadata
{
    std::optional<std::string> ipAddress; ///< Address of the submitting client, if known.
    std::time_t receivedAt; ///< Unix timestamp of receipt.
};

/**
 * @brief Outcome of a write to the repository.
 */
enum class SaveResult
{
    Stored, ///< The event was written.
    Duplicate, ///< An event with the same ID is already stored.
    Superseded ///< A newer version of the same replaceable or addressable object is stored.
};

/**
 * @brief An interface for persisting and querying Nostr events.
 */
class IEventRepository
{
public:
    virtual ~IEventRepository() = default;

    /**
     * @brief Appends a regular event.
     * @throws `RepositoryError` if the backend fails.
     */
    virtual SaveResult save(const data::Event& event, const EventMetadata& metadata) = 0;

    /**
     * @brief Stores a replaceable event if it is the latest version for its `(kind, pubkey)`,
     * and deletes the versions it supersedes.
     * @throws `RepositoryError` if the backend fails.
     * @remark The lookup of existing versions and the delete-and-insert that follows are separate
     * steps.  A concurrent write to the same key between the two may leave a superseded row in
     * place until the next write to that key.
     */
    virtual SaveResult saveReplaceable(const data::Event& event, const EventMetadata& metadata) = 0;

    /**
     * @brief Stores an addressable event if it is the latest version for its
     * `(kind, pubkey, d tag)`, and deletes the versions it supersedes.
     * @throws `std::invalid_argument` if the event has no `d` tag, or `RepositoryError` if the
     * backend fails.
     * @remark Subject to the same race window as `saveReplaceable`.
     */
    virtual SaveResult saveAddressable(const data::Event& event, const EventMetadata& metadata) = 0;

    /**
     * @brief Deletes the events referenced by the `e` tags of a deletion request.
     * @returns The IDs of the events that were deleted.
     * @remark Only events authored by the deletion request's pubkey are deleted, and deletion
     * requests themselves are never deleted.  Other references are ignored.
     * @throws `RepositoryError` if the backend fails.
     */
    virtual std::vector<std::string> deleteByReference(const data::Event& deletion) = 0;

    /**
     * @brief Finds stored events matching the filter, newest first.
     * @remark The number of results is bounded by the filter limit, which defaults to and is
     * capped by the repository's configured limits.  Ties on `createdAt` have no defined order.
     * @throws `RepositoryError` if the backend fails.
     */
    virtual std::vector<data::Event> find(const data::Filters& filters) = 0;
};

/**
 * @brief An interface for looking up the pubkeys allowed to publish when writes are restricted.
 */
class IAccountRegistry
{
public:
    virtual ~IAccountRegistry() = default;

    virtual bool isRegistered(const std::string& pubkey) = 0;

    virtual void registerAccount(const std::string& pubkey) = 0;
};
} // namespace repository
} // namespace nrelay
