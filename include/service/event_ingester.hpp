#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <plog/Init.h>
#include <plog/Log.h>

#include "config/relay_config.hpp"
#include "data/data.hpp"
#include "repository/event_repository.hpp"
#include "session/connection.hpp"
#include "verifier/verifier.hpp"

namespace nrelay
{
namespace service
{
/**
 * @brief Outcome of submitting an event to the relay.
 */
struct IngestResult
{
    bool accepted; ///< The `accepted` flag of the OK response.
    std::string message; ///< The message of the OK response.
    bool broadcast; ///< Whether the event should be delivered to live subscriptions.
    std::optional<std::string> challenge; ///< An AUTH challenge to send before the OK response.
};

/**
 * @brief Validates submitted events and writes them according to their kind.
 */
class EventIngester
{
public:
    EventIngester(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<verifier::IEventVerifier> verifier,
        std::shared_ptr<repository::IEventRepository> repository,
        config::Limitation limitation);

    /**
     * @brief Processes an event submitted on the given connection.
     * @param now The current time, recorded on any challenge issued to the connection.
     * @remark Events that need an authenticated author issue a fresh challenge on the connection
     * and are rejected with an `auth-required` message.  Storage failures are reported in the
     * result, never thrown.
     */
    IngestResult ingest(
        const data::Event& event,
        session::Connection& connection,
        std::chrono::system_clock::time_point now);

private:
    std::shared_ptr<verifier::IEventVerifier> _verifier;
    std::shared_ptr<repository::IEventRepository> _repository;
    config::Limitation _limitation;

    bool _requiresAuthentication(const data::Event& event, const session::Connection& connection) const;

    repository::SaveResult _store(const data::Event& event, const repository::EventMetadata& metadata);
};
} // namespace service
} // namespace nrelay
