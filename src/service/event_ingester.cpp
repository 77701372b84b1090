#include "service/event_ingester.hpp"
#include "session/auth.hpp"
#include "internal/logging.hpp"

using namespace nrelay::config;
using namespace nrelay::data;
using namespace nrelay::repository;
using namespace nrelay::service;
using namespace nrelay::session;
using namespace nrelay::verifier;
using namespace std;

EventIngester::EventIngester(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IEventVerifier> verifier,
    shared_ptr<IEventRepository> repository,
    Limitation limitation)
: _verifier(verifier), _repository(repository), _limitation(limitation)
{
    nrelay::internal::initLogging(appender.get());
};

IngestResult EventIngester::ingest(const Event& event, Connection& connection, chrono::system_clock::time_point now)
{
    if (!this->_verifier->verify(event))
    {
        PLOG_WARNING << "Rejected event with invalid ID or signature: " << event.id;
        return IngestResult{ false, "invalid: event id or signature", false, nullopt };
    }

    if (this->_requiresAuthentication(event, connection))
    {
        string challenge = Challenge::issue(connection, now);
        string reason = event.isProtected()
            ? "auth-required: this event may only be published by its author"
            : "auth-required: we only accept events from registered users";

        PLOG_DEBUG << "Event " << event.id << " requires authentication on connection " << connection.id;
        return IngestResult{ false, reason, false, challenge };
    }

    EventKind kind = event.classify();
    if (kind == EventKind::Ephemeral)
    {
        return IngestResult{ true, "", true, nullopt };
    }

    if (kind == EventKind::Addressable && !event.identifier())
    {
        PLOG_WARNING << "Rejected addressable event without a d tag: " << event.id;
        return IngestResult{ false, "invalid: addressable event requires d tag", false, nullopt };
    }

    EventMetadata metadata{ connection.ipAddress, chrono::system_clock::to_time_t(now) };

    SaveResult result;
    try
    {
        result = this->_store(event, metadata);
    }
    catch (const RepositoryError& re)
    {
        PLOG_ERROR << "Failed to save event " << event.id << ": " << re.what();
        return IngestResult{ false, "error: could not save event", false, nullopt };
    }

    switch (result)
    {
    case SaveResult::Duplicate:
        return IngestResult{ true, "duplicate: already have this event", false, nullopt };
    case SaveResult::Superseded:
        PLOG_DEBUG << "Event " << event.id << " is older than the stored version.";
        return IngestResult{ true, "", false, nullopt };
    case SaveResult::Stored:
    default:
        return IngestResult{ true, "", true, nullopt };
    }
};

bool EventIngester::_requiresAuthentication(const Event& event, const Connection& connection) const
{
    if (connection.isAuthenticatedAs(event.pubkey))
    {
        return false;
    }

    return this->_limitation.authRequired
        || this->_limitation.restrictedWrites
        || event.isProtected();
};

SaveResult EventIngester::_store(const Event& event, const EventMetadata& metadata)
{
    switch (event.classify())
    {
    case EventKind::Replaceable:
        return this->_repository->saveReplaceable(event, metadata);

    case EventKind::Addressable:
        return this->_repository->saveAddressable(event, metadata);

    case EventKind::Deletion:
    {
        SaveResult result = this->_repository->save(event, metadata);
        if (result != SaveResult::Stored)
        {
            return result;
        }

        try
        {
            auto deletedIds = this->_repository->deleteByReference(event);
            PLOG_INFO << "Deletion request " << event.id << " removed " << deletedIds.size() << " events.";
        }
        catch (const RepositoryError& re)
        {
            // The request itself is stored, so it is still accepted.
            PLOG_ERROR << "Failed to apply deletion request " << event.id << ": " << re.what();
        }
        return result;
    }

    default:
        return this->_repository->save(event, metadata);
    }
};
