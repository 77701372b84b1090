#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "data/data.hpp"

namespace nrelay
{
namespace protocol
{
/**
 * @brief Builders for the relay-to-client frames of NIP-01 and NIP-42.
 * @remark Each function returns the serialized JSON array ready to be sent over the socket.
 */
namespace messages
{
std::string ok(const std::string& eventId, bool accepted, const std::string& message);

std::string event(const std::string& subscriptionId, const data::Event& event);

std::string eose(const std::string& subscriptionId);

std::string closed(const std::string& subscriptionId, const std::string& message);

std::string notice(const std::string& message);

std::string auth(const std::string& challenge);
} // namespace messages
} // namespace protocol
} // namespace nrelay
