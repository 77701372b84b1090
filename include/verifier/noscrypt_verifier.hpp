#pragma once

#include <memory>

#include <plog/Init.h>
#include <plog/Log.h>
#include <noscrypt.h>

#include "verifier/verifier.hpp"

namespace nrelay
{
namespace verifier
{
/**
 * @brief An implementation of the `IEventVerifier` interface that checks BIP-340 Schnorr
 * signatures with noscrypt.
 */
class NoscryptVerifier : public IEventVerifier
{
public:
    NoscryptVerifier(std::shared_ptr<plog::IAppender> appender);

    ~NoscryptVerifier();

    bool verify(const data::Event& event) override;

private:
    std::shared_ptr<NCContext> _noscryptContext;
};
} // namespace verifier
} // namespace nrelay
