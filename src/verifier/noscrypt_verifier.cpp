#include <cstring>
#include <stdexcept>
#include <vector>

#include "verifier/noscrypt_verifier.hpp"
#include "hex.hpp"
#include "../cryptography/nostr_secure_rng.hpp"
#include "../internal/logging.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace nrelay::cryptography;
using namespace nrelay::data;
using namespace nrelay::verifier;

#pragma region Local Statics

static void _ncFreeContext(NCContext* ctx)
{
    operator delete(ctx);
}

static shared_ptr<NCContext> ncAllocContext()
{
    /* Allocates a new unmanaged block that will
    * be freed manually with the above helper when the smart
    * pointer is destroyed
    */
    void* ctxMemory = operator new(NCGetContextStructSize());

    return shared_ptr<NCContext>(
        static_cast<NCContext*>(ctxMemory),
        _ncFreeContext
    );
}

static shared_ptr<NCContext> initNoscryptContext()
{
    auto ctx = ncAllocContext();

    vector<uint8_t> randomEntropy(NC_CONTEXT_ENTROPY_SIZE);
    NostrSecureRng::fill(randomEntropy);

    NCResult initResult = NCInitContext(ctx.get(), randomEntropy.data());
    NostrSecureRng::zero(randomEntropy);

    if (initResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(initResult);
        throw runtime_error(
            "NoscryptVerifier: Failed to initialize the noscrypt context: "
            + nrelay::internal::describeNoscryptResult(initResult));
    }

    return ctx;
};

#pragma endregion

NoscryptVerifier::NoscryptVerifier(shared_ptr<plog::IAppender> appender)
{
    nrelay::internal::initLogging(appender.get());

    this->_noscryptContext = initNoscryptContext();
};

NoscryptVerifier::~NoscryptVerifier()
{
    NCDestroyContext(this->_noscryptContext.get());
};

bool NoscryptVerifier::verify(const Event& event)
{
    if (!event.isWellFormed())
    {
        PLOG_DEBUG << "Rejecting malformed event " << event.id;
        return false;
    }

    if (event.computeId() != event.id)
    {
        PLOG_DEBUG << "Rejecting event " << event.id << ": the ID does not match the event data.";
        return false;
    }

    NCPublicKey pubkey;
    vector<uint8_t> digest;
    vector<uint8_t> sig;
    try
    {
        auto pubkeyBytes = encoding::fromHex(event.pubkey);
        memcpy(pubkey.key, pubkeyBytes.data(), sizeof(pubkey.key));
        digest = encoding::fromHex(event.id);
        sig = encoding::fromHex(event.sig);
    }
    catch (const invalid_argument& e)
    {
        PLOG_DEBUG << "Rejecting event " << event.id << ": " << e.what();
        return false;
    }

    NCResult verifyResult = NCVerifyDigest(
        this->_noscryptContext.get(),
        &pubkey,
        digest.data(),
        sig.data()
    );

    if (verifyResult != NC_SUCCESS)
    {
        PLOG_DEBUG << "Rejecting event " << event.id << ": the signature is invalid ("
            << nrelay::internal::describeNoscryptResult(verifyResult) << ").";
        return false;
    }

    return true;
};
