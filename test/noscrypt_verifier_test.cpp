#include <cctype>
#include <memory>

#include <gtest/gtest.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "verifier/noscrypt_verifier.hpp"
#include "test_events.hpp"

using namespace nrelay::data;
using namespace nrelay::verifier;
using namespace nrelay_test;
using namespace std;
using namespace ::testing;

class NoscryptVerifierTest : public testing::Test
{
protected:
    // The logger keeps the first appender it receives for the whole test run.
    inline static shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender =
        make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    shared_ptr<NoscryptVerifier> verifier;
    shared_ptr<TestSigner> signer;

    void SetUp() override
    {
        this->verifier = make_shared<NoscryptVerifier>(this->testAppender);
        this->signer = make_shared<TestSigner>(ALICE_SECRET_KEY);
    };

    static char flipHexDigit(char c)
    {
        return c == '0' ? '1' : '0';
    };
};

TEST_F(NoscryptVerifierTest, Verify_AcceptsSignedEvent)
{
    auto event = this->signer->signedEvent(1, 1700000000, { { "t", "nostr" } }, "Hello, World!");

    ASSERT_TRUE(this->verifier->verify(event));
}

TEST_F(NoscryptVerifierTest, Verify_RejectsTamperedContent)
{
    auto event = this->signer->signedEvent(1, 1700000000, {}, "Hello, World!");
    event.content = "Goodbye, World!";

    ASSERT_FALSE(this->verifier->verify(event));
}

TEST_F(NoscryptVerifierTest, Verify_RejectsAlteredId)
{
    auto event = this->signer->signedEvent(1, 1700000000);
    event.id[10] = flipHexDigit(event.id[10]);

    ASSERT_FALSE(this->verifier->verify(event));
}

TEST_F(NoscryptVerifierTest, Verify_RejectsAlteredSignature)
{
    auto event = this->signer->signedEvent(1, 1700000000);
    event.sig[100] = flipHexDigit(event.sig[100]);

    ASSERT_FALSE(this->verifier->verify(event));
}

TEST_F(NoscryptVerifierTest, Verify_RejectsSignatureFromAnotherKey)
{
    TestSigner otherSigner(BOB_SECRET_KEY);
    auto event = this->signer->signedEvent(1, 1700000000);
    auto forged = otherSigner.signedEvent(1, 1700000000);

    event.sig = forged.sig;

    ASSERT_FALSE(this->verifier->verify(event));
}

TEST_F(NoscryptVerifierTest, Verify_RejectsUppercaseHex)
{
    auto event = this->signer->signedEvent(1, 1700000000);
    for (char& c : event.sig)
    {
        c = static_cast<char>(toupper(c));
    }

    ASSERT_FALSE(this->verifier->verify(event));
}

TEST_F(NoscryptVerifierTest, Verify_RejectsMalformedEvent)
{
    auto event = this->signer->signedEvent(1, 1700000000);
    event.pubkey = "abc";

    ASSERT_FALSE(this->verifier->verify(event));
}
