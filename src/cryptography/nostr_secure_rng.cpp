#include <stdexcept>

#include <plog/Init.h>
#include <plog/Log.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "nostr_secure_rng.hpp"
#include "hex.hpp"

using namespace std;
using namespace nrelay::cryptography;

void NostrSecureRng::fill(void* buffer, size_t length)
{
	if (RAND_bytes((uint8_t*)buffer, length) != 1)
	{
		PLOG_ERROR << "Failed to generate random bytes";
		throw runtime_error("NostrSecureRng: Failed to generate random bytes.");
	}
}

string NostrSecureRng::token(size_t byteCount)
{
	vector<uint8_t> buffer(byteCount);
	fill(buffer);

	return nrelay::encoding::toHex(buffer);
}

void NostrSecureRng::zero(void* buffer, size_t length)
{
	OPENSSL_cleanse(buffer, length);
}
