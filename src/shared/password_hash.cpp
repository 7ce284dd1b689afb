/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

password_hash.cpp implementation.*/

#include "password_hash.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mmq {

/*
=============
Sha256Hex

Hashes the input with SHA-256 and returns the digest as 64 lowercase hex
characters. Throws std::runtime_error when libcrypto fails.
=============
*/
std::string Sha256Hex(std::string_view input)
{
	std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
	if (!ctx)
		throw std::runtime_error("Sha256Hex: EVP_MD_CTX_new failed");

	std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
	unsigned int digestLength = 0;

	if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
		EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
		EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1)
		throw std::runtime_error("Sha256Hex: digest computation failed");

	static constexpr char kHex[] = "0123456789abcdef";
	std::string hex;
	hex.reserve(static_cast<size_t>(digestLength) * 2);
	for (unsigned int i = 0; i < digestLength; ++i) {
		hex.push_back(kHex[digest[i] >> 4]);
		hex.push_back(kHex[digest[i] & 0x0F]);
	}
	return hex;
}

/*
=============
ConstantTimeEquals

Compares two strings without short-circuiting on the first differing byte.
Only the length is leaked, which is fixed for digests.
=============
*/
bool ConstantTimeEquals(std::string_view a, std::string_view b)
{
	if (a.size() != b.size())
		return false;
	if (a.empty())
		return true;

	return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace mmq
