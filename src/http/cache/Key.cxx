// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "serialize.hxx"

#include <fmt/format.h>

#include <openssl/evp.h>

#include <array>
#include <iterator>
#include <memory>
#include <new>
#include <stdexcept>

namespace {

class CryptoSHA256 {
	struct Deleter {
		void operator()(EVP_MD_CTX *ctx) const noexcept {
			EVP_MD_CTX_free(ctx);
		}
	};

	std::unique_ptr<EVP_MD_CTX, Deleter> ctx;

public:
	CryptoSHA256()
		:ctx(EVP_MD_CTX_new()) {
		if (!ctx)
			throw std::bad_alloc{};

		if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
			throw std::runtime_error{"EVP_DigestInit_ex() failed"};
	}

	auto &Update(std::string_view src) {
		if (EVP_DigestUpdate(ctx.get(), src.data(), src.size()) != 1)
			throw std::runtime_error{"EVP_DigestUpdate() failed"};
		return *this;
	}

	std::array<unsigned char, 32> Final() {
		std::array<unsigned char, 32> md;
		unsigned length = md.size();
		if (EVP_DigestFinal_ex(ctx.get(), md.data(), &length) != 1 ||
		    length != md.size())
			throw std::runtime_error{"EVP_DigestFinal_ex() failed"};
		return md;
	}
};

} // anonymous namespace

static std::string
HexFormat(const std::array<unsigned char, 32> &md)
{
	fmt::memory_buffer buffer;
	for (const unsigned char i : md)
		fmt::format_to(std::back_inserter(buffer), "{:02x}", i);
	return fmt::to_string(buffer);
}

static std::string
Hash(const std::string &input)
{
	return HexFormat(CryptoSHA256{}.Update(input).Final());
}

HttpCacheRequestKey
HttpCacheMakeRequestKey(std::string_view method, std::string_view url,
			std::string_view body,
			std::optional<std::string_view> bucket)
{
	std::string input;
	serialize_string(input, method);
	serialize_string(input, url);
	serialize_string(input, body);

	if (bucket) {
		serialize_uint8(input, 1);
		serialize_string(input, *bucket);
	} else
		serialize_uint8(input, 0);

	return Hash(input);
}

HttpCacheUrlDigest
HttpCacheMakeUrlDigest(std::string_view url)
{
	std::string input;
	serialize_string(input, url);
	return Hash(input);
}
