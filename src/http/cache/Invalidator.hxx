// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Store.hxx"
#include "io/Logger.hxx"

#include <cstdint>
#include <optional>
#include <vector>

struct HttpCacheInvalidationOutcome {
	enum class Status : uint8_t {
		OK,

		/**
		 * The backend does not implement this kind of
		 * invalidation; nothing was done.
		 */
		UNSUPPORTED,
	};

	Status status;

	/**
	 * The number of invalidated responses; std::nullopt if the
	 * backend cannot tell or if the operation is unsupported.
	 */
	std::optional<std::size_t> count;

	static constexpr HttpCacheInvalidationOutcome Unsupported() noexcept {
		return {Status::UNSUPPORTED, std::nullopt};
	}

	static constexpr HttpCacheInvalidationOutcome Ok(const HttpCacheInvalidationResult &result) noexcept {
		return {Status::OK, result.count};
	}

	constexpr bool IsSupported() const noexcept {
		return status != Status::UNSUPPORTED;
	}
};

/**
 * A uniform interface to the invalidation methods of a backend,
 * whether it supports alternate keys or not.  Backend errors are
 * propagated.
 */
template<HttpCacheStore S>
class HttpCacheInvalidator {
	S &store;

	const Logger logger{"HttpCacheInvalidator"};

public:
	using Options = typename S::Options;

	explicit HttpCacheInvalidator(S &_store) noexcept
		:store(_store) {}

	static constexpr bool SupportsAlternateKeys() noexcept {
		return HttpCacheSupportsAlternateKeys<S>;
	}

	HttpCacheInvalidationOutcome
	InvalidateUrl(const HttpCacheUrlDigest &url_digest,
		      const Options &options={}) const {
		const auto result = store.InvalidateUrl(url_digest, options);
		Log("url", result);
		return HttpCacheInvalidationOutcome::Ok(result);
	}

	HttpCacheInvalidationOutcome
	InvalidateByAlternateKey(const std::vector<HttpCacheAlternateKey> &keys,
				 const Options &options={}) const {
		if constexpr (HttpCacheAlternateKeyStore<S>) {
			const auto result = store.InvalidateByAlternateKey(keys, options);
			Log("alternate keys", result);
			return HttpCacheInvalidationOutcome::Ok(result);
		} else {
			(void)keys;
			(void)options;
			logger(3, "backend does not support invalidation by alternate key");
			return HttpCacheInvalidationOutcome::Unsupported();
		}
	}

private:
	void Log(const char *what,
		 const HttpCacheInvalidationResult &result) const noexcept {
		if (result.count)
			logger(4, "invalidated by ", what, ": ", *result.count);
		else
			logger(4, "invalidated by ", what);
	}
};
