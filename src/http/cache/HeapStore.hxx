// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Types.hxx"
#include "io/Logger.hxx"

#include <boost/intrusive/list.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

/**
 * An in-memory cache store with a size limit.  The least recently
 * used responses are evicted first.  A response which is larger than
 * the whole limit is dropped by Put() right away (counted in
 * Stats::rejected), as if it had been evicted immediately; it is
 * never listed.
 *
 * A Put() with the same vary headers and content range as an
 * existing response under the same key replaces it, unless the
 * existing one was created later.
 *
 * All methods are thread-safe.
 */
class HttpCacheHeapStore {
public:
	using Ref = uint64_t;

	struct Options {};

	struct Stats {
		std::size_t items, size, max_size;

		/**
		 * The number of responses which were dropped because
		 * a Put() with the same vary headers won.
		 */
		uint64_t replaced;

		/**
		 * Responses dropped to make room.
		 */
		uint64_t evicted;

		/**
		 * Responses removed by Expire().
		 */
		uint64_t expired;

		/**
		 * Responses removed by InvalidateUrl() or
		 * InvalidateByAlternateKey().
		 */
		uint64_t invalidated;

		/**
		 * Responses which were too large to be stored.
		 */
		uint64_t rejected;
	};

private:
	struct Item final
		: boost::intrusive::list_base_hook<>
	{
		const Ref id;
		const HttpCacheRequestKey key;
		const HttpCacheUrlDigest url_digest;
		const HttpCacheVary vary;
		const HttpStatus status;
		const HttpCacheHeaders headers;
		const HttpCacheBody body;
		const HttpCacheMetadata metadata;

		/**
		 * The estimated memory usage of this item.
		 */
		const std::size_t size;

		Item(Ref _id, const HttpCacheRequestKey &_key,
		     const HttpCacheUrlDigest &_url_digest,
		     const HttpCacheVary &_vary,
		     const HttpCacheResponse &response,
		     const HttpCacheMetadata &_metadata,
		     std::size_t _size)
			:id(_id), key(_key), url_digest(_url_digest),
			 vary(_vary),
			 status(response.status), headers(response.headers),
			 body(response.body), metadata(_metadata),
			 size(_size) {}
	};

	using Index = std::multimap<std::string, Item *, std::less<>>;

	const Logger logger{"HttpCacheHeapStore"};

	mutable std::mutex mutex;

	const std::size_t max_size;
	std::size_t size = 0;

	Ref next_id = 1;

	/**
	 * Owns all items.
	 */
	std::map<Ref, std::unique_ptr<Item>> items;

	Index by_key, by_url, by_alternate_key;

	/**
	 * All items sorted by last access, oldest first.
	 */
	boost::intrusive::list<Item,
			       boost::intrusive::constant_time_size<false>> lru;

	uint64_t n_replaced = 0, n_evicted = 0, n_expired = 0;
	uint64_t n_invalidated = 0, n_rejected = 0;

public:
	explicit HttpCacheHeapStore(std::size_t _max_size) noexcept
		:max_size(_max_size) {}

	~HttpCacheHeapStore() noexcept;

	HttpCacheHeapStore(const HttpCacheHeapStore &) = delete;
	HttpCacheHeapStore &operator=(const HttpCacheHeapStore &) = delete;

	std::vector<HttpCacheCandidate<Ref>>
	ListCandidates(const HttpCacheRequestKey &key,
		       const Options &options={}) const;

	std::optional<HttpCacheStoredResponse>
	GetResponse(const Ref &ref, const Options &options={}) const;

	void Put(const HttpCacheRequestKey &key,
		 const HttpCacheUrlDigest &url_digest,
		 const HttpCacheVary &vary,
		 const HttpCacheResponse &response,
		 const HttpCacheMetadata &metadata,
		 const Options &options={});

	void NotifyUsed(const Ref &ref, const Options &options={}) noexcept;

	HttpCacheInvalidationResult
	InvalidateUrl(const HttpCacheUrlDigest &url_digest,
		      const Options &options={}) noexcept;

	HttpCacheInvalidationResult
	InvalidateByAlternateKey(const std::vector<HttpCacheAlternateKey> &keys,
				 const Options &options={}) noexcept;

	/**
	 * Remove all responses whose grace period has ended.
	 *
	 * @return the number of responses which were removed
	 */
	std::size_t Expire(HttpCacheTime now) noexcept;

	/**
	 * Remove all responses.
	 */
	void Flush() noexcept;

	Stats GetStats() const noexcept;

private:
	static std::size_t CalcSize(const HttpCacheRequestKey &key,
				    const HttpCacheUrlDigest &url_digest,
				    const HttpCacheVary &vary,
				    const HttpCacheResponse &response,
				    const HttpCacheMetadata &metadata) noexcept;

	[[gnu::pure]]
	Item *FindDuplicate(const HttpCacheRequestKey &key,
			    const HttpCacheVary &vary,
			    const HttpCacheMetadata &metadata) const noexcept;

	/**
	 * Evict the least recently used items until the given number
	 * of bytes is available.
	 */
	void NeedRoom(std::size_t needed) noexcept;

	void RemoveItem(Item &item) noexcept;
};
