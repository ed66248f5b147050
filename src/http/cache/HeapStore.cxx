// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeapStore.hxx"

HttpCacheHeapStore::~HttpCacheHeapStore() noexcept
{
	lru.clear();
}

std::size_t
HttpCacheHeapStore::CalcSize(const HttpCacheRequestKey &key,
			     const HttpCacheUrlDigest &url_digest,
			     const HttpCacheVary &vary,
			     const HttpCacheResponse &response,
			     const HttpCacheMetadata &metadata) noexcept
{
	std::size_t result = sizeof(Item) + key.size() + url_digest.size();

	for (const auto &[name, value] : response.headers)
		result += name.size() + value.size();

	for (const auto &[name, value] : vary)
		result += name.size() + (value ? value->size() : 0);

	for (const auto &i : metadata.parsed_headers) {
		result += i.first.size();
		if (const auto *s = std::get_if<std::string>(&i.second))
			result += s->size();
	}

	for (const auto &i : metadata.alternate_keys)
		result += i.size();

	/* a file body is kept by reference */
	if (const auto *s = std::get_if<std::string>(&response.body))
		result += s->size();

	return result;
}

/**
 * Erase one entry of a multimap index.
 */
template<typename I, typename T>
static void
EraseIndex(I &index, std::string_view key, const T *value) noexcept
{
	auto [begin, end] = index.equal_range(key);
	for (auto i = begin; i != end; ++i) {
		if (i->second == value) {
			index.erase(i);
			return;
		}
	}
}

[[gnu::pure]]
static bool
SameContentRange(const HttpCacheMetadata &a,
		 const HttpCacheMetadata &b) noexcept
{
	const auto *ra = a.GetContentRange(), *rb = b.GetContentRange();
	if (ra == nullptr || rb == nullptr)
		return ra == rb;

	return *ra == *rb;
}

std::vector<HttpCacheCandidate<HttpCacheHeapStore::Ref>>
HttpCacheHeapStore::ListCandidates(const HttpCacheRequestKey &key,
				   const Options &) const
{
	std::vector<HttpCacheCandidate<Ref>> result;

	const std::scoped_lock lock{mutex};

	auto [begin, end] = by_key.equal_range(key);
	for (auto i = begin; i != end; ++i) {
		const Item &item = *i->second;

		HttpCacheCandidate<Ref> c;
		c.ref = item.id;
		c.status = item.status;
		c.response_headers = item.headers;
		c.vary = item.vary;
		c.metadata = item.metadata;
		result.emplace_back(std::move(c));
	}

	return result;
}

std::optional<HttpCacheStoredResponse>
HttpCacheHeapStore::GetResponse(const Ref &ref, const Options &) const
{
	const std::scoped_lock lock{mutex};

	auto i = items.find(ref);
	if (i == items.end())
		return std::nullopt;

	const Item &item = *i->second;
	return HttpCacheStoredResponse{
		item.status,
		item.headers,
		item.body,
		item.metadata,
	};
}

HttpCacheHeapStore::Item *
HttpCacheHeapStore::FindDuplicate(const HttpCacheRequestKey &key,
				  const HttpCacheVary &vary,
				  const HttpCacheMetadata &metadata) const noexcept
{
	auto [begin, end] = by_key.equal_range(key);
	for (auto i = begin; i != end; ++i) {
		Item &item = *i->second;
		if (item.vary == vary &&
		    SameContentRange(item.metadata, metadata))
			return &item;
	}

	return nullptr;
}

void
HttpCacheHeapStore::Put(const HttpCacheRequestKey &key,
			const HttpCacheUrlDigest &url_digest,
			const HttpCacheVary &vary,
			const HttpCacheResponse &response,
			const HttpCacheMetadata &metadata,
			const Options &)
{
	const std::size_t item_size =
		CalcSize(key, url_digest, vary, response, metadata);

	const std::scoped_lock lock{mutex};

	if (item_size > max_size) {
		++n_rejected;
		logger(4, "response too large: ", item_size);
		return;
	}

	if (Item *old = FindDuplicate(key, vary, metadata)) {
		++n_replaced;

		if (old->metadata.created > metadata.created) {
			/* the existing response is newer; discard
			   the new one */
			logger(4, "discarding older duplicate");
			return;
		}

		logger(4, "replacing duplicate #", old->id);
		RemoveItem(*old);
	}

	NeedRoom(item_size);

	auto item = std::make_unique<Item>(next_id++, key, url_digest, vary,
					   response, metadata, item_size);
	Item *const p = item.get();
	items.emplace(p->id, std::move(item));

	by_key.emplace(key, p);
	by_url.emplace(url_digest, p);
	for (const auto &i : metadata.alternate_keys)
		by_alternate_key.emplace(i, p);

	lru.push_back(*p);
	size += item_size;
}

void
HttpCacheHeapStore::NotifyUsed(const Ref &ref, const Options &) noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = items.find(ref);
	if (i == items.end())
		return;

	Item &item = *i->second;
	lru.erase(lru.iterator_to(item));
	lru.push_back(item);
}

HttpCacheInvalidationResult
HttpCacheHeapStore::InvalidateUrl(const HttpCacheUrlDigest &url_digest,
				  const Options &) noexcept
{
	const std::scoped_lock lock{mutex};

	std::size_t n = 0;

	while (true) {
		auto i = by_url.find(url_digest);
		if (i == by_url.end())
			break;

		RemoveItem(*i->second);
		++n;
	}

	n_invalidated += n;
	return {n};
}

HttpCacheInvalidationResult
HttpCacheHeapStore::InvalidateByAlternateKey(const std::vector<HttpCacheAlternateKey> &keys,
					     const Options &) noexcept
{
	const std::scoped_lock lock{mutex};

	std::size_t n = 0;

	for (const auto &key : keys) {
		while (true) {
			auto i = by_alternate_key.find(key);
			if (i == by_alternate_key.end())
				break;

			RemoveItem(*i->second);
			++n;
		}
	}

	n_invalidated += n;
	return {n};
}

std::size_t
HttpCacheHeapStore::Expire(HttpCacheTime now) noexcept
{
	const std::scoped_lock lock{mutex};

	std::size_t n = 0;

	for (auto i = items.begin(); i != items.end();) {
		Item &item = *i->second;
		++i;

		if (now >= item.metadata.grace) {
			RemoveItem(item);
			++n;
		}
	}

	n_expired += n;

	if (n > 0)
		logger(4, "expired ", n, " responses");

	return n;
}

void
HttpCacheHeapStore::Flush() noexcept
{
	const std::scoped_lock lock{mutex};

	lru.clear();
	by_key.clear();
	by_url.clear();
	by_alternate_key.clear();
	items.clear();
	size = 0;
}

HttpCacheHeapStore::Stats
HttpCacheHeapStore::GetStats() const noexcept
{
	const std::scoped_lock lock{mutex};

	return {
		items.size(), size, max_size,
		n_replaced, n_evicted, n_expired, n_invalidated, n_rejected,
	};
}

void
HttpCacheHeapStore::NeedRoom(std::size_t needed) noexcept
{
	while (size + needed > max_size && !lru.empty()) {
		Item &oldest = lru.front();
		logger(5, "evicting #", oldest.id);
		RemoveItem(oldest);
		++n_evicted;
	}
}

void
HttpCacheHeapStore::RemoveItem(Item &item) noexcept
{
	EraseIndex(by_key, item.key, &item);
	EraseIndex(by_url, item.url_digest, &item);
	for (const auto &i : item.metadata.alternate_keys)
		EraseIndex(by_alternate_key, i, &item);

	lru.erase(lru.iterator_to(item));

	size -= item.size;

	/* this destroys the item */
	const Ref id = item.id;
	items.erase(id);
}
