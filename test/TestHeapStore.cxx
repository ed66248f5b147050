// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MetadataUtil.hxx"
#include "http/cache/HeapStore.hxx"
#include "http/cache/Invalidator.hxx"
#include "http/cache/Put.hxx"
#include "http/cache/Selector.hxx"

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

static_assert(HttpCacheStore<HttpCacheHeapStore>);
static_assert(HttpCacheSupportsAlternateKeys<HttpCacheHeapStore>);

static HttpCacheResponse
MakeResponse(std::string body)
{
	HttpCacheResponse response;
	response.headers = {{"content-type", "text/plain"}};
	response.body = std::move(body);
	return response;
}

static const std::string &
GetBody(const HttpCacheStoredResponse &response)
{
	return std::get<std::string>(response.body);
}

TEST(HttpCacheHeapStore, Basic)
{
	HttpCacheHeapStore store(1024 * 1024);

	EXPECT_TRUE(store.ListCandidates("key").empty());

	auto metadata = MakeMetadata(100, 200, 260);
	metadata.parsed_headers.emplace("etag", std::string{"\"x\""});
	metadata.parsed_headers.emplace("content-length", int64_t{5});
	metadata.alternate_keys.emplace("tag");

	store.Put("key", "url", {{"accept-encoding", std::nullopt}},
		  MakeResponse("hello"), metadata);

	const auto candidates = store.ListCandidates("key");
	ASSERT_EQ(candidates.size(), 1u);

	const auto &c = candidates.front();
	EXPECT_EQ(c.status, HttpStatus::OK);
	EXPECT_EQ(c.metadata, metadata);
	EXPECT_EQ(c.vary, (HttpCacheVary{{"accept-encoding", std::nullopt}}));
	ASSERT_EQ(c.response_headers.size(), 1u);

	const auto response = store.GetResponse(c.ref);
	ASSERT_TRUE(response);
	EXPECT_EQ(GetBody(*response), "hello");
	EXPECT_EQ(response->GetBodySize(), 5u);
	EXPECT_EQ(response->metadata, metadata);

	const auto stats = store.GetStats();
	EXPECT_EQ(stats.items, 1u);
	EXPECT_GT(stats.size, 5u);
}

TEST(HttpCacheHeapStore, MultipleCandidates)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("key", "url", {{"accept-encoding", "gzip"}},
		  MakeResponse("gzip"), MakeMetadata(100, 200, 260));
	store.Put("key", "url", {{"accept-encoding", "br"}},
		  MakeResponse("br"), MakeMetadata(100, 200, 260));
	store.Put("key", "url", {}, MakeResponse("partial"),
		  MakePartialMetadata(100, 200, 260, 0, 3, 10));

	const auto candidates = store.ListCandidates("key");
	ASSERT_EQ(candidates.size(), 3u);

	/* listing order is insertion order */
	EXPECT_EQ(candidates[0].vary.at("accept-encoding"), "gzip");
	EXPECT_EQ(candidates[1].vary.at("accept-encoding"), "br");
	EXPECT_TRUE(candidates[2].metadata.IsPartial());
}

TEST(HttpCacheHeapStore, DeduplicateNewer)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("key", "url", {}, MakeResponse("old"),
		  MakeMetadata(100, 200, 260));
	store.Put("key", "url", {}, MakeResponse("new"),
		  MakeMetadata(150, 200, 260));

	const auto candidates = store.ListCandidates("key");
	ASSERT_EQ(candidates.size(), 1u);
	EXPECT_EQ(candidates.front().metadata.created, At(150));
	EXPECT_EQ(store.GetStats().replaced, 1u);
}

TEST(HttpCacheHeapStore, DeduplicateOlder)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("key", "url", {}, MakeResponse("new"),
		  MakeMetadata(150, 200, 260));
	store.Put("key", "url", {}, MakeResponse("old"),
		  MakeMetadata(100, 200, 260));

	const auto candidates = store.ListCandidates("key");
	ASSERT_EQ(candidates.size(), 1u);
	EXPECT_EQ(candidates.front().metadata.created, At(150));

	const auto response = store.GetResponse(candidates.front().ref);
	ASSERT_TRUE(response);
	EXPECT_EQ(GetBody(*response), "new");
	EXPECT_EQ(store.GetStats().replaced, 1u);
}

TEST(HttpCacheHeapStore, DeduplicateTie)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("key", "url", {}, MakeResponse("first"),
		  MakeMetadata(100, 200, 260));
	store.Put("key", "url", {}, MakeResponse("second"),
		  MakeMetadata(100, 200, 260));

	const auto candidates = store.ListCandidates("key");
	ASSERT_EQ(candidates.size(), 1u);

	const auto response = store.GetResponse(candidates.front().ref);
	ASSERT_TRUE(response);
	EXPECT_EQ(GetBody(*response), "second");
}

TEST(HttpCacheHeapStore, NoDeduplicateDifferentRange)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("key", "url", {}, MakeResponse("a"),
		  MakePartialMetadata(100, 200, 260, 0, 3, 10));
	store.Put("key", "url", {}, MakeResponse("b"),
		  MakePartialMetadata(100, 200, 260, 4, 9, 10));
	store.Put("key", "url", {}, MakeResponse("c"),
		  MakeMetadata(100, 200, 260));

	EXPECT_EQ(store.ListCandidates("key").size(), 3u);
	EXPECT_EQ(store.GetStats().replaced, 0u);
}

TEST(HttpCacheHeapStore, StaleRef)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("key", "url", {}, MakeResponse("a"),
		  MakeMetadata(100, 200, 260));
	const auto ref = store.ListCandidates("key").front().ref;

	store.InvalidateUrl("url");

	EXPECT_FALSE(store.GetResponse(ref));

	/* must not crash */
	store.NotifyUsed(ref);
}

TEST(HttpCacheHeapStore, LruEviction)
{
	const auto body = std::string(1000, 'x');

	HttpCacheHeapStore store(1024 * 1024);
	store.Put("a", "url-a", {}, MakeResponse(body), MakeMetadata(100, 200, 260));
	const std::size_t item_size = store.GetStats().size;
	store.Flush();

	/* room for two items, but not for three */
	HttpCacheHeapStore small(item_size * 2 + item_size / 2);
	small.Put("a", "url-a", {}, MakeResponse(body), MakeMetadata(100, 200, 260));
	small.Put("b", "url-b", {}, MakeResponse(body), MakeMetadata(100, 200, 260));

	/* "a" was used recently, so "b" is the oldest */
	small.NotifyUsed(small.ListCandidates("a").front().ref);

	small.Put("c", "url-c", {}, MakeResponse(body), MakeMetadata(100, 200, 260));

	EXPECT_EQ(small.ListCandidates("a").size(), 1u);
	EXPECT_TRUE(small.ListCandidates("b").empty());
	EXPECT_EQ(small.ListCandidates("c").size(), 1u);

	const auto stats = small.GetStats();
	EXPECT_EQ(stats.items, 2u);
	EXPECT_EQ(stats.evicted, 1u);
	EXPECT_LE(stats.size, stats.max_size);
}

TEST(HttpCacheHeapStore, TooLarge)
{
	HttpCacheHeapStore store(100);

	store.Put("key", "url", {}, MakeResponse(std::string(1000, 'x')),
		  MakeMetadata(100, 200, 260));

	EXPECT_TRUE(store.ListCandidates("key").empty());

	/* dropped at once; nothing else was evicted for it */
	const auto stats = store.GetStats();
	EXPECT_EQ(stats.rejected, 1u);
	EXPECT_EQ(stats.evicted, 0u);
	EXPECT_EQ(stats.items, 0u);
	EXPECT_EQ(stats.size, 0u);
}

TEST(HttpCacheHeapStore, InvalidateUrl)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("a1", "url1", {}, MakeResponse("a1"), MakeMetadata(100, 200, 260));
	store.Put("a2", "url1", {{"accept", "x"}}, MakeResponse("a2"),
		  MakeMetadata(100, 200, 260));
	store.Put("b", "url2", {}, MakeResponse("b"), MakeMetadata(100, 200, 260));

	EXPECT_EQ(store.InvalidateUrl("url1").count, 2u);
	EXPECT_TRUE(store.ListCandidates("a1").empty());
	EXPECT_TRUE(store.ListCandidates("a2").empty());
	EXPECT_EQ(store.ListCandidates("b").size(), 1u);

	EXPECT_EQ(store.InvalidateUrl("url1").count, 0u);
	EXPECT_EQ(store.GetStats().invalidated, 2u);
}

TEST(HttpCacheHeapStore, InvalidateByAlternateKey)
{
	HttpCacheHeapStore store(1024 * 1024);

	auto tagged = [](std::initializer_list<const char *> tags){
		auto m = MakeMetadata(100, 200, 260);
		for (const char *i : tags)
			m.alternate_keys.emplace(i);
		return m;
	};

	store.Put("a", "url-a", {}, MakeResponse("a"), tagged({"product-42", "shop"}));
	store.Put("b", "url-b", {}, MakeResponse("b"), tagged({"product-43", "shop"}));
	store.Put("c", "url-c", {}, MakeResponse("c"), tagged({}));

	const HttpCacheInvalidator invalidator(store);

	auto outcome = invalidator.InvalidateByAlternateKey({"product-42"});
	EXPECT_TRUE(outcome.IsSupported());
	EXPECT_EQ(outcome.count, 1u);
	EXPECT_TRUE(store.ListCandidates("a").empty());

	/* one response matching two keys is counted once */
	store.Put("d", "url-d", {}, MakeResponse("d"), tagged({"x", "y"}));
	outcome = invalidator.InvalidateByAlternateKey({"shop", "x", "y", "unknown"});
	EXPECT_EQ(outcome.count, 2u);
	EXPECT_TRUE(store.ListCandidates("b").empty());
	EXPECT_TRUE(store.ListCandidates("d").empty());
	EXPECT_EQ(store.ListCandidates("c").size(), 1u);
}

TEST(HttpCacheHeapStore, Expire)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("a", "url", {}, MakeResponse("a"), MakeMetadata(100, 200, 260));
	store.Put("b", "url", {}, MakeResponse("b"), MakeMetadata(100, 500, 560));

	EXPECT_EQ(store.Expire(At(259)), 0u);
	EXPECT_EQ(store.Expire(At(260)), 1u);
	EXPECT_TRUE(store.ListCandidates("a").empty());
	EXPECT_EQ(store.ListCandidates("b").size(), 1u);
	EXPECT_EQ(store.GetStats().expired, 1u);
}

TEST(HttpCacheHeapStore, Flush)
{
	HttpCacheHeapStore store(1024 * 1024);

	store.Put("a", "url", {}, MakeResponse("a"), MakeMetadata(100, 200, 260));
	store.Flush();

	EXPECT_TRUE(store.ListCandidates("a").empty());
	EXPECT_EQ(store.GetStats().items, 0u);
	EXPECT_EQ(store.GetStats().size, 0u);
}

TEST(HttpCacheHeapStore, Selector)
{
	HttpCacheHeapStore store(1024 * 1024);

	HttpCachePut(store, "key", "url", {{"accept-encoding", "gzip"}},
		     MakeResponse("gzip"), MakeMetadata(100, 200, 260));
	HttpCachePut(store, "key", "url", {{"accept-encoding", std::nullopt}},
		     MakeResponse("identity"), MakeMetadata(100, 200, 260));

	const HttpCacheSelector selector(store);

	auto s = selector.Resolve("key", {}, std::nullopt, At(150));
	ASSERT_TRUE(s);
	EXPECT_EQ(GetBody(s->response), "identity");
	EXPECT_EQ(s->freshness, HttpCacheFreshness::FRESH);
	store.NotifyUsed(s->ref);

	s = selector.Resolve("key", {{"accept-encoding", "gzip"}}, std::nullopt,
			     At(220));
	ASSERT_TRUE(s);
	EXPECT_EQ(GetBody(s->response), "gzip");
	EXPECT_EQ(s->freshness, HttpCacheFreshness::STALE);
}

TEST(HttpCacheHeapStore, Concurrent)
{
	constexpr unsigned n_threads = 8, n_puts = 50;

	HttpCacheHeapStore store(1024 * 1024);

	std::vector<std::thread> threads;
	for (unsigned t = 0; t < n_threads; ++t)
		threads.emplace_back([&store, t]{
			for (unsigned i = 0; i < n_puts; ++i)
				store.Put("key", "url", {{"accept", "*/*"}},
					  MakeResponse(fmt::format("{}-{}", t, i)),
					  MakeMetadata(100 + i, 200, 260));
		});

	/* a reader never sees two responses with the same vary
	   headers, nor a body which does not belong to its metadata */
	threads.emplace_back([&store]{
		for (unsigned i = 0; i < 500; ++i) {
			const auto candidates = store.ListCandidates("key");
			EXPECT_LE(candidates.size(), 1u);

			for (const auto &c : candidates) {
				const auto r = store.GetResponse(c.ref);
				if (!r)
					continue;

				EXPECT_EQ(r->metadata, c.metadata);

				const auto i = (r->metadata.created - At(100)).count();
				const auto &body = GetBody(*r);
				const auto dash = body.find('-');
				ASSERT_NE(dash, body.npos);
				EXPECT_EQ(body.substr(dash + 1), std::to_string(i));
			}
		}
	});

	/* invalidating another URL meanwhile */
	threads.emplace_back([&store]{
		const HttpCacheInvalidator invalidator(store);
		for (unsigned i = 0; i < 100; ++i) {
			store.Put("other", "url2", {}, MakeResponse("x"),
				  MakeMetadata(100, 200, 260));
			EXPECT_EQ(invalidator.InvalidateUrl("url2").count, 1u);
		}
	});

	for (auto &i : threads)
		i.join();

	EXPECT_TRUE(store.ListCandidates("other").empty());
	ASSERT_EQ(store.ListCandidates("key").size(), 1u);

	const auto stats = store.GetStats();
	EXPECT_EQ(stats.items, 1u);
	EXPECT_EQ(stats.replaced, n_threads * n_puts - 1);
	EXPECT_EQ(stats.evicted, 0u);
}
