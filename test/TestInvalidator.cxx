// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeStore.hxx"
#include "MetadataUtil.hxx"
#include "http/cache/Invalidator.hxx"
#include "http/cache/Selector.hxx"

#include <gtest/gtest.h>

static_assert(!HttpCacheSupportsAlternateKeys<FakeStore>);
static_assert(HttpCacheSupportsAlternateKeys<FakeAlternateKeyStore>);

static HttpCacheMetadata
MakeTagged(std::initializer_list<const char *> tags)
{
	auto m = MakeMetadata(0, 1000, 1060);
	for (const char *i : tags)
		m.alternate_keys.emplace(i);
	return m;
}

TEST(HttpCacheInvalidator, Url)
{
	FakeStore store;
	store.Add("a", {}, MakeMetadata(0, 1000, 1060), "a1", "url1");
	store.Add("a", {{"accept-encoding", "gzip"}},
		  MakeMetadata(0, 1000, 1060), "a2", "url1");
	store.Add("b", {}, MakeMetadata(0, 1000, 1060), "b", "url2");

	const HttpCacheSelector selector(store);
	ASSERT_TRUE(selector.Resolve("a", {}, std::nullopt, At(10)));

	const HttpCacheInvalidator invalidator(store);
	const auto outcome = invalidator.InvalidateUrl("url1");
	EXPECT_TRUE(outcome.IsSupported());
	EXPECT_EQ(outcome.status, HttpCacheInvalidationOutcome::Status::OK);
	EXPECT_EQ(outcome.count, 2u);

	/* invalidated responses are never selected again */
	EXPECT_TRUE(store.ListCandidates("a").empty());
	EXPECT_FALSE(selector.Resolve("a", {}, std::nullopt, At(10)));
	EXPECT_TRUE(selector.Resolve("b", {}, std::nullopt, At(10)));

	/* nothing left to invalidate */
	EXPECT_EQ(invalidator.InvalidateUrl("url1").count, 0u);
}

TEST(HttpCacheInvalidator, Unsupported)
{
	FakeStore store;
	store.Add("a", {}, MakeTagged({"product-42"}), "a");

	const HttpCacheInvalidator invalidator(store);
	EXPECT_FALSE(invalidator.SupportsAlternateKeys());

	const auto outcome = invalidator.InvalidateByAlternateKey({"product-42"});
	EXPECT_FALSE(outcome.IsSupported());
	EXPECT_EQ(outcome.status, HttpCacheInvalidationOutcome::Status::UNSUPPORTED);
	EXPECT_FALSE(outcome.count);

	/* the backend was not touched */
	EXPECT_TRUE(store.option_tags.empty());
	EXPECT_EQ(store.ListCandidates("a").size(), 1u);
}

TEST(HttpCacheInvalidator, AlternateKey)
{
	FakeAlternateKeyStore store;
	store.Add("a", {}, MakeTagged({"product-42", "shop"}), "a");
	store.Add("b", {}, MakeTagged({"product-43", "shop"}), "b");
	store.Add("c", {}, MakeTagged({}), "c");

	const HttpCacheInvalidator invalidator(store);
	EXPECT_TRUE(invalidator.SupportsAlternateKeys());

	FakeAlternateKeyStore::Options options;
	options.tag = 7;

	const auto outcome = invalidator.InvalidateByAlternateKey({"product-42"},
								   options);
	EXPECT_TRUE(outcome.IsSupported());

	/* this backend does not count */
	EXPECT_FALSE(outcome.count);

	ASSERT_EQ(store.alternate_key_calls.size(), 1u);
	EXPECT_EQ(store.alternate_key_calls.front(),
		  std::vector<HttpCacheAlternateKey>{"product-42"});
	ASSERT_EQ(store.option_tags.size(), 1u);
	EXPECT_EQ(store.option_tags.front(), 7);

	EXPECT_TRUE(store.ListCandidates("a").empty());
	EXPECT_EQ(store.ListCandidates("b").size(), 1u);
	EXPECT_EQ(store.ListCandidates("c").size(), 1u);

	invalidator.InvalidateByAlternateKey({"shop"});
	EXPECT_TRUE(store.ListCandidates("b").empty());
	EXPECT_EQ(store.ListCandidates("c").size(), 1u);
}
