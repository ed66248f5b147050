// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeStore.hxx"
#include "MetadataUtil.hxx"
#include "http/cache/Put.hxx"

#include <gtest/gtest.h>

static HttpCacheResponse
MakeResponse(HttpStatus status=HttpStatus::OK)
{
	HttpCacheResponse response;
	response.status = status;
	response.headers = {{"content-type", "text/plain"}};
	response.body = std::string{"hello"};
	return response;
}

TEST(HttpCachePut, Valid)
{
	FakeStore store;

	HttpCachePut(store, "key", "url", {}, MakeResponse(),
		     MakeMetadata(100, 200, 260));
	ASSERT_EQ(store.entries.size(), 1u);
	EXPECT_EQ(store.entries.front().body, "hello");
	EXPECT_EQ(store.entries.front().info.metadata, MakeMetadata(100, 200, 260));

	/* all three may be equal */
	HttpCachePut(store, "key", "url", {}, MakeResponse(),
		     MakeMetadata(100, 100, 100));
	EXPECT_EQ(store.entries.size(), 2u);
}

TEST(HttpCachePut, CreatedAfterExpires)
{
	FakeStore store;

	EXPECT_THROW(HttpCachePut(store, "key", "url", {}, MakeResponse(),
				  MakeMetadata(300, 200, 260)),
		     HttpCacheInvalidMetadata);
	EXPECT_TRUE(store.entries.empty());
	EXPECT_TRUE(store.option_tags.empty());
}

TEST(HttpCachePut, ExpiresAfterGrace)
{
	FakeStore store;

	EXPECT_THROW(HttpCachePut(store, "key", "url", {}, MakeResponse(),
				  MakeMetadata(100, 300, 260)),
		     HttpCacheInvalidMetadata);
	EXPECT_TRUE(store.entries.empty());
}

TEST(HttpCachePut, MalformedContentRange)
{
	FakeStore store;

	auto metadata = MakeMetadata(100, 200, 260);
	metadata.parsed_headers.emplace("content-range", std::string{"bytes 0-1/2"});

	EXPECT_THROW(HttpCachePut(store, "key", "url", {},
				  MakeResponse(HttpStatus::PARTIAL_CONTENT),
				  metadata),
		     HttpCacheInvalidMetadata);
	EXPECT_TRUE(store.entries.empty());
}

TEST(HttpCachePut, PartialWithoutRange)
{
	FakeStore store;

	EXPECT_THROW(HttpCachePut(store, "key", "url", {},
				  MakeResponse(HttpStatus::PARTIAL_CONTENT),
				  MakeMetadata(100, 200, 260)),
		     HttpCacheInvalidMetadata);

	HttpCachePut(store, "key", "url", {},
		     MakeResponse(HttpStatus::PARTIAL_CONTENT),
		     MakePartialMetadata(100, 200, 260, 0, 4, 10));
	EXPECT_EQ(store.entries.size(), 1u);
}

TEST(HttpCachePut, BackendFailure)
{
	FakeStore store;
	store.fail_put = true;

	EXPECT_THROW(HttpCachePut(store, "key", "url", {}, MakeResponse(),
				  MakeMetadata(100, 200, 260)),
		     HttpCacheStoreError);
}
