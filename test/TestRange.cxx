// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/cache/Range.hxx"

#include <gtest/gtest.h>

TEST(HttpRangeRequest, Parse)
{
	EXPECT_EQ(HttpRangeRequest::Parse("bytes=0-499"),
		  HttpRangeRequest::Closed(0, 499));
	EXPECT_EQ(HttpRangeRequest::Parse(" bytes=10-10 "),
		  HttpRangeRequest::Closed(10, 10));
	EXPECT_EQ(HttpRangeRequest::Parse("bytes=500-"),
		  HttpRangeRequest::OpenEnded(500));
	EXPECT_EQ(HttpRangeRequest::Parse("bytes=-100"),
		  HttpRangeRequest::Suffix(100));
}

TEST(HttpRangeRequest, ParseMalformed)
{
	EXPECT_FALSE(HttpRangeRequest::Parse(""));
	EXPECT_FALSE(HttpRangeRequest::Parse("bytes="));
	EXPECT_FALSE(HttpRangeRequest::Parse("bytes=-"));
	EXPECT_FALSE(HttpRangeRequest::Parse("bytes=-0"));
	EXPECT_FALSE(HttpRangeRequest::Parse("bytes=5-4"));
	EXPECT_FALSE(HttpRangeRequest::Parse("bytes=a-b"));
	EXPECT_FALSE(HttpRangeRequest::Parse("items=0-1"));
	EXPECT_FALSE(HttpRangeRequest::Parse("0-1"));

	/* multiple ranges are not supported */
	EXPECT_FALSE(HttpRangeRequest::Parse("bytes=0-1,5-6"));
}

TEST(HttpRangeRequest, Format)
{
	EXPECT_EQ(HttpRangeRequest::Closed(0, 499).Format(), "bytes=0-499");
	EXPECT_EQ(HttpRangeRequest::OpenEnded(7).Format(), "bytes=7-");
	EXPECT_EQ(HttpRangeRequest::Suffix(3).Format(), "bytes=-3");
}

TEST(HttpContentRange, Parse)
{
	auto r = HttpContentRange::Parse("bytes 0-999/2000");
	ASSERT_TRUE(r);
	EXPECT_EQ(r->first, 0u);
	EXPECT_EQ(r->last, 999u);
	EXPECT_EQ(r->complete_length, 2000u);
	EXPECT_EQ(r->GetSize(), 1000u);

	r = HttpContentRange::Parse("bytes 42-42/*");
	ASSERT_TRUE(r);
	EXPECT_EQ(r->first, 42u);
	EXPECT_EQ(r->last, 42u);
	EXPECT_FALSE(r->complete_length);
}

TEST(HttpContentRange, ParseMalformed)
{
	EXPECT_FALSE(HttpContentRange::Parse(""));
	EXPECT_FALSE(HttpContentRange::Parse("bytes */2000"));
	EXPECT_FALSE(HttpContentRange::Parse("bytes 0-999"));
	EXPECT_FALSE(HttpContentRange::Parse("bytes 10-9/20"));
	EXPECT_FALSE(HttpContentRange::Parse("bytes 0-20/20"));
	EXPECT_FALSE(HttpContentRange::Parse("bytes 0-x/20"));
	EXPECT_FALSE(HttpContentRange::Parse("items 0-1/2"));
}

TEST(HttpContentRange, Format)
{
	EXPECT_EQ((HttpContentRange{0, 999, 2000}).Format(), "bytes 0-999/2000");
	EXPECT_EQ((HttpContentRange{5, 6, std::nullopt}).Format(), "bytes 5-6/*");
}

TEST(HttpContentRange, CoversClosed)
{
	const HttpContentRange r{0, 999, 2000};

	EXPECT_TRUE(r.Covers(HttpRangeRequest::Closed(0, 499)));
	EXPECT_TRUE(r.Covers(HttpRangeRequest::Closed(0, 999)));
	EXPECT_TRUE(r.Covers(HttpRangeRequest::Closed(100, 200)));
	EXPECT_FALSE(r.Covers(HttpRangeRequest::Closed(500, 1999)));
	EXPECT_FALSE(r.Covers(HttpRangeRequest::Closed(0, 1000)));
	EXPECT_FALSE(r.Covers(HttpRangeRequest::Closed(2000, 2100)));
}

TEST(HttpContentRange, CoversClosedBeyondEnd)
{
	/* the tail of a 2000 byte resource */
	const HttpContentRange r{1000, 1999, 2000};

	/* "last" beyond the end means "until the end" */
	EXPECT_TRUE(r.Covers(HttpRangeRequest::Closed(1500, 5000)));
	EXPECT_FALSE(r.Covers(HttpRangeRequest::Closed(500, 5000)));

	const HttpContentRange unknown{1000, 1999, std::nullopt};
	EXPECT_TRUE(unknown.Covers(HttpRangeRequest::Closed(1500, 1999)));
	EXPECT_FALSE(unknown.Covers(HttpRangeRequest::Closed(1500, 5000)));
}

TEST(HttpContentRange, CoversOpenEnded)
{
	const HttpContentRange tail{1000, 1999, 2000};
	EXPECT_TRUE(tail.Covers(HttpRangeRequest::OpenEnded(1000)));
	EXPECT_TRUE(tail.Covers(HttpRangeRequest::OpenEnded(1999)));
	EXPECT_FALSE(tail.Covers(HttpRangeRequest::OpenEnded(999)));
	EXPECT_FALSE(tail.Covers(HttpRangeRequest::OpenEnded(2000)));

	const HttpContentRange head{0, 999, 2000};
	EXPECT_FALSE(head.Covers(HttpRangeRequest::OpenEnded(500)));

	const HttpContentRange unknown{1000, 1999, std::nullopt};
	EXPECT_FALSE(unknown.Covers(HttpRangeRequest::OpenEnded(1000)));
}

TEST(HttpContentRange, CoversSuffix)
{
	const HttpContentRange tail{1000, 1999, 2000};
	EXPECT_TRUE(tail.Covers(HttpRangeRequest::Suffix(1000)));
	EXPECT_TRUE(tail.Covers(HttpRangeRequest::Suffix(1)));
	EXPECT_FALSE(tail.Covers(HttpRangeRequest::Suffix(1001)));

	/* a suffix longer than the resource means "everything" */
	const HttpContentRange all{0, 1999, 2000};
	EXPECT_TRUE(all.Covers(HttpRangeRequest::Suffix(5000)));

	const HttpContentRange head{0, 999, 2000};
	EXPECT_FALSE(head.Covers(HttpRangeRequest::Suffix(100)));
}
