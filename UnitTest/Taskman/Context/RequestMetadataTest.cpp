//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <Taskman/Context/RequestMetadata.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>

namespace Taskman
{
  TEST(RequestMetadataTest, Set_NewKeys_KeepInsertionOrder)
  {
    RequestMetadata metadata;
    metadata.Set("zeta", "1");
    metadata.Set("alpha", std::int64_t{2});
    metadata.Set("mid", true);

    EXPECT_EQ(metadata.GetKeys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
    EXPECT_EQ(metadata.Size(), 3u);
  }

  TEST(RequestMetadataTest, Set_ExistingKey_OverwritesInPlace)
  {
    RequestMetadata metadata{{"a", std::string("1")}, {"b", std::string("2")}};
    metadata.Set("a", "changed");

    EXPECT_EQ(metadata.GetKeys(), (std::vector<std::string>{"a", "b"}));
    ASSERT_NE(metadata.Find("a"), nullptr);
    EXPECT_EQ(std::get<std::string>(*metadata.Find("a")), "changed");
  }

  TEST(RequestMetadataTest, Merge_KeepsKeysMissingFromPatch)
  {
    RequestMetadata metadata{{"tool", std::string("list_tasks")}, {"attempt", std::int64_t{1}}};
    RequestMetadata patch{{"attempt", std::int64_t{2}}, {"cached", true}};

    metadata.Merge(patch);

    EXPECT_EQ(metadata.GetKeys(), (std::vector<std::string>{"tool", "attempt", "cached"}));
    EXPECT_EQ(std::get<std::int64_t>(*metadata.Find("attempt")), 2);
    EXPECT_TRUE(metadata.Contains("tool"));
  }

  TEST(RequestMetadataTest, Find_Missing_ReturnsNull)
  {
    RequestMetadata metadata;

    EXPECT_TRUE(metadata.IsEmpty());
    EXPECT_EQ(metadata.Find("nope"), nullptr);
    EXPECT_FALSE(metadata.Contains("nope"));
  }

  TEST(ScalarValueTest, ToString_RendersEveryAlternative)
  {
    EXPECT_EQ(ToString(ScalarValue(true)), "true");
    EXPECT_EQ(ToString(ScalarValue(std::int64_t{42})), "42");
    EXPECT_EQ(ToString(ScalarValue(1.5)), "1.5");
    EXPECT_EQ(ToString(ScalarValue(std::string("text"))), "text");
  }
}
