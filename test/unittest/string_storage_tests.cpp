#include <gtest/gtest.h>
#include <session_data/string_storage.h>

#include <string>

TEST(StringStorage, SameStringSameView)
{
  dapc::StringStorage storage{};
  std::string a{ "/usr/lib/libc.so.6" };
  std::string b{ "/usr/lib/libc.so.6" };
  const auto first = storage.GetAndPut(a);
  const auto second = storage.GetAndPut(b);
  EXPECT_EQ(first.data(), second.data());
  EXPECT_NE(first.data(), a.data());
  EXPECT_EQ(storage.Size(), 1);
  EXPECT_EQ(storage.Requests(), 2);
}

TEST(StringStorage, ViewsStayValidAsStorageGrows)
{
  dapc::StringStorage storage{};
  const auto first = storage.GetAndPut("first");
  const auto *address = first.data();
  for (auto i = 0; i < 10'000; ++i) {
    storage.GetAndPut(std::to_string(i));
  }
  EXPECT_EQ(storage.GetAndPut("first").data(), address);
  EXPECT_EQ(first, "first");
  EXPECT_EQ(storage.Size(), 10'001);
}

TEST(StringStorage, ViewsOutliveTheirSource)
{
  dapc::StringStorage storage{};
  std::string_view view;
  {
    std::string temporary{ "thread #1" };
    view = storage.GetAndPut(temporary);
    temporary.assign("overwritten");
  }
  EXPECT_EQ(view, "thread #1");
  EXPECT_TRUE(storage.Contains("thread #1"));
  EXPECT_FALSE(storage.Contains("overwritten"));
}

TEST(StringStorage, EmptyString)
{
  dapc::StringStorage storage{};
  EXPECT_TRUE(storage.GetAndPut("").empty());
  EXPECT_TRUE(storage.Contains(""));
}
