#include <gtest/gtest.h>
#include "web/url.hpp"

using namespace lutube::web;

TEST(UrlTest, DecodeEscapes) {
  EXPECT_EQ(url_decode("My%20Trip"), "My Trip");
  EXPECT_EQ(url_decode("a%2Fb%3f"), "a/b?");
  EXPECT_EQ(url_decode("a+b"), "a+b");
  EXPECT_EQ(url_decode("a+b", true), "a b");
}

TEST(UrlTest, DecodeKeepsMalformedEscapes) {
  EXPECT_EQ(url_decode("100%"), "100%");
  EXPECT_EQ(url_decode("%zz"), "%zz");
  EXPECT_EQ(url_decode("%4"), "%4");
}

TEST(UrlTest, EncodeReservedCharacters) {
  EXPECT_EQ(url_encode("abc-_.~09"), "abc-_.~09");
  EXPECT_EQ(url_encode("a b&c=d/"), "a%20b%26c%3Dd%2F");
  EXPECT_EQ(url_decode(url_encode("Ünïcödé?#")), "Ünïcödé?#");
}

TEST(UrlTest, ParseQuery) {
  auto query = parse_query("error=notfound&id=abc%20def&msg=a+b&flag&id=second");
  EXPECT_EQ(query["error"], "notfound");
  EXPECT_EQ(query["id"], "abc def");
  EXPECT_EQ(query["msg"], "a b");
  EXPECT_EQ(query.count("flag"), 1u);
  EXPECT_TRUE(parse_query("").empty());
}

TEST(UrlTest, SplitTarget) {
  std::string path, query;
  split_target("/watch/abc?x=1", path, query);
  EXPECT_EQ(path, "/watch/abc");
  EXPECT_EQ(query, "x=1");

  split_target("/", path, query);
  EXPECT_EQ(path, "/");
  EXPECT_EQ(query, "");
}
