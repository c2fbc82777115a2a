#include <gtest/gtest.h>
#include "web/html.hpp"

using namespace lutube::web;
using lutube::store::Video;

TEST(HtmlTest, EscapesMarkup) {
  EXPECT_EQ(escape_html("<a href=\"x\">Tom & Jerry's</a>"),
            "&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&#39;s&lt;/a&gt;");
  EXPECT_EQ(escape_html("plain"), "plain");
}

TEST(HtmlTest, ErrorMessages) {
  EXPECT_EQ(error_message({{"error", "notfound"}, {"id", "abc"}}), "ID abc not found.");
  EXPECT_EQ(error_message({{"error", "misc"}, {"msg", "disk full"}}), "Error: disk full");
  EXPECT_EQ(error_message({{"error", "fu"}}), "Upload failed.");
  EXPECT_EQ(error_message({{"error", "other"}}), "");
  EXPECT_EQ(error_message({}), "");
}

TEST(HtmlTest, HomeListsVideos) {
  std::string page = render_home({{"id1", "First <video>"}, {"id2", "Second"}}, "");

  EXPECT_NE(page.find("href=\"/watch/id1\""), std::string::npos);
  EXPECT_NE(page.find("First &lt;video&gt;"), std::string::npos);
  EXPECT_NE(page.find("href=\"/watch/id2\""), std::string::npos);
  EXPECT_NE(page.find("enctype=\"multipart/form-data\""), std::string::npos);
  EXPECT_NE(page.find("name=\"video-file\""), std::string::npos);
  EXPECT_EQ(page.find("class=\"error\""), std::string::npos);
}

TEST(HtmlTest, HomeShowsEscapedError) {
  std::string page = render_home({}, "ID <script> not found.");
  EXPECT_NE(page.find("ID &lt;script&gt; not found."), std::string::npos);
  EXPECT_NE(page.find("No videos yet."), std::string::npos);
}

TEST(HtmlTest, WatchPage) {
  std::string page = render_watch(Video{"abc123", "My Trip"});
  EXPECT_NE(page.find("<h1>My Trip</h1>"), std::string::npos);
  EXPECT_NE(page.find("src=\"/videos/abc123/video.mp4\""), std::string::npos);
}
