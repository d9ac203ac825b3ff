#include "services/FeedFormatParser.hpp"
#include <gtest/gtest.h>

using namespace FeedScout;

class FeedFormatParserTest : public ::testing::Test {
protected:
    StandardFeedParser parser_;
};

TEST_F(FeedFormatParserTest, ParsesRss2Channel) {
    const std::string xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0" xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:media="http://search.yahoo.com/mrss/">
  <channel>
    <title>Example &amp; Friends</title>
    <link>https://example.com/</link>
    <description>All the news</description>
    <item>
      <title>First</title>
      <link>/posts/1</link>
      <guid>post-1</guid>
      <description><![CDATA[<p>Hello <b>world</b> &amp; more</p><img src="https://img.test/1.png">]]></description>
      <pubDate>Tue, 10 Jun 2003 04:00:00 GMT</pubDate>
      <dc:creator>Ada</dc:creator>
    </item>
    <item>
      <title>Second</title>
      <link>https://example.com/posts/2</link>
      <pubDate>sometime last week</pubDate>
      <media:thumbnail url="https://img.test/2.png"/>
    </item>
  </channel>
</rss>)";

    FeedParseResult result = parser_.parse(xml, "application/rss+xml", "https://example.com/feed");

    ASSERT_TRUE(result.success) << result.error;
    const ParsedFeed& feed = result.feed;
    EXPECT_EQ(feed.format, FeedFormat::Rss);
    EXPECT_EQ(feed.title, "Example & Friends");
    EXPECT_EQ(feed.link, "https://example.com/");
    EXPECT_EQ(feed.feedUrl, "https://example.com/feed");
    EXPECT_EQ(feed.description, "All the news");
    ASSERT_EQ(feed.items.size(), 2u);

    const FeedItem& first = feed.items[0];
    EXPECT_EQ(first.title, "First");
    EXPECT_EQ(first.link, "https://example.com/posts/1");
    EXPECT_EQ(first.id, "post-1");
    EXPECT_EQ(first.description, "Hello world & more");
    EXPECT_EQ(first.imageUrl, "https://img.test/1.png");
    EXPECT_EQ(first.author, "Ada");
    EXPECT_EQ(first.publishedMs.value_or(-1), 1055217600000LL);

    const FeedItem& second = feed.items[1];
    EXPECT_EQ(second.imageUrl, "https://img.test/2.png");
    EXPECT_EQ(second.rawDate, "sometime last week");
    EXPECT_FALSE(second.publishedMs.has_value());
}

TEST_F(FeedFormatParserTest, ParsesRdfItemsBesideChannel) {
    const std::string xml = R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#" xmlns="http://purl.org/rss/1.0/"
         xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel rdf:about="https://rdf.test/"><title>RDF Site</title><link>https://rdf.test/</link></channel>
  <item rdf:about="https://rdf.test/a"><title>A</title><link>https://rdf.test/a</link>
    <dc:date>2024-01-02T03:04:05Z</dc:date></item>
</rdf:RDF>)";

    FeedParseResult result = parser_.parse(xml, "application/rdf+xml", "https://rdf.test/index.rdf");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.feed.format, FeedFormat::Rss);
    EXPECT_EQ(result.feed.title, "RDF Site");
    ASSERT_EQ(result.feed.items.size(), 1u);
    EXPECT_EQ(result.feed.items[0].id, "https://rdf.test/a");
    EXPECT_EQ(result.feed.items[0].publishedMs.value_or(-1), 1704164645000LL);
}

TEST_F(FeedFormatParserTest, ParsesAtomFeed) {
    const std::string xml = R"(<feed xmlns="http://www.w3.org/2005/Atom">
  <title type="text">Atom Site</title>
  <subtitle>Notes</subtitle>
  <link rel="self" href="https://atom.test/feed.atom"/>
  <link rel="alternate" href="https://atom.test/"/>
  <entry>
    <id>tag:atom.test,2024:1</id>
    <title>Entry One</title>
    <link rel="alternate" href="https://atom.test/1"/>
    <updated>2024-01-02T03:04:05Z</updated>
    <author><name>Grace</name></author>
    <summary>Short &lt;b&gt;summary&lt;/b&gt;</summary>
  </entry>
</feed>)";

    FeedParseResult result = parser_.parse(xml, "application/atom+xml", "https://atom.test/feed.atom");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.feed.format, FeedFormat::Atom);
    EXPECT_EQ(result.feed.title, "Atom Site");
    EXPECT_EQ(result.feed.link, "https://atom.test/");
    EXPECT_EQ(result.feed.description, "Notes");
    ASSERT_EQ(result.feed.items.size(), 1u);
    const FeedItem& entry = result.feed.items[0];
    EXPECT_EQ(entry.id, "tag:atom.test,2024:1");
    EXPECT_EQ(entry.link, "https://atom.test/1");
    EXPECT_EQ(entry.author, "Grace");
    EXPECT_EQ(entry.description, "Short summary");
    EXPECT_EQ(entry.publishedMs.value_or(-1), 1704164645000LL);
}

TEST_F(FeedFormatParserTest, ParsesJsonFeed) {
    const std::string json = R"({
  "version": "https://jsonfeed.org/version/1.1",
  "title": "Json Site",
  "home_page_url": "https://json.test/",
  "items": [
    {"id": "1", "url": "https://json.test/1", "title": "Hello", "content_html": "<p>Body</p>",
     "date_published": "2024-01-02T03:04:05Z", "authors": [{"name": "Linus"}]},
    {"id": 2, "content_text": "untitled"}
  ]
})";

    FeedParseResult result = parser_.parse(json, "application/feed+json", "https://json.test/feed.json");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.feed.format, FeedFormat::JsonFeed);
    EXPECT_EQ(result.feed.title, "Json Site");
    EXPECT_EQ(result.feed.link, "https://json.test/");
    ASSERT_EQ(result.feed.items.size(), 2u);
    EXPECT_EQ(result.feed.items[0].description, "Body");
    EXPECT_EQ(result.feed.items[0].author, "Linus");
    EXPECT_EQ(result.feed.items[0].publishedMs.value_or(-1), 1704164645000LL);
    EXPECT_EQ(result.feed.items[1].id, "2");
    EXPECT_EQ(result.feed.items[1].description, "untitled");
}

TEST_F(FeedFormatParserTest, SniffsWhenContentTypeIsMissingOrGeneric) {
    const std::string rss = "\xEF\xBB\xBF  <rss version=\"2.0\"><channel><title>Bom</title></channel></rss>";
    EXPECT_TRUE(parser_.parse(rss, "", "https://a.test/").success);
    EXPECT_TRUE(parser_.parse(rss, "text/plain", "https://a.test/").success);
    EXPECT_TRUE(parser_.parse(R"({"version":"1","items":[]})", "application/octet-stream", "https://a.test/").success);
}

TEST_F(FeedFormatParserTest, DeclaredContentTypeWins) {
    // Declared JSON, so markup is never tried
    FeedParseResult result =
        parser_.parse("<rss version=\"2.0\"><channel/></rss>", "application/json", "https://a.test/");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("JSON"), std::string::npos);
}

TEST_F(FeedFormatParserTest, TitleFallsBackToHost) {
    FeedParseResult result =
        parser_.parse("<rss version=\"2.0\"><channel><link>https://x.test/</link></channel></rss>", "",
                      "https://feeds.example.org/main.xml");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.feed.title, "feeds.example.org");
}

TEST_F(FeedFormatParserTest, RejectsNonFeeds) {
    EXPECT_FALSE(parser_.parse("", "", "https://a.test/").success);
    EXPECT_FALSE(parser_.parse("just words", "", "https://a.test/").success);
    EXPECT_FALSE(parser_.parse("<rss><channel>", "", "https://a.test/").success);
    EXPECT_FALSE(parser_.parse("<html><body/></html>", "", "https://a.test/").success);
    EXPECT_FALSE(parser_.parse(R"({"name":"not a feed"})", "application/json", "https://a.test/").success);
    EXPECT_FALSE(parser_.parse("[1,2,3]", "application/json", "https://a.test/").success);

    FeedParseResult html = parser_.parse("<html><body/></html>", "", "https://a.test/");
    EXPECT_EQ(html.error, "unsupported root element <html>");
}

TEST_F(FeedFormatParserTest, LongItemTextIsHandledLinearly) {
    const std::string longText(200000, 'x');
    const std::string xml = "<rss version=\"2.0\"><channel><title>Big" + std::string(300000, ' ') +
                            "Feed</title>"
                            "<item><title>Huge" + std::string(250000, '\n') + "title</title>"
                            "<description>a &lt; b " + longText + "</description>"
                            "<pubDate>" + std::string(100000, '9') + "</pubDate></item>"
                            "<item><title>Open image</title><description>&lt;img" + std::string(200000, ' ') +
                            "</description></item>"
                            "</channel></rss>";

    FeedParseResult result = parser_.parse(xml, "application/rss+xml", "https://big.test/feed.xml");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.feed.title, "Big Feed");
    ASSERT_EQ(result.feed.items.size(), 2u);
    EXPECT_EQ(result.feed.items[0].title, "Huge title");
    EXPECT_EQ(result.feed.items[0].description, "a < b " + longText);
    EXPECT_FALSE(result.feed.items[0].publishedMs.has_value());
    EXPECT_EQ(result.feed.items[1].description, "<img");
    EXPECT_TRUE(result.feed.items[1].imageUrl.empty());
}
