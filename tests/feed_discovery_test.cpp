#include "services/FeedDiscoveryService.hpp"
#include "support/TestDoubles.hpp"
#include "utils/CancellationToken.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace FeedScout;
using namespace FeedScout::Testing;

namespace {

std::string rssDocument(const std::string& title) {
    return "<?xml version=\"1.0\"?><rss version=\"2.0\"><channel><title>" + title +
           "</title><link>https://example.com</link><item><title>First post</title>"
           "<link>https://example.com/1</link><pubDate>Tue, 10 Jun 2003 04:00:00 GMT</pubDate></item>"
           "</channel></rss>";
}

std::string atomDocument(const std::string& title) {
    return "<feed xmlns=\"http://www.w3.org/2005/Atom\"><title>" + title +
           "</title><entry><id>urn:1</id><title>Entry</title><updated>2024-01-02T03:04:05Z</updated></entry></feed>";
}

bool hasCode(const DiscoveryResult& result, DiagnosticCode code) {
    return std::any_of(result.suggestions.begin(), result.suggestions.end(),
                       [&](const Suggestion& s) { return s.code == code; });
}

class ThrowingParser : public FeedFormatParser {
public:
    FeedParseResult parse(const std::string&, const std::string&, const std::string&) override {
        throw std::runtime_error("parser exploded");
    }
};

}

class FeedDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher_ = std::make_shared<ScriptedFetcher>();
        proxies_ = std::make_shared<ScriptedProxyManager>();
        logger_ = std::make_shared<RecordingLogger>();
        options_.directTimeoutMs = 1000;
        options_.relayTimeoutMs = 1000;
        options_.candidateTimeoutMs = 1000;
    }

    FeedDiscoveryService makeService() {
        return FeedDiscoveryService(fetcher_, proxies_, std::make_shared<StandardFeedParser>(), logger_, options_);
    }

    std::shared_ptr<ScriptedFetcher> fetcher_;
    std::shared_ptr<ScriptedProxyManager> proxies_;
    std::shared_ptr<RecordingLogger> logger_;
    DiscoveryOptions options_;
};

TEST_F(FeedDiscoveryTest, DirectFeedShortCircuitsRelays) {
    fetcher_->script("https://example.com", okResponse(rssDocument("Fallback Feed"), "application/rss+xml"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://example.com");

    ASSERT_GE(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].title, "Fallback Feed");
    EXPECT_EQ(result.discoveredFeeds[0].method, DiscoveryMethod::Direct);
    EXPECT_EQ(result.discoveredFeeds[0].feedUrl, "https://example.com");
    EXPECT_TRUE(proxies_->targets().empty());
    EXPECT_TRUE(result.suggestions.empty());
    EXPECT_EQ(result.originalUrl, "https://example.com");
    EXPECT_EQ(result.totalAttempts, 1);
    EXPECT_EQ(result.successfulAttempts, 1);
}

TEST_F(FeedDiscoveryTest, DirectAndRelayFailureExhausts) {
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://broken.com");

    EXPECT_TRUE(result.discoveredFeeds.empty());
    ASSERT_GE(result.suggestions.size(), 1u);
    EXPECT_TRUE(hasCode(result, DiagnosticCode::SiteUnreachable));
    EXPECT_TRUE(hasCode(result, DiagnosticCode::AllRelaysFailed));
    EXPECT_EQ(result.totalAttempts, 3);
    EXPECT_EQ(result.successfulAttempts, 0);
}

TEST_F(FeedDiscoveryTest, RelayRescuesBlockedPage) {
    fetcher_->script("https://blocked.test/feed.xml", httpErrorResponse(403));
    proxies_->script("https://blocked.test/feed.xml", okResponse(rssDocument("Relayed")));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://blocked.test/feed.xml");

    ASSERT_EQ(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].title, "Relayed");
    EXPECT_EQ(proxies_->targets().size(), 1u);
    EXPECT_EQ(result.totalAttempts, 2);
    EXPECT_EQ(result.successfulAttempts, 1);
}

TEST_F(FeedDiscoveryTest, InvalidUrlMakesNoNetworkCall) {
    auto service = makeService();

    for (const std::string url : {"", "not a url", "example.com", "ftp://example.com/feed", "javascript:alert(1)"}) {
        DiscoveryResult result = service.discoverFromWebsite(url);
        EXPECT_TRUE(result.discoveredFeeds.empty()) << url;
        EXPECT_TRUE(hasCode(result, DiagnosticCode::InvalidUrl)) << url;
    }
    EXPECT_EQ(fetcher_->callCount(), 0);
    EXPECT_TRUE(proxies_->targets().empty());
}

TEST_F(FeedDiscoveryTest, EveryOutcomeIsAResultWithFeedsOrSuggestions) {
    fetcher_->script("https://ok.test/", okResponse(rssDocument("Ok")));
    fetcher_->script("https://page.test/", okResponse("<html><body>nothing here</body></html>", "text/html"));
    fetcher_->script("https://blob.test/", okResponse("\x01\x02\x03", "application/octet-stream"));
    auto service = makeService();

    for (const std::string url : {"https://ok.test/", "https://page.test/", "https://blob.test/",
                                  "https://down.test/", "::::"}) {
        DiscoveryResult result = service.discoverFromWebsite(url);
        EXPECT_TRUE(!result.discoveredFeeds.empty() || !result.suggestions.empty()) << url;
        EXPECT_GE(result.discoveryTimeMs, 0) << url;
    }
}

TEST_F(FeedDiscoveryTest, LinkTagsAreFetchedDeduplicatedAndKeptInDocumentOrder) {
    std::string page =
        "<html><head>"
        "<link rel=\"alternate\" type=\"application/atom+xml\" href=\"/atom.xml\">"
        "<link rel=\"alternate\" type=\"application/rss+xml\" href=\"https://blog.test/rss.xml\">"
        "<link rel=\"alternate\" type=\"application/rss+xml\" href=\"https://BLOG.test/rss.xml#top\">"
        "<link rel=\"stylesheet\" href=\"/style.css\">"
        "</head><body></body></html>";
    fetcher_->script("https://blog.test/", okResponse(page, "text/html; charset=utf-8"));
    // The first candidate answers last; order must still follow the markup
    fetcher_->script("https://blog.test/atom.xml", okResponse(atomDocument("Atom Side"), "application/atom+xml"), 50);
    fetcher_->script("https://blog.test/rss.xml", okResponse(rssDocument("RSS Side"), "application/rss+xml"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://blog.test/");

    ASSERT_EQ(result.discoveredFeeds.size(), 2u);
    EXPECT_EQ(result.discoveredFeeds[0].title, "Atom Side");
    EXPECT_EQ(result.discoveredFeeds[0].format, FeedFormat::Atom);
    EXPECT_EQ(result.discoveredFeeds[0].method, DiscoveryMethod::LinkTag);
    EXPECT_EQ(result.discoveredFeeds[1].title, "RSS Side");
    EXPECT_EQ(result.discoveredFeeds[1].feedUrl, "https://blog.test/rss.xml");
    EXPECT_EQ(fetcher_->callCount("https://blog.test/rss.xml"), 1);
    EXPECT_EQ(fetcher_->callCount("https://BLOG.test/rss.xml#top"), 0);
    EXPECT_EQ(fetcher_->callCount("https://blog.test/style.css"), 0);
    EXPECT_EQ(fetcher_->callCount("https://blog.test/feed"), 0);
    EXPECT_TRUE(hasCode(result, DiagnosticCode::MultipleFeedsFound));
    EXPECT_EQ(logger_->count("candidate.feed"), 2);
}

TEST_F(FeedDiscoveryTest, MetaTagCandidateIsUsed) {
    fetcher_->script("https://meta.test/",
                     okResponse("<html><head><meta name=\"feed\" content=\"/feed.json\"></head></html>", "text/html"));
    fetcher_->script("https://meta.test/feed.json",
                     okResponse(R"({"version":"https://jsonfeed.org/version/1.1","title":"Json Side","items":[]})",
                                "application/feed+json"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://meta.test/");

    ASSERT_EQ(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].format, FeedFormat::JsonFeed);
    EXPECT_EQ(result.discoveredFeeds[0].method, DiscoveryMethod::MetaTag);
}

TEST_F(FeedDiscoveryTest, ConventionalPathsOnlyWhenMarkupIsSilent) {
    fetcher_->script("https://quiet.test/",
                     okResponse("<html><head><title>Quiet</title></head><body><p>hello</p></body></html>",
                                "text/html"));
    fetcher_->script("https://quiet.test/rss.xml", okResponse(rssDocument("Guessed")));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://quiet.test/");

    ASSERT_EQ(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].method, DiscoveryMethod::CommonPath);
    EXPECT_EQ(result.discoveredFeeds[0].feedUrl, "https://quiet.test/rss.xml");
    EXPECT_EQ(fetcher_->callCount("https://quiet.test/feed"), 1);
    EXPECT_FALSE(hasCode(result, DiagnosticCode::CandidatesFailed));
    EXPECT_FALSE(hasCode(result, DiagnosticCode::MultipleFeedsFound));
}

TEST_F(FeedDiscoveryTest, CandidatesAreNeverSniffedAgain) {
    fetcher_->script("https://nest.test/",
                     okResponse("<html><head><link rel=\"alternate\" type=\"application/rss+xml\" href=\"/feeds\">"
                                "</head></html>",
                                "text/html"));
    fetcher_->script("https://nest.test/feeds",
                     okResponse("<html><head><link rel=\"alternate\" type=\"application/rss+xml\" "
                                "href=\"/deep.xml\"></head></html>",
                                "text/html"));
    fetcher_->script("https://nest.test/deep.xml", okResponse(rssDocument("Too Deep")));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://nest.test/");

    EXPECT_TRUE(result.discoveredFeeds.empty());
    EXPECT_EQ(fetcher_->callCount("https://nest.test/deep.xml"), 0);
    EXPECT_TRUE(hasCode(result, DiagnosticCode::NoFeedFound));
    EXPECT_FALSE(hasCode(result, DiagnosticCode::CandidatesFailed));
}

TEST_F(FeedDiscoveryTest, UnreachableAdvertisedCandidateIsReported) {
    fetcher_->script("https://gone.test/",
                     okResponse("<html><head><link rel=\"alternate\" type=\"application/rss+xml\" href=\"/gone.xml\">"
                                "</head></html>",
                                "text/html"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://gone.test/");

    EXPECT_TRUE(result.discoveredFeeds.empty());
    EXPECT_TRUE(hasCode(result, DiagnosticCode::CandidatesFailed));
    EXPECT_TRUE(hasCode(result, DiagnosticCode::NoFeedFound));
}

TEST_F(FeedDiscoveryTest, PageWithoutCandidatesHasNoFeed) {
    options_.commonFeedPaths.clear();
    fetcher_->script("https://plain.test/", okResponse("<html><body><a href=\"/about\">About</a></body></html>"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://plain.test/");

    EXPECT_TRUE(result.discoveredFeeds.empty());
    ASSERT_EQ(result.suggestions.size(), 1u);
    EXPECT_EQ(result.suggestions[0].code, DiagnosticCode::NoFeedFound);
    EXPECT_EQ(fetcher_->callCount(), 1);
}

TEST_F(FeedDiscoveryTest, NonFeedNonPageIsUnrecognized) {
    fetcher_->script("https://data.test/file.bin", okResponse("\x01\x02 binary", "application/octet-stream"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://data.test/file.bin");

    EXPECT_TRUE(result.discoveredFeeds.empty());
    EXPECT_TRUE(hasCode(result, DiagnosticCode::UnrecognizedContent));
    EXPECT_EQ(logger_->count("classify.unrecognized"), 1);
}

TEST_F(FeedDiscoveryTest, YouTubeChannelResolvesThroughPlatformRule) {
    fetcher_->script("https://www.youtube.com/channel/UCabc123",
                     okResponse("<html><head><title>Channel</title></head><body></body></html>", "text/html"));
    fetcher_->script("https://www.youtube.com/feeds/videos.xml?channel_id=UCabc123",
                     okResponse(atomDocument("Some Channel"), "application/atom+xml"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://www.youtube.com/channel/UCabc123");

    ASSERT_EQ(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].method, DiscoveryMethod::PlatformRule);
    EXPECT_EQ(result.discoveredFeeds[0].title, "Some Channel");
}

TEST_F(FeedDiscoveryTest, SlowSiteTimesOutWithinConfiguredBudget) {
    options_.directTimeoutMs = 100;
    fetcher_->script("https://slow.test/", okResponse(rssDocument("Never")), 5000);
    auto service = makeService();

    auto start = std::chrono::steady_clock::now();
    DiscoveryResult result = service.discoverFromWebsite("https://slow.test/");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.discoveredFeeds.empty());
    ASSERT_TRUE(hasCode(result, DiagnosticCode::SiteUnreachable));
    EXPECT_NE(result.suggestions[0].text.find("timed out"), std::string::npos);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

TEST_F(FeedDiscoveryTest, RequestTimeoutOverridesConfiguredTimeouts) {
    fetcher_->script("https://slow.test/", okResponse(rssDocument("Never")), 1000);
    auto service = makeService();

    DiscoveryRequest request;
    request.url = "https://slow.test/";
    request.timeoutMs = 50;
    DiscoveryResult result = service.discover(request);

    auto requests = fetcher_->requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_EQ(requests[0].timeoutMs, 50);
    EXPECT_TRUE(hasCode(result, DiagnosticCode::SiteUnreachable));
}

TEST_F(FeedDiscoveryTest, CancelledBeforeStartMakesNoCall) {
    auto service = makeService();
    DiscoveryRequest request;
    request.url = "https://example.com";
    request.cancel = std::make_shared<CancellationToken>();
    request.cancel->cancel();

    DiscoveryResult result = service.discover(request);

    EXPECT_TRUE(result.discoveredFeeds.empty());
    EXPECT_TRUE(hasCode(result, DiagnosticCode::Cancelled));
    EXPECT_EQ(fetcher_->callCount(), 0);
}

TEST_F(FeedDiscoveryTest, CancellationDuringFetchReturnsPromptly) {
    options_.directTimeoutMs = 10000;
    fetcher_->script("https://hang.test/", okResponse(rssDocument("Never")), 10000);
    auto service = makeService();
    DiscoveryRequest request;
    request.url = "https://hang.test/";
    request.cancel = std::make_shared<CancellationToken>();

    auto start = std::chrono::steady_clock::now();
    std::thread canceller([token = request.cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->cancel();
    });
    DiscoveryResult result = service.discover(request);
    canceller.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(hasCode(result, DiagnosticCode::Cancelled));
    EXPECT_TRUE(proxies_->targets().empty());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

TEST_F(FeedDiscoveryTest, AsyncDiscoveryDeliversResult) {
    fetcher_->script("https://example.com", okResponse(rssDocument("Async Feed")));
    auto service = makeService();
    std::promise<DiscoveryResult> promise;
    auto future = promise.get_future();

    DiscoveryRequest request;
    request.url = "https://example.com";
    service.discoverAsync(request, [&promise](DiscoveryResult result) { promise.set_value(std::move(result)); });

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    DiscoveryResult result = future.get();
    ASSERT_EQ(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].title, "Async Feed");
}

TEST_F(FeedDiscoveryTest, UnexpectedExceptionBecomesInternalError) {
    fetcher_->script("https://example.com", okResponse(rssDocument("Whatever")));
    FeedDiscoveryService service(fetcher_, proxies_, std::make_shared<ThrowingParser>(), logger_, options_);

    DiscoveryResult result = service.discoverFromWebsite("https://example.com");

    EXPECT_TRUE(result.discoveredFeeds.empty());
    EXPECT_TRUE(hasCode(result, DiagnosticCode::InternalError));
    EXPECT_EQ(logger_->count("discovery.error"), 1);
    EXPECT_EQ(logger_->count("discovery.done"), 1);
}

TEST_F(FeedDiscoveryTest, EmitsStructuredEventsPerPhase) {
    fetcher_->script("https://example.com", httpErrorResponse(500));
    proxies_->script("https://example.com", okResponse(rssDocument("Via Relay")));
    auto service = makeService();

    service.discoverFromWebsite("https://example.com");

    EXPECT_EQ(logger_->count("discovery.start"), 1);
    EXPECT_EQ(logger_->count("fetch.failed"), 1);
    EXPECT_EQ(logger_->count("classify.feed"), 1);
    EXPECT_EQ(logger_->count("discovery.done"), 1);
    for (const auto& event : logger_->events()) {
        if (event.event == "fetch.failed") EXPECT_EQ(event.cause, "HTTP 500");
        if (event.event == "classify.feed") EXPECT_EQ(event.endpoint, "test-relay");
    }
}

TEST_F(FeedDiscoveryTest, LargeFeedNearFetchCapIsDiscovered) {
    std::string items;
    for (int i = 0; i < 4; ++i) {
        items += "<item><title>Post " + std::to_string(i) + std::string(50000, ' ') + "</title>"
                 "<link>https://big.test/" + std::to_string(i) + "</link>"
                 "<description>x &lt; y " + std::string(200000, 'z') + "</description></item>";
    }
    const std::string feed = "<?xml version=\"1.0\"?><rss version=\"2.0\"><channel><title>Big Feed</title>" + items +
                             "</channel></rss>";
    fetcher_->script("https://big.test/feed.xml", okResponse(feed, "application/rss+xml"));
    auto service = makeService();

    DiscoveryResult result = service.discoverFromWebsite("https://big.test/feed.xml");

    ASSERT_EQ(result.discoveredFeeds.size(), 1u);
    EXPECT_EQ(result.discoveredFeeds[0].title, "Big Feed");
    ASSERT_EQ(result.discoveredFeeds[0].items.size(), 4u);
    EXPECT_EQ(result.discoveredFeeds[0].items[3].title, "Post 3");
    EXPECT_EQ(result.discoveredFeeds[0].items[0].description.size(), 200006u);
    EXPECT_TRUE(result.suggestions.empty());
}
