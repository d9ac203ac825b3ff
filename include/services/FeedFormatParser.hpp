#pragma once
#include "services/FeedTypes.hpp"
#include <string>

namespace FeedScout {

struct FeedParseResult {
    bool success = false;
    ParsedFeed feed;
    std::string error; // FeedFormatError reason when !success
};

class FeedFormatParser {
public:
    virtual ~FeedFormatParser() = default;
    // Never throws; unrecognized or malformed input comes back with success == false.
    virtual FeedParseResult parse(const std::string& rawText, const std::string& declaredContentType,
                                  const std::string& sourceUrl) = 0;
};

// RSS 2.0, RSS 1.0 (RDF) and Atom through libxml2; JSON Feed through json-glib.
class StandardFeedParser : public FeedFormatParser {
public:
    StandardFeedParser();
    FeedParseResult parse(const std::string& rawText, const std::string& declaredContentType,
                          const std::string& sourceUrl) override;

    enum class Family { Unknown, Xml, Json };
    // Family named by a Content-Type value; Unknown when absent or ambiguous.
    static Family familyForContentType(const std::string& contentType);

private:
    FeedParseResult parseXml(const std::string& text, const std::string& sourceUrl);
    FeedParseResult parseJsonFeed(const std::string& text);
    static void finalize(ParsedFeed& feed, const std::string& sourceUrl);
};

}
