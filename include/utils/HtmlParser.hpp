#pragma once
#include <string>
#include <vector>
#include <map>
#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>

namespace FeedScout {

class HtmlParser {
public:
    HtmlParser();
    ~HtmlParser();
    HtmlParser(const HtmlParser&) = delete;
    HtmlParser& operator=(const HtmlParser&) = delete;

    bool parse(const std::string& html);
    std::string getAttribute(const std::string& xpath, const std::string& attr);
    // Every attribute of every matching element, in document order.
    std::vector<std::map<std::string, std::string>> getElements(const std::string& xpath);

private:
    htmlDocPtr doc_;
    xmlXPathContextPtr xpathCtx_;
    void cleanup();
};

}
