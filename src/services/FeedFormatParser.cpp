#include "services/FeedFormatParser.hpp"
#include "utils/DateUtils.hpp"
#include "utils/TextUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <json-glib/json-glib.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

namespace FeedScout {

namespace {

std::string nodeText(xmlNodePtr node) {
    if (!node) return "";
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    return TextUtils::trim(result);
}

std::string nodeAttr(xmlNodePtr node, const char* name) {
    xmlChar* val = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!val) return "";
    std::string result(reinterpret_cast<char*>(val));
    xmlFree(val);
    return TextUtils::trim(result);
}

std::string nsPrefix(xmlNodePtr node) {
    return node->ns && node->ns->prefix ? reinterpret_cast<const char*>(node->ns->prefix) : "";
}

bool isElement(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcasecmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

// Unprefixed (or default-namespace) child element; extension elements such as
// atom:link inside an RSS channel are skipped.
xmlNodePtr plainChild(xmlNodePtr parent, const char* name) {
    for (xmlNodePtr cur = parent->children; cur; cur = cur->next) {
        if (isElement(cur, name) && nsPrefix(cur).empty()) return cur;
    }
    return nullptr;
}

std::string plainChildText(xmlNodePtr parent, const char* name) {
    return nodeText(plainChild(parent, name));
}

bool isImageType(const std::string& type) {
    return type.rfind("image", 0) == 0;
}

void finishItem(FeedItem& item, const std::string& descriptionHtml) {
    item.title = TextUtils::stripMarkup(TextUtils::sanitizeUtf8(item.title));
    item.author = TextUtils::sanitizeUtf8(item.author);
    if (item.imageUrl.empty() && !descriptionHtml.empty()) {
        item.imageUrl = TextUtils::extractImageFromHtml(descriptionHtml);
    }
    item.description = TextUtils::stripMarkup(TextUtils::sanitizeUtf8(descriptionHtml));
    item.publishedMs = DateUtils::parseFeedDate(item.rawDate);
}

FeedItem parseRssItem(xmlNodePtr itemNode) {
    FeedItem item;
    std::string descriptionHtml;
    item.id = nodeAttr(itemNode, "about");

    for (xmlNodePtr child = itemNode->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        std::string name(reinterpret_cast<const char*>(child->name));
        std::string ns = nsPrefix(child);

        if (name == "title" && ns.empty()) {
            item.title = nodeText(child);
        } else if (name == "link" && ns.empty()) {
            item.link = nodeText(child);
        } else if (name == "description") {
            descriptionHtml = nodeText(child);
        } else if (name == "encoded" && ns == "content") {
            if (descriptionHtml.empty()) descriptionHtml = nodeText(child);
        } else if (name == "pubDate" || (name == "date" && ns == "dc")) {
            if (item.rawDate.empty()) item.rawDate = nodeText(child);
        } else if (name == "guid") {
            item.id = nodeText(child);
        } else if (name == "author" || (name == "creator" && ns == "dc")) {
            if (item.author.empty()) item.author = nodeText(child);
        } else if (name == "enclosure") {
            if (item.imageUrl.empty() && isImageType(nodeAttr(child, "type"))) item.imageUrl = nodeAttr(child, "url");
        } else if ((name == "thumbnail" || name == "content") && ns == "media") {
            std::string url = nodeAttr(child, "url");
            if (item.imageUrl.empty() && !url.empty()) item.imageUrl = url;
        } else if (name == "image") {
            std::string href = nodeAttr(child, "href");
            std::string content = nodeText(child);
            if (!href.empty()) item.imageUrl = href;
            else if (content.rfind("http", 0) == 0) item.imageUrl = content;
        }
    }
    finishItem(item, descriptionHtml);
    return item;
}

// Atom links: rel="alternate" or no rel wins; otherwise the first href.
std::string atomLink(xmlNodePtr parent) {
    std::string fallback;
    for (xmlNodePtr cur = parent->children; cur; cur = cur->next) {
        if (!isElement(cur, "link")) continue;
        std::string href = nodeAttr(cur, "href");
        if (href.empty()) continue;
        std::string rel = nodeAttr(cur, "rel");
        if (rel.empty() || rel == "alternate") return href;
        if (fallback.empty() && rel != "self" && rel != "enclosure") fallback = href;
    }
    return fallback;
}

FeedItem parseAtomEntry(xmlNodePtr entry) {
    FeedItem item;
    std::string descriptionHtml;
    std::string updated;
    item.link = atomLink(entry);

    for (xmlNodePtr child = entry->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        std::string name(reinterpret_cast<const char*>(child->name));
        std::string ns = nsPrefix(child);

        if (name == "title" && ns.empty()) {
            item.title = nodeText(child);
        } else if (name == "id" && ns.empty()) {
            item.id = nodeText(child);
        } else if (name == "published") {
            item.rawDate = nodeText(child);
        } else if (name == "updated") {
            updated = nodeText(child);
        } else if (name == "summary") {
            descriptionHtml = nodeText(child);
        } else if (name == "content" && ns.empty()) {
            if (descriptionHtml.empty()) descriptionHtml = nodeText(child);
        } else if (name == "author") {
            if (xmlNodePtr authorName = plainChild(child, "name")) item.author = nodeText(authorName);
        } else if (name == "thumbnail" && ns == "media") {
            item.imageUrl = nodeAttr(child, "url");
        } else if (name == "link" && nodeAttr(child, "rel") == "enclosure") {
            if (item.imageUrl.empty() && isImageType(nodeAttr(child, "type"))) item.imageUrl = nodeAttr(child, "href");
        } else if (name == "group" && ns == "media") {
            for (xmlNodePtr media = child->children; media; media = media->next) {
                if (isElement(media, "thumbnail") && item.imageUrl.empty()) item.imageUrl = nodeAttr(media, "url");
                if (isElement(media, "description") && descriptionHtml.empty()) descriptionHtml = nodeText(media);
            }
        }
    }
    if (item.rawDate.empty()) item.rawDate = updated;
    finishItem(item, descriptionHtml);
    return item;
}

void parseRssDocument(xmlNodePtr root, ParsedFeed& feed) {
    feed.format = FeedFormat::Rss;
    if (xmlNodePtr channel = plainChild(root, "channel")) {
        feed.title = plainChildText(channel, "title");
        feed.link = plainChildText(channel, "link");
        feed.description = plainChildText(channel, "description");
        for (xmlNodePtr cur = channel->children; cur; cur = cur->next) {
            if (isElement(cur, "item")) feed.items.push_back(parseRssItem(cur));
        }
    }
    // RSS 1.0 keeps items beside the channel
    for (xmlNodePtr cur = root->children; cur; cur = cur->next) {
        if (isElement(cur, "item")) feed.items.push_back(parseRssItem(cur));
    }
}

void parseAtomDocument(xmlNodePtr root, ParsedFeed& feed) {
    feed.format = FeedFormat::Atom;
    feed.title = plainChildText(root, "title");
    feed.description = plainChildText(root, "subtitle");
    feed.link = atomLink(root);
    for (xmlNodePtr cur = root->children; cur; cur = cur->next) {
        if (isElement(cur, "entry")) feed.items.push_back(parseAtomEntry(cur));
    }
}

std::string jsonString(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) return "";
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) return "";
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_STRING) {
        const char* val = json_node_get_string(node);
        return val ? TextUtils::trim(val) : "";
    }
    if (type == G_TYPE_INT64) return std::to_string(json_node_get_int(node));
    return "";
}

JsonObject* jsonObjectMember(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) return nullptr;
    JsonNode* node = json_object_get_member(obj, member);
    return (node && JSON_NODE_HOLDS_OBJECT(node)) ? json_node_get_object(node) : nullptr;
}

JsonArray* jsonArrayMember(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) return nullptr;
    JsonNode* node = json_object_get_member(obj, member);
    return (node && JSON_NODE_HOLDS_ARRAY(node)) ? json_node_get_array(node) : nullptr;
}

FeedItem parseJsonFeedItem(JsonObject* obj) {
    FeedItem item;
    item.id = jsonString(obj, "id");
    item.title = jsonString(obj, "title");
    item.link = jsonString(obj, "url");
    if (item.link.empty()) item.link = jsonString(obj, "external_url");
    item.rawDate = jsonString(obj, "date_published");
    if (item.rawDate.empty()) item.rawDate = jsonString(obj, "date_modified");
    item.imageUrl = jsonString(obj, "image");
    if (item.imageUrl.empty()) item.imageUrl = jsonString(obj, "banner_image");

    if (JsonObject* author = jsonObjectMember(obj, "author")) {
        item.author = jsonString(author, "name");
    } else if (JsonArray* authors = jsonArrayMember(obj, "authors")) {
        if (json_array_get_length(authors) > 0) {
            JsonNode* first = json_array_get_element(authors, 0);
            if (JSON_NODE_HOLDS_OBJECT(first)) item.author = jsonString(json_node_get_object(first), "name");
        }
    }

    std::string descriptionHtml = jsonString(obj, "summary");
    if (descriptionHtml.empty()) descriptionHtml = jsonString(obj, "content_html");
    if (descriptionHtml.empty()) descriptionHtml = jsonString(obj, "content_text");
    finishItem(item, descriptionHtml);
    return item;
}

std::string stripPreamble(const std::string& raw) {
    size_t start = 0;
    if (raw.compare(0, 3, "\xEF\xBB\xBF") == 0) start = 3;
    start = raw.find_first_not_of(" \t\r\n", start);
    return start == std::string::npos ? "" : raw.substr(start);
}

}

StandardFeedParser::StandardFeedParser() { xmlInitParser(); }

StandardFeedParser::Family StandardFeedParser::familyForContentType(const std::string& contentType) {
    std::string type = TextUtils::toLower(contentType.substr(0, contentType.find(';')));
    type = TextUtils::trim(type);
    if (type.empty()) return Family::Unknown;
    if (type.find("json") != std::string::npos) return Family::Json;
    if (type.find("rss") != std::string::npos || type.find("atom") != std::string::npos ||
        type.find("rdf") != std::string::npos || type == "application/xml" || type == "text/xml") {
        return Family::Xml;
    }
    return Family::Unknown;
}

FeedParseResult StandardFeedParser::parse(const std::string& rawText, const std::string& declaredContentType,
                                          const std::string& sourceUrl) {
    std::string text = stripPreamble(rawText);
    if (text.empty()) {
        FeedParseResult result;
        result.error = "empty document";
        return result;
    }

    Family family = familyForContentType(declaredContentType);
    if (family == Family::Unknown) {
        if (text[0] == '{') family = Family::Json;
        else if (text[0] == '<') family = Family::Xml;
    }

    FeedParseResult result;
    if (family == Family::Json) {
        result = parseJsonFeed(text);
    } else if (family == Family::Xml) {
        result = parseXml(text, sourceUrl);
    } else {
        result.error = "payload is neither markup nor JSON";
    }
    if (result.success) finalize(result.feed, sourceUrl);
    return result;
}

FeedParseResult StandardFeedParser::parseXml(const std::string& text, const std::string& sourceUrl) {
    FeedParseResult result;
    xmlDocPtr doc = xmlReadMemory(text.c_str(), static_cast<int>(text.size()),
                                  sourceUrl.empty() ? "feed.xml" : sourceUrl.c_str(), nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOCDATA);
    if (!doc) {
        result.error = "markup is not well-formed";
        return result;
    }
    xmlNodePtr root = xmlDocGetRootElement(doc);
    if (!root) {
        xmlFreeDoc(doc);
        result.error = "document has no root element";
        return result;
    }

    if (isElement(root, "rss") || isElement(root, "RDF")) {
        parseRssDocument(root, result.feed);
        result.success = true;
    } else if (isElement(root, "feed")) {
        parseAtomDocument(root, result.feed);
        result.success = true;
    } else {
        result.error = "unsupported root element <" + std::string(reinterpret_cast<const char*>(root->name)) + ">";
    }
    xmlFreeDoc(doc);
    return result;
}

FeedParseResult StandardFeedParser::parseJsonFeed(const std::string& text) {
    FeedParseResult result;
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_data(parser, text.c_str(), static_cast<gssize>(text.size()), &error)) {
        result.error = std::string("malformed JSON: ") + (error ? error->message : "unknown error");
        if (error) g_error_free(error);
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_object_unref(parser);
        result.error = "JSON document is not an object";
        return result;
    }
    JsonObject* obj = json_node_get_object(root);
    if (!json_object_has_member(obj, "version") && !json_object_has_member(obj, "feed_url")) {
        g_object_unref(parser);
        result.error = "JSON document has neither version nor feed_url";
        return result;
    }

    ParsedFeed& feed = result.feed;
    feed.format = FeedFormat::JsonFeed;
    feed.title = jsonString(obj, "title");
    feed.link = jsonString(obj, "home_page_url");
    feed.description = jsonString(obj, "description");
    if (JsonArray* items = jsonArrayMember(obj, "items")) {
        guint len = json_array_get_length(items);
        for (guint i = 0; i < len; i++) {
            JsonNode* node = json_array_get_element(items, i);
            if (!JSON_NODE_HOLDS_OBJECT(node)) continue;
            feed.items.push_back(parseJsonFeedItem(json_node_get_object(node)));
        }
    }
    g_object_unref(parser);
    result.success = true;
    return result;
}

void StandardFeedParser::finalize(ParsedFeed& feed, const std::string& sourceUrl) {
    feed.feedUrl = sourceUrl;
    feed.title = TextUtils::stripMarkup(TextUtils::sanitizeUtf8(feed.title));
    feed.description = TextUtils::stripMarkup(TextUtils::sanitizeUtf8(feed.description));
    if (feed.link.empty()) feed.link = sourceUrl;

    if (feed.title.empty()) feed.title = UrlUtils::hostOf(sourceUrl);
    if (feed.title.empty()) feed.title = UrlUtils::hostOf(feed.link);
    if (feed.title.empty()) feed.title = sourceUrl.empty() ? "Untitled feed" : sourceUrl;

    if (sourceUrl.empty()) return;
    for (auto& item : feed.items) {
        if (!item.link.empty() && !UrlUtils::isValidAbsoluteUrl(item.link)) {
            std::string resolved = UrlUtils::resolveUrl(sourceUrl, item.link);
            if (!resolved.empty()) item.link = resolved;
        }
    }
}

}
