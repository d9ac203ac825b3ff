#include "utils/HtmlParser.hpp"
#include <libxml/parser.h>
#include <libxml/xpathInternals.h>

namespace FeedScout {

HtmlParser::HtmlParser() : doc_(nullptr), xpathCtx_(nullptr) { xmlInitParser(); }
HtmlParser::~HtmlParser() { cleanup(); }

void HtmlParser::cleanup() {
    if (xpathCtx_) { xmlXPathFreeContext(xpathCtx_); xpathCtx_ = nullptr; }
    if (doc_) { xmlFreeDoc(doc_); doc_ = nullptr; }
}

bool HtmlParser::parse(const std::string& html) {
    cleanup();
    if (html.empty()) return false;
    doc_ = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
                          HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!doc_) return false;
    xpathCtx_ = xmlXPathNewContext(doc_);
    return xpathCtx_ != nullptr;
}

std::string HtmlParser::getAttribute(const std::string& xpath, const std::string& attr) {
    if (!xpathCtx_) return "";
    xmlXPathObjectPtr result = xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), xpathCtx_);
    if (!result) return "";
    std::string value;
    if (result->nodesetval && result->nodesetval->nodeNr > 0) {
        xmlChar* attrVal = xmlGetProp(result->nodesetval->nodeTab[0], reinterpret_cast<const xmlChar*>(attr.c_str()));
        if (attrVal) { value = reinterpret_cast<char*>(attrVal); xmlFree(attrVal); }
    }
    xmlXPathFreeObject(result);
    return value;
}

std::vector<std::map<std::string, std::string>> HtmlParser::getElements(const std::string& xpath) {
    std::vector<std::map<std::string, std::string>> elements;
    if (!xpathCtx_) return elements;
    xmlXPathObjectPtr result = xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), xpathCtx_);
    if (!result) return elements;
    if (result->nodesetval) {
        for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
            xmlNodePtr node = result->nodesetval->nodeTab[i];
            if (node->type != XML_ELEMENT_NODE) continue;
            std::map<std::string, std::string> attrs;
            for (xmlAttrPtr prop = node->properties; prop; prop = prop->next) {
                xmlChar* val = xmlNodeGetContent(reinterpret_cast<xmlNodePtr>(prop));
                if (!val) continue;
                attrs[reinterpret_cast<const char*>(prop->name)] = reinterpret_cast<char*>(val);
                xmlFree(val);
            }
            elements.push_back(attrs);
        }
    }
    xmlXPathFreeObject(result);
    return elements;
}

}
