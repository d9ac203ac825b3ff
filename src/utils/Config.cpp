#include "utils/Config.hpp"
#include <json-glib/json-glib.h>
#include <cstdlib>

namespace FeedScout {

namespace {

const char* DEFAULT_USER_AGENT = "FeedScout/1.0 (+feed discovery)";

std::string stringMember(JsonObject* obj, const char* name, const std::string& fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return fallback;
    const char* val = json_node_get_string(node);
    return val ? val : fallback;
}

long intMember(JsonObject* obj, const char* name, long fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_INT64) return fallback;
    return static_cast<long>(json_node_get_int(node));
}

bool boolMember(JsonObject* obj, const char* name, bool fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_BOOLEAN) return fallback;
    return json_node_get_boolean(node);
}

JsonArray* arrayMember(JsonObject* obj, const char* name) {
    if (!json_object_has_member(obj, name)) return nullptr;
    JsonNode* node = json_object_get_member(obj, name);
    return JSON_NODE_HOLDS_ARRAY(node) ? json_node_get_array(node) : nullptr;
}

RelayEndpoint parseRelay(JsonObject* obj, guint index) {
    RelayEndpoint relay;
    relay.urlTemplate = stringMember(obj, "url", "");
    relay.id = stringMember(obj, "id", "relay-" + std::to_string(index));
    relay.name = stringMember(obj, "name", relay.id);
    relay.priority = static_cast<int>(intMember(obj, "priority", static_cast<long>(index)));
    relay.enabled = boolMember(obj, "enabled", true);
    relay.timeoutMs = intMember(obj, "timeoutMs", 0);
    relay.unwrapJsonField = stringMember(obj, "unwrapJsonField", "");

    if (json_object_has_member(obj, "headers")) {
        JsonNode* headers = json_object_get_member(obj, "headers");
        if (JSON_NODE_HOLDS_OBJECT(headers)) {
            JsonObject* h = json_node_get_object(headers);
            GList* names = json_object_get_members(h);
            for (GList* l = names; l; l = l->next) {
                const char* name = static_cast<const char*>(l->data);
                std::string value = stringMember(h, name, "");
                if (!value.empty()) relay.headers[name] = value;
            }
            g_list_free(names);
        }
    }
    return relay;
}

}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reset();
}

std::string Config::getDefaultConfigPath() {
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/feedscout/config.json";
    const char* home = getenv("HOME");
    return std::string(home ? home : ".") + "/.config/feedscout/config.json";
}

std::vector<RelayEndpoint> Config::defaultRelays() {
    RelayEndpoint codetabs;
    codetabs.id = "codetabs";
    codetabs.name = "CodeTabs";
    codetabs.urlTemplate = "https://api.codetabs.com/v1/proxy?quest={url}";
    codetabs.priority = 0;
    codetabs.timeoutMs = 15000;

    RelayEndpoint allorigins;
    allorigins.id = "allorigins";
    allorigins.name = "AllOrigins";
    allorigins.urlTemplate = "https://api.allorigins.win/get?url={url}";
    allorigins.priority = 1;
    allorigins.timeoutMs = 10000;
    allorigins.headers["Accept"] = "application/json";
    allorigins.unwrapJsonField = "contents";

    RelayEndpoint corsproxy;
    corsproxy.id = "corsproxy-io";
    corsproxy.name = "CorsProxy.io";
    corsproxy.urlTemplate = "https://corsproxy.io/?{url}";
    corsproxy.priority = 2;
    corsproxy.timeoutMs = 8000;
    corsproxy.headers["Accept"] = "application/rss+xml, application/atom+xml, application/xml, text/xml";

    RelayEndpoint whatever;
    whatever.id = "whateverorigin";
    whatever.name = "WhateverOrigin";
    whatever.urlTemplate = "https://whateverorigin.org/get?url={url}";
    whatever.priority = 6;
    whatever.timeoutMs = 10000;
    whatever.unwrapJsonField = "contents";

    return {codetabs, allorigins, corsproxy, whatever};
}

void Config::reset() {
    userAgent_ = DEFAULT_USER_AGENT;
    relays_.clear();
    options_ = DiscoveryOptions();
    ensureDefaults();
}

void Config::ensureDefaults() {
    if (userAgent_.empty()) userAgent_ = DEFAULT_USER_AGENT;
    if (relays_.empty()) relays_ = defaultRelays();
    if (options_.commonFeedPaths.empty()) options_.commonFeedPaths = DiscoveryOptions().commonFeedPaths;
    if (options_.maxConcurrentCandidates == 0) options_.maxConcurrentCandidates = 1;
    if (options_.maxCandidates == 0) options_.maxCandidates = DiscoveryOptions().maxCandidates;
}

bool Config::load(const std::string& path, std::string* error) {
    gchar* contents = nullptr;
    gsize length = 0;
    GError* gerror = nullptr;
    if (!g_file_get_contents(path.c_str(), &contents, &length, &gerror)) {
        if (error) *error = gerror ? std::string(gerror->message) : "cannot read " + path;
        if (gerror) g_error_free(gerror);
        reset();
        return false;
    }
    std::string data(contents, length);
    g_free(contents);
    return loadFromData(data, error);
}

bool Config::loadFromData(const std::string& json, std::string* error) {
    reset();

    JsonParser* parser = json_parser_new();
    GError* gerror = nullptr;
    if (!json_parser_load_from_data(parser, json.c_str(), static_cast<gssize>(json.size()), &gerror)) {
        if (error) *error = std::string("malformed config: ") + (gerror ? gerror->message : "parse error");
        if (gerror) g_error_free(gerror);
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        if (error) *error = "malformed config: top level is not an object";
        g_object_unref(parser);
        return false;
    }
    JsonObject* obj = json_node_get_object(root);

    userAgent_ = stringMember(obj, "userAgent", userAgent_);
    options_.directTimeoutMs = intMember(obj, "directTimeoutMs", options_.directTimeoutMs);
    options_.relayTimeoutMs = intMember(obj, "relayTimeoutMs", options_.relayTimeoutMs);
    options_.candidateTimeoutMs = intMember(obj, "candidateTimeoutMs", options_.candidateTimeoutMs);
    long concurrency = intMember(obj, "maxConcurrentCandidates", static_cast<long>(options_.maxConcurrentCandidates));
    if (concurrency > 0) options_.maxConcurrentCandidates = static_cast<size_t>(concurrency);
    long maxCandidates = intMember(obj, "maxCandidates", static_cast<long>(options_.maxCandidates));
    if (maxCandidates > 0) options_.maxCandidates = static_cast<size_t>(maxCandidates);

    if (JsonArray* paths = arrayMember(obj, "commonFeedPaths")) {
        options_.commonFeedPaths.clear();
        guint len = json_array_get_length(paths);
        for (guint i = 0; i < len; i++) {
            JsonNode* node = json_array_get_element(paths, i);
            if (JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING)
                options_.commonFeedPaths.push_back(json_node_get_string(node));
        }
    }

    if (JsonArray* relays = arrayMember(obj, "relays")) {
        relays_.clear();
        guint len = json_array_get_length(relays);
        for (guint i = 0; i < len; i++) {
            JsonNode* node = json_array_get_element(relays, i);
            if (!JSON_NODE_HOLDS_OBJECT(node)) continue;
            RelayEndpoint relay = parseRelay(json_node_get_object(node), i);
            if (!relay.urlTemplate.empty()) relays_.push_back(relay);
        }
    }

    g_object_unref(parser);
    ensureDefaults();
    return true;
}

}
