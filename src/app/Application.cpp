#include "app/Application.hpp"
#include "services/FeedDiscoveryService.hpp"
#include "utils/CancellationToken.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include <glib.h>
#include <json-glib/json-glib.h>
#include <csignal>
#include <iostream>
#include <stdexcept>

namespace FeedScout {

Application* Application::instance_ = nullptr;

namespace {

void addString(JsonBuilder* builder, const char* name, const std::string& value) {
    json_builder_set_member_name(builder, name);
    json_builder_add_string_value(builder, value.c_str());
}

}

Application::Application() : cancel_(std::make_shared<CancellationToken>()) {
    instance_ = this;
}

Application::~Application() {
    std::signal(SIGINT, SIG_DFL);
    instance_ = nullptr;
}

Application* Application::getInstance() {
    return instance_;
}

void Application::onInterrupt(int /*signum*/) {
    // Only the atomic flag is touched here; curl's progress callback picks it up
    if (instance_) instance_->cancel_->cancel();
}

int Application::run(int argc, char* argv[]) {
    gchar* configPath = nullptr;
    gint timeoutMs = 0;
    gboolean json = FALSE;
    gboolean verbose = FALSE;

    GOptionEntry entries[] = {
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &configPath, "Read settings from FILE", "FILE"},
        {"timeout", 't', 0, G_OPTION_ARG_INT, &timeoutMs, "Per-request timeout in milliseconds", "MS"},
        {"json", 'j', 0, G_OPTION_ARG_NONE, &json, "Print the result as JSON", nullptr},
        {"verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose, "Log every fetch and relay attempt", nullptr},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}};

    GOptionContext* context = g_option_context_new("URL - find the RSS, Atom or JSON feeds of a website");
    g_option_context_add_main_entries(context, entries, nullptr);
    GError* error = nullptr;
    bool parsed = g_option_context_parse(context, &argc, &argv, &error);
    g_option_context_free(context);
    if (!parsed) {
        std::string message = error ? error->message : "invalid arguments";
        if (error) g_error_free(error);
        g_free(configPath);
        std::cerr << message << std::endl;
        return 2;
    }
    if (argc != 2) {
        g_free(configPath);
        std::cerr << "usage: feedscout [--config FILE] [--timeout MS] [--json] [--verbose] URL" << std::endl;
        return 2;
    }
    std::string url = argv[1];

    if (verbose) g_setenv("G_MESSAGES_DEBUG", "FeedScout", TRUE);

    Config& config = Config::getInstance();
    std::string loadError;
    if (configPath) {
        std::string path = configPath;
        g_free(configPath);
        if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) throw std::runtime_error("config file not found: " + path);
        if (!config.load(path, &loadError)) {
            g_warning("%s: %s; using defaults", path.c_str(), loadError.c_str());
        }
    } else {
        std::string path = Config::getDefaultConfigPath();
        if (g_file_test(path.c_str(), G_FILE_TEST_EXISTS) && !config.load(path, &loadError)) {
            g_warning("%s: %s; using defaults", path.c_str(), loadError.c_str());
        }
    }

    auto logger = std::make_shared<GLibLogger>();
    auto client = std::make_shared<HttpClient>();
    client->setUserAgent(config.getUserAgent());
    auto relays = std::make_shared<RelayProxyManager>(client, config.getRelays(), logger);
    FeedDiscoveryService service(client, relays, std::make_shared<StandardFeedParser>(), logger,
                                 config.getDiscoveryOptions());

    std::signal(SIGINT, onInterrupt);

    DiscoveryRequest request;
    request.url = url;
    request.timeoutMs = timeoutMs > 0 ? timeoutMs : 0;
    request.cancel = cancel_;
    DiscoveryResult result = service.discover(request);

    if (json) printJson(result);
    else printText(result);
    return result.discoveredFeeds.empty() ? 1 : 0;
}

void Application::printText(const DiscoveryResult& result) const {
    for (const auto& feed : result.discoveredFeeds) {
        std::cout << feed.feedUrl << "\n"
                  << "  " << feed.title << " [" << feedFormatName(feed.format) << ", "
                  << discoveryMethodName(feed.method) << ", " << feed.items.size() << " items]\n";
    }
    for (const auto& suggestion : result.suggestions) {
        std::cout << diagnosticCodeName(suggestion.code) << ": " << suggestion.text << "\n";
    }
    std::cout << result.successfulAttempts << "/" << result.totalAttempts << " requests succeeded in "
              << result.discoveryTimeMs << " ms" << std::endl;
}

void Application::printJson(const DiscoveryResult& result) const {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    addString(builder, "originalUrl", result.originalUrl);

    json_builder_set_member_name(builder, "discoveredFeeds");
    json_builder_begin_array(builder);
    for (const auto& feed : result.discoveredFeeds) {
        json_builder_begin_object(builder);
        addString(builder, "feedUrl", feed.feedUrl);
        addString(builder, "title", feed.title);
        addString(builder, "link", feed.link);
        addString(builder, "description", feed.description);
        addString(builder, "format", feedFormatName(feed.format));
        addString(builder, "method", discoveryMethodName(feed.method));

        json_builder_set_member_name(builder, "items");
        json_builder_begin_array(builder);
        for (const auto& item : feed.items) {
            json_builder_begin_object(builder);
            addString(builder, "id", item.id);
            addString(builder, "title", item.title);
            addString(builder, "link", item.link);
            addString(builder, "description", item.description);
            addString(builder, "imageUrl", item.imageUrl);
            addString(builder, "author", item.author);
            json_builder_set_member_name(builder, "publishedMs");
            if (item.publishedMs) json_builder_add_int_value(builder, *item.publishedMs);
            else json_builder_add_null_value(builder);
            json_builder_end_object(builder);
        }
        json_builder_end_array(builder);
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "suggestions");
    json_builder_begin_array(builder);
    for (const auto& suggestion : result.suggestions) {
        json_builder_begin_object(builder);
        addString(builder, "code", diagnosticCodeName(suggestion.code));
        addString(builder, "text", suggestion.text);
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "totalAttempts");
    json_builder_add_int_value(builder, result.totalAttempts);
    json_builder_set_member_name(builder, "successfulAttempts");
    json_builder_add_int_value(builder, result.successfulAttempts);
    json_builder_set_member_name(builder, "discoveryTimeMs");
    json_builder_add_int_value(builder, result.discoveryTimeMs);
    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);
    gchar* text = json_generator_to_data(gen, nullptr);
    std::cout << text << std::endl;

    g_free(text);
    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
}

} // namespace FeedScout
