#pragma once
#include "services/FeedDiscoveryService.hpp"
#include "services/ProxyFailoverManager.hpp"
#include <string>
#include <vector>

namespace FeedScout {

class Config {
public:
    static Config& getInstance();

    Config();

    // Reads a JSON config file. Missing keys keep their defaults; on a
    // missing or malformed file every setting falls back to its default and
    // false is returned with the reason in *error.
    bool load(const std::string& path, std::string* error = nullptr);
    bool loadFromData(const std::string& json, std::string* error = nullptr);

    // $XDG_CONFIG_HOME/feedscout/config.json, or ~/.config/feedscout/config.json
    static std::string getDefaultConfigPath();
    static std::vector<RelayEndpoint> defaultRelays();

    std::string getUserAgent() const { return userAgent_; }
    std::vector<RelayEndpoint> getRelays() const { return relays_; }
    DiscoveryOptions getDiscoveryOptions() const { return options_; }

private:
    void reset();
    void ensureDefaults();

    std::string userAgent_;
    std::vector<RelayEndpoint> relays_;
    DiscoveryOptions options_;
};

}
