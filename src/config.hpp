#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mtsatori {

struct ServerConfig {
    std::string listen = "127.0.0.1:5140";
    std::string path;                 // route prefix, e.g. "/satori"
    std::string token;                // bearer token; empty disables the check
    uint32_t max_body = 8 * 1024 * 1024;
};

struct AccountConfig {
    int32_t api_id = 0;
    std::string api_hash;
    std::string phone;
    std::string password;             // second factor
    std::string bot_token;            // bot login instead of phone
    std::string data_dir = "~/.mtsatori/tdlib";
};

struct ProxyConfig {
    std::string scheme;               // "socks5", "http"; empty disables
    std::string hostname;
    uint16_t port = 0;
    std::string username;
    std::string password;

    bool enabled() const { return !scheme.empty() && !hostname.empty() && port != 0; }
};

struct BridgeConfig {
    uint32_t max_text_length = 4096;
    uint32_t max_caption_length = 1024;
    uint32_t max_album_size = 10;
    uint32_t dedup_window = 2048;
    uint32_t read_attempts = 3;
    uint32_t backoff_base_ms = 200;
    uint32_t backoff_max_ms = 5000;
    uint32_t rpc_timeout_sec = 30;
    uint64_t max_media_bytes = 50ull * 1024 * 1024;
    uint32_t media_timeout_sec = 60;
};

struct WebhookTarget {
    std::string url;
    std::string token;
};

struct Config {
    ServerConfig server;
    AccountConfig account;
    ProxyConfig proxy;
    BridgeConfig bridge;
    std::vector<WebhookTarget> webhooks;
    int tdlib_verbosity = 1;

    // Load from path (default ~/.mtsatori/config.json), merge defaults into
    // the file, then apply environment overrides.
    static Config load(const std::string& path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already merged JSON document. Wrongly typed values keep
    // their defaults.
    static Config from_json(const nlohmann::json& j);

    // TG_* and SATORI_* environment variables win over the file.
    void apply_env();
};

// Fill keys missing from existing with the values from defaults, recursively.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace mtsatori
