#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace mtsatori {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "127.0.0.1:5140"},
            {"path", ""},
            {"token", ""},
            {"max_body", 8 * 1024 * 1024}
        }},
        {"account", {
            {"api_id", 0},
            {"api_hash", ""},
            {"phone", ""},
            {"password", ""},
            {"bot_token", ""},
            {"data_dir", "~/.mtsatori/tdlib"}
        }},
        {"proxy", {
            {"scheme", ""},
            {"hostname", ""},
            {"port", 0},
            {"username", ""},
            {"password", ""}
        }},
        {"bridge", {
            {"max_text_length", 4096},
            {"max_caption_length", 1024},
            {"max_album_size", 10},
            {"dedup_window", 2048},
            {"read_attempts", 3},
            {"backoff_base_ms", 200},
            {"backoff_max_ms", 5000},
            {"rpc_timeout_sec", 30},
            {"max_media_bytes", 50ull * 1024 * 1024},
            {"media_timeout_sec", 60}
        }},
        {"webhooks", nlohmann::json::array()},
        {"tdlib_verbosity", 1}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Assign j[key] to out when it holds the expected JSON type.
static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) out = j[key].get<std::string>();
}

template<typename T>
static void read_unsigned(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || !j[key].is_number_integer()) return;
    if (j[key].is_number_unsigned() || j[key].get<int64_t>() >= 0) out = j[key].get<T>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_string(s, "path", cfg.server.path);
        read_string(s, "token", cfg.server.token);
        read_unsigned(s, "max_body", cfg.server.max_body);
        // "/satori/" and "satori" both mean "/satori"
        while (!cfg.server.path.empty() && cfg.server.path.back() == '/')
            cfg.server.path.pop_back();
        if (!cfg.server.path.empty() && cfg.server.path.front() != '/')
            cfg.server.path.insert(0, "/");
    }

    if (j.contains("account") && j["account"].is_object()) {
        auto& a = j["account"];
        if (a.contains("api_id") && a["api_id"].is_number_integer())
            cfg.account.api_id = a["api_id"].get<int32_t>();
        read_string(a, "api_hash", cfg.account.api_hash);
        read_string(a, "phone", cfg.account.phone);
        read_string(a, "password", cfg.account.password);
        read_string(a, "bot_token", cfg.account.bot_token);
        read_string(a, "data_dir", cfg.account.data_dir);
    }

    if (j.contains("proxy") && j["proxy"].is_object()) {
        auto& p = j["proxy"];
        read_string(p, "scheme", cfg.proxy.scheme);
        read_string(p, "hostname", cfg.proxy.hostname);
        read_unsigned(p, "port", cfg.proxy.port);
        read_string(p, "username", cfg.proxy.username);
        read_string(p, "password", cfg.proxy.password);
    }

    if (j.contains("bridge") && j["bridge"].is_object()) {
        auto& b = j["bridge"];
        read_unsigned(b, "max_text_length", cfg.bridge.max_text_length);
        read_unsigned(b, "max_caption_length", cfg.bridge.max_caption_length);
        read_unsigned(b, "max_album_size", cfg.bridge.max_album_size);
        read_unsigned(b, "dedup_window", cfg.bridge.dedup_window);
        read_unsigned(b, "read_attempts", cfg.bridge.read_attempts);
        read_unsigned(b, "backoff_base_ms", cfg.bridge.backoff_base_ms);
        read_unsigned(b, "backoff_max_ms", cfg.bridge.backoff_max_ms);
        read_unsigned(b, "rpc_timeout_sec", cfg.bridge.rpc_timeout_sec);
        read_unsigned(b, "max_media_bytes", cfg.bridge.max_media_bytes);
        read_unsigned(b, "media_timeout_sec", cfg.bridge.media_timeout_sec);
        if (cfg.bridge.read_attempts == 0) cfg.bridge.read_attempts = 1;
    }

    if (j.contains("webhooks") && j["webhooks"].is_array()) {
        for (const auto& w : j["webhooks"]) {
            if (!w.is_object()) continue;
            WebhookTarget target;
            read_string(w, "url", target.url);
            read_string(w, "token", target.token);
            if (!target.url.empty()) cfg.webhooks.push_back(std::move(target));
        }
    }

    if (j.contains("tdlib_verbosity") && j["tdlib_verbosity"].is_number_integer())
        cfg.tdlib_verbosity = j["tdlib_verbosity"].get<int>();

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("TG_API_ID")) {
        try {
            account.api_id = std::stoi(v);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring non-numeric TG_API_ID\n";
        }
    }
    if (const char* v = std::getenv("TG_API_HASH"))
        account.api_hash = v;
    if (const char* v = std::getenv("TG_PHONE"))
        account.phone = v;
    if (const char* v = std::getenv("TG_PASSWORD"))
        account.password = v;
    if (const char* v = std::getenv("TG_BOT_TOKEN"))
        account.bot_token = v;
    if (const char* v = std::getenv("SATORI_TOKEN"))
        server.token = v;
    if (const char* v = std::getenv("SATORI_LISTEN"))
        server.listen = v;
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path.empty() ? "~/.mtsatori/config.json" : path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    cfg.account.data_dir = expand_home(cfg.account.data_dir);
    return cfg;
}

} // namespace mtsatori
