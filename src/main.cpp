#include "config.hpp"
#include "http.hpp"
#include "event_bus.hpp"
#include "event_stream.hpp"
#include "normalizer.hpp"
#include "session.hpp"
#include "media.hpp"
#include "dispatcher.hpp"
#include "router.hpp"
#include "api_server.hpp"
#include "webhook_sink.hpp"
#include "bridge.hpp"
#include "bridge_stats.hpp"
#include "telegram/td_login.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <memory>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: mtsatori [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ~/.mtsatori/config.json)\n"
              << "  --no-prompt          Never ask for a login code on stdin\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TG_API_ID            Telegram application id\n"
              << "  TG_API_HASH          Telegram application hash\n"
              << "  TG_PHONE             Phone number of the account\n"
              << "  TG_PASSWORD          Cloud password (second factor)\n"
              << "  TG_BOT_TOKEN         Log in as a bot instead of a phone account\n"
              << "  SATORI_LISTEN        Gateway listen address (default: 127.0.0.1:5140)\n"
              << "  SATORI_TOKEN         Bearer token required from gateway callers\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    bool prompt = true;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--no-prompt") == 0) {
            prompt = false;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = mtsatori::Config::load(config_path);
    if (config.account.api_id == 0 || config.account.api_hash.empty()) {
        std::cerr << "Error: account.api_id and account.api_hash are required "
                  << "(or TG_API_ID / TG_API_HASH).\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    mtsatori::http_set_abort_flag(&g_shutdown);

    mtsatori::SocketHttpClient http_client;
    mtsatori::EventBus bus;
    mtsatori::BridgeStats stats(bus);
    mtsatori::EventStream stream;
    if (!config.webhooks.empty()) {
        stream.add_sink(std::make_shared<mtsatori::WebhookSink>(http_client, config.webhooks));
    }

    mtsatori::EventNormalizer normalizer(stream, bus, config.bridge.dedup_window);
    mtsatori::TdLoginDriver driver(config);
    if (!prompt) driver.set_interactive(false);
    mtsatori::SessionController session(driver, normalizer, bus);

    mtsatori::MediaFetcher media(http_client, config.bridge.max_media_bytes,
                                 static_cast<long>(config.bridge.media_timeout_sec));
    mtsatori::ActionDispatcher dispatcher(session, media, config.bridge);
    mtsatori::ApiRouter router(dispatcher, bus);
    mtsatori::ApiServer api(config.server, router, dispatcher);

    // Subscribes to session changes, so it must exist before the first login.
    mtsatori::BridgeRunner runner(session, normalizer, stream, bus);

    std::string error;
    if (!api.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    if (!session.start() && session.state() == mtsatori::SessionState::Terminated) {
        std::cerr << "Error: login failed ("
                  << mtsatori::login_failure_name(session.last_failure()) << ")\n";
        api.stop();
        return 1;
    }

    runner.run(g_shutdown);

    std::cerr << "Shutting down...\n";
    stats.log_summary();
    api.stop();
    bool revoked = session.state() == mtsatori::SessionState::Terminated;
    session.shutdown("shutdown");
    return revoked && !g_shutdown.load() ? 1 : 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
