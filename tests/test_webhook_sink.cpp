#include <catch2/catch_test_macros.hpp>
#include "mock_http_client.hpp"
#include "webhook_sink.hpp"
#include <nlohmann/json.hpp>

using namespace mtsatori;

static GatewayEvent sample_event() {
    GatewayEvent ev;
    ev.id = 7;
    ev.type = event_types::MessageCreated;
    ev.self_id = "user:1";
    ev.timestamp = 1000;
    return ev;
}

TEST_CASE("WebhookSink: posts the event with gateway headers", "[webhook]") {
    MockHttpClient http;
    http.next_response = {200, "", ""};
    WebhookSink sink(http, {{"http://127.0.0.1:9000/hook", "secret"}});

    sink.on_event(sample_event());

    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_method == "POST");
    REQUIRE(http.last_url == "http://127.0.0.1:9000/hook");
    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["id"] == 7);
    REQUIRE(body["type"] == "message-created");
    REQUIRE(http.header("Satori-Opcode") == "0");
    REQUIRE(http.header("X-Platform") == "telegram");
    REQUIRE(http.header("X-Self-ID") == "user:1");
    REQUIRE(http.header("Authorization") == "Bearer secret");
    REQUIRE(sink.delivered() == 1);
}

TEST_CASE("WebhookSink: no Authorization header without a token", "[webhook]") {
    MockHttpClient http;
    http.next_response = {204, "", ""};
    WebhookSink sink(http, {{"http://h/hook", ""}});
    sink.on_event(sample_event());
    REQUIRE(http.header("Authorization").empty());
    REQUIRE(sink.delivered() == 1);
}

TEST_CASE("WebhookSink: every target receives the event", "[webhook]") {
    MockHttpClient http;
    http.response_queue = {{200, "", ""}, {500, "", ""}};
    WebhookSink sink(http, {{"http://a/hook", ""}, {"http://b/hook", ""}});
    sink.on_event(sample_event());
    REQUIRE(http.call_count == 2);
    REQUIRE(http.last_url == "http://b/hook");
    REQUIRE(sink.delivered() == 1);
    REQUIRE(sink.failed() == 1);
}

TEST_CASE("WebhookSink: connection errors count as failures", "[webhook]") {
    MockHttpClient http;
    http.next_response = {0, "", ""};
    WebhookSink sink(http, {{"http://down/hook", ""}});
    REQUIRE_NOTHROW(sink.on_event(sample_event()));
    REQUIRE(sink.failed() == 1);
}

TEST_CASE("WebhookSink: no targets, no requests", "[webhook]") {
    MockHttpClient http;
    WebhookSink sink(http, {});
    sink.on_event(sample_event());
    REQUIRE(http.call_count == 0);
}
