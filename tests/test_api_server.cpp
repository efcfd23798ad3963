#include <catch2/catch_test_macros.hpp>
#include "gateway_harness.hpp"

using namespace mtsatori;

static nlohmann::json body_of(const ServerResponse& r) {
    return nlohmann::json::parse(r.body);
}

TEST_CASE("ApiServer: POST action returns JSON", "[api]") {
    GatewayHarness h;
    auto r = h.api.handle(h.post("user.get", R"({"user_id":"user:2"})"));
    REQUIRE(r.status == 200);
    REQUIRE(r.content_type == "application/json");
    REQUIRE(body_of(r)["id"] == "user:2");
}

TEST_CASE("ApiServer: empty body means no parameters", "[api]") {
    GatewayHarness h;
    auto r = h.api.handle(h.post("login.get", ""));
    REQUIRE(r.status == 200);
    REQUIRE(body_of(r)["platform"] == "telegram");
}

TEST_CASE("ApiServer: body that is not a JSON object is 400", "[api]") {
    GatewayHarness h;
    REQUIRE(h.api.handle(h.post("user.get", "{not json")).status == 400);
    REQUIRE(h.api.handle(h.post("user.get", "[1,2]")).status == 400);
}

TEST_CASE("ApiServer: unknown route is 404", "[api]") {
    GatewayHarness h;
    HttpRequest req;
    req.method = "POST";
    req.path = "/v2/user.get";
    REQUIRE(h.api.handle(req).status == 404);
}

TEST_CASE("ApiServer: actions require POST", "[api]") {
    GatewayHarness h;
    auto req = h.post("login.get", "");
    req.method = "GET";
    REQUIRE(h.api.handle(req).status == 405);
}

TEST_CASE("ApiServer: token is enforced when configured", "[api]") {
    GatewayHarness h;
    h.server_config.token = "secret";

    auto req = h.post("login.get", "");
    auto r = h.api.handle(req);
    REQUIRE(r.status == 401);
    REQUIRE(body_of(r)["error"] == "Unauthorized");

    req.headers["authorization"] = "Bearer wrong";
    REQUIRE(h.api.handle(req).status == 401);

    req.headers["authorization"] = "Bearer secret";
    REQUIRE(h.api.handle(req).status == 200);
}

TEST_CASE("ApiServer: path prefix is honored", "[api]") {
    GatewayHarness h;
    h.server_config.path = "/satori";

    auto req = h.post("login.get", "");
    REQUIRE(req.path == "/satori/v1/login.get");
    REQUIRE(h.api.handle(req).status == 200);

    req.path = "/v1/login.get";
    REQUIRE(h.api.handle(req).status == 404);
}

TEST_CASE("ApiServer: caller headers are forwarded", "[api]") {
    GatewayHarness h;
    auto req = h.post("user.get", R"({"user_id":"user:2"})");

    req.headers["x-platform"] = "telegram";
    req.headers["x-self-id"] = "user:1";
    REQUIRE(h.api.handle(req).status == 200);

    req.headers.clear();
    req.headers["satori-platform"] = "discord";
    REQUIRE(h.api.handle(req).status == 404);
}

TEST_CASE("ApiServer: proxy serves native file bytes", "[api]") {
    GatewayHarness h;
    h.backend().files["AgAD"] = "GIF89a...";

    HttpRequest req;
    req.method = "GET";
    req.path = "/v1/proxy/" + internal_media_url(1, "AgAD");
    auto r = h.api.handle(req);
    REQUIRE(r.status == 200);
    REQUIRE(r.content_type == "image/gif");
    REQUIRE(r.body == "GIF89a...");
}

TEST_CASE("ApiServer: proxy errors", "[api]") {
    GatewayHarness h;
    HttpRequest req;
    req.method = "GET";

    req.path = "/v1/proxy/" + internal_media_url(5, "AgAD");
    REQUIRE(h.api.handle(req).status == 404);

    req.path = "/v1/proxy/https://example.com/a.png";
    REQUIRE(h.api.handle(req).status == 400);

    req.method = "POST";
    req.path = "/v1/proxy/" + internal_media_url(1, "AgAD");
    REQUIRE(h.api.handle(req).status == 405);
}

TEST_CASE("ApiServer: dispatcher errors keep their status", "[api]") {
    GatewayHarness h;
    auto r = h.api.handle(h.post("message.get",
                                 R"({"channel_id":"channel:-100","message_id":"message:77"})"));
    REQUIRE(r.status == 404);
    REQUIRE(body_of(r)["error"] == "NotFound");
}

// ── Listener helpers ─────────────────────────────────────────────

TEST_CASE("parse_listen_addr: host and port", "[api]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:5140", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 5140);
    REQUIRE_FALSE(parse_listen_addr("localhost", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:99999", host, port));
}

TEST_CASE("url_decode: percent escapes and plus", "[api]") {
    REQUIRE(url_decode("internal%3Atelegram%2F1%2Fx") == "internal:telegram/1/x");
    REQUIRE(url_decode("a+b") == "a b");
    REQUIRE(url_decode("a+b", false) == "a+b");
}

TEST_CASE("HttpRequest: header and query lookups", "[api]") {
    HttpRequest req;
    req.headers["x-platform"] = "telegram";
    req.query_params["next"] = "10";
    REQUIRE(req.header("x-platform") == "telegram");
    REQUIRE(req.header("missing").empty());
    REQUIRE(req.query_param("next") == "10");
}
