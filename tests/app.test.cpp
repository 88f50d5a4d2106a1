#include <catch2/catch_all.hpp>
#include "restbridge/restbridge.hpp"
#include "restbridge/core/routing/route_table.hpp"
#include "mock_transport.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace restbridge;
using restbridge::test::MockTransport;
using nlohmann::json;

namespace {

    struct Fixture {
        std::unique_ptr<App> app;
        MockTransport* transport = nullptr;
        std::atomic<int> calls{ 0 };

        explicit Fixture(BridgeOptions options = {}) {
            auto user = types::record("user", { { "id", types::integer() }, { "name", types::text() } });
            auto notFound = types::record("user_error", { { "message", types::text() } }, "not_found");

            std::vector<ProcedureDescriptor> procs;
            procs.push_back({ "echo", "echo", { { "text", "text", types::text() } },
                              types::text(), {}, std::nullopt });
            procs.push_back({ "get_user", "getUser", { { "id", "id", types::integer() } },
                              user, { notFound }, HttpResource{ "/users/{id}", "GET" } });
            procs.push_back({ "delete_user", "deleteUser", { { "id", "id", types::integer() } },
                              types::unit(), {}, HttpResource{ "/users/{id}", "DELETE" } });
            procs.push_back({ "rename_user", "renameUser",
                              { { "id", "id", types::integer() }, { "name", "name", types::text() } },
                              user, {}, HttpResource{ "/users/{id}?name={name}", "PUT" } });
            procs.push_back({ "upload", "upload", { { "data", "data", types::optional(types::text()) } },
                              types::integer(), {}, HttpResource{ "/uploads", "POST" } });
            procs.push_back({ "search", "search",
                              { { "q", "terms", types::list(types::text()) },
                                { "limit", "limit", types::optional(types::integer()) } },
                              types::list(types::text()), {}, HttpResource{ "/search?q={q}", "GET" } });
            procs.push_back({ "broken", "broken", {}, types::text(), {}, std::nullopt });
            procs.push_back({ "wrong_type", "wrongType", {}, types::integer(), {}, std::nullopt });
            procs.push_back({ "crash", "crash", {}, types::text(), {}, std::nullopt });
            procs.push_back({ "rogue_error", "rogueError", {}, types::text(), {}, std::nullopt });
            procs.push_back({ "panic", "panic", {}, types::text(), {}, std::nullopt });

            HandlerRegistry h;
            h.registerRPC("echo", [this](const Arguments& a) -> Value {
                ++calls;
                return a.get<std::string>("text");
            });
            h.registerRPC("getUser", [this](const Arguments& a) -> Value {
                ++calls;
                auto id = a.get<std::int64_t>("id");
                if (id != 42)
                    throw ProcedureError(Record{ "user_error", "not_found",
                                                 { { "message", std::string("no such user") } } });
                return Record{ "user", {}, { { "id", id }, { "name", std::string("Ada") } } };
            });
            h.registerRPC("deleteUser", [this](const Arguments&) -> Value { ++calls; return {}; });
            h.registerRPC("renameUser", [this](const Arguments& a) -> Value {
                ++calls;
                return Record{ "user", {}, { { "id", a.get<std::int64_t>("id") },
                                             { "name", a.get<std::string>("name") } } };
            });
            h.registerRPC("upload", [this](const Arguments& a) -> Value {
                ++calls;
                return std::int64_t(a.isNull("data") ? 0 : a.get<std::string>("data").size());
            });
            h.registerRPC("search", [this](const Arguments& a) -> Value {
                ++calls;
                ValueList out;
                for (const auto& t : a.get<ValueList>("terms"))
                    out.push_back(std::string("hit:") + std::any_cast<const std::string&>(t));
                return out;
            });
            h.registerRPC("broken", [](const Arguments&) -> Value { return {}; });
            h.registerRPC("wrongType", [](const Arguments&) -> Value { return std::string("nope"); });
            h.registerRPC("crash", [](const Arguments&) -> Value { throw std::runtime_error("boom"); });
            h.registerRPC("rogueError", [](const Arguments&) -> Value {
                throw ProcedureError(Record{ "undeclared", {}, {} });
            });
            h.registerRPC("panic", [](const Arguments&) -> Value { throw 42; });

            app = std::make_unique<App>(ServiceDescriptor("demo", std::move(procs)), std::move(h), options);
            auto t = std::make_unique<MockTransport>();
            transport = t.get();
            app->setTransport(std::move(t));
        }

        HttpResponse send(std::string method, std::string path, std::string query = {},
                          std::string body = {}, HeaderList headers = {}) {
            return transport->send(std::move(method), std::move(path), std::move(query),
                                   std::move(body), std::move(headers));
        }
    };

    json bodyOf(const HttpResponse& res) { return json::parse(res.body); }

}

// ------------------------------------------------------------------
// 1) Path routing
// ------------------------------------------------------------------
TEST_CASE("GET /users/42 calls getUser with the decoded id", "[app]") {
    Fixture f;
    auto res = f.send("GET", "/users/42");

    REQUIRE(res.status == 200);
    REQUIRE(bodyOf(res) == json{ { "_type", "user" }, { "id", 42 }, { "name", "Ada" } });
    REQUIRE(res.header("Content-Type") == std::optional<std::string>("application/json"));
    REQUIRE(res.header("Vary") == std::optional<std::string>("Origin"));
    REQUIRE(res.header("Access-Control-Allow-Methods") ==
            std::optional<std::string>("DELETE, GET, OPTIONS"));
}

TEST_CASE("Query clause routes and collects repeated keys", "[app]") {
    Fixture f;

    auto one = f.send("GET", "/search", "q=hello");
    REQUIRE(one.status == 200);
    REQUIRE(bodyOf(one) == json::array({ "hit:hello" }));

    auto many = f.send("GET", "/search", "q=a&q=b");
    REQUIRE(bodyOf(many) == json::array({ "hit:a", "hit:b" }));

    // without q the rule does not match and GET cannot fall back
    auto none = f.send("GET", "/search");
    REQUIRE(none.status == 405);
}

TEST_CASE("Routed PUT merges query captures with the body", "[app]") {
    Fixture f;
    auto res = f.send("PUT", "/users/7", "name=old", R"({"name":"new"})");
    REQUIRE(res.status == 200);
    REQUIRE(bodyOf(res)["name"] == "new");
    REQUIRE(bodyOf(res)["id"] == 7);
}

TEST_CASE("Routed DELETE returning nothing gives null", "[app]") {
    Fixture f;
    auto res = f.send("DELETE", "/users/3", {}, "not even json");
    REQUIRE(res.status == 200);
    REQUIRE(bodyOf(res).is_null());
}

// ------------------------------------------------------------------
// 2) OPTIONS and 405
// ------------------------------------------------------------------
TEST_CASE("OPTIONS on a bound path lists every verb and skips dispatch", "[app][cors]") {
    Fixture f;
    auto res = f.send("OPTIONS", "/users/42", {}, "{broken");

    REQUIRE(res.status == 200);
    REQUIRE(res.body.empty());
    REQUIRE(res.header("Access-Control-Allow-Methods") ==
            std::optional<std::string>("DELETE, GET, OPTIONS"));
    REQUIRE(f.calls == 0);
}

TEST_CASE("OPTIONS on the fallback endpoint", "[app][cors]") {
    Fixture f;
    auto res = f.send("OPTIONS", "/");
    REQUIRE(res.status == 200);
    REQUIRE(res.body.empty());
    REQUIRE(res.header("Access-Control-Allow-Methods") == std::optional<std::string>("POST, OPTIONS"));
}

TEST_CASE("Unsupported verb on a POST-only path is 405", "[app]") {
    Fixture f;
    auto res = f.send("GET", "/uploads");

    REQUIRE(res.status == 405);
    REQUIRE(bodyOf(res) == json{ { "_type", "error" }, { "_tag", "method_not_allowed" },
                                 { "message", "the requested URL does not allow this method." } });
    REQUIRE(res.header("Access-Control-Allow-Methods") == std::optional<std::string>("POST, OPTIONS"));
    REQUIRE(res.header("Allow") == std::optional<std::string>("POST, OPTIONS"));
    REQUIRE(res.header("Vary") == std::optional<std::string>("Origin"));
}

// ------------------------------------------------------------------
// 3) Fallback protocol
// ------------------------------------------------------------------
TEST_CASE("Fallback POST /?method=echo", "[app][fallback]") {
    Fixture f;
    auto res = f.send("POST", "/", "method=echo", R"({"text":"hi"})");
    REQUIRE(res.status == 200);
    REQUIRE(bodyOf(res) == "hi");
    REQUIRE(res.header("Access-Control-Allow-Methods") == std::optional<std::string>("POST, OPTIONS"));
}

TEST_CASE("Fallback with a missing required argument", "[app][fallback]") {
    Fixture f;
    auto res = f.send("POST", "/", "method=echo", "{}");

    REQUIRE(res.status == 400);
    auto body = bodyOf(res);
    REQUIRE(body["_tag"] == "bad_request");
    REQUIRE(body["message"] == "A argument named 'text' is missing, it is required.");
    REQUIRE(f.calls == 0);
}

TEST_CASE("Fallback without a method name", "[app][fallback]") {
    Fixture f;
    auto res = f.send("POST", "/", {}, R"({"text":"hi"})");
    REQUIRE(res.status == 400);
    REQUIRE(bodyOf(res)["message"] == "`method` is missing.");
}

TEST_CASE("Unknown procedure via fallback is 400", "[app][fallback]") {
    Fixture f;
    auto res = f.send("POST", "/", "method=nope");
    REQUIRE(res.status == 400);
    REQUIRE(bodyOf(res)["message"] == "No service method `nope` found.");

    // internal names are not addressable
    REQUIRE(f.send("POST", "/", "method=getUser").status == 400);
}

TEST_CASE("Malformed JSON body is 400", "[app][fallback]") {
    Fixture f;
    auto res = f.send("POST", "/", "method=echo", "{\"text\":");
    REQUIRE(res.status == 400);
    REQUIRE_THAT(bodyOf(res)["message"].get<std::string>(),
                 Catch::Matchers::StartsWith("Invalid JSON payload: '"));
}

TEST_CASE("Fallback also reaches routed procedures", "[app][fallback]") {
    Fixture f;
    auto res = f.send("POST", "/", "method=get_user", R"({"id":42})");
    REQUIRE(res.status == 200);
    REQUIRE(bodyOf(res)["name"] == "Ada");
}

// ------------------------------------------------------------------
// 4) Argument and return failures
// ------------------------------------------------------------------
TEST_CASE("Path capture that does not decode is 400", "[app]") {
    Fixture f;
    auto res = f.send("GET", "/users/abc");
    REQUIRE(res.status == 400);
    REQUIRE(bodyOf(res)["message"] == "Incorrect type 'string' for 'id'. expected 'bigint'.");
}

TEST_CASE("Declared procedure errors use their own envelope", "[app]") {
    Fixture f;
    auto res = f.send("GET", "/users/1");
    REQUIRE(res.status == 400);
    REQUIRE(bodyOf(res) == json{ { "_type", "user_error" }, { "_tag", "not_found" },
                                 { "message", "no such user" } });
    REQUIRE(res.header("Vary"));
}

TEST_CASE("Handler failures are 500", "[app]") {
    Fixture f;

    auto nothing = f.send("POST", "/", "method=broken");
    REQUIRE(nothing.status == 500);
    REQUIRE_THAT(bodyOf(nothing)["message"].get<std::string>(),
                 Catch::Matchers::StartsWith("The return type of broken() method is not optional"));

    auto wrong = f.send("POST", "/", "method=wrong_type");
    REQUIRE(wrong.status == 500);
    REQUIRE_THAT(bodyOf(wrong)["message"].get<std::string>(),
                 Catch::Matchers::StartsWith("The return type of the wrong-type() method is bigint"));

    auto crash = f.send("POST", "/", "method=crash");
    REQUIRE(crash.status == 500);
    REQUIRE(bodyOf(crash) == json{ { "_type", "error" }, { "_tag", "internal_server_error" },
                                   { "message", "Internal Server Error" } });

    REQUIRE(f.send("POST", "/", "method=rogue_error").status == 500);
}

TEST_CASE("A handler throwing a non-exception type is 500", "[app]") {
    Fixture f;
    auto res = f.send("POST", "/", "method=panic");
    REQUIRE(res.status == 500);
    REQUIRE(bodyOf(res) == json{ { "_type", "error" }, { "_tag", "internal_server_error" },
                                 { "message", "Internal Server Error" } });
    REQUIRE(res.header("Vary"));

    // the app keeps serving afterwards
    REQUIRE(f.send("POST", "/", "method=echo", R"({"text":"still here"})").status == 200);
}

TEST_CASE("Very long paths and queries are routed", "[app]") {
    Fixture f;

    std::string longId(100000, '9');
    auto path = f.send("GET", "/users/" + longId);
    REQUIRE(path.status == 400);
    REQUIRE(bodyOf(path)["message"] == "Incorrect type 'string' for 'id'. expected 'bigint'.");

    std::string term(100000, 'x');
    auto query = f.send("GET", "/search", "q=" + term);
    REQUIRE(query.status == 200);
    REQUIRE(bodyOf(query) == json::array({ "hit:" + term }));
}

// ------------------------------------------------------------------
// 5) CORS
// ------------------------------------------------------------------
TEST_CASE("Allowed origins are echoed on every response", "[app][cors]") {
    BridgeOptions opts;
    opts.allowedOrigins = { "*.example.com" };
    opts.allowedHeaders = { "X-Requested-With", "Content-Type" };
    Fixture f(opts);

    HeaderList origin{ { "Origin", "https://api.example.com" } };
    auto ok = f.send("GET", "/users/42", {}, {}, origin);
    REQUIRE(ok.header("Access-Control-Allow-Origin") == std::optional<std::string>("https://api.example.com"));
    REQUIRE(ok.header("Access-Control-Allow-Headers") ==
            std::optional<std::string>("content-type, x-requested-with"));

    auto failed = f.send("GET", "/users/abc", {}, {}, origin);
    REQUIRE(failed.status == 400);
    REQUIRE(failed.header("Access-Control-Allow-Origin"));

    auto notAllowed = f.send("GET", "/uploads", {}, {}, origin);
    REQUIRE(notAllowed.status == 405);
    REQUIRE(notAllowed.header("Access-Control-Allow-Origin"));

    HeaderList deep{ { "Origin", "https://a.b.example.com" } };
    REQUIRE_FALSE(f.send("GET", "/users/42", {}, {}, deep).header("Access-Control-Allow-Origin"));
}

// ------------------------------------------------------------------
// 6) Construction and transport wiring
// ------------------------------------------------------------------
TEST_CASE("Invalid routing annotations fail construction", "[app]") {
    std::vector<ProcedureDescriptor> procs;
    procs.push_back({ "root", "root", {}, types::text(), {}, HttpResource{ "/", "GET" } });
    HandlerRegistry h;
    h.registerRPC("root", [](const Arguments&) -> Value { return std::string("x"); });

    REQUIRE_THROWS_AS(App(ServiceDescriptor("bad", std::move(procs)), std::move(h)), TemplateError);
}

TEST_CASE("Handlers must match the descriptor", "[app]") {
    std::vector<ProcedureDescriptor> procs;
    procs.push_back({ "ping", "ping", {}, types::text(), {}, std::nullopt });
    HandlerRegistry h;

    REQUIRE_THROWS_AS(App(ServiceDescriptor("bad", std::move(procs)), std::move(h)), DescriptorError);
}

TEST_CASE("run and stop drive the transport", "[app]") {
    Fixture f;
    REQUIRE(f.app->getTransport() == f.transport);
    f.app->run(8080);
    REQUIRE(f.transport->running());
    REQUIRE(f.transport->port() == 8080);
    f.app->stop();
    REQUIRE_FALSE(f.transport->running());
    REQUIRE(f.app->routes().rules().size() == 5);
    REQUIRE(f.app->service().name() == "demo");
}

TEST_CASE("handle is safe to call concurrently", "[app]") {
    Fixture f;
    std::atomic<int> ok{ 0 };
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 50; ++j) {
                if (f.app->handle(HttpRequest{ "GET", "/users/42", {}, {}, {} }).status == 200) ++ok;
            }
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(ok == 400);
}
