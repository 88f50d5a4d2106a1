// Demo RestBridge server: a small user directory exposed over HTTP.
//
//   curl localhost:8080/users/1
//   curl 'localhost:8080/search?q=ada&q=grace'
//   curl -X POST 'localhost:8080/?method=create_user' -d '{"name":"Linus"}'
//   curl -X POST 'localhost:8080/?method=echo' -d '{"message":"hi"}'
//
// Usage: restbridge_example [port] [--debug] [--log-level trace|debug|info|warn|error]
#include "restbridge/restbridge.hpp"
#include "restbridge/transports/http/http_transport.hpp"
#include "restbridge/core/util/url.hpp"
#include <charconv>
#include <iostream>
#include <mutex>
#include <string_view>

using namespace restbridge;

namespace {
    struct Directory {
        std::mutex mx;
        std::map<std::int64_t, std::string> users{ { 1, "Ada" }, { 2, "Grace" } };
        std::int64_t nextId = 3;
    };

    Record makeUser(std::int64_t id, const std::string& name) {
        return Record{ "user", {}, { { "id", id }, { "name", name } } };
    }
}

int main(int argc, char** argv) {
    uint16_t port = 8080;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--debug") {
            Logger::inst().setLevel(LogLevel::Debug);
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            auto level = Logger::parseLevel(toLower(argv[++i]));
            if (!level) {
                std::cerr << "unknown log level '" << argv[i] << "' (trace, debug, info, warn, error)\n";
                return 2;
            }
            Logger::inst().setLevel(*level);
            continue;
        }
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
        if (ec != std::errc() || ptr != arg.data() + arg.size() || value == 0 || value > 65535) {
            std::cerr << "usage: " << argv[0] << " [port] [--debug] [--log-level <level>]\n";
            return 2;
        }
        port = static_cast<uint16_t>(value);
    }

    auto user = types::record("user", { { "id", types::integer() }, { "name", types::text() } });
    auto notFound = types::record("user_error", { { "message", types::text() } }, "not_found");

    std::vector<ProcedureDescriptor> procedures;
    procedures.push_back({ "echo", "echo",
                           { { "message", "message", types::text() } },
                           types::text(), {}, std::nullopt });
    procedures.push_back({ "get_user", "getUser",
                           { { "id", "id", types::integer() } },
                           user, { notFound }, HttpResource{ "/users/{id}", "GET" } });
    procedures.push_back({ "create_user", "createUser",
                           { { "name", "name", types::text() } },
                           user, {}, std::nullopt });
    procedures.push_back({ "search", "search",
                           { { "term", "terms", types::list(types::text()) },
                             { "limit", "limit", types::optional(types::integer()) } },
                           types::list(user), {}, HttpResource{ "/search?q={term}", "GET" } });

    Directory dir;
    HandlerRegistry handlers;
    handlers.registerRPC("echo", [](const Arguments& args) -> Value {
        return args.get<std::string>("message");
    });
    handlers.registerRPC("getUser", [&dir](const Arguments& args) -> Value {
        auto id = args.get<std::int64_t>("id");
        std::lock_guard<std::mutex> lk(dir.mx);
        auto it = dir.users.find(id);
        if (it == dir.users.end())
            throw ProcedureError(Record{ "user_error", "not_found",
                                         { { "message", std::string("no user " + std::to_string(id)) } } });
        return makeUser(it->first, it->second);
    });
    handlers.registerRPC("createUser", [&dir](const Arguments& args) -> Value {
        std::lock_guard<std::mutex> lk(dir.mx);
        auto id = dir.nextId++;
        dir.users[id] = args.get<std::string>("name");
        return makeUser(id, dir.users[id]);
    });
    handlers.registerRPC("search", [&dir](const Arguments& args) -> Value {
        auto terms = args.get<ValueList>("terms");
        std::int64_t limit = args.isNull("limit") ? 10 : args.get<std::int64_t>("limit");
        ValueList out;
        std::lock_guard<std::mutex> lk(dir.mx);
        for (const auto& [id, name] : dir.users) {
            if (static_cast<std::int64_t>(out.size()) >= limit) break;
            for (const auto& t : terms) {
                if (toLower(name).find(toLower(std::any_cast<const std::string&>(t))) != std::string::npos) {
                    out.push_back(makeUser(id, name));
                    break;
                }
            }
        }
        return out;
    });

    BridgeOptions options;
    options.allowedOrigins = { "localhost", "*.example.com" };
    options.allowedHeaders = { "Content-Type" };

    App app(ServiceDescriptor("directory", std::move(procedures)), std::move(handlers), options);
    app.setTransport(std::make_unique<HttpTransport>());

    std::cout << "[Server] http://localhost:" << port << "\n";
    app.run(port);

    std::cin.get();
    app.stop();
    return 0;
}
