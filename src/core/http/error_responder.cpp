#include "restbridge/core/http/error_responder.hpp"
#include "restbridge/core/util/http_status.hpp"

namespace restbridge {

    std::optional<std::string> ErrorResponder::messageFor(int status, const std::optional<std::string>& message) {
        switch (status) {
            case 404: return std::string("the requested URL was not found");
            case 405: return std::string("the requested URL does not allow this method.");
            case 400: return message;
            default:
                if (message && !message->empty()) return message;
                return std::string(reasonPhrase(status));
        }
    }

    nlohmann::json ErrorResponder::makeEnvelope(const std::string& tag, const std::optional<std::string>& message) {
        nlohmann::json env = {
            { "_type", "error" },
            { "_tag", tag },
        };
        if (message) env["message"] = *message;
        else env["message"] = nullptr;
        return env;
    }

    HttpResponse ErrorResponder::jsonResponse(int status, const nlohmann::json& body) {
        HttpResponse res;
        res.status = status;
        appendHeader(res.headers, "Content-Type", "application/json");
        res.body = body.dump();
        return res;
    }

    HttpResponse ErrorResponder::error(int status, const std::optional<std::string>& message) {
        return jsonResponse(status, makeEnvelope(statusTag(status), messageFor(status, message)));
    }

    HttpResponse ErrorResponder::error(const ErrorObj& err) {
        auto res = error(err.status, err.msg.empty() ? std::nullopt : std::optional<std::string>(err.msg));
        for (const auto& [name, value] : err.headers)
            appendHeader(res.headers, name, value);
        return res;
    }

}
