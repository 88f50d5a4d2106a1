#include "restbridge/core/rpc/return_validator.hpp"
#include <algorithm>
#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"

namespace restbridge {

    std::string ReturnValidator::displayName(const std::string& wireName) {
        std::string out = wireName;
        std::replace(out.begin(), out.end(), '_', '-');
        return out;
    }

    bool ReturnValidator::check(const TypeDescriptor& type, const Value& value) const {
        if (!value.has_value()) return type.isNullable();
        try {
            codec_.decode(type, codec_.encode(value));
            return true;
        }
        catch (const CodecError& e) {
            LOG_DEBUG(std::string("[ReturnValidator] ") + e.what());
            return false;
        }
    }

    nlohmann::json ReturnValidator::validate(const ProcedureDescriptor& procedure, const Value& value) const {
        const auto& type = *procedure.returnType;
        const auto name = displayName(procedure.wireName);

        if (!value.has_value()) {
            if (type.isNullable()) return nullptr;
            std::string msg = "The return type of " + name + "() method is not optional "
                "(i.e., no trailing question mark), but its server-side implementation has "
                "tried to return nothing (i.e., null, nil, None).  It is an internal server "
                "error and should be fixed by server-side.";
            LOG_ERROR("[ReturnValidator] " + msg);
            throw DispatchError(BridgeErr::ServerFault, 500, std::move(msg));
        }

        try {
            auto encoded = codec_.encode(value);
            codec_.decode(type, encoded);
            return encoded;
        }
        catch (const CodecError& e) {
            std::string msg = "The return type of the " + name + "() method is " + type.name() +
                ", but its server-side implementation has tried to return a value of an invalid "
                "type.  It is an internal server error and should be fixed by server-side.";
            LOG_ERROR("[ReturnValidator] " + msg + " (" + e.what() + ")");
            throw DispatchError(BridgeErr::ServerFault, 500, std::move(msg));
        }
    }

}
