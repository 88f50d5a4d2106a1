#include "restbridge/core/rpc/handler_registry.hpp"
#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"

namespace restbridge {

/* Registration */
void HandlerRegistry::registerRPC(const std::string& name, ProcedureHandler handler)
{
    if (!handler)
        throw DescriptorError("handler for '" + name + "' is empty");
    if (!handlers_.emplace(name, std::move(handler)).second)
        throw DescriptorError("handler for '" + name + "' is already registered");
    LOG_DEBUG("[HandlerRegistry] registered " + name);
}

/* Lookup */
const ProcedureHandler* HandlerRegistry::find(std::string_view name) const
{
    auto it = handlers_.find(std::string(name));
    return it == handlers_.end() ? nullptr : &it->second;
}

/* Startup check */
void HandlerRegistry::validate(const ServiceDescriptor& service) const
{
    for (const auto& p : service.procedures()) {
        if (!find(p.name))
            throw DescriptorError("procedure " + p.wireName + "() has no handler registered under '" +
                                  p.name + "'");
    }
    for (const auto& [name, _] : handlers_) {
        if (!service.find(name))
            throw DescriptorError("handler '" + name + "' does not back any procedure of " +
                                  service.name());
    }
}

}
