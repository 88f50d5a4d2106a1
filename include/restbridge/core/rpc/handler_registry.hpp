/**
 * @file handler_registry.hpp
 * @brief HandlerRegistry class for registering procedure handlers in RestBridge.
 *
 * Handlers are registered by internal procedure name before the App is built. The App
 * validates the registry against the ServiceDescriptor once and never mutates it
 * afterwards, so lookups need no locking.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <string>
#include <string_view>
#include <ankerl/unordered_dense.h>
#include "restbridge/core/types.hpp"

namespace restbridge {

    class ServiceDescriptor;

    /**
     * @class HandlerRegistry
     * @brief Maps internal procedure names to their handlers.
     */
    class HandlerRegistry {
    public:
        /**
         * @brief Register a handler for an internal procedure name.
         * @param name Internal procedure name
         * @param handler Handler function to register
         * @throws DescriptorError if the handler is empty or the name is already taken
         */
        void registerRPC(const std::string& name, ProcedureHandler handler);

        /**
         * @brief Look up a handler.
         * @param name Internal procedure name
         * @return Pointer to the handler, or nullptr if none is registered
         */
        const ProcedureHandler* find(std::string_view name) const;

        /**
         * @brief Check that handlers and procedures correspond one to one.
         * @param service Service descriptor to check against
         * @throws DescriptorError naming the first procedure without a handler, or the
         *         first handler without a procedure
         */
        void validate(const ServiceDescriptor& service) const;

        std::size_t size() const { return handlers_.size(); }

    private:
        ankerl::unordered_dense::map<std::string, ProcedureHandler> handlers_; ///< Registered handlers
    };

}
