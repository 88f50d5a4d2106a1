/**
 * @file argument_binder.hpp
 * @brief Merges captured and body values into a validated argument set.
 *
 * Binding runs in two explicit stages. The capture stage copies path and query
 * variables of a routed request into the raw payload, keyed by parameter wire name.
 * The body stage parses the JSON body (for verbs that carry one) and lets its keys
 * override the captured ones. Each declared parameter is then decoded through the codec.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <any>
#include <stdexcept>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <ankerl/unordered_dense.h>
#include "restbridge/core/types.hpp"
#include "restbridge/core/http/http_message.hpp"
#include "restbridge/core/interfaces/icodec.hpp"

namespace restbridge {

    struct ProcedureDescriptor;
    struct DispatchContext;

    /**
     * @class Arguments
     * @brief Decoded arguments of one call, keyed by internal parameter name.
     *
     * Omitted optional parameters are present with an empty (null) value.
     */
    class Arguments {
    public:
        void set(const std::string& name, Value value);
        bool has(std::string_view name) const;

        /**
         * @brief Raw value of a parameter.
         * @throws std::out_of_range if the parameter was not bound
         */
        const Value& raw(std::string_view name) const;

        /**
         * @brief Whether a bound parameter holds null.
         * @throws std::out_of_range if the parameter was not bound
         */
        bool isNull(std::string_view name) const { return !raw(name).has_value(); }

        /**
         * @brief Typed value of a parameter.
         * @tparam T Stored type (bool, std::int64_t, double, std::string, ValueList, ValueMap, Record)
         * @throws std::out_of_range if the parameter was not bound
         * @throws std::bad_any_cast if the value is null or of another type
         */
        template<typename T>
        T get(std::string_view name) const {
            return std::any_cast<T>(raw(name));
        }

        std::size_t size() const { return values_.size(); }

    private:
        ankerl::unordered_dense::map<std::string, Value> values_;
    };

    /**
     * @class ArgumentBinder
     * @brief Builds the raw payload of a request and binds it against a procedure signature.
     */
    class ArgumentBinder {
    public:
        /**
         * @param codec Codec used to decode parameter values (must outlive the binder)
         */
        explicit ArgumentBinder(const ICodec& codec) : codec_(codec) {}

        /**
         * @brief Parse a request body.
         * @param body Raw body; empty means no arguments
         * @return A JSON object
         * @throws DispatchError (InvalidJsonBody, 400) if the body is not a JSON object
         */
        static nlohmann::json parseBody(const std::string& body);

        /**
         * @brief Run the capture and body stages.
         *
         * Captures are used only for routed requests. The body is read for the fallback
         * protocol and for routed verbs other than GET and DELETE.
         *
         * @return Raw payload keyed by parameter wire name
         * @throws DispatchError (InvalidJsonBody, 400)
         */
        nlohmann::json mergePayload(const ProcedureDescriptor& procedure,
                                    const DispatchContext& ctx,
                                    const HttpRequest& req) const;

        /**
         * @brief Decode every declared parameter.
         * @param procedure Target procedure
         * @param payload Raw payload from mergePayload
         * @return Decoded arguments keyed by internal parameter name
         * @throws DispatchError (RequiredArgumentMissing or InvalidArgumentValue, 400)
         */
        Arguments bind(const ProcedureDescriptor& procedure, const nlohmann::json& payload) const;

    private:
        const ICodec& codec_;
    };

}
