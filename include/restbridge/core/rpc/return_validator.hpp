/**
 * @file return_validator.hpp
 * @brief Checks handler results against the declared return type.
 *
 * A result is valid when it is null and the return type is nullable, or when it
 * survives a round trip through the codec: `decode(T, encode(v))` must succeed.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "restbridge/core/types.hpp"
#include "restbridge/core/interfaces/icodec.hpp"

namespace restbridge {

    struct ProcedureDescriptor;

    /**
     * @class ReturnValidator
     * @brief Validates and encodes procedure results.
     */
    class ReturnValidator {
    public:
        /**
         * @param codec Codec used for the round trip (must outlive the validator)
         */
        explicit ReturnValidator(const ICodec& codec) : codec_(codec) {}

        /**
         * @brief Whether a value conforms to a type.
         */
        bool check(const TypeDescriptor& type, const Value& value) const;

        /**
         * @brief Validate a handler result and encode it.
         * @param procedure Procedure that produced the value
         * @param value Handler result
         * @return Encoded result
         * @throws DispatchError (ServerFault, 500) if the value does not match the return type
         */
        nlohmann::json validate(const ProcedureDescriptor& procedure, const Value& value) const;

        /// Name used in messages: the wire name with '_' replaced by '-'.
        static std::string displayName(const std::string& wireName);

    private:
        const ICodec& codec_;
    };

}
