/**
 * @file error_types.hpp
 * @brief Error type definitions for RestBridge.
 *
 * Provides the request-time error taxonomy (BridgeErr, ErrorObj, DispatchError) and the
 * exception types raised while building a service (TemplateError, DescriptorError),
 * while decoding or encoding values (CodecError) and by procedure handlers (ProcedureError).
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include "restbridge/core/types.hpp"

namespace restbridge {

    /**
     * @enum BridgeErr
     * @brief Error codes for request-time dispatch failures.
     *
     * - RequiredArgumentMissing: A non-optional parameter is absent from the payload
     * - InvalidArgumentValue: A value failed to decode against its declared type
     * - InvalidJsonBody: The request body is not a JSON object
     * - MethodMissing: The fallback protocol was used without a `method` parameter
     * - MethodNotFound: The resolved procedure name has no backing handler
     * - MethodNotAllowed: No rule and no fallback accepts the request method
     * - ServerFault: The handler failed or returned a value of the wrong type
     */
    enum class BridgeErr : int {
        RequiredArgumentMissing = 1, ///< Non-optional parameter absent
        InvalidArgumentValue,        ///< Codec decode failure
        InvalidJsonBody,             ///< Body is not valid JSON
        MethodMissing,               ///< Fallback without `method`
        MethodNotFound,              ///< Unknown procedure name
        MethodNotAllowed,            ///< Verb not accepted
        ServerFault = 99             ///< Internal server error
    };

    /**
     * @struct ErrorObj
     * @brief Structure representing a dispatch failure and the HTTP status it maps to.
     */
    struct ErrorObj {
        BridgeErr   code;    ///< Error code
        int         status;  ///< HTTP status code
        std::string msg;     ///< Error message (may be empty)
        HeaderList  headers; ///< Extra response headers (e.g. Allow on 405)
    };

    /**
     * @class DispatchError
     * @brief Raised anywhere in the request pipeline; converted to an error envelope by App.
     */
    class DispatchError : public std::runtime_error {
    public:
        explicit DispatchError(ErrorObj e)
            : std::runtime_error(e.msg), err_(std::move(e)) {}

        DispatchError(BridgeErr code, int status, std::string msg = {}, HeaderList headers = {})
            : DispatchError(ErrorObj{ code, status, std::move(msg), std::move(headers) }) {}

        const ErrorObj& error() const noexcept { return err_; }

    private:
        ErrorObj err_;
    };

    /**
     * @class TemplateError
     * @brief Malformed URI template or HTTP annotation. Fatal at startup.
     */
    class TemplateError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @class DescriptorError
     * @brief Inconsistent service descriptor or handler registry. Fatal at startup.
     */
    class DescriptorError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @class CodecError
     * @brief Base class of codec failures.
     */
    class CodecError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// A JSON tree does not conform to the requested type.
    class DecodeError : public CodecError {
    public:
        using CodecError::CodecError;
    };

    /// A value holds a payload the codec cannot represent.
    class EncodeError : public CodecError {
    public:
        using CodecError::CodecError;
    };

    /**
     * @class ProcedureError
     * @brief Thrown by procedure handlers to report one of their declared error variants.
     *
     * The carried record is serialized with the codec and returned as a 400 response when
     * the procedure declares its type; otherwise the call is treated as a server fault.
     */
    class ProcedureError : public std::runtime_error {
    public:
        explicit ProcedureError(Record value)
            : std::runtime_error(value.typeName + (value.tag.empty() ? "" : "." + value.tag)),
              value_(std::move(value)) {}

        const Record& value() const noexcept { return value_; }
        const std::string& typeName() const noexcept { return value_.typeName; }

    private:
        Record value_;
    };

}
