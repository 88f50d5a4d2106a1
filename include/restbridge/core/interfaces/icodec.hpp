/**
 * @file icodec.hpp
 * @brief Interface for value codecs in RestBridge.
 *
 * Defines the ICodec interface that converts between typed procedure values and
 * generic JSON trees. Implementations must be pure: the dispatch core calls them
 * concurrently from every request without synchronization.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <nlohmann/json.hpp>
#include "restbridge/core/types.hpp"
#include "restbridge/core/service/type_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"

namespace restbridge {

    /**
     * @class ICodec
     * @brief Interface for custom value codecs in RestBridge.
     *
     * For every type T and every JSON tree v representable in T,
     * `encode(decode(T, v)) == v` must hold.
     */
    class ICodec {
    public:
        virtual ~ICodec() = default;
        /**
         * @brief Decode a JSON tree against a declared type.
         * @param type Declared type
         * @param raw JSON tree (null for absent optional values)
         * @return The decoded value; an empty Value for null
         * @throws DecodeError if the tree does not conform to the type
         */
        virtual Value decode(const TypeDescriptor& type, const nlohmann::json& raw) const = 0;
        /**
         * @brief Encode a value into a JSON tree.
         * @param value Value to encode
         * @return JSON tree
         * @throws EncodeError if the value holds an unsupported payload
         */
        virtual nlohmann::json encode(const Value& value) const = 0;
    };

}
