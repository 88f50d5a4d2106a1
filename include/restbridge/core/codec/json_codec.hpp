/**
 * @file json_codec.hpp
 * @brief JsonCodec: default ICodec implementation over nlohmann::json.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "restbridge/core/interfaces/icodec.hpp"

namespace restbridge {

    /**
     * @class JsonCodec
     * @brief Decodes JSON trees into native values and encodes them back.
     *
     * Value mapping:
     *   - Unit / null        ↔ empty Value
     *   - Boolean            ↔ bool
     *   - Integer            ↔ std::int64_t
     *   - Float              ↔ double
     *   - Text               ↔ std::string
     *   - List               ↔ ValueList
     *   - Map                ↔ ValueMap
     *   - Record             ↔ Record, encoded with "_type" (and "_tag" for union variants)
     *
     * Scalars captured from URL paths and query strings arrive as strings, so Integer,
     * Float and Boolean also accept their canonical textual form ("42", "1.5", "true").
     */
    class JsonCodec : public ICodec {
    public:
        Value decode(const TypeDescriptor& type, const nlohmann::json& raw) const override;
        nlohmann::json encode(const Value& value) const override;
    };

}
