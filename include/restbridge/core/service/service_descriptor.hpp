/**
 * @file service_descriptor.hpp
 * @brief Immutable description of the procedures a RestBridge service exposes.
 *
 * The descriptor is built once at startup, validated on construction and read
 * concurrently by every request afterwards.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ankerl/unordered_dense.h>
#include "restbridge/core/service/type_descriptor.hpp"

namespace restbridge {

    /**
     * @struct Parameter
     * @brief One declared procedure parameter.
     */
    struct Parameter {
        std::string wireName; ///< Name on the wire (JSON key, template variable)
        std::string name;     ///< Name handlers read the decoded value by
        TypePtr     type;     ///< Declared type; optional types may be omitted by callers
    };

    /**
     * @struct HttpResource
     * @brief URL-mapping annotation of a procedure.
     */
    struct HttpResource {
        std::string path; ///< URI template, e.g. "/users/{id}" or "/search?q={term}"
        std::string verb; ///< HTTP verb, case-insensitive
    };

    /**
     * @struct ProcedureDescriptor
     * @brief Signature of one remote procedure.
     */
    struct ProcedureDescriptor {
        std::string                 wireName;   ///< Public procedure name
        std::string                 name;       ///< Internal handler name
        std::vector<Parameter>      parameters; ///< Ordered parameter list
        TypePtr                     returnType; ///< Declared return type (types::unit() for none)
        std::vector<TypePtr>        errors;     ///< Declared error types
        std::optional<HttpResource> http;       ///< Optional routing annotation

        /**
         * @brief Whether an error record of the given type name is declared.
         */
        bool declaresError(std::string_view typeName) const;
    };

    /**
     * @class ServiceDescriptor
     * @brief Validated, immutable table of procedures with a bijective wire ↔ internal name map.
     */
    class ServiceDescriptor {
    public:
        /**
         * @brief Validate and index the procedure table.
         * @param name Service name, used in log messages
         * @param procedures Procedure signatures
         * @throws DescriptorError on duplicate or reserved names, or missing types
         */
        ServiceDescriptor(std::string name, std::vector<ProcedureDescriptor> procedures);

        const std::string& name() const { return name_; }
        const std::vector<ProcedureDescriptor>& procedures() const { return procedures_; }

        /**
         * @brief Translate a public procedure name to its internal name.
         * @return Internal name, or std::nullopt if no procedure has that wire name
         */
        std::optional<std::string> internalName(std::string_view wireName) const;

        /**
         * @brief Translate an internal procedure name to its public name.
         */
        std::optional<std::string> wireName(std::string_view internalName) const;

        /**
         * @brief Find a procedure by internal name.
         * @return Pointer into the descriptor, or nullptr
         */
        const ProcedureDescriptor* find(std::string_view internalName) const;

    private:
        using Index = ankerl::unordered_dense::map<std::string, std::size_t>;

        std::string                      name_;
        std::vector<ProcedureDescriptor> procedures_;
        Index                            byWireName_;
        Index                            byName_;
    };

}
