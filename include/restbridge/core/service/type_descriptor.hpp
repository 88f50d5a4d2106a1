/**
 * @file type_descriptor.hpp
 * @brief Declared types of procedure parameters, return values and errors.
 *
 * A TypeDescriptor is an immutable node of a type tree built once together with the
 * ServiceDescriptor. The codec walks it to decode JSON into values; the dispatch core
 * only asks it about optionality and shape.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <memory>
#include <string>
#include <vector>

namespace restbridge {

    class TypeDescriptor;
    using TypePtr = std::shared_ptr<const TypeDescriptor>;

    /**
     * @enum TypeKind
     * @brief Shape of a declared type.
     */
    enum class TypeKind {
        Unit,     ///< Only null; "returns nothing"
        Boolean,
        Integer,  ///< 64-bit signed integer
        Float,    ///< IEEE double
        Text,
        List,     ///< Homogeneous list of element()
        Map,      ///< Text-keyed map of element()
        Optional, ///< element() or null
        Record    ///< Named fields; optionally a union variant carrying a tag
    };

    /**
     * @struct Field
     * @brief One named field of a record type.
     */
    struct Field {
        std::string name;
        TypePtr     type;
    };

    /**
     * @class TypeDescriptor
     * @brief Immutable description of a declared type.
     */
    class TypeDescriptor {
    public:
        TypeDescriptor(TypeKind kind, std::string name, TypePtr element = nullptr,
                       std::vector<Field> fields = {}, std::string tag = {});

        TypeKind kind() const { return kind_; }
        /// Display name, e.g. "bigint", "[text]", "text?", "user".
        const std::string& name() const { return name_; }
        const TypePtr& element() const { return element_; }
        const std::vector<Field>& fields() const { return fields_; }
        const std::string& tag() const { return tag_; }

        bool isOptional() const { return kind_ == TypeKind::Optional; }
        /// Whether null is a valid value of this type.
        bool isNullable() const { return kind_ == TypeKind::Optional || kind_ == TypeKind::Unit; }
        /// Whether the type, looking through one optional layer, is a list.
        bool isSequence() const;

    private:
        TypeKind           kind_;
        std::string        name_;
        TypePtr            element_;
        std::vector<Field> fields_;
        std::string        tag_;
    };

    /**
     * Factories for the built-in types.
     */
    namespace types {
        TypePtr unit();
        TypePtr boolean();
        TypePtr integer();
        TypePtr floating();
        TypePtr text();
        TypePtr list(TypePtr element);
        TypePtr map(TypePtr element);
        TypePtr optional(TypePtr element);
        /**
         * @brief Record type; pass a tag to describe one variant of a union (e.g. an error union).
         */
        TypePtr record(std::string name, std::vector<Field> fields, std::string tag = {});
    }

}
