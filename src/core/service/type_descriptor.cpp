#include "restbridge/core/service/type_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"

namespace restbridge {

    TypeDescriptor::TypeDescriptor(TypeKind kind, std::string name, TypePtr element,
                                   std::vector<Field> fields, std::string tag)
        : kind_(kind), name_(std::move(name)), element_(std::move(element)),
          fields_(std::move(fields)), tag_(std::move(tag))
    {
        const bool needsElement = kind_ == TypeKind::List || kind_ == TypeKind::Map ||
                                  kind_ == TypeKind::Optional;
        if (needsElement && !element_)
            throw DescriptorError("type '" + name_ + "' requires an element type");
        for (const auto& f : fields_) {
            if (!f.type)
                throw DescriptorError("field '" + f.name + "' of '" + name_ + "' has no type");
        }
    }

    bool TypeDescriptor::isSequence() const {
        if (kind_ == TypeKind::Optional) return element_->kind() == TypeKind::List;
        return kind_ == TypeKind::List;
    }

    namespace types {

        TypePtr unit() {
            static const TypePtr t = std::make_shared<TypeDescriptor>(TypeKind::Unit, "none");
            return t;
        }

        TypePtr boolean() {
            static const TypePtr t = std::make_shared<TypeDescriptor>(TypeKind::Boolean, "bool");
            return t;
        }

        TypePtr integer() {
            static const TypePtr t = std::make_shared<TypeDescriptor>(TypeKind::Integer, "bigint");
            return t;
        }

        TypePtr floating() {
            static const TypePtr t = std::make_shared<TypeDescriptor>(TypeKind::Float, "float64");
            return t;
        }

        TypePtr text() {
            static const TypePtr t = std::make_shared<TypeDescriptor>(TypeKind::Text, "text");
            return t;
        }

        TypePtr list(TypePtr element) {
            if (!element) throw DescriptorError("list element type is null");
            auto name = "[" + element->name() + "]";
            return std::make_shared<TypeDescriptor>(TypeKind::List, std::move(name), std::move(element));
        }

        TypePtr map(TypePtr element) {
            if (!element) throw DescriptorError("map element type is null");
            auto name = "{text: " + element->name() + "}";
            return std::make_shared<TypeDescriptor>(TypeKind::Map, std::move(name), std::move(element));
        }

        TypePtr optional(TypePtr element) {
            if (!element) throw DescriptorError("optional element type is null");
            if (element->isOptional()) return element;
            auto name = element->name() + "?";
            return std::make_shared<TypeDescriptor>(TypeKind::Optional, std::move(name), std::move(element));
        }

        TypePtr record(std::string name, std::vector<Field> fields, std::string tag) {
            return std::make_shared<TypeDescriptor>(TypeKind::Record, std::move(name), nullptr,
                                                    std::move(fields), std::move(tag));
        }

    }

}
