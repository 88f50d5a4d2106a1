#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"
#include <algorithm>

namespace restbridge {

    namespace {

        void checkName(const std::string& what, const std::string& name) {
            if (name.empty())
                throw DescriptorError(what + " name must not be empty");
            if (name.front() == '_')
                throw DescriptorError(what + " name '" + name + "' uses the reserved '_' prefix");
        }

        void checkParameters(const ProcedureDescriptor& p) {
            ankerl::unordered_dense::set<std::string> wire, internal;
            for (const auto& param : p.parameters) {
                checkName("parameter", param.wireName);
                checkName("parameter", param.name);
                if (!param.type)
                    throw DescriptorError("parameter '" + param.wireName + "' of " + p.wireName +
                                          "() has no type");
                if (!wire.insert(param.wireName).second)
                    throw DescriptorError("duplicate parameter wire name '" + param.wireName +
                                          "' in " + p.wireName + "()");
                if (!internal.insert(param.name).second)
                    throw DescriptorError("duplicate parameter name '" + param.name +
                                          "' in " + p.wireName + "()");
            }
        }

    }

    bool ProcedureDescriptor::declaresError(std::string_view typeName) const {
        return std::any_of(errors.begin(), errors.end(),
                           [&](const TypePtr& t) { return t && t->name() == typeName; });
    }

    ServiceDescriptor::ServiceDescriptor(std::string name, std::vector<ProcedureDescriptor> procedures)
        : name_(std::move(name)), procedures_(std::move(procedures))
    {
        for (std::size_t i = 0; i < procedures_.size(); ++i) {
            auto& p = procedures_[i];
            checkName("procedure", p.wireName);
            checkName("procedure", p.name);
            if (!p.returnType) p.returnType = types::unit();
            for (const auto& e : p.errors) {
                if (!e || e->kind() != TypeKind::Record)
                    throw DescriptorError("declared errors of " + p.wireName + "() must be record types");
            }
            checkParameters(p);

            if (!byWireName_.emplace(p.wireName, i).second)
                throw DescriptorError("duplicate procedure wire name '" + p.wireName + "'");
            if (!byName_.emplace(p.name, i).second)
                throw DescriptorError("duplicate procedure name '" + p.name + "'");
        }
    }

    std::optional<std::string> ServiceDescriptor::internalName(std::string_view wireName) const {
        auto it = byWireName_.find(std::string(wireName));
        if (it == byWireName_.end()) return std::nullopt;
        return procedures_[it->second].name;
    }

    std::optional<std::string> ServiceDescriptor::wireName(std::string_view internalName) const {
        auto it = byName_.find(std::string(internalName));
        if (it == byName_.end()) return std::nullopt;
        return procedures_[it->second].wireName;
    }

    const ProcedureDescriptor* ServiceDescriptor::find(std::string_view internalName) const {
        auto it = byName_.find(std::string(internalName));
        return it == byName_.end() ? nullptr : &procedures_[it->second];
    }

}
