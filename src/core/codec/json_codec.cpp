#include "restbridge/core/codec/json_codec.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace restbridge {

    namespace {

        [[noreturn]] void mismatch(const TypeDescriptor& type, const nlohmann::json& raw) {
            throw DecodeError("expected " + type.name() + ", got " + std::string(raw.type_name()));
        }

        std::int64_t integerFromText(const TypeDescriptor& type, const nlohmann::json& raw) {
            const auto& s = raw.get_ref<const std::string&>();
            std::int64_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
                mismatch(type, raw);
            return out;
        }

        double floatFromText(const TypeDescriptor& type, const nlohmann::json& raw) {
            const auto& s = raw.get_ref<const std::string&>();
            size_t used = 0;
            double out = 0.0;
            try {
                out = std::stod(s, &used);
            }
            catch (const std::exception&) {
                mismatch(type, raw);
            }
            if (used != s.size() || !std::isfinite(out))
                mismatch(type, raw);
            return out;
        }

    }

    Value JsonCodec::decode(const TypeDescriptor& type, const nlohmann::json& raw) const {
        switch (type.kind()) {
            case TypeKind::Unit:
                if (!raw.is_null()) mismatch(type, raw);
                return Value{};

            case TypeKind::Optional:
                if (raw.is_null()) return Value{};
                return decode(*type.element(), raw);

            case TypeKind::Boolean:
                if (raw.is_boolean()) return raw.get<bool>();
                if (raw.is_string()) {
                    const auto& s = raw.get_ref<const std::string&>();
                    if (s == "true") return true;
                    if (s == "false") return false;
                }
                mismatch(type, raw);

            case TypeKind::Integer:
                if (raw.is_number_unsigned()) {
                    auto u = raw.get<std::uint64_t>();
                    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                        mismatch(type, raw);
                    return static_cast<std::int64_t>(u);
                }
                if (raw.is_number_integer()) return raw.get<std::int64_t>();
                if (raw.is_string()) return integerFromText(type, raw);
                mismatch(type, raw);

            case TypeKind::Float:
                if (raw.is_number()) return raw.get<double>();
                if (raw.is_string()) return floatFromText(type, raw);
                mismatch(type, raw);

            case TypeKind::Text:
                if (!raw.is_string()) mismatch(type, raw);
                return raw.get<std::string>();

            case TypeKind::List: {
                if (!raw.is_array()) mismatch(type, raw);
                ValueList out;
                out.reserve(raw.size());
                for (const auto& item : raw)
                    out.push_back(decode(*type.element(), item));
                return out;
            }

            case TypeKind::Map: {
                if (!raw.is_object()) mismatch(type, raw);
                ValueMap out;
                for (const auto& [k, v] : raw.items())
                    out.emplace(k, decode(*type.element(), v));
                return out;
            }

            case TypeKind::Record: {
                if (!raw.is_object()) mismatch(type, raw);
                if (auto it = raw.find("_type"); it != raw.end()) {
                    if (!it->is_string() || it->get_ref<const std::string&>() != type.name())
                        throw DecodeError("expected record " + type.name() + ", got " + it->dump());
                }
                if (!type.tag().empty()) {
                    if (auto it = raw.find("_tag"); it != raw.end()) {
                        if (!it->is_string() || it->get_ref<const std::string&>() != type.tag())
                            throw DecodeError("expected tag " + type.tag() + ", got " + it->dump());
                    }
                }
                Record out{ type.name(), type.tag(), {} };
                for (const auto& field : type.fields()) {
                    auto it = raw.find(field.name);
                    if (it == raw.end()) {
                        if (!field.type->isNullable())
                            throw DecodeError("record " + type.name() + " is missing field '" + field.name + "'");
                        out.fields.emplace(field.name, Value{});
                        continue;
                    }
                    out.fields.emplace(field.name, decode(*field.type, *it));
                }
                return out;
            }
        }
        mismatch(type, raw);
    }

    nlohmann::json JsonCodec::encode(const Value& value) const {
        if (!value.has_value()) return nullptr;

        const auto& t = value.type();
        if (t == typeid(bool))          return std::any_cast<bool>(value);
        if (t == typeid(std::int64_t))  return std::any_cast<std::int64_t>(value);
        if (t == typeid(int))           return static_cast<std::int64_t>(std::any_cast<int>(value));
        if (t == typeid(long long))     return static_cast<std::int64_t>(std::any_cast<long long>(value));
        if (t == typeid(double))        return std::any_cast<double>(value);
        if (t == typeid(float))         return static_cast<double>(std::any_cast<float>(value));
        if (t == typeid(std::string))   return std::any_cast<const std::string&>(value);
        if (t == typeid(const char*))   return std::string(std::any_cast<const char*>(value));

        if (t == typeid(ValueList)) {
            auto out = nlohmann::json::array();
            for (const auto& item : std::any_cast<const ValueList&>(value))
                out.push_back(encode(item));
            return out;
        }
        if (t == typeid(ValueMap)) {
            auto out = nlohmann::json::object();
            for (const auto& [k, v] : std::any_cast<const ValueMap&>(value))
                out[k] = encode(v);
            return out;
        }
        if (t == typeid(Record)) {
            const auto& rec = std::any_cast<const Record&>(value);
            auto out = nlohmann::json::object();
            out["_type"] = rec.typeName;
            if (!rec.tag.empty()) out["_tag"] = rec.tag;
            for (const auto& [k, v] : rec.fields)
                out[k] = encode(v);
            return out;
        }
        throw EncodeError(std::string("cannot encode value of C++ type ") + t.name());
    }

}
