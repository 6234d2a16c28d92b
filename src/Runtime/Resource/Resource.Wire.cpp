module;

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

module Resource:Wire.Impl;

import :Wire;
import :Errors;

namespace Resource
{
    namespace
    {
        std::unexpected<Error> Malformed(std::string_view context, std::string_view key, std::string_view problem)
        {
            return MakeError(ResourceError::MalformedDocument, std::format("{}: '{}' {}", context, key, problem),
                             std::string(key));
        }
    }

    Result<const nlohmann::json*> RequireMember(const nlohmann::json& doc, std::string_view key,
                                                std::string_view context)
    {
        if (!doc.is_object())
        {
            return MakeError(ResourceError::MalformedDocument,
                             std::format("{}: expected an object, got {}", context, doc.type_name()));
        }

        auto it = doc.find(key);
        if (it == doc.end()) return Malformed(context, key, "is missing");
        return &*it;
    }

    Result<std::string> RequireString(const nlohmann::json& doc, std::string_view key, std::string_view context)
    {
        auto member = RequireMember(doc, key, context);
        if (!member) return std::unexpected(std::move(member.error()));
        if (!(*member)->is_string()) return Malformed(context, key, "must be a string");
        return (*member)->get<std::string>();
    }

    Result<const nlohmann::json*> RequireObject(const nlohmann::json& doc, std::string_view key,
                                                std::string_view context)
    {
        auto member = RequireMember(doc, key, context);
        if (!member) return member;
        if (!(*member)->is_object()) return Malformed(context, key, "must be an object");
        return member;
    }

    Result<const nlohmann::json*> RequireArray(const nlohmann::json& doc, std::string_view key,
                                               std::string_view context)
    {
        auto member = RequireMember(doc, key, context);
        if (!member) return member;
        if (!(*member)->is_array()) return Malformed(context, key, "must be an array");
        return member;
    }

    Result<std::string> OptionalString(const nlohmann::json& doc, std::string_view key, std::string_view context)
    {
        if (!doc.is_object()) return std::string{};

        auto it = doc.find(key);
        if (it == doc.end() || it->is_null()) return std::string{};
        if (!it->is_string()) return Malformed(context, key, "must be a string");
        return it->get<std::string>();
    }
}
