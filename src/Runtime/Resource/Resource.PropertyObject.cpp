module;

#include <cstddef>
#include <expected>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:PropertyObject.Impl;

import :PropertyObject;
import :Errors;
import :Codec;
import :Field;

namespace Resource
{
    std::vector<const FieldBase*> PropertyObject::Fields() const
    {
        return CollectFields();
    }

    std::vector<const PropertyObject*> PropertyObject::Children() const
    {
        return CollectChildren();
    }

    Status PropertyObject::Validate(const Limits& limits) const
    {
        for (const FieldBase* field : Fields())
        {
            if (field->IsRequiredButMissing())
            {
                return MakeError(ResourceError::MissingRequired,
                                 std::format("required field '{}' has no value", field->Name()), field->Name());
            }
        }

        for (const PropertyObject* child : Children())
        {
            if (auto status = child->Validate(limits); !status)
                return status;
        }

        return ValidateInvariants(limits);
    }

    bool PropertyObject::IsDirty() const
    {
        for (const FieldBase* field : Fields())
        {
            if (field->IsDirty()) return true;
        }
        for (const PropertyObject* child : Children())
        {
            if (child->IsDirty()) return true;
        }
        return false;
    }

    void PropertyObject::MarkSynced()
    {
        for (FieldBase* field : CollectFields())
            field->ClearDirty();
        for (PropertyObject* child : CollectChildren())
            child->MarkSynced();
    }

    Result<DirtyFileSet> PropertyObject::DirtyFiles(bool force, const Limits& limits) const
    {
        if (auto status = Validate(limits); !status)
            return std::unexpected(std::move(status.error()));

        DirtyFileSet files;
        CollectDirtyFiles(files, force, {});
        return files;
    }

    void PropertyObject::CollectDirtyFiles(DirtyFileSet& files, bool force, const std::string& prefix) const
    {
        for (const FieldBase* field : Fields())
            field->CollectDirty(files, force, prefix);
        for (const PropertyObject* child : Children())
            child->CollectDirtyFiles(files, force, prefix);
    }

    nlohmann::json PropertyObject::Metadata() const
    {
        nlohmann::json meta = nlohmann::json::object();
        for (const FieldBase* field : Fields())
        {
            if (!field->IsBinary())
                field->WriteJson(meta);
        }
        return meta;
    }

    Status PropertyObject::ApplyMetadata(const nlohmann::json& meta)
    {
        if (!meta.is_object())
        {
            return MakeError(ResourceError::MalformedDocument,
                             std::format("expected a metadata object, got {}", meta.type_name()));
        }

        for (FieldBase* field : CollectFields())
        {
            if (field->IsBinary()) continue;

            auto it = meta.find(field->Name());
            if (it == meta.end()) continue;

            if (auto status = field->ReadJson(*it); !status)
                return status;
        }
        return {};
    }

    std::size_t PropertyObject::NBytes() const
    {
        std::size_t total = 0;
        for (const FieldBase* field : Fields())
            total += field->ByteSize();
        for (const PropertyObject* child : Children())
            total += child->NBytes();
        return total;
    }

    Status UserContent::SetContent(std::string title, std::string description)
    {
        if (!title.empty())
        {
            if (auto status = Title.Set(std::move(title)); !status)
                return status;
        }
        if (!description.empty())
        {
            if (auto status = Description.Set(std::move(description)); !status)
                return status;
        }
        return {};
    }
}
