module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:Composite.Impl;

import :Composite;
import :Errors;
import :Codec;
import :Field;
import :PropertyObject;
import :DataArray;
import :Mesh;
import :Binding;
import :Wire;

namespace Resource
{
    Status CompositeResource::AddData(std::string_view location, DataArray data)
    {
        DataBinding binding(Locations());
        if (auto status = binding.Location.Set(location); !status)
            return status;
        binding.Data = std::move(data);
        m_Bindings.push_back(std::move(binding));
        return {};
    }

    bool CompositeResource::RemoveData(std::size_t index)
    {
        if (index >= m_Bindings.size()) return false;

        m_Bindings.erase(m_Bindings.begin() + static_cast<std::ptrdiff_t>(index));
        m_StablePrefix = std::min(m_StablePrefix, index);
        return true;
    }

    Status CompositeResource::SetData(std::vector<DataBinding> bindings)
    {
        const ChoiceField accepted("location", Locations());
        for (std::size_t i = 0; i < bindings.size(); ++i)
        {
            const ChoiceField& location = bindings[i].Location;
            const auto canonical = location.HasValue() ? accepted.Resolve(location.Value()) : std::nullopt;
            if (canonical && *canonical == location.Value()) continue;

            Error error;
            error.Code = ResourceError::KindMismatch;
            error.Message = location.HasValue()
                                ? std::format("{}.data[{}] location '{}' is not accepted", TypeName(), i,
                                              location.Value())
                                : std::format("{}.data[{}] has no location", TypeName(), i);
            error.Subject = "location";
            error.Index = i;
            return MakeError(std::move(error));
        }

        m_Bindings = std::move(bindings);
        m_StablePrefix = 0;
        return {};
    }

    void CompositeResource::ClearData()
    {
        m_Bindings.clear();
        m_StablePrefix = 0;
    }

    bool CompositeResource::BindingListChanged() const noexcept
    {
        return m_StablePrefix < m_Bindings.size() || m_Bindings.size() != m_SyncedCount;
    }

    bool CompositeResource::IsDirty() const
    {
        return BindingListChanged() || UserContent::IsDirty();
    }

    void CompositeResource::MarkSynced()
    {
        UserContent::MarkSynced();
        m_StablePrefix = m_Bindings.size();
        m_SyncedCount = m_Bindings.size();
    }

    std::vector<PropertyObject*> CompositeResource::CollectChildren()
    {
        std::vector<PropertyObject*> children;
        children.reserve(m_Bindings.size() + 2);
        children.push_back(&MutableMesh());
        children.push_back(&MutableOptions());
        for (DataBinding& binding : m_Bindings)
            children.push_back(&binding);
        return children;
    }

    std::vector<const PropertyObject*> CompositeResource::CollectChildren() const
    {
        std::vector<const PropertyObject*> children;
        children.reserve(m_Bindings.size() + 2);
        children.push_back(&GetMesh());
        children.push_back(&GetOptions());
        for (const DataBinding& binding : m_Bindings)
            children.push_back(&binding);
        return children;
    }

    Status CompositeResource::ValidateInvariants(const Limits& /*limits*/) const
    {
        const Mesh& mesh = GetMesh();

        std::optional<Error> first;
        std::size_t failures = 0;

        for (std::size_t i = 0; i < m_Bindings.size(); ++i)
        {
            const DataBinding& binding = m_Bindings[i];
            const std::string& location = binding.Location.Value();
            const std::size_t length = binding.Data.Length();

            std::size_t expected = 0;
            if (binding.IsPerNode())
            {
                expected = mesh.NodeCount();
            }
            else if (location == kLocationCell)
            {
                expected = mesh.CellCount();
            }
            else
            {
                ++failures;
                if (!first)
                {
                    Error error;
                    error.Code = ResourceError::KindMismatch;
                    error.Message = std::format("{}.data[{}] has unrecognised location '{}'", TypeName(), i, location);
                    error.Subject = location;
                    error.Index = i;
                    first = std::move(error);
                }
                continue;
            }

            if (length == expected) continue;

            ++failures;
            if (!first)
            {
                Error error;
                error.Code = ResourceError::DataLengthMismatch;
                error.Message = std::format("{}.data[{}] length {} does not match {} length {}", TypeName(), i,
                                            length, location, expected);
                error.Subject = location;
                error.Index = i;
                error.Expected = static_cast<std::int64_t>(expected);
                error.Actual = static_cast<std::int64_t>(length);
                first = std::move(error);
            }
        }

        if (!first) return {};

        first->Message += std::format(" ({} of {} bindings failed)", failures, m_Bindings.size());
        return MakeError(std::move(*first));
    }

    void CompositeResource::CollectDirtyFiles(DirtyFileSet& files, bool force, const std::string& prefix) const
    {
        for (const FieldBase* field : Fields())
            field->CollectDirty(files, force, prefix);

        GetMesh().CollectDirtyFiles(files, force, prefix + "mesh/");
        for (std::size_t i = 0; i < m_Bindings.size(); ++i)
        {
            const bool moved = i >= m_StablePrefix;
            m_Bindings[i].CollectDirtyFiles(files, force || moved, std::format("{}data/{}/", prefix, i));
        }
    }

    nlohmann::json CompositeResource::BuildMetadata() const
    {
        nlohmann::json doc = Metadata();
        doc["type"] = TypeName();
        doc["meta"] = GetOptions().Metadata();
        doc["mesh"] = GetMesh().Document();

        nlohmann::json data = nlohmann::json::array();
        for (const DataBinding& binding : m_Bindings)
            data.push_back(binding.Document());
        doc["data"] = std::move(data);
        return doc;
    }

    Status CompositeResource::ReadDocument(const nlohmann::json& doc, IArrayFetcher& fetcher)
    {
        const std::string context(TypeName());

        auto title = OptionalString(doc, "title", context);
        if (!title) return std::unexpected(std::move(title.error()));
        auto description = OptionalString(doc, "description", context);
        if (!description) return std::unexpected(std::move(description.error()));
        if (auto status = SetContent(std::move(*title), std::move(*description)); !status)
            return status;

        auto meta = RequireObject(doc, "meta", context);
        if (!meta) return std::unexpected(std::move(meta.error()));
        if (auto status = MutableOptions().ApplyMetadata(**meta); !status)
            return status;

        ClearData();
        m_SyncedCount = 0;
        auto it = doc.find("data");
        if (it == doc.end() || it->is_null()) return {};
        if (!it->is_array())
        {
            return MakeError(ResourceError::MalformedDocument, std::format("{}: 'data' must be an array", context),
                             "data");
        }

        for (const nlohmann::json& entry : *it)
        {
            auto binding = DataBinding::BuildFromJson(entry, fetcher, Locations());
            if (!binding) return std::unexpected(std::move(binding.error()));
            m_Bindings.push_back(std::move(*binding));
        }
        return {};
    }
}
