module;

#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:Mesh0D.Impl;

import :Mesh0D;
import :Errors;
import :Codec;
import :Field;
import :Wire;

namespace Resource
{
    std::vector<FieldBase*> Mesh0D::CollectFields()
    {
        auto fields = UserContent::CollectFields();
        fields.push_back(&Vertices);
        return fields;
    }

    std::vector<const FieldBase*> Mesh0D::CollectFields() const
    {
        auto fields = UserContent::CollectFields();
        fields.push_back(&Vertices);
        return fields;
    }

    Result<Mesh0D> Mesh0D::Create(FloatArray vertices)
    {
        Mesh0D mesh;
        if (auto status = mesh.Vertices.Set(std::move(vertices)); !status)
            return std::unexpected(std::move(status.error()));
        return mesh;
    }

    Result<Mesh0D> Mesh0D::BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher, std::string title,
                                         std::string description, const Limits& limits)
    {
        auto meta = RequireObject(doc, "meta", "mesh");
        if (!meta) return std::unexpected(std::move(meta.error()));

        auto vertices = FetchArray<float>(fetcher, doc, "vertices", ShapeSpec{{kWildcard, 3}}, "mesh");
        if (!vertices) return std::unexpected(std::move(vertices.error()));

        auto mesh = Create(std::move(*vertices));
        if (!mesh) return mesh;

        if (auto status = mesh->SetContent(std::move(title), std::move(description)); !status)
            return std::unexpected(std::move(status.error()));
        if (auto status = mesh->Opts.ApplyMetadata(**meta); !status)
            return std::unexpected(std::move(status.error()));
        if (auto status = mesh->Validate(limits); !status)
            return std::unexpected(std::move(status.error()));
        return mesh;
    }
}
