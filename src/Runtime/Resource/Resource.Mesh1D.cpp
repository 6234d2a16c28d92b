module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:Mesh1D.Impl;

import :Mesh1D;
import :Errors;
import :Codec;
import :Field;
import :Wire;

namespace Resource
{
    Status CheckConnectivity(const IndexArray& segments, std::size_t nodeCount)
    {
        const std::size_t columns = segments.Columns();
        for (std::size_t i = 0; i < segments.Values.size(); ++i)
        {
            const std::int32_t index = segments.Values[i];
            const std::size_t row = columns == 0 ? 0 : i / columns;

            if (index < 0)
            {
                Error error;
                error.Code = ResourceError::InvalidConnectivity;
                error.Fault = ConnectivityFault::NegativeIndex;
                error.Message = std::format("segment {} has negative vertex index {}", row, index);
                error.Subject = "segments";
                error.Index = row;
                error.Expected = 0;
                error.Actual = index;
                return MakeError(std::move(error));
            }

            if (static_cast<std::size_t>(index) >= nodeCount)
            {
                Error error;
                error.Code = ResourceError::InvalidConnectivity;
                error.Fault = ConnectivityFault::IndexOutOfRange;
                error.Message = std::format("segment {} references vertex {} but the mesh has {} vertices ({} >= {})",
                                            row, index, nodeCount, index, nodeCount);
                error.Subject = "segments";
                error.Index = row;
                error.Expected = static_cast<std::int64_t>(nodeCount);
                error.Actual = index;
                return MakeError(std::move(error));
            }
        }
        return {};
    }

    std::vector<FieldBase*> Mesh1D::CollectFields()
    {
        auto fields = UserContent::CollectFields();
        fields.push_back(&Vertices);
        fields.push_back(&Segments);
        return fields;
    }

    std::vector<const FieldBase*> Mesh1D::CollectFields() const
    {
        auto fields = UserContent::CollectFields();
        fields.push_back(&Vertices);
        fields.push_back(&Segments);
        return fields;
    }

    Status Mesh1D::ValidateInvariants(const Limits& limits) const
    {
        if (auto status = CheckConnectivity(Segments.Value(), NodeCount()); !status)
            return status;
        if (auto status = Segments.CheckSize(limits); !status)
            return status;
        return Vertices.CheckSize(limits);
    }

    Result<Mesh1D> Mesh1D::Create(FloatArray vertices, IndexArray segments)
    {
        Mesh1D mesh;
        if (auto status = mesh.Vertices.Set(std::move(vertices)); !status)
            return std::unexpected(std::move(status.error()));
        if (auto status = mesh.Segments.Set(std::move(segments)); !status)
            return std::unexpected(std::move(status.error()));
        return mesh;
    }

    Result<Mesh1D> Mesh1D::BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher, std::string title,
                                         std::string description, const Limits& limits)
    {
        auto meta = RequireObject(doc, "meta", "mesh");
        if (!meta) return std::unexpected(std::move(meta.error()));

        auto vertices = FetchArray<float>(fetcher, doc, "vertices", ShapeSpec{{kWildcard, 3}}, "mesh");
        if (!vertices) return std::unexpected(std::move(vertices.error()));

        auto segments = FetchArray<std::int32_t>(fetcher, doc, "segments", ShapeSpec{{kWildcard, 2}}, "mesh");
        if (!segments) return std::unexpected(std::move(segments.error()));

        auto mesh = Create(std::move(*vertices), std::move(*segments));
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
