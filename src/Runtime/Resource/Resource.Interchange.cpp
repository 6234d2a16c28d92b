module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

module Resource:Interchange.Impl;

import :Interchange;
import :Errors;
import :Codec;
import :Mesh0D;
import :Mesh1D;
import :Wire;

namespace Resource
{
    namespace
    {
        FloatArray ShiftedVertices(const std::vector<glm::dvec3>& vertices, const glm::dvec3& offset)
        {
            FloatArray array;
            array.Shape = {vertices.size(), 3};
            array.Values.reserve(vertices.size() * 3);
            for (const glm::dvec3& v : vertices)
            {
                const glm::dvec3 p = v + offset;
                array.Values.push_back(static_cast<float>(p.x));
                array.Values.push_back(static_cast<float>(p.y));
                array.Values.push_back(static_cast<float>(p.z));
            }
            return array;
        }

        Result<glm::dvec3> ReadVec3(const nlohmann::json& value, std::string_view context)
        {
            if (!value.is_array() || value.size() != 3 ||
                !value[0].is_number() || !value[1].is_number() || !value[2].is_number())
            {
                return MakeError(ResourceError::MalformedDocument,
                                 std::format("{}: expected a 3-component numeric array", context));
            }
            return glm::dvec3(value[0].get<double>(), value[1].get<double>(), value[2].get<double>());
        }

        Result<std::vector<glm::dvec3>> ReadVertexRows(const nlohmann::json& doc, std::string_view context)
        {
            auto holder = RequireObject(doc, "vertices", context);
            if (!holder) return std::unexpected(std::move(holder.error()));
            auto rows = RequireArray(**holder, "array", "vertices");
            if (!rows) return std::unexpected(std::move(rows.error()));

            std::vector<glm::dvec3> vertices;
            vertices.reserve((*rows)->size());
            for (const nlohmann::json& row : **rows)
            {
                auto v = ReadVec3(row, "vertices.array");
                if (!v) return std::unexpected(std::move(v.error()));
                vertices.push_back(*v);
            }
            return vertices;
        }

        Result<glm::dvec3> ReadOrigin(const nlohmann::json& doc, std::string_view context)
        {
            auto it = doc.find("origin");
            if (it == doc.end() || it->is_null()) return glm::dvec3(0.0);
            return ReadVec3(*it, std::format("{}.origin", context));
        }
    }

    Result<Mesh1D> ImportMesh1D(const InterchangeLineSet& geometry, const InterchangeProject& project)
    {
        IndexArray segments;
        segments.Shape = {geometry.Segments.size(), 2};
        segments.Values.reserve(geometry.Segments.size() * 2);

        for (std::size_t row = 0; row < geometry.Segments.size(); ++row)
        {
            const auto& segment = geometry.Segments[row];
            if (segment.size() != 2)
            {
                Error error;
                error.Code = ResourceError::ShapeMismatch;
                error.Message = std::format("segment {} has {} indices; segments must be pairwise", row,
                                            segment.size());
                error.Subject = "segments";
                error.Index = row;
                error.Expected = 2;
                error.Actual = static_cast<std::int64_t>(segment.size());
                return MakeError(std::move(error));
            }

            for (const std::int64_t index : segment)
            {
                if (index < std::numeric_limits<std::int32_t>::min() || index > std::numeric_limits<std::int32_t>::max())
                {
                    Error error;
                    error.Code = ResourceError::KindMismatch;
                    error.Message = std::format("segment {} index {} is not representable as int32", row, index);
                    error.Subject = "segments";
                    error.Index = row;
                    error.Actual = index;
                    return MakeError(std::move(error));
                }
                segments.Values.push_back(static_cast<std::int32_t>(index));
            }
        }

        return Mesh1D::Create(ShiftedVertices(geometry.Vertices, geometry.Origin + project.Origin),
                              std::move(segments));
    }

    Result<Mesh0D> ImportMesh0D(const InterchangePointSet& geometry, const InterchangeProject& project)
    {
        return Mesh0D::Create(ShiftedVertices(geometry.Vertices, geometry.Origin + project.Origin));
    }

    Result<InterchangeLineSet> ReadInterchangeLineSet(const nlohmann::json& doc)
    {
        InterchangeLineSet geometry;

        auto vertices = ReadVertexRows(doc, "lineset");
        if (!vertices) return std::unexpected(std::move(vertices.error()));
        geometry.Vertices = std::move(*vertices);

        auto holder = RequireObject(doc, "segments", "lineset");
        if (!holder) return std::unexpected(std::move(holder.error()));
        auto rows = RequireArray(**holder, "array", "segments");
        if (!rows) return std::unexpected(std::move(rows.error()));

        for (const nlohmann::json& row : **rows)
        {
            if (!row.is_array())
                return MakeError(ResourceError::MalformedDocument, "segments.array: each row must be an array");

            std::vector<std::int64_t> segment;
            for (const nlohmann::json& index : row)
            {
                if (!index.is_number_integer())
                    return MakeError(ResourceError::KindMismatch, "segments.array: indices must be integers",
                                     "segments");
                if (index.is_number_unsigned() &&
                    index.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                    return MakeError(ResourceError::KindMismatch,
                                     "segments.array: index is not representable as int32", "segments");
                segment.push_back(index.get<std::int64_t>());
            }
            geometry.Segments.push_back(std::move(segment));
        }

        auto origin = ReadOrigin(doc, "lineset");
        if (!origin) return std::unexpected(std::move(origin.error()));
        geometry.Origin = *origin;
        return geometry;
    }

    Result<InterchangePointSet> ReadInterchangePointSet(const nlohmann::json& doc)
    {
        InterchangePointSet geometry;

        auto vertices = ReadVertexRows(doc, "pointset");
        if (!vertices) return std::unexpected(std::move(vertices.error()));
        geometry.Vertices = std::move(*vertices);

        auto origin = ReadOrigin(doc, "pointset");
        if (!origin) return std::unexpected(std::move(origin.error()));
        geometry.Origin = *origin;
        return geometry;
    }

    Result<InterchangeProject> ReadInterchangeProject(const nlohmann::json& doc)
    {
        if (!doc.is_object())
            return MakeError(ResourceError::MalformedDocument, "project: expected an object");

        auto origin = ReadOrigin(doc, "project");
        if (!origin) return std::unexpected(std::move(origin.error()));
        return InterchangeProject{*origin};
    }
}
