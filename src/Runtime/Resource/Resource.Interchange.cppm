module;

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

export module Resource:Interchange;

import :Errors;
import :Mesh0D;
import :Mesh1D;

export namespace Resource
{
    // --- Foreign interchange geometry ---------------------------------------
    // Geometry objects from a project-based interchange container. Vertex
    // positions are relative to the geometry origin, which is itself relative
    // to the project origin.

    struct InterchangeProject
    {
        glm::dvec3 Origin{0.0};
    };

    struct InterchangeLineSet
    {
        std::vector<glm::dvec3> Vertices;
        std::vector<std::vector<std::int64_t>> Segments;
        glm::dvec3 Origin{0.0};
    };

    struct InterchangePointSet
    {
        std::vector<glm::dvec3> Vertices;
        glm::dvec3 Origin{0.0};
    };

    // Vertices are shifted by both origins. Segments must be pairwise
    // (ShapeMismatch) and representable as int32 (KindMismatch).
    [[nodiscard]] Result<Mesh1D> ImportMesh1D(const InterchangeLineSet& geometry, const InterchangeProject& project);
    [[nodiscard]] Result<Mesh0D> ImportMesh0D(const InterchangePointSet& geometry, const InterchangeProject& project);

    // JSON form: {"vertices": {"array": [[x,y,z], ...]}, "segments": {"array": [[a,b], ...]},
    // "origin": [x,y,z]}. "origin" is optional.
    [[nodiscard]] Result<InterchangeLineSet> ReadInterchangeLineSet(const nlohmann::json& doc);
    [[nodiscard]] Result<InterchangePointSet> ReadInterchangePointSet(const nlohmann::json& doc);
    [[nodiscard]] Result<InterchangeProject> ReadInterchangeProject(const nlohmann::json& doc);
}
