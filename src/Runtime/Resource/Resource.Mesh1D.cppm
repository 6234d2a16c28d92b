module;

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Mesh1D;

import :Errors;
import :Codec;
import :Field;
import :PropertyObject;
import :Options;
import :Wire;
import :Mesh;

export namespace Resource
{
    // Line-segment mesh: vertices (n x 3, float32) joined by segments
    // (m x 2, int32 vertex indices).
    class Mesh1D final : public Mesh
    {
    public:
        ArrayField<float> Vertices{"vertices", ShapeSpec{{kWildcard, 3}}};
        ArrayField<std::int32_t> Segments{"segments", ShapeSpec{{kWildcard, 2}}};
        Mesh1DOptions Opts;

        [[nodiscard]] std::string_view TypeName() const noexcept override { return kTypeMesh1D; }
        [[nodiscard]] std::size_t NodeCount() const noexcept override { return Vertices.Rows(); }
        [[nodiscard]] std::size_t CellCount() const noexcept override { return Segments.Rows(); }
        [[nodiscard]] const Options& MeshOptions() const noexcept override { return Opts; }

        [[nodiscard]] static Result<Mesh1D> Create(FloatArray vertices, IndexArray segments);

        // `doc` is {"vertices": <location>, "segments": <location>, "meta": {...}}.
        // The result is validated against `limits` before it is returned.
        [[nodiscard]] static Result<Mesh1D> BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher,
                                                          std::string title = {}, std::string description = {},
                                                          const Limits& limits = {});

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override;
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override;
        [[nodiscard]] std::vector<PropertyObject*> CollectChildren() override { return {&Opts}; }
        [[nodiscard]] std::vector<const PropertyObject*> CollectChildren() const override { return {&Opts}; }

        // Connectivity bounds first, then the per-array size limit.
        [[nodiscard]] Status ValidateInvariants(const Limits& limits) const override;
    };

    // InvalidConnectivity for the first segment index that is negative or
    // not below `nodeCount`.
    [[nodiscard]] Status CheckConnectivity(const IndexArray& segments, std::size_t nodeCount);
}
