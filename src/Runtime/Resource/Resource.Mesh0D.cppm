module;

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Mesh0D;

import :Errors;
import :Codec;
import :Field;
import :PropertyObject;
import :Options;
import :Wire;
import :Mesh;

export namespace Resource
{
    // Point-set mesh. Every vertex is both a node and a cell.
    class Mesh0D final : public Mesh
    {
    public:
        ArrayField<float> Vertices{"vertices", ShapeSpec{{kWildcard, 3}}};
        Options Opts;

        [[nodiscard]] std::string_view TypeName() const noexcept override { return kTypeMesh0D; }
        [[nodiscard]] std::size_t NodeCount() const noexcept override { return Vertices.Rows(); }
        [[nodiscard]] std::size_t CellCount() const noexcept override { return Vertices.Rows(); }
        [[nodiscard]] const Options& MeshOptions() const noexcept override { return Opts; }

        [[nodiscard]] static Result<Mesh0D> Create(FloatArray vertices);

        // `doc` is {"vertices": <location>, "meta": {...}}.
        [[nodiscard]] static Result<Mesh0D> BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher,
                                                          std::string title = {}, std::string description = {},
                                                          const Limits& limits = {});

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override;
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override;
        [[nodiscard]] std::vector<PropertyObject*> CollectChildren() override { return {&Opts}; }
        [[nodiscard]] std::vector<const PropertyObject*> CollectChildren() const override { return {&Opts}; }
        [[nodiscard]] Status ValidateInvariants(const Limits& limits) const override
        {
            return Vertices.CheckSize(limits);
        }
    };
}
