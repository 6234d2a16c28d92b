module;

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Point;

import :Errors;
import :Codec;
import :Field;
import :Options;
import :Mesh;
import :Mesh0D;
import :Binding;
import :Composite;
import :Wire;

export namespace Resource
{
    // Point set: a Mesh0D with per-node data.
    class Point final : public CompositeResource
    {
    public:
        Mesh0D Geometry;
        PointOptions Opts;

        [[nodiscard]] std::string_view TypeName() const noexcept override { return kTypePoint; }
        [[nodiscard]] const Mesh& GetMesh() const noexcept override { return Geometry; }
        [[nodiscard]] const Options& GetOptions() const noexcept override { return Opts; }
        [[nodiscard]] std::vector<Choice> Locations() const override { return PointLocations(); }

        [[nodiscard]] static Result<Point> BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher,
                                                         const Limits& limits = {});

    protected:
        [[nodiscard]] Mesh& MutableMesh() noexcept override { return Geometry; }
        [[nodiscard]] Options& MutableOptions() noexcept override { return Opts; }
    };
}
