module;

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Line;

import :Errors;
import :Codec;
import :Field;
import :Options;
import :Mesh;
import :Mesh1D;
import :Binding;
import :Composite;
import :Wire;

export namespace Resource
{
    // Line set: a Mesh1D with per-node or per-segment data.
    class Line final : public CompositeResource
    {
    public:
        Mesh1D Geometry;
        LineOptions Opts;

        [[nodiscard]] std::string_view TypeName() const noexcept override { return kTypeLine; }
        [[nodiscard]] const Mesh& GetMesh() const noexcept override { return Geometry; }
        [[nodiscard]] const Options& GetOptions() const noexcept override { return Opts; }
        [[nodiscard]] std::vector<Choice> Locations() const override { return LineLocations(); }

        // Rebuilds a line from a download document; array locations are
        // resolved through `fetcher`. The result is validated.
        [[nodiscard]] static Result<Line> BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher,
                                                        const Limits& limits = {});

    protected:
        [[nodiscard]] Mesh& MutableMesh() noexcept override { return Geometry; }
        [[nodiscard]] Options& MutableOptions() noexcept override { return Opts; }
    };
}
