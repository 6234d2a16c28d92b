module;

#include <cstddef>
#include <string_view>

#include <nlohmann/json.hpp>

export module Resource:Mesh;

import :PropertyObject;
import :Options;

export namespace Resource
{
    // Spatial part of a composite resource. Concrete meshes own their
    // geometry arrays and an options object.
    class Mesh : public UserContent
    {
    public:
        [[nodiscard]] virtual std::string_view TypeName() const noexcept = 0;
        [[nodiscard]] virtual std::size_t NodeCount() const noexcept = 0;
        [[nodiscard]] virtual std::size_t CellCount() const noexcept = 0;
        [[nodiscard]] virtual const Options& MeshOptions() const noexcept = 0;

        // {"type", "title", "description", "meta"} without array locations.
        [[nodiscard]] nlohmann::json Document() const
        {
            nlohmann::json doc = Metadata();
            doc["type"] = TypeName();
            doc["meta"] = MeshOptions().Metadata();
            return doc;
        }
    };
}
