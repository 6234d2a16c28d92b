module;

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Binding;

import :Errors;
import :Field;
import :PropertyObject;
import :DataArray;
import :Wire;

export namespace Resource
{
    inline constexpr std::string_view kLocationNode = "N";
    inline constexpr std::string_view kLocationCell = "CC";

    // Accepted location tags for data bound to a line mesh.
    [[nodiscard]] std::vector<Choice> LineLocations();

    // Points only know per-node data; every alias maps to N.
    [[nodiscard]] std::vector<Choice> PointLocations();

    // Attaches a DataArray to the nodes (N) or cells (CC) of the owner's mesh.
    // The length rule is checked by the owning composite.
    class DataBinding final : public PropertyObject
    {
    public:
        explicit DataBinding(std::vector<Choice> locations);

        ChoiceField Location;
        DataArray Data;

        [[nodiscard]] bool IsPerNode() const { return Location.HasValue() && Location.Value() == kLocationNode; }

        // {"location": ..., "title": ..., "description": ...}
        [[nodiscard]] nlohmann::json Document() const;

        // As Document(), plus "array": <location>.
        [[nodiscard]] static Result<DataBinding> BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher,
                                                               std::vector<Choice> locations);

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override { return {&Location}; }
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override { return {&Location}; }
        [[nodiscard]] std::vector<PropertyObject*> CollectChildren() override { return {&Data}; }
        [[nodiscard]] std::vector<const PropertyObject*> CollectChildren() const override { return {&Data}; }
    };
}
