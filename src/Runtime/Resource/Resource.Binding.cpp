module;

#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:Binding.Impl;

import :Binding;
import :Errors;
import :Field;
import :DataArray;
import :Wire;

namespace Resource
{
    std::vector<Choice> LineLocations()
    {
        return {
            {std::string(kLocationCell), {"LINE", "FACE", "CELLCENTER", "EDGE", "SEGMENT"}},
            {std::string(kLocationNode), {"VERTEX", "NODE", "ENDPOINT"}},
        };
    }

    std::vector<Choice> PointLocations()
    {
        return {
            {std::string(kLocationNode), {"NODE", "CELLCENTER", "CC", "VERTEX"}},
        };
    }

    DataBinding::DataBinding(std::vector<Choice> locations) : Location("location", std::move(locations))
    {
    }

    nlohmann::json DataBinding::Document() const
    {
        nlohmann::json doc = Data.Metadata();
        Location.WriteJson(doc);
        return doc;
    }

    Result<DataBinding> DataBinding::BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher,
                                                   std::vector<Choice> locations)
    {
        auto location = RequireString(doc, "location", "data");
        if (!location) return std::unexpected(std::move(location.error()));

        DataBinding binding(std::move(locations));
        if (auto status = binding.Location.Set(*location); !status)
            return std::unexpected(std::move(status.error()));

        auto data = DataArray::BuildFromJson(doc, fetcher);
        if (!data) return std::unexpected(std::move(data.error()));
        binding.Data = std::move(*data);
        return binding;
    }
}
