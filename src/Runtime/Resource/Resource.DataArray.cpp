module;

#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:DataArray.Impl;

import :DataArray;
import :Errors;
import :Codec;
import :Field;
import :Wire;

namespace Resource
{
    std::vector<FieldBase*> DataArray::CollectFields()
    {
        auto fields = UserContent::CollectFields();
        fields.push_back(&Values);
        return fields;
    }

    std::vector<const FieldBase*> DataArray::CollectFields() const
    {
        auto fields = UserContent::CollectFields();
        fields.push_back(&Values);
        return fields;
    }

    Status DataArray::ValidateInvariants(const Limits& limits) const
    {
        return Values.CheckSize(limits);
    }

    Result<DataArray> DataArray::Create(std::span<const float> values, std::string title, std::string description)
    {
        DataArray data;
        if (auto status = data.Values.Set(MakeScalarArray(values)); !status)
            return std::unexpected(std::move(status.error()));
        if (auto status = data.SetContent(std::move(title), std::move(description)); !status)
            return std::unexpected(std::move(status.error()));
        return data;
    }

    Result<DataArray> DataArray::BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher)
    {
        auto array = FetchArray<float>(fetcher, doc, "array", ShapeSpec{{kWildcard}}, "data");
        if (!array) return std::unexpected(std::move(array.error()));

        DataArray data;
        if (auto status = data.Values.Set(std::move(*array)); !status)
            return std::unexpected(std::move(status.error()));

        auto title = OptionalString(doc, "title", "data");
        if (!title) return std::unexpected(std::move(title.error()));
        auto description = OptionalString(doc, "description", "data");
        if (!description) return std::unexpected(std::move(description.error()));

        if (auto status = data.SetContent(std::move(*title), std::move(*description)); !status)
            return std::unexpected(std::move(status.error()));
        return data;
    }
}
