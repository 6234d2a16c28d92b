module;

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:DataArray;

import :Errors;
import :Codec;
import :Field;
import :PropertyObject;
import :Wire;

export namespace Resource
{
    // One scalar value per node or per cell, depending on how it is bound.
    class DataArray final : public UserContent
    {
    public:
        ArrayField<float> Values{"array", ShapeSpec{{kWildcard}}};

        [[nodiscard]] std::size_t Length() const noexcept { return Values.Rows(); }

        [[nodiscard]] static Result<DataArray> Create(std::span<const float> values, std::string title = {},
                                                      std::string description = {});

        // `doc` is {"array": <location>, "title": ..., "description": ...}.
        [[nodiscard]] static Result<DataArray> BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher);

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override;
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override;
        [[nodiscard]] Status ValidateInvariants(const Limits& limits) const override;
    };
}
