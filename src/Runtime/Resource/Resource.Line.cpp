module;

#include <expected>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

module Resource:Line.Impl;

import :Line;
import :Errors;
import :Mesh1D;
import :Wire;

namespace Resource
{
    Result<Line> Line::BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher, const Limits& limits)
    {
        auto meshDoc = RequireObject(doc, "mesh", "line");
        if (!meshDoc) return std::unexpected(std::move(meshDoc.error()));

        auto title = OptionalString(**meshDoc, "title", "mesh");
        if (!title) return std::unexpected(std::move(title.error()));
        auto description = OptionalString(**meshDoc, "description", "mesh");
        if (!description) return std::unexpected(std::move(description.error()));

        auto mesh = Mesh1D::BuildFromJson(**meshDoc, fetcher, std::move(*title), std::move(*description), limits);
        if (!mesh) return std::unexpected(std::move(mesh.error()));

        Line line;
        line.Geometry = std::move(*mesh);
        if (auto status = line.ReadDocument(doc, fetcher); !status)
            return std::unexpected(std::move(status.error()));
        if (auto status = line.Validate(limits); !status)
            return std::unexpected(std::move(status.error()));
        return line;
    }
}
