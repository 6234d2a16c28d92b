module;

#include <expected>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

module Resource:Point.Impl;

import :Point;
import :Errors;
import :Mesh0D;
import :Wire;

namespace Resource
{
    Result<Point> Point::BuildFromJson(const nlohmann::json& doc, IArrayFetcher& fetcher, const Limits& limits)
    {
        auto meshDoc = RequireObject(doc, "mesh", "point");
        if (!meshDoc) return std::unexpected(std::move(meshDoc.error()));

        auto title = OptionalString(**meshDoc, "title", "mesh");
        if (!title) return std::unexpected(std::move(title.error()));
        auto description = OptionalString(**meshDoc, "description", "mesh");
        if (!description) return std::unexpected(std::move(description.error()));

        auto mesh = Mesh0D::BuildFromJson(**meshDoc, fetcher, std::move(*title), std::move(*description), limits);
        if (!mesh) return std::unexpected(std::move(mesh.error()));

        Point point;
        point.Geometry = std::move(*mesh);
        if (auto status = point.ReadDocument(doc, fetcher); !status)
            return std::unexpected(std::move(status.error()));
        if (auto status = point.Validate(limits); !status)
            return std::unexpected(std::move(status.error()));
        return point;
    }
}
