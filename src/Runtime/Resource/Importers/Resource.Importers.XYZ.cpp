module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Resource:Importers.XYZ.Impl;
import :Importers.XYZ;
import :ImportRegistry;
import :Errors;
import :Codec;
import :DataArray;
import :Binding;
import :Mesh0D;
import :Point;

namespace Resource
{
    namespace
    {
        static constexpr std::string_view s_Extensions[] = { ".xyz" };
    }

    std::span<const std::string_view> XYZImporter::Extensions() const
    {
        return s_Extensions;
    }

    Result<ImportResult> XYZImporter::Import(
        std::span<const std::byte> data,
        const ImportContext& ctx)
    {
        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        std::istringstream stream{std::string{text}};

        // Column-major: columns[c][row].
        std::vector<std::vector<float>> columns;
        std::string line;
        std::size_t lineNo = 0;

        while (std::getline(stream, line))
        {
            ++lineNo;
            const auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos || line[first] == '#') continue;

            std::istringstream ss(line);
            std::vector<float> row;
            float value;
            while (ss >> value) row.push_back(value);
            if (!ss.eof())
            {
                return MakeError(ResourceError::DecodeError,
                                 std::format("{}:{}: non-numeric value", ctx.SourcePath, lineNo),
                                 std::string(ctx.SourcePath));
            }

            if (columns.empty())
            {
                if (row.size() < 3)
                {
                    Error error;
                    error.Code = ResourceError::ShapeMismatch;
                    error.Message = std::format("{}:{}: rows need at least x y z, got {} values",
                                                ctx.SourcePath, lineNo, row.size());
                    error.Subject = std::string(ctx.SourcePath);
                    error.Index = lineNo;
                    error.Expected = 3;
                    error.Actual = static_cast<std::int64_t>(row.size());
                    return MakeError(std::move(error));
                }
                columns.resize(row.size());
            }
            else if (row.size() != columns.size())
            {
                Error error;
                error.Code = ResourceError::ShapeMismatch;
                error.Message = std::format("{}:{}: row has {} values, expected {}",
                                            ctx.SourcePath, lineNo, row.size(), columns.size());
                error.Subject = std::string(ctx.SourcePath);
                error.Index = lineNo;
                error.Expected = static_cast<std::int64_t>(columns.size());
                error.Actual = static_cast<std::int64_t>(row.size());
                return MakeError(std::move(error));
            }

            for (std::size_t c = 0; c < row.size(); ++c)
                columns[c].push_back(row[c]);
        }

        if (columns.empty())
        {
            return MakeError(ResourceError::DecodeError, std::format("{}: no points found", ctx.SourcePath),
                             std::string(ctx.SourcePath));
        }

        const std::size_t count = columns[0].size();
        FloatArray vertices;
        vertices.Shape = {count, 3};
        vertices.Values.reserve(count * 3);
        for (std::size_t i = 0; i < count; ++i)
        {
            vertices.Values.push_back(columns[0][i]);
            vertices.Values.push_back(columns[1][i]);
            vertices.Values.push_back(columns[2][i]);
        }

        auto mesh = Mesh0D::Create(std::move(vertices));
        if (!mesh) return std::unexpected(std::move(mesh.error()));

        Point result;
        result.Geometry = std::move(*mesh);
        if (auto status = result.SetContent(std::filesystem::path(ctx.SourcePath).stem().string(), {}); !status)
            return std::unexpected(std::move(status.error()));

        for (std::size_t c = 3; c < columns.size(); ++c)
        {
            auto array = DataArray::Create(columns[c], std::format("column{}", c));
            if (!array) return std::unexpected(std::move(array.error()));
            if (auto status = result.AddData(kLocationNode, std::move(*array)); !status)
                return std::unexpected(std::move(status.error()));
        }

        return ImportResult{std::move(result)};
    }
}
