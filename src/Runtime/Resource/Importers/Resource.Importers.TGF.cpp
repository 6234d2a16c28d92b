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
#include <unordered_map>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Resource:Importers.TGF.Impl;
import :Importers.TGF;
import :ImportRegistry;
import :Errors;
import :Codec;
import :Mesh1D;
import :Line;

namespace Resource
{
    namespace
    {
        static constexpr std::string_view s_Extensions[] = { ".tgf" };

        std::unexpected<Error> ParseError(ResourceError code, const ImportContext& ctx, std::size_t lineNo,
                                          std::string_view problem)
        {
            Error error;
            error.Code = code;
            error.Message = std::format("{}:{}: {}", ctx.SourcePath, lineNo, problem);
            error.Subject = std::string(ctx.SourcePath);
            error.Index = lineNo;
            return MakeError(std::move(error));
        }
    }

    std::span<const std::string_view> TGFImporter::Extensions() const
    {
        return s_Extensions;
    }

    Result<ImportResult> TGFImporter::Import(
        std::span<const std::byte> data,
        const ImportContext& ctx)
    {
        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        std::istringstream stream{std::string{text}};

        std::vector<glm::vec3> positions;
        std::vector<glm::ivec2> edges;
        std::unordered_map<std::int64_t, std::int32_t> idMap;
        bool parsingEdges = false;
        std::string line;
        std::size_t lineNo = 0;

        while (std::getline(stream, line))
        {
            ++lineNo;
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            if (line[line.find_first_not_of(" \t")] == '#')
            {
                parsingEdges = true;
                continue;
            }

            std::istringstream ss(line);
            if (!parsingEdges)
            {
                std::int64_t id;
                if (!(ss >> id))
                    return ParseError(ResourceError::DecodeError, ctx, lineNo, "expected a node id");
                if (idMap.contains(id))
                    return ParseError(ResourceError::DecodeError, ctx, lineNo, std::format("duplicate node id {}", id));

                // Anything after the id that is not three coordinates is a label.
                glm::vec3 p{0.0f};
                if (!(ss >> p.x >> p.y >> p.z)) p = glm::vec3(0.0f);

                idMap[id] = static_cast<std::int32_t>(positions.size());
                positions.push_back(p);
            }
            else
            {
                std::int64_t from, to;
                if (!(ss >> from >> to))
                    return ParseError(ResourceError::ShapeMismatch, ctx, lineNo, "edges must name exactly two nodes");

                auto fromIt = idMap.find(from);
                auto toIt = idMap.find(to);
                if (fromIt == idMap.end() || toIt == idMap.end())
                {
                    return ParseError(ResourceError::ShapeMismatch, ctx, lineNo,
                                      std::format("edge {} -> {} references an undeclared node",
                                                  from, to));
                }
                edges.emplace_back(fromIt->second, toIt->second);
            }
        }

        if (positions.empty())
            return ParseError(ResourceError::DecodeError, ctx, lineNo, "no nodes declared");

        auto mesh = Mesh1D::Create(MakeVertexArray(positions), MakeSegmentArray(edges));
        if (!mesh) return std::unexpected(std::move(mesh.error()));

        Line result;
        result.Geometry = std::move(*mesh);
        if (auto status = result.SetContent(std::filesystem::path(ctx.SourcePath).stem().string(), {}); !status)
            return std::unexpected(std::move(status.error()));
        return ImportResult{std::move(result)};
    }
}
