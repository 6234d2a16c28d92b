module;

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Resource:Codec.Impl;

import :Codec;
import :Errors;

namespace Resource
{
    bool ShapeSpec::Matches(std::span<const std::size_t> shape) const noexcept
    {
        if (shape.size() != Dims.size()) return false;
        for (std::size_t i = 0; i < Dims.size(); ++i)
        {
            if (Dims[i] != kWildcard && Dims[i] != shape[i]) return false;
        }
        return true;
    }

    std::string ShapeSpec::ToString() const
    {
        std::string out = "(";
        for (std::size_t i = 0; i < Dims.size(); ++i)
        {
            if (i > 0) out += ", ";
            out += Dims[i] == kWildcard ? std::string("*") : std::to_string(Dims[i]);
        }
        out += ")";
        return out;
    }

    std::string FormatShape(std::span<const std::size_t> shape)
    {
        std::string out = "(";
        for (std::size_t i = 0; i < shape.size(); ++i)
        {
            if (i > 0) out += ", ";
            out += std::to_string(shape[i]);
        }
        out += ")";
        return out;
    }

    FloatArray MakeVertexArray(std::span<const glm::vec3> points)
    {
        FloatArray array;
        array.Shape = {points.size(), 3};
        array.Values.reserve(points.size() * 3);
        for (const glm::vec3& p : points)
        {
            array.Values.push_back(p.x);
            array.Values.push_back(p.y);
            array.Values.push_back(p.z);
        }
        return array;
    }

    IndexArray MakeSegmentArray(std::span<const glm::ivec2> segments)
    {
        IndexArray array;
        array.Shape = {segments.size(), 2};
        array.Values.reserve(segments.size() * 2);
        for (const glm::ivec2& s : segments)
        {
            array.Values.push_back(static_cast<std::int32_t>(s.x));
            array.Values.push_back(static_cast<std::int32_t>(s.y));
        }
        return array;
    }

    FloatArray MakeScalarArray(std::span<const float> values)
    {
        FloatArray array;
        array.Shape = {values.size()};
        array.Values.assign(values.begin(), values.end());
        return array;
    }

    glm::vec3 VertexAt(const FloatArray& vertices, std::size_t row)
    {
        return {vertices.At(row, 0), vertices.At(row, 1), vertices.At(row, 2)};
    }

    Result<std::vector<std::size_t>> ResolveShape(std::size_t byteCount, const ShapeSpec& shape)
    {
        if (byteCount % kElementWidth != 0)
        {
            Error error;
            error.Code = ResourceError::DecodeError;
            error.Message = std::format("payload of {} bytes is not a multiple of the {}-byte element width",
                                        byteCount, kElementWidth);
            error.Actual = static_cast<std::int64_t>(byteCount);
            return MakeError(std::move(error));
        }

        if (shape.Rank() == 0)
            return MakeError(ResourceError::DecodeError, "cannot decode into a rank-0 shape");

        std::size_t fixed = 1;
        std::size_t wildcardAxis = kWildcard;
        for (std::size_t i = 0; i < shape.Dims.size(); ++i)
        {
            if (shape.Dims[i] == kWildcard)
            {
                if (wildcardAxis != kWildcard)
                    return MakeError(ResourceError::DecodeError,
                                     std::format("shape {} has more than one wildcard extent", shape.ToString()));
                wildcardAxis = i;
                continue;
            }
            fixed *= shape.Dims[i];
        }

        const std::size_t count = byteCount / kElementWidth;
        std::vector<std::size_t> resolved = shape.Dims;

        if (wildcardAxis == kWildcard)
        {
            if (count != fixed)
            {
                Error error;
                error.Code = ResourceError::DecodeError;
                error.Message = std::format("payload of {} bytes does not match shape {} ({} bytes expected)",
                                            byteCount, shape.ToString(), fixed * kElementWidth);
                error.Expected = static_cast<std::int64_t>(fixed * kElementWidth);
                error.Actual = static_cast<std::int64_t>(byteCount);
                return MakeError(std::move(error));
            }
            return resolved;
        }

        if (fixed == 0 || count % fixed != 0)
        {
            if (fixed == 0 && count == 0)
            {
                resolved[wildcardAxis] = 0;
                return resolved;
            }

            Error error;
            error.Code = ResourceError::DecodeError;
            error.Message = std::format("payload of {} bytes cannot be split into rows of shape {}",
                                        byteCount, shape.ToString());
            error.Actual = static_cast<std::int64_t>(byteCount);
            return MakeError(std::move(error));
        }

        resolved[wildcardAxis] = count / fixed;
        return resolved;
    }

    Status CheckPayloadSize(std::string_view arrayName, std::size_t byteSize, const Limits& limits)
    {
        if (byteSize <= limits.MaxArrayBytes) return {};

        Error error;
        error.Code = ResourceError::PayloadTooLarge;
        error.Message = std::format("array '{}' encodes to {} bytes, exceeding the {} byte limit",
                                    arrayName, byteSize, limits.MaxArrayBytes);
        error.Subject = std::string(arrayName);
        error.Expected = static_cast<std::int64_t>(limits.MaxArrayBytes);
        error.Actual = static_cast<std::int64_t>(byteSize);
        return MakeError(std::move(error));
    }
}
