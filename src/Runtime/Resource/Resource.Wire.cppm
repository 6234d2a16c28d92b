module;

#include <cstddef>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Wire;

import :Errors;
import :Codec;

export namespace Resource
{
    // --- Wire format ---------------------------------------------------------
    // Resource documents are JSON. Array payloads never travel inline: the
    // document carries a location string per array and the bytes are fetched
    // separately through an IArrayFetcher.

    inline constexpr std::string_view kTypeLine = "line";
    inline constexpr std::string_view kTypePoint = "point";
    inline constexpr std::string_view kTypeMesh1D = "mesh1d";
    inline constexpr std::string_view kTypeMesh0D = "mesh0d";

    // Resolves an array location to its raw bytes. Implemented by transports.
    class IArrayFetcher
    {
    public:
        virtual ~IArrayFetcher() = default;

        [[nodiscard]] virtual Result<std::vector<std::byte>> Fetch(std::string_view location) = 0;
    };

    // MalformedDocument unless `doc` is an object holding `key`.
    [[nodiscard]] Result<const nlohmann::json*> RequireMember(const nlohmann::json& doc, std::string_view key,
                                                              std::string_view context);
    [[nodiscard]] Result<std::string> RequireString(const nlohmann::json& doc, std::string_view key,
                                                    std::string_view context);
    [[nodiscard]] Result<const nlohmann::json*> RequireObject(const nlohmann::json& doc, std::string_view key,
                                                              std::string_view context);
    [[nodiscard]] Result<const nlohmann::json*> RequireArray(const nlohmann::json& doc, std::string_view key,
                                                             std::string_view context);

    // Empty string when the key is absent or null; MalformedDocument when it is not a string.
    [[nodiscard]] Result<std::string> OptionalString(const nlohmann::json& doc, std::string_view key,
                                                     std::string_view context);

    // Reads the location stored under `key`, fetches it and decodes it against `shape`.
    template <ArrayElement T>
    [[nodiscard]] Result<Array<T>> FetchArray(IArrayFetcher& fetcher, const nlohmann::json& doc, std::string_view key,
                                              const ShapeSpec& shape, std::string_view context)
    {
        auto location = RequireString(doc, key, context);
        if (!location) return std::unexpected(std::move(location.error()));

        auto bytes = fetcher.Fetch(*location);
        if (!bytes) return std::unexpected(std::move(bytes.error()));

        auto array = ArrayCodec<T>::Decode(std::span<const std::byte>(*bytes), shape);
        if (!array)
        {
            Error error = std::move(array.error());
            error.Message = std::format("{}.{}: {}", context, key, error.Message);
            error.Subject = std::string(key);
            return std::unexpected(std::move(error));
        }
        return array;
    }
}
