module;

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module Resource:Codec;

import :Errors;

export namespace Resource
{
    // =========================================================================
    // Binary Array Codec
    // =========================================================================
    //
    // Every array crosses the wire as a flat little-endian buffer with a fixed
    // 4-byte element width. The element kind is fixed per field when the
    // entity schema is declared; the set of kinds is closed (float32, int32).
    //
    // Encoding is deterministic: identical arrays always produce identical
    // bytes, so a forced re-upload of unchanged data is byte-for-byte stable.

    inline constexpr std::size_t kWildcard = std::numeric_limits<std::size_t>::max();
    inline constexpr std::size_t kElementWidth = 4;
    inline constexpr std::size_t kDefaultMaxArrayBytes = 50ull * 1024ull * 1024ull;

    // Declared shape of an array field. kWildcard matches any extent.
    struct ShapeSpec
    {
        std::vector<std::size_t> Dims;

        [[nodiscard]] std::size_t Rank() const noexcept { return Dims.size(); }
        [[nodiscard]] bool Matches(std::span<const std::size_t> shape) const noexcept;
        [[nodiscard]] std::string ToString() const;
    };

    [[nodiscard]] std::string FormatShape(std::span<const std::size_t> shape);

    enum class ElementKind : std::uint8_t
    {
        Float32,
        Int32
    };

    template <class T>
    struct ElementTraits;

    template <>
    struct ElementTraits<float>
    {
        static constexpr ElementKind Kind = ElementKind::Float32;
        static constexpr std::string_view DType = "Float32Array";
    };

    template <>
    struct ElementTraits<std::int32_t>
    {
        static constexpr ElementKind Kind = ElementKind::Int32;
        static constexpr std::string_view DType = "Int32Array";
    };

    template <class T>
    concept ArrayElement = requires {
        { ElementTraits<T>::Kind } -> std::convertible_to<ElementKind>;
    } && sizeof(T) == kElementWidth;

    // Row-major n-dimensional array. Shape[0] is the row count.
    template <ArrayElement T>
    struct Array
    {
        std::vector<T> Values;
        std::vector<std::size_t> Shape;

        [[nodiscard]] std::size_t Rows() const noexcept { return Shape.empty() ? 0 : Shape.front(); }

        [[nodiscard]] std::size_t Columns() const noexcept
        {
            std::size_t columns = 1;
            for (std::size_t i = 1; i < Shape.size(); ++i) columns *= Shape[i];
            return columns;
        }

        // Values must hold exactly prod(Shape) elements.
        [[nodiscard]] bool IsConsistent() const noexcept
        {
            if (Shape.empty()) return Values.empty();
            return Rows() * Columns() == Values.size();
        }

        [[nodiscard]] T At(std::size_t row, std::size_t column) const
        {
            return Values[row * Columns() + column];
        }

        // Content equality on the bit pattern, so NaN payloads and signed zeros
        // compare the way their encodings do.
        [[nodiscard]] friend bool operator==(const Array& lhs, const Array& rhs) noexcept
        {
            return lhs.Shape == rhs.Shape &&
                   std::equal(lhs.Values.begin(), lhs.Values.end(), rhs.Values.begin(), rhs.Values.end(),
                              [](T a, T b) { return std::bit_cast<std::uint32_t>(a) == std::bit_cast<std::uint32_t>(b); });
        }
    };

    using FloatArray = Array<float>;
    using IndexArray = Array<std::int32_t>;

    [[nodiscard]] FloatArray MakeVertexArray(std::span<const glm::vec3> points);
    [[nodiscard]] IndexArray MakeSegmentArray(std::span<const glm::ivec2> segments);
    [[nodiscard]] FloatArray MakeScalarArray(std::span<const float> values);
    [[nodiscard]] glm::vec3 VertexAt(const FloatArray& vertices, std::size_t row);

    // Resolves the concrete shape for a payload of `byteCount` bytes. Fails with
    // DecodeError when the length cannot be reconciled with `shape`.
    [[nodiscard]] Result<std::vector<std::size_t>> ResolveShape(std::size_t byteCount, const ShapeSpec& shape);

    template <ArrayElement T>
    class ArrayCodec
    {
    public:
        [[nodiscard]] static constexpr ElementKind Kind() noexcept { return ElementTraits<T>::Kind; }
        [[nodiscard]] static constexpr std::string_view DType() noexcept { return ElementTraits<T>::DType; }

        [[nodiscard]] static std::size_t ByteSize(const Array<T>& array) noexcept
        {
            return array.Values.size() * kElementWidth;
        }

        [[nodiscard]] static std::vector<std::byte> Encode(const Array<T>& array)
        {
            std::vector<std::byte> bytes(ByteSize(array));
            std::size_t offset = 0;
            for (const T value : array.Values)
            {
                const auto bits = std::bit_cast<std::uint32_t>(value);
                bytes[offset + 0] = static_cast<std::byte>(bits & 0xFFu);
                bytes[offset + 1] = static_cast<std::byte>((bits >> 8) & 0xFFu);
                bytes[offset + 2] = static_cast<std::byte>((bits >> 16) & 0xFFu);
                bytes[offset + 3] = static_cast<std::byte>((bits >> 24) & 0xFFu);
                offset += kElementWidth;
            }
            return bytes;
        }

        [[nodiscard]] static Result<Array<T>> Decode(std::span<const std::byte> bytes, const ShapeSpec& shape)
        {
            auto resolved = ResolveShape(bytes.size(), shape);
            if (!resolved) return std::unexpected(std::move(resolved.error()));

            Array<T> array;
            array.Shape = std::move(*resolved);
            array.Values.resize(bytes.size() / kElementWidth);
            for (std::size_t i = 0; i < array.Values.size(); ++i)
            {
                const std::size_t offset = i * kElementWidth;
                const std::uint32_t bits = std::to_integer<std::uint32_t>(bytes[offset]) |
                                           (std::to_integer<std::uint32_t>(bytes[offset + 1]) << 8) |
                                           (std::to_integer<std::uint32_t>(bytes[offset + 2]) << 16) |
                                           (std::to_integer<std::uint32_t>(bytes[offset + 3]) << 24);
                array.Values[i] = std::bit_cast<T>(bits);
            }
            return array;
        }
    };

    // Size policy applied before any upload.
    struct Limits
    {
        std::size_t MaxArrayBytes{kDefaultMaxArrayBytes};
    };

    // PayloadTooLarge when byteSize exceeds the per-array limit.
    [[nodiscard]] Status CheckPayloadSize(std::string_view arrayName, std::size_t byteSize, const Limits& limits);
}
