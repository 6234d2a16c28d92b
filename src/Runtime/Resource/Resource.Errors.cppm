module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

export module Resource:Errors;

export namespace Resource
{
    enum class ResourceError : std::uint32_t
    {
        ShapeMismatch,
        KindMismatch,
        MissingRequired,
        InvalidConnectivity,
        PayloadTooLarge,
        DataLengthMismatch,
        DecodeError,
        MalformedDocument,
        TransportFailed
    };

    [[nodiscard]] constexpr std::string_view ResourceErrorToString(ResourceError e) noexcept
    {
        switch (e)
        {
            case ResourceError::ShapeMismatch:       return "ShapeMismatch";
            case ResourceError::KindMismatch:        return "KindMismatch";
            case ResourceError::MissingRequired:     return "MissingRequired";
            case ResourceError::InvalidConnectivity: return "InvalidConnectivity";
            case ResourceError::PayloadTooLarge:     return "PayloadTooLarge";
            case ResourceError::DataLengthMismatch:  return "DataLengthMismatch";
            case ResourceError::DecodeError:         return "DecodeError";
            case ResourceError::MalformedDocument:   return "MalformedDocument";
            case ResourceError::TransportFailed:     return "TransportFailed";
            default:                                 return "Unknown";
        }
    }

    // Sub-case of InvalidConnectivity.
    enum class ConnectivityFault : std::uint8_t
    {
        None,
        NegativeIndex,
        IndexOutOfRange
    };

    struct Error
    {
        ResourceError Code{ResourceError::ShapeMismatch};
        std::string Message;

        // Field, array identifier or location tag the error refers to.
        std::string Subject;

        // Row of the offending segment, or index of the offending data binding.
        std::optional<std::size_t> Index;

        // Meaning depends on Code: bound/actual index, limit/size in bytes,
        // expected/actual array length.
        std::int64_t Expected{0};
        std::int64_t Actual{0};

        ConnectivityFault Fault{ConnectivityFault::None};
    };

    template <class T>
    using Result = std::expected<T, Error>;

    using Status = std::expected<void, Error>;

    [[nodiscard]] inline std::unexpected<Error> MakeError(ResourceError code, std::string message,
                                                          std::string subject = {})
    {
        Error error;
        error.Code = code;
        error.Message = std::move(message);
        error.Subject = std::move(subject);
        return std::unexpected(std::move(error));
    }

    [[nodiscard]] inline std::unexpected<Error> MakeError(Error error)
    {
        return std::unexpected(std::move(error));
    }
}
