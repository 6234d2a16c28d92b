module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - File I/O, parsing, validation
    //                          - Transport calls that can fail
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error (lookup by name, extension, key).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference".
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    //
    // Domain modules (e.g. Resource) define richer error payloads and map
    // ErrorCode into them at their boundary.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        FileWriteError = 202,
        InvalidPath = 203,
        PermissionDenied = 204,

        // Validation errors (300-399)
        InvalidArgument = 300,
        OutOfRange = 303,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:           return "Success";
            case ErrorCode::FileNotFound:      return "FileNotFound";
            case ErrorCode::FileReadError:     return "FileReadError";
            case ErrorCode::FileWriteError:    return "FileWriteError";
            case ErrorCode::InvalidPath:       return "InvalidPath";
            case ErrorCode::PermissionDenied:  return "PermissionDenied";
            case ErrorCode::InvalidArgument:   return "InvalidArgument";
            case ErrorCode::OutOfRange:        return "OutOfRange";
            default:                           return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;
}
