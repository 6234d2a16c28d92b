module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

module Core.IOBackend;

namespace Core::IO
{
    // -------------------------------------------------------------------------
    // FileIOBackend
    // -------------------------------------------------------------------------

    bool FileIOBackend::Exists(std::string_view path) const
    {
        std::error_code ec;
        return !path.empty() && std::filesystem::is_regular_file(std::filesystem::path(path), ec) && !ec;
    }

    Expected<std::vector<std::byte>> FileIOBackend::ReadFile(std::string_view path)
    {
        if (path.empty())
            return std::unexpected(ErrorCode::InvalidPath);
        if (!Exists(path))
            return std::unexpected(ErrorCode::FileNotFound);

        std::ifstream file(std::filesystem::path(path), std::ios::binary | std::ios::ate);
        if (!file.is_open())
            return std::unexpected(ErrorCode::FileReadError);

        const auto end = file.tellg();
        if (end < 0)
            return std::unexpected(ErrorCode::FileReadError);

        std::vector<std::byte> bytes(static_cast<std::size_t>(end));
        if (bytes.empty())
            return bytes;

        file.seekg(0, std::ios::beg);
        file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file)
            return std::unexpected(ErrorCode::FileReadError);

        return bytes;
    }

    Expected<void> FileIOBackend::WriteFile(std::string_view path, std::span<const std::byte> data)
    {
        if (path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        namespace fs = std::filesystem;
        const fs::path target(path);

        std::error_code ec;
        if (const fs::path parent = target.parent_path(); !parent.empty())
        {
            fs::create_directories(parent, ec);
            if (ec)
                return std::unexpected(ec == std::errc::permission_denied
                                           ? ErrorCode::PermissionDenied
                                           : ErrorCode::FileWriteError);
        }

        std::ofstream file(target, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return std::unexpected(ErrorCode::FileWriteError);

        if (!data.empty())
        {
            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!file)
                return std::unexpected(ErrorCode::FileWriteError);
        }

        return {};
    }

    // -------------------------------------------------------------------------
    // MemoryIOBackend
    // -------------------------------------------------------------------------

    bool MemoryIOBackend::Exists(std::string_view path) const
    {
        return m_Files.find(path) != m_Files.end();
    }

    Expected<std::vector<std::byte>> MemoryIOBackend::ReadFile(std::string_view path)
    {
        if (path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        auto it = m_Files.find(path);
        if (it == m_Files.end())
            return std::unexpected(ErrorCode::FileNotFound);
        return it->second;
    }

    Expected<void> MemoryIOBackend::WriteFile(std::string_view path, std::span<const std::byte> data)
    {
        if (path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        m_Files.insert_or_assign(std::string(path), std::vector<std::byte>(data.begin(), data.end()));
        m_WriteLog.emplace_back(path);
        return {};
    }
}
