module;
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Core.IOBackend;

import Core.Error;

export namespace Core::IO
{
    // Whole-file byte storage. Importers and the file-backed store go through
    // it and never open files themselves.
    class IIOBackend
    {
    public:
        virtual ~IIOBackend() = default;
        IIOBackend(const IIOBackend&) = delete;
        IIOBackend& operator=(const IIOBackend&) = delete;
        IIOBackend(IIOBackend&&) = delete;
        IIOBackend& operator=(IIOBackend&&) = delete;

        [[nodiscard]] virtual bool Exists(std::string_view path) const = 0;

        // FileNotFound when nothing is stored at `path`.
        [[nodiscard]] virtual Expected<std::vector<std::byte>> ReadFile(std::string_view path) = 0;

        // Replaces whatever is stored at `path`.
        [[nodiscard]] virtual Expected<void> WriteFile(std::string_view path, std::span<const std::byte> data) = 0;

    protected:
        IIOBackend() = default;
    };

    // Loose files on disk. Writes create missing parent directories.
    class FileIOBackend final : public IIOBackend
    {
    public:
        FileIOBackend() = default;

        [[nodiscard]] bool Exists(std::string_view path) const override;
        [[nodiscard]] Expected<std::vector<std::byte>> ReadFile(std::string_view path) override;
        [[nodiscard]] Expected<void> WriteFile(std::string_view path, std::span<const std::byte> data) override;
    };

    // Path -> bytes map. Used for headless runs and tests; paths are taken
    // verbatim, without normalization.
    class MemoryIOBackend final : public IIOBackend
    {
    public:
        MemoryIOBackend() = default;

        [[nodiscard]] bool Exists(std::string_view path) const override;
        [[nodiscard]] Expected<std::vector<std::byte>> ReadFile(std::string_view path) override;
        [[nodiscard]] Expected<void> WriteFile(std::string_view path, std::span<const std::byte> data) override;

        [[nodiscard]] const std::map<std::string, std::vector<std::byte>, std::less<>>& Files() const noexcept
        {
            return m_Files;
        }

        // Paths written since construction, in write order. Rewrites repeat.
        [[nodiscard]] const std::vector<std::string>& WriteLog() const noexcept { return m_WriteLog; }

    private:
        std::map<std::string, std::vector<std::byte>, std::less<>> m_Files;
        std::vector<std::string> m_WriteLog;
    };
}
