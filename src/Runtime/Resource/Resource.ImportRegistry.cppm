module;
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

export module Resource:ImportRegistry;

import :Errors;
import :Line;
import :Point;
import Core.IOBackend;

export namespace Resource
{
    // --- Import Context (everything the importer needs, no I/O ownership) ---
    struct ImportContext
    {
        std::string_view SourcePath;   // Original file path (error messages, default title)
    };

    using ImportResult = std::variant<Line, Point>;

    // --- Importer Base Class ---
    // Importers are pure transforms: bytes -> resource.
    // They never open files; bytes come from the I/O backend.
    class IResourceImporter
    {
    public:
        virtual ~IResourceImporter() = default;

        [[nodiscard]] virtual std::string_view FormatName() const = 0;
        [[nodiscard]] virtual std::span<const std::string_view> Extensions() const = 0;

        [[nodiscard]] virtual Result<ImportResult> Import(
            std::span<const std::byte> data,
            const ImportContext& ctx) = 0;
    };

    // --- Registry ---
    // Non-copyable, non-movable. Extensions are matched case-insensitively.
    class ImportRegistry
    {
    public:
        ImportRegistry() = default;
        ~ImportRegistry() = default;

        ImportRegistry(const ImportRegistry&) = delete;
        ImportRegistry& operator=(const ImportRegistry&) = delete;
        ImportRegistry(ImportRegistry&&) = delete;
        ImportRegistry& operator=(ImportRegistry&&) = delete;

        bool RegisterImporter(std::unique_ptr<IResourceImporter> importer);

        [[nodiscard]] IResourceImporter* FindImporter(std::string_view extension) const;
        [[nodiscard]] bool CanImport(std::string_view extension) const;
        [[nodiscard]] std::vector<std::string_view> GetSupportedExtensions() const;

        // Convenience: read bytes via backend, find importer by extension, decode.
        [[nodiscard]] Result<ImportResult> Import(
            const std::string& filepath,
            Core::IO::IIOBackend& backend) const;

    private:
        std::unordered_map<std::string, IResourceImporter*> m_ImportersByExt;
        std::vector<std::unique_ptr<IResourceImporter>> m_Importers;
    };

    // Registers all built-in importers (TGF, XYZ).
    void RegisterBuiltinImporters(ImportRegistry& registry);
}
