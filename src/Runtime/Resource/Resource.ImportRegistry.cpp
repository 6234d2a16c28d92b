module;
#include <algorithm>
#include <cctype>
#include <expected>
#include <cstddef>
#include <filesystem>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

module Resource:ImportRegistry.Impl;
import :ImportRegistry;
import :Errors;
import :Importers.TGF;
import :Importers.XYZ;
import Core.IOBackend;
import Core.Error;
import Core.Logging;

namespace Resource
{
    namespace
    {
        std::string ToLowerStr(std::string_view sv)
        {
            std::string s(sv);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::unexpected<Error> MapCoreError(Core::ErrorCode code, const std::string& path)
        {
            return MakeError(ResourceError::TransportFailed,
                             std::format("reading '{}' failed: {}", path, Core::ErrorCodeToString(code)), path);
        }
    }

    bool ImportRegistry::RegisterImporter(std::unique_ptr<IResourceImporter> importer)
    {
        if (!importer) return false;

        bool anyRegistered = false;
        for (auto ext : importer->Extensions())
        {
            std::string key = ToLowerStr(ext);
            if (m_ImportersByExt.contains(key))
            {
                Core::Log::Warn("ImportRegistry: Extension '{}' already registered, skipping", key);
                continue;
            }
            m_ImportersByExt[key] = importer.get();
            anyRegistered = true;
        }

        if (anyRegistered)
        {
            m_Importers.push_back(std::move(importer));
        }
        return anyRegistered;
    }

    IResourceImporter* ImportRegistry::FindImporter(std::string_view extension) const
    {
        auto it = m_ImportersByExt.find(ToLowerStr(extension));
        if (it != m_ImportersByExt.end())
            return it->second;
        return nullptr;
    }

    bool ImportRegistry::CanImport(std::string_view extension) const
    {
        return FindImporter(extension) != nullptr;
    }

    std::vector<std::string_view> ImportRegistry::GetSupportedExtensions() const
    {
        std::vector<std::string_view> result;
        result.reserve(m_ImportersByExt.size());
        for (const auto& [ext, _] : m_ImportersByExt)
            result.emplace_back(ext);
        return result;
    }

    Result<ImportResult> ImportRegistry::Import(const std::string& filepath, Core::IO::IIOBackend& backend) const
    {
        const std::string ext = std::filesystem::path(filepath).extension().string();

        auto* importer = FindImporter(ext);
        if (!importer)
        {
            return MakeError(ResourceError::DecodeError,
                             std::format("no importer registered for extension '{}'", ext), filepath);
        }

        auto readResult = backend.ReadFile(filepath);
        if (!readResult)
            return MapCoreError(readResult.error(), filepath);

        ImportContext ctx;
        ctx.SourcePath = filepath;

        Core::Log::Debug("ImportRegistry: importing '{}' as {}", filepath, importer->FormatName());
        return importer->Import(*readResult, ctx);
    }

    // Key functions for the importer vtables, emitted in the TU that imports
    // every importer partition.
    TGFImporter::~TGFImporter() = default;
    XYZImporter::~XYZImporter() = default;

    void RegisterBuiltinImporters(ImportRegistry& registry)
    {
        registry.RegisterImporter(std::make_unique<TGFImporter>());
        registry.RegisterImporter(std::make_unique<XYZImporter>());

        Core::Log::Info("ImportRegistry: Registered {} built-in importer extensions",
                        registry.GetSupportedExtensions().size());
    }
}
