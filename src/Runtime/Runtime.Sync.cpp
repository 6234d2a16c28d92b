module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Runtime.Sync;

import Core.Error;
import Core.IOBackend;
import Core.Logging;
import Resource;

namespace Runtime::Sync
{
    namespace
    {
        constexpr std::string_view kDocumentName = "resource.json";

        std::unexpected<Resource::Error> TransportError(Core::ErrorCode code, std::string_view what,
                                                        const std::string& path)
        {
            return Resource::MakeError(Resource::ResourceError::TransportFailed,
                                       std::format("{} '{}' failed: {}", what, path, Core::ErrorCodeToString(code)),
                                       path);
        }

        std::string SchemeOf(std::string_view url)
        {
            const auto pos = url.find("://");
            if (pos == std::string_view::npos) return {};
            return std::string(url.substr(0, pos));
        }

        nlohmann::json::json_pointer PointerFor(std::string_view key)
        {
            return nlohmann::json::json_pointer("/" + std::string(key));
        }
    }

    // -------------------------------------------------------------------------
    // Session
    // -------------------------------------------------------------------------

    std::string Session::Username() const
    {
        const auto pos = DevelKey.find("//");
        return pos == std::string::npos ? std::string{} : DevelKey.substr(0, pos);
    }

    std::string HostOf(std::string_view url)
    {
        const auto schemeEnd = url.find("://");
        if (schemeEnd == std::string_view::npos) return {};

        std::string_view rest = url.substr(schemeEnd + 3);
        const auto hostEnd = rest.find_first_of("/:?#");
        return std::string(rest.substr(0, hostEnd));
    }

    Core::Expected<std::string> NormalizeBaseUrl(std::string_view url)
    {
        if (url.empty())
            return std::unexpected(Core::ErrorCode::InvalidArgument);

        std::string value(url);
        if (value.back() != '/')
            value += '/';

        const std::string host = HostOf(value);
        if (host.empty())
        {
            Core::Log::Warn("Sync: '{}' has no scheme or host", value);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        if (host.find(".com") != std::string::npos && SchemeOf(value) != "https")
        {
            Core::Log::Warn("Sync: live endpoint '{}' requires HTTPS", value);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        return value;
    }

    bool IsDevelKey(std::string_view key)
    {
        const auto pos = key.find("//");
        if (pos == std::string_view::npos) return false;

        std::string_view secret = key.substr(pos + 2);
        return secret.find("//") == std::string_view::npos && secret.size() == kDevelKeySecretLength;
    }

    Core::Expected<Session> MakeSession(std::string_view baseUrl, std::string develKey)
    {
        auto url = NormalizeBaseUrl(baseUrl);
        if (!url) return std::unexpected(url.error());

        if (!IsDevelKey(develKey))
        {
            Core::Log::Warn("Sync: developer key must be a username followed by '//' and {} characters",
                            kDevelKeySecretLength);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        Session session;
        session.BaseUrl = std::move(*url);
        session.DevelKey = std::move(develKey);
        return session;
    }

    // -------------------------------------------------------------------------
    // Upload / Download
    // -------------------------------------------------------------------------

    Resource::Result<UploadReceipt> Upload(Resource::CompositeResource& resource, ITransport& transport,
                                           const SyncConfig& config, std::string_view resourceId)
    {
        auto files = resource.DirtyFiles(config.ForceFullUpload, config.Limits);
        if (!files)
        {
            Core::Log::Warn("Sync: {} failed validation ({}): {}", resource.TypeName(),
                            Resource::ResourceErrorToString(files.error().Code), files.error().Message);
            return std::unexpected(std::move(files.error()));
        }

        if (!config.ForceFullUpload && !resource.IsDirty())
        {
            Core::Log::Debug("Sync: {} has no changes, skipping upload", resource.TypeName());
            UploadReceipt receipt;
            receipt.ResourceId = std::string(resourceId);
            return receipt;
        }

        UploadRequest request;
        request.ResourceId = std::string(resourceId);
        request.Metadata = resource.BuildMetadata();
        request.Files = std::move(*files);

        const std::size_t fileCount = request.Files.size();
        auto receipt = transport.Upload(request);
        if (!receipt)
        {
            Core::Log::Error("Sync: upload of {} failed: {}", resource.TypeName(), receipt.error().Message);
            return receipt;
        }

        resource.MarkSynced();
        Core::Log::Info("Sync: uploaded {} '{}' ({} arrays)", resource.TypeName(), receipt->ResourceId, fileCount);
        return receipt;
    }

    namespace
    {
        Resource::Status CheckType(const nlohmann::json& doc, std::string_view expected)
        {
            auto type = Resource::RequireString(doc, "type", "resource");
            if (!type) return std::unexpected(std::move(type.error()));
            if (*type != expected)
            {
                return Resource::MakeError(Resource::ResourceError::MalformedDocument,
                                           std::format("resource: expected type '{}', got '{}'", expected, *type),
                                           "type");
            }
            return {};
        }
    }

    Resource::Result<Resource::Line> DownloadLine(ITransport& transport, std::string_view resourceId,
                                                  const SyncConfig& config)
    {
        auto doc = transport.Download(resourceId);
        if (!doc) return std::unexpected(std::move(doc.error()));
        if (auto status = CheckType(*doc, Resource::kTypeLine); !status)
            return std::unexpected(std::move(status.error()));
        return Resource::Line::BuildFromJson(*doc, transport, config.Limits);
    }

    Resource::Result<Resource::Point> DownloadPoint(ITransport& transport, std::string_view resourceId,
                                                    const SyncConfig& config)
    {
        auto doc = transport.Download(resourceId);
        if (!doc) return std::unexpected(std::move(doc.error()));
        if (auto status = CheckType(*doc, Resource::kTypePoint); !status)
            return std::unexpected(std::move(status.error()));
        return Resource::Point::BuildFromJson(*doc, transport, config.Limits);
    }

    // -------------------------------------------------------------------------
    // FileStoreTransport
    // -------------------------------------------------------------------------

    FileStoreTransport::FileStoreTransport(std::string root, Core::IO::IIOBackend& backend)
        : m_Root(std::move(root)), m_Backend(backend)
    {
    }

    std::string FileStoreTransport::PathOf(std::string_view relative) const
    {
        return (std::filesystem::path(m_Root) / std::filesystem::path(relative)).string();
    }

    std::string FileStoreTransport::NextResourceId()
    {
        while (true)
        {
            std::string id = std::format("res-{}", m_NextId++);
            if (!m_Backend.Exists(PathOf(std::format("{}/{}", id, kDocumentName)))) return id;
        }
    }

    Resource::Result<UploadReceipt> FileStoreTransport::Upload(const UploadRequest& request)
    {
        UploadReceipt receipt;
        receipt.ResourceId = request.ResourceId.empty() ? NextResourceId() : request.ResourceId;

        // Arrays not in this request keep the locations of the previous upload.
        nlohmann::json previous;
        if (!request.ResourceId.empty())
        {
            auto existing = Download(request.ResourceId);
            if (existing) previous = std::move(*existing);
        }

        nlohmann::json doc = request.Metadata;
        if (previous.is_object())
        {
            for (const std::string_view key : {"mesh/vertices", "mesh/segments"})
            {
                const auto ptr = PointerFor(key);
                const auto typePtr = PointerFor(std::string(key) + "Type");
                if (previous.contains(ptr) && doc.contains(PointerFor("mesh")))
                {
                    doc[ptr] = previous.at(ptr);
                    if (previous.contains(typePtr)) doc[typePtr] = previous.at(typePtr);
                }
            }

            const auto data = doc.find("data");
            const auto previousData = previous.find("data");
            if (data != doc.end() && data->is_array() && previousData != previous.end() && previousData->is_array())
            {
                for (std::size_t i = 0; i < data->size() && i < previousData->size(); ++i)
                {
                    const auto& entry = (*previousData)[i];
                    if (entry.is_object() && entry.contains("array"))
                    {
                        (*data)[i]["array"] = entry.at("array");
                        if (entry.contains("arrayType")) (*data)[i]["arrayType"] = entry.at("arrayType");
                    }
                }
            }
        }

        for (const auto& [key, file] : request.Files)
        {
            const std::string location = std::format("{}/{}.bin", receipt.ResourceId, key);

            const std::string path = PathOf(location);
            if (auto written = m_Backend.WriteFile(path, file.Bytes); !written)
                return TransportError(written.error(), "writing", path);

            doc[PointerFor(key)] = location;
            doc[PointerFor(key + "Type")] = file.DType;
            receipt.Locations.emplace(key, location);
        }

        const std::string text = doc.dump(2);
        const std::string documentPath = PathOf(std::format("{}/{}", receipt.ResourceId, kDocumentName));
        auto bytes = std::as_bytes(std::span<const char>(text.data(), text.size()));
        if (auto written = m_Backend.WriteFile(documentPath, bytes); !written)
            return TransportError(written.error(), "writing", documentPath);

        Core::Log::Debug("FileStore: wrote '{}' ({} arrays)", receipt.ResourceId, receipt.Locations.size());
        return receipt;
    }

    Resource::Result<nlohmann::json> FileStoreTransport::Download(std::string_view resourceId)
    {
        const std::string path = PathOf(std::format("{}/{}", resourceId, kDocumentName));
        auto bytes = m_Backend.ReadFile(path);
        if (!bytes) return TransportError(bytes.error(), "reading", path);

        std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
        nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
        if (doc.is_discarded())
        {
            return Resource::MakeError(Resource::ResourceError::MalformedDocument,
                                       std::format("'{}' is not valid JSON", path), path);
        }
        return doc;
    }

    Resource::Result<std::vector<std::byte>> FileStoreTransport::Fetch(std::string_view location)
    {
        const std::string path = PathOf(location);
        auto bytes = m_Backend.ReadFile(path);
        if (!bytes) return TransportError(bytes.error(), "reading", path);
        return std::move(*bytes);
    }
}
