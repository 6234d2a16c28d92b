module;
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Runtime.Sync;

import Core.Error;
import Core.IOBackend;
import Resource;

export namespace Runtime::Sync
{
    inline constexpr std::string_view kApiSubpath = "api/";
    inline constexpr std::size_t kDevelKeySecretLength = 36;

    // Connection context passed explicitly to transports. There is no global
    // session state.
    struct Session
    {
        std::string BaseUrl;   // Normalized: always ends with '/'
        std::string DevelKey;  // "<username>//<36 characters>"

        [[nodiscard]] std::string ApiUrl() const { return BaseUrl + std::string(kApiSubpath); }
        [[nodiscard]] std::string Username() const;
    };

    // Appends a trailing '/', rejects empty input (InvalidArgument) and
    // requires https for live ".com" hosts (InvalidArgument).
    [[nodiscard]] Core::Expected<std::string> NormalizeBaseUrl(std::string_view url);

    // Hostname part of a URL, empty when there is none.
    [[nodiscard]] std::string HostOf(std::string_view url);

    [[nodiscard]] bool IsDevelKey(std::string_view key);

    // Normalizes the URL and checks the key format.
    [[nodiscard]] Core::Expected<Session> MakeSession(std::string_view baseUrl, std::string develKey);

    struct SyncConfig
    {
        Resource::Limits Limits{};
        bool ForceFullUpload = false;   // Send every array, not only dirty ones
    };

    struct UploadRequest
    {
        std::string ResourceId;            // Empty: create a new remote resource
        nlohmann::json Metadata;
        Resource::DirtyFileSet Files;
    };

    struct UploadReceipt
    {
        std::string ResourceId;
        std::map<std::string, std::string> Locations;   // Array key -> remote location
    };

    // Remote store collaborator. Downloads resolve array locations through
    // the inherited IArrayFetcher::Fetch.
    class ITransport : public Resource::IArrayFetcher
    {
    public:
        [[nodiscard]] virtual Resource::Result<UploadReceipt> Upload(const UploadRequest& request) = 0;
        [[nodiscard]] virtual Resource::Result<nlohmann::json> Download(std::string_view resourceId) = 0;
    };

    // Validate -> collect dirty files -> transport upload -> MarkSynced.
    // Nothing is sent when validation fails, and dirty state is cleared only
    // after the transport confirms the write.
    [[nodiscard]] Resource::Result<UploadReceipt> Upload(Resource::CompositeResource& resource, ITransport& transport,
                                                         const SyncConfig& config = {},
                                                         std::string_view resourceId = {});

    [[nodiscard]] Resource::Result<Resource::Line> DownloadLine(ITransport& transport, std::string_view resourceId,
                                                                const SyncConfig& config = {});
    [[nodiscard]] Resource::Result<Resource::Point> DownloadPoint(ITransport& transport, std::string_view resourceId,
                                                                  const SyncConfig& config = {});

    // Directory-backed store, used for offline work and tests. Layout:
    //   <root>/<id>/resource.json   download document (array locations in place)
    //   <root>/<id>/<key>.bin       one file per array, key as in the dirty set
    // Array locations are "<id>/<key>.bin", relative to the root.
    class FileStoreTransport final : public ITransport
    {
    public:
        FileStoreTransport(std::string root, Core::IO::IIOBackend& backend);

        [[nodiscard]] Resource::Result<UploadReceipt> Upload(const UploadRequest& request) override;
        [[nodiscard]] Resource::Result<nlohmann::json> Download(std::string_view resourceId) override;
        [[nodiscard]] Resource::Result<std::vector<std::byte>> Fetch(std::string_view location) override;

        [[nodiscard]] const std::string& Root() const noexcept { return m_Root; }

    private:
        [[nodiscard]] std::string PathOf(std::string_view relative) const;
        [[nodiscard]] std::string NextResourceId();

        std::string m_Root;
        Core::IO::IIOBackend& m_Backend;
        std::size_t m_NextId = 1;
    };
}
