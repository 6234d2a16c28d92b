#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

import Core.Error;
import Core.IOBackend;
import Resource;
import Runtime.Sync;

#include "TestResourceBuilders.h"

using namespace Resource;
using namespace Runtime::Sync;

namespace
{
    // Records every request; can be told to fail.
    class RecordingTransport final : public ITransport
    {
    public:
        std::vector<UploadRequest> Requests;
        bool Fail = false;

        Result<UploadReceipt> Upload(const UploadRequest& request) override
        {
            Requests.push_back(request);
            if (Fail)
                return MakeError(ResourceError::TransportFailed, "connection refused");

            UploadReceipt receipt;
            receipt.ResourceId = request.ResourceId.empty() ? "remote-1" : request.ResourceId;
            for (const auto& [key, file] : request.Files)
                receipt.Locations.emplace(key, "blob/" + key);
            return receipt;
        }

        Result<nlohmann::json> Download(std::string_view resourceId) override
        {
            return MakeError(ResourceError::TransportFailed, "not stored", std::string(resourceId));
        }

        Result<std::vector<std::byte>> Fetch(std::string_view location) override
        {
            return MakeError(ResourceError::TransportFailed, "not stored", std::string(location));
        }
    };

    Line MakeLineWithData()
    {
        Line line = MakeLLine();
        EXPECT_TRUE(line.SetContent("pipes", "two segments").has_value());
        EXPECT_TRUE(line.AddData("CC", MakeData(2, 10.0f)).has_value());
        return line;
    }

    struct TempStore
    {
        std::filesystem::path Dir;

        explicit TempStore(std::string_view name)
            : Dir(std::filesystem::temp_directory_path() / std::string(name))
        {
            std::filesystem::remove_all(Dir);
        }

        ~TempStore() { std::filesystem::remove_all(Dir); }
    };
}

// =============================================================================
// Session
// =============================================================================

TEST(SyncSession, NormalizeBaseUrl)
{
    EXPECT_EQ(NormalizeBaseUrl("http://localhost:3000").value(), "http://localhost:3000/");
    EXPECT_EQ(NormalizeBaseUrl("https://volcano.example.com/").value(), "https://volcano.example.com/");
}

TEST(SyncSession, NormalizeBaseUrl_Rejects)
{
    auto empty = NormalizeBaseUrl("");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), Core::ErrorCode::InvalidArgument);

    EXPECT_FALSE(NormalizeBaseUrl("localhost").has_value());
    EXPECT_FALSE(NormalizeBaseUrl("http://volcano.example.com").has_value());
}

TEST(SyncSession, HostOf)
{
    EXPECT_EQ(HostOf("https://volcano.example.com/api/"), "volcano.example.com");
    EXPECT_EQ(HostOf("http://localhost:3000/"), "localhost");
    EXPECT_EQ(HostOf("localhost"), "");
}

TEST(SyncSession, DevelKey)
{
    const std::string secret(kDevelKeySecretLength, 'a');
    EXPECT_TRUE(IsDevelKey("ada//" + secret));
    EXPECT_FALSE(IsDevelKey("ada//" + secret.substr(1)));
    EXPECT_FALSE(IsDevelKey("ada" + secret));
    EXPECT_FALSE(IsDevelKey("ada//" + secret.substr(2) + "//"));
}

TEST(SyncSession, MakeSession)
{
    auto session = MakeSession("http://localhost:3000", "ada//" + std::string(kDevelKeySecretLength, 'x'));
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->BaseUrl, "http://localhost:3000/");
    EXPECT_EQ(session->ApiUrl(), "http://localhost:3000/api/");
    EXPECT_EQ(session->Username(), "ada");

    auto badKey = MakeSession("http://localhost:3000", "ada");
    ASSERT_FALSE(badKey.has_value());
    EXPECT_EQ(badKey.error(), Core::ErrorCode::InvalidArgument);
}

// =============================================================================
// Upload protocol
// =============================================================================

TEST(SyncUpload, SuccessClearsDirtyState)
{
    Line line = MakeLineWithData();
    RecordingTransport transport;

    auto receipt = Upload(line, transport);
    ASSERT_TRUE(receipt.has_value()) << receipt.error().Message;
    EXPECT_EQ(receipt->ResourceId, "remote-1");

    ASSERT_EQ(transport.Requests.size(), 1u);
    const UploadRequest& request = transport.Requests[0];
    EXPECT_TRUE(request.ResourceId.empty());
    EXPECT_EQ(request.Files.size(), 3u);
    EXPECT_TRUE(request.Files.contains("mesh/vertices"));
    EXPECT_TRUE(request.Files.contains("mesh/segments"));
    EXPECT_TRUE(request.Files.contains("data/0/array"));
    EXPECT_EQ(request.Files.at("mesh/segments").DType, "Int32Array");
    EXPECT_EQ(request.Metadata["type"], "line");
    EXPECT_EQ(request.Metadata["title"], "pipes");

    EXPECT_FALSE(line.IsDirty());
}

TEST(SyncUpload, TransportFailureKeepsDirtyState)
{
    Line line = MakeLineWithData();
    RecordingTransport transport;
    transport.Fail = true;

    auto receipt = Upload(line, transport);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().Code, ResourceError::TransportFailed);
    EXPECT_EQ(transport.Requests.size(), 1u);
    EXPECT_TRUE(line.IsDirty());

    // A retry sends the same arrays again.
    transport.Fail = false;
    ASSERT_TRUE(Upload(line, transport).has_value());
    EXPECT_EQ(transport.Requests[1].Files.size(), 3u);
}

TEST(SyncUpload, ValidationFailureSendsNothing)
{
    Line line = MakeLLine();
    ASSERT_TRUE(line.AddData("CC", MakeData(5)).has_value());
    RecordingTransport transport;

    auto receipt = Upload(line, transport);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().Code, ResourceError::DataLengthMismatch);
    EXPECT_TRUE(transport.Requests.empty());
    EXPECT_TRUE(line.IsDirty());
}

TEST(SyncUpload, SizeLimitSendsNothing)
{
    Line line = MakeLLine();
    RecordingTransport transport;
    SyncConfig config;
    config.Limits.MaxArrayBytes = 8;

    auto receipt = Upload(line, transport, config);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().Code, ResourceError::PayloadTooLarge);
    EXPECT_TRUE(transport.Requests.empty());
}

TEST(SyncUpload, CleanResourceSkipsTransport)
{
    Line line = MakeLineWithData();
    RecordingTransport transport;
    ASSERT_TRUE(Upload(line, transport).has_value());

    auto receipt = Upload(line, transport, {}, "remote-1");
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt->ResourceId, "remote-1");
    EXPECT_TRUE(receipt->Locations.empty());
    EXPECT_EQ(transport.Requests.size(), 1u);
}

TEST(SyncUpload, ForceSendsEveryArray)
{
    Line line = MakeLineWithData();
    RecordingTransport transport;
    ASSERT_TRUE(Upload(line, transport).has_value());

    SyncConfig config;
    config.ForceFullUpload = true;
    ASSERT_TRUE(Upload(line, transport, config, "remote-1").has_value());
    ASSERT_EQ(transport.Requests.size(), 2u);
    EXPECT_EQ(transport.Requests[1].ResourceId, "remote-1");
    EXPECT_EQ(transport.Requests[1].Files.size(), 3u);

    // Deterministic encoding: forced bytes equal the first upload's.
    EXPECT_EQ(transport.Requests[1].Files, transport.Requests[0].Files);
}

TEST(SyncUpload, OnlyChangedArraysAreSent)
{
    Line line = MakeLineWithData();
    RecordingTransport transport;
    ASSERT_TRUE(Upload(line, transport).has_value());

    const std::vector<float> values = {7.0f, 8.0f};
    ASSERT_TRUE(line.BindingAt(0).Data.Values.Set(MakeScalarArray(values)).has_value());
    EXPECT_TRUE(line.IsDirty());

    ASSERT_TRUE(Upload(line, transport, {}, "remote-1").has_value());
    ASSERT_EQ(transport.Requests.size(), 2u);
    ASSERT_EQ(transport.Requests[1].Files.size(), 1u);
    EXPECT_TRUE(transport.Requests[1].Files.contains("data/0/array"));
}

TEST(SyncUpload, SwappedBindingsAreResent)
{
    Line line = MakeLineWithData();
    ASSERT_TRUE(line.AddData("CC", MakeData(2, 20.0f)).has_value());
    RecordingTransport transport;
    ASSERT_TRUE(Upload(line, transport).has_value());
    ASSERT_FALSE(line.IsDirty());

    std::vector<DataBinding> swapped = {line.Bindings()[1], line.Bindings()[0]};
    ASSERT_TRUE(line.SetData(std::move(swapped)).has_value());

    ASSERT_TRUE(Upload(line, transport, {}, "remote-1").has_value());
    ASSERT_EQ(transport.Requests.size(), 2u);
    const UploadRequest& request = transport.Requests[1];
    EXPECT_EQ(request.Files.size(), 2u);
    EXPECT_TRUE(request.Files.contains("data/0/array"));
    EXPECT_TRUE(request.Files.contains("data/1/array"));
    EXPECT_EQ(request.Files.at("data/0/array"), transport.Requests[0].Files.at("data/1/array"));
    EXPECT_FALSE(line.IsDirty());
}

TEST(SyncUpload, RemovedBindingIsNotSkipped)
{
    Line line = MakeLineWithData();
    RecordingTransport transport;
    ASSERT_TRUE(Upload(line, transport).has_value());

    ASSERT_TRUE(line.RemoveData(0));
    ASSERT_TRUE(Upload(line, transport, {}, "remote-1").has_value());
    ASSERT_EQ(transport.Requests.size(), 2u);
    EXPECT_TRUE(transport.Requests[1].Files.empty());
    EXPECT_TRUE(transport.Requests[1].Metadata["data"].empty());
}

// =============================================================================
// FileStoreTransport
// =============================================================================

TEST(FileStoreTransport, LineRoundTrip)
{
    TempStore store("tessera_sync_line");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    Line line = MakeLineWithData();
    ASSERT_TRUE(line.Opts.Color.Set("#0F0").has_value());

    auto receipt = Upload(line, transport);
    ASSERT_TRUE(receipt.has_value()) << receipt.error().Message;
    EXPECT_EQ(receipt->ResourceId, "res-1");
    EXPECT_EQ(receipt->Locations.at("mesh/vertices"), "res-1/mesh/vertices.bin");

    auto downloaded = DownloadLine(transport, receipt->ResourceId);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().Message;
    EXPECT_EQ(downloaded->Title.Value(), "pipes");
    EXPECT_EQ(downloaded->Description.Value(), "two segments");
    EXPECT_EQ(downloaded->Opts.Color.Value(), "#00ff00");
    EXPECT_EQ(downloaded->Geometry.Vertices.Value(), line.Geometry.Vertices.Value());
    EXPECT_EQ(downloaded->Geometry.Segments.Value(), line.Geometry.Segments.Value());
    ASSERT_EQ(downloaded->Bindings().size(), 1u);
    EXPECT_EQ(downloaded->Bindings()[0].Location.Value(), "CC");
    EXPECT_EQ(downloaded->Bindings()[0].Data.Values.Value().Values, (std::vector<float>{10.0f, 11.0f}));
}

TEST(FileStoreTransport, PointRoundTrip)
{
    TempStore store("tessera_sync_point");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    Point point;
    point.Geometry = MakeSquarePoints();
    ASSERT_TRUE(point.AddData("node", MakeData(4)).has_value());
    ASSERT_TRUE(point.Opts.Opacity.Set(0.25).has_value());

    auto receipt = Upload(point, transport);
    ASSERT_TRUE(receipt.has_value()) << receipt.error().Message;

    auto downloaded = DownloadPoint(transport, receipt->ResourceId);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().Message;
    EXPECT_EQ(downloaded->GetMesh().NodeCount(), 4u);
    EXPECT_DOUBLE_EQ(downloaded->Opts.Opacity.Value(), 0.25);
    ASSERT_EQ(downloaded->Bindings().size(), 1u);
    EXPECT_EQ(downloaded->Bindings()[0].Location.Value(), "N");
    EXPECT_FLOAT_EQ(VertexAt(downloaded->Geometry.Vertices.Value(), 2).y, 1.0f);
}

TEST(FileStoreTransport, NewUploadsGetDistinctIds)
{
    TempStore store("tessera_sync_ids");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    Line first = MakeLLine();
    Line second = MakeLLine();
    auto a = Upload(first, transport);
    auto b = Upload(second, transport);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->ResourceId, b->ResourceId);
}

TEST(FileStoreTransport, PartialReuploadKeepsOtherArrays)
{
    TempStore store("tessera_sync_partial");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    Line line = MakeLineWithData();
    auto first = Upload(line, transport);
    ASSERT_TRUE(first.has_value());

    const std::vector<float> values = {-1.0f, -2.0f};
    ASSERT_TRUE(line.BindingAt(0).Data.Values.Set(MakeScalarArray(values)).has_value());

    auto second = Upload(line, transport, {}, first->ResourceId);
    ASSERT_TRUE(second.has_value()) << second.error().Message;
    ASSERT_EQ(second->Locations.size(), 1u);
    EXPECT_TRUE(second->Locations.contains("data/0/array"));

    auto downloaded = DownloadLine(transport, first->ResourceId);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().Message;
    EXPECT_EQ(downloaded->Geometry.CellCount(), 2u);
    EXPECT_EQ(downloaded->Bindings()[0].Data.Values.Value().Values, values);
}

TEST(FileStoreTransport, RemovedBindingIsGoneAfterDownload)
{
    TempStore store("tessera_sync_remove");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    Line line = MakeLineWithData();
    ASSERT_TRUE(line.AddData("N", MakeData(3, 20.0f)).has_value());
    auto first = Upload(line, transport);
    ASSERT_TRUE(first.has_value()) << first.error().Message;

    ASSERT_TRUE(line.RemoveData(0));
    auto second = Upload(line, transport, {}, first->ResourceId);
    ASSERT_TRUE(second.has_value()) << second.error().Message;
    EXPECT_TRUE(second->Locations.contains("data/0/array"));

    auto downloaded = DownloadLine(transport, first->ResourceId);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().Message;
    ASSERT_EQ(downloaded->Bindings().size(), 1u);
    EXPECT_EQ(downloaded->Bindings()[0].Location.Value(), "N");
    EXPECT_EQ(downloaded->Bindings()[0].Data.Values.Value().Values, (std::vector<float>{20.0f, 21.0f, 22.0f}));
}

TEST(FileStoreTransport, ReuploadWritesOnlyChangedArrays)
{
    Core::IO::MemoryIOBackend backend;
    FileStoreTransport transport("store", backend);

    Line line = MakeLineWithData();
    auto first = Upload(line, transport);
    ASSERT_TRUE(first.has_value()) << first.error().Message;
    const std::size_t firstWrites = backend.WriteLog().size();
    EXPECT_EQ(firstWrites, 4u);

    const std::vector<float> values = {3.0f, 4.0f};
    ASSERT_TRUE(line.BindingAt(0).Data.Values.Set(MakeScalarArray(values)).has_value());
    ASSERT_TRUE(Upload(line, transport, {}, first->ResourceId).has_value());

    const std::filesystem::path root("store");
    const std::vector<std::string> expected = {(root / "res-1/data/0/array.bin").string(),
                                               (root / "res-1/resource.json").string()};
    const std::vector<std::string> written(backend.WriteLog().begin() + static_cast<std::ptrdiff_t>(firstWrites),
                                           backend.WriteLog().end());
    EXPECT_EQ(written, expected);

    auto downloaded = DownloadLine(transport, first->ResourceId);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().Message;
    EXPECT_EQ(downloaded->Geometry.Vertices.Value(), line.Geometry.Vertices.Value());
    EXPECT_EQ(downloaded->Bindings()[0].Data.Values.Value().Values, values);
}

TEST(FileStoreTransport, DownloadChecksType)
{
    TempStore store("tessera_sync_type");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    Point point;
    point.Geometry = MakeSquarePoints();
    auto receipt = Upload(point, transport);
    ASSERT_TRUE(receipt.has_value());

    auto line = DownloadLine(transport, receipt->ResourceId);
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error().Code, ResourceError::MalformedDocument);
}

TEST(FileStoreTransport, MissingResource)
{
    TempStore store("tessera_sync_missing");
    Core::IO::FileIOBackend backend;
    FileStoreTransport transport(store.Dir.string(), backend);

    auto doc = transport.Download("res-404");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().Code, ResourceError::TransportFailed);
}
