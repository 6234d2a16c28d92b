#include <cstdlib>
#include <string>
#include <type_traits>
#include <variant>

import Core.IOBackend;
import Core.Logging;
import Resource;
import Runtime.Sync;

using namespace Core;

// Imports a .tgf or .xyz file, uploads it to a directory-backed store, then
// downloads it again and reports what came back.
//
//   Sandbox <input file> [store directory]
int main(int argc, char** argv)
{
    if (argc < 2)
    {
        Log::Error("usage: {} <input.tgf|input.xyz> [store directory]", argv[0]);
        return EXIT_FAILURE;
    }

    const std::string input = argv[1];
    const std::string storeRoot = argc > 2 ? argv[2] : "tessera-store";

    IO::FileIOBackend backend;
    Resource::ImportRegistry registry;
    Resource::RegisterBuiltinImporters(registry);

    auto imported = registry.Import(input, backend);
    if (!imported)
    {
        Log::Error("Import failed ({}): {}", Resource::ResourceErrorToString(imported.error().Code),
                   imported.error().Message);
        return EXIT_FAILURE;
    }

    Runtime::Sync::FileStoreTransport store(storeRoot, backend);
    Runtime::Sync::SyncConfig config;

    return std::visit([&](auto& resource) -> int
    {
        Log::Info("Imported {} with {} nodes, {} cells, {} bound arrays ({} bytes)", resource.TypeName(),
                  resource.GetMesh().NodeCount(), resource.GetMesh().CellCount(), resource.Bindings().size(),
                  resource.NBytes());

        auto receipt = Runtime::Sync::Upload(resource, store, config);
        if (!receipt)
        {
            Log::Error("Upload failed: {}", receipt.error().Message);
            return EXIT_FAILURE;
        }

        using T = std::decay_t<decltype(resource)>;
        bool ok = false;
        if constexpr (std::is_same_v<T, Resource::Line>)
        {
            auto downloaded = Runtime::Sync::DownloadLine(store, receipt->ResourceId, config);
            ok = downloaded.has_value() && downloaded->GetMesh().NodeCount() == resource.GetMesh().NodeCount();
        }
        else
        {
            auto downloaded = Runtime::Sync::DownloadPoint(store, receipt->ResourceId, config);
            ok = downloaded.has_value() && downloaded->GetMesh().NodeCount() == resource.GetMesh().NodeCount();
        }

        if (!ok)
        {
            Log::Error("Round trip through '{}' did not reproduce the resource", storeRoot);
            return EXIT_FAILURE;
        }

        Log::Info("Stored as '{}' under '{}'", receipt->ResourceId, storeRoot);
        return EXIT_SUCCESS;
    }, *imported);
}
