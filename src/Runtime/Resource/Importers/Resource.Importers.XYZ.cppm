module;
#include <cstddef>
#include <span>
#include <string_view>

export module Resource:Importers.XYZ;

import :Errors;
import :ImportRegistry;

export namespace Resource
{
    // Whitespace separated "x y z [extra...]" rows, "#" comments. Produces a
    // Point; each extra column becomes a per-node DataArray.
    class XYZImporter final : public IResourceImporter
    {
    public:
        ~XYZImporter() override;

        [[nodiscard]] std::string_view FormatName() const override { return "XYZ Point Cloud"; }
        [[nodiscard]] std::span<const std::string_view> Extensions() const override;

        [[nodiscard]] Result<ImportResult> Import(
            std::span<const std::byte> data,
            const ImportContext& ctx) override;
    };
}
