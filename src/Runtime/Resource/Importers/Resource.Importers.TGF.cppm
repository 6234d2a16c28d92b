module;
#include <cstddef>
#include <span>
#include <string_view>

export module Resource:Importers.TGF;

import :Errors;
import :ImportRegistry;

export namespace Resource
{
    // Trivial Graph Format: "id [x y z]" node lines, a "#" separator, then
    // "from to [label]" edge lines. Produces a Line.
    class TGFImporter final : public IResourceImporter
    {
    public:
        ~TGFImporter() override;

        [[nodiscard]] std::string_view FormatName() const override { return "Trivial Graph Format"; }
        [[nodiscard]] std::span<const std::string_view> Extensions() const override;

        [[nodiscard]] Result<ImportResult> Import(
            std::span<const std::byte> data,
            const ImportContext& ctx) override;
    };
}
