module;

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Composite;

import :Errors;
import :Codec;
import :Field;
import :PropertyObject;
import :Options;
import :DataArray;
import :Mesh;
import :Binding;
import :Wire;

export namespace Resource
{
    // -------------------------------------------------------------------------
    // CompositeResource
    // -------------------------------------------------------------------------
    // A mesh, an ordered list of data bindings and display options. The
    // composite is the unit of upload: its dirty files are keyed
    // "mesh/<array>" and "data/<i>/array".
    //
    // The binding list is dirty state of its own. Removing or replacing
    // bindings marks the composite dirty, and every binding whose index may
    // have moved since the last sync has its array sent again.
    class CompositeResource : public UserContent
    {
    public:
        [[nodiscard]] virtual std::string_view TypeName() const noexcept = 0;
        [[nodiscard]] virtual const Mesh& GetMesh() const noexcept = 0;
        [[nodiscard]] virtual const Options& GetOptions() const noexcept = 0;

        // Location tags this resource accepts for its bindings.
        [[nodiscard]] virtual std::vector<Choice> Locations() const = 0;

        [[nodiscard]] const std::vector<DataBinding>& Bindings() const noexcept { return m_Bindings; }

        // In-place edits are tracked by the binding's own fields.
        [[nodiscard]] DataBinding& BindingAt(std::size_t index) { return m_Bindings.at(index); }

        // Binds `data` at `location` (any accepted alias). KindMismatch for an
        // unknown location. The length rule is checked at validation.
        [[nodiscard]] Status AddData(std::string_view location, DataArray data);

        // False when `index` is out of range.
        bool RemoveData(std::size_t index);

        // Replaces the whole list. KindMismatch, leaving the list untouched,
        // when a binding has no location or one this resource does not accept.
        [[nodiscard]] Status SetData(std::vector<DataBinding> bindings);

        void ClearData();

        // Upload document: {"type", "title", "description", "meta", "mesh", "data"}.
        [[nodiscard]] nlohmann::json BuildMetadata() const;

        [[nodiscard]] bool IsDirty() const override;
        void MarkSynced() override;
        void CollectDirtyFiles(DirtyFileSet& files, bool force, const std::string& prefix) const override;

    protected:
        [[nodiscard]] virtual Mesh& MutableMesh() noexcept = 0;
        [[nodiscard]] virtual Options& MutableOptions() noexcept = 0;

        [[nodiscard]] std::vector<PropertyObject*> CollectChildren() override;
        [[nodiscard]] std::vector<const PropertyObject*> CollectChildren() const override;

        // Every binding's length must equal the node or cell count of the mesh.
        [[nodiscard]] Status ValidateInvariants(const Limits& limits) const override;

        // Reads title, description, meta and the data list of a download
        // document into this resource. The mesh is built by the caller.
        [[nodiscard]] Status ReadDocument(const nlohmann::json& doc, IArrayFetcher& fetcher);

    private:
        [[nodiscard]] bool BindingListChanged() const noexcept;

        std::vector<DataBinding> m_Bindings;

        // Bindings [0, m_StablePrefix) sit at the index they had at the last
        // sync; m_SyncedCount is the list length at that sync.
        std::size_t m_StablePrefix{0};
        std::size_t m_SyncedCount{0};
    };
}
