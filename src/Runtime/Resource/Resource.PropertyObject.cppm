module;

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:PropertyObject;

import :Errors;
import :Codec;
import :Field;

export namespace Resource
{
    // -------------------------------------------------------------------------
    // PropertyObject
    // -------------------------------------------------------------------------
    // Base of every entity in the resource model. Each concrete type lists its
    // own fields and owned children; there is no runtime attribute injection.
    //
    // Validation order: required fields -> children -> cross-field invariants.
    // A failing validation leaves every dirty flag untouched.
    class PropertyObject
    {
    public:
        PropertyObject() = default;
        virtual ~PropertyObject() = default;

        PropertyObject(const PropertyObject&) = default;
        PropertyObject& operator=(const PropertyObject&) = default;
        PropertyObject(PropertyObject&&) noexcept = default;
        PropertyObject& operator=(PropertyObject&&) noexcept = default;

        [[nodiscard]] std::vector<const FieldBase*> Fields() const;
        [[nodiscard]] std::vector<const PropertyObject*> Children() const;

        [[nodiscard]] Status Validate(const Limits& limits = {}) const;

        // True when any field of this object or of an owned child is dirty.
        [[nodiscard]] virtual bool IsDirty() const;

        // Clears every field of this object and all children. Only the caller
        // of a confirmed remote write may invoke this.
        virtual void MarkSynced();

        // Validates, then returns identifier -> encoded bytes for each dirty
        // array (every array when `force`).
        [[nodiscard]] Result<DirtyFileSet> DirtyFiles(bool force = false, const Limits& limits = {}) const;

        // Appends encoded dirty arrays without validating. Default: own array
        // fields under `prefix`, children under the same prefix.
        virtual void CollectDirtyFiles(DirtyFileSet& files, bool force, const std::string& prefix) const;

        // Non-binary fields of this object as a JSON object. Unset fields are omitted.
        [[nodiscard]] nlohmann::json Metadata() const;
        [[nodiscard]] Status ApplyMetadata(const nlohmann::json& meta);

        // Sum of the encoded size of every array field, children included.
        [[nodiscard]] virtual std::size_t NBytes() const;

    protected:
        // Overridden in const/non-const pairs; both must list the same members.
        [[nodiscard]] virtual std::vector<FieldBase*> CollectFields() = 0;
        [[nodiscard]] virtual std::vector<const FieldBase*> CollectFields() const = 0;
        [[nodiscard]] virtual std::vector<PropertyObject*> CollectChildren() { return {}; }
        [[nodiscard]] virtual std::vector<const PropertyObject*> CollectChildren() const { return {}; }

        [[nodiscard]] virtual Status ValidateInvariants(const Limits& /*limits*/) const { return {}; }
    };

    // Adds the optional human-readable title and description.
    class UserContent : public PropertyObject
    {
    public:
        StringField Title{"title"};
        StringField Description{"description"};

        // Sets whichever of title/description is non-empty.
        [[nodiscard]] Status SetContent(std::string title, std::string description);

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override { return {&Title, &Description}; }
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override { return {&Title, &Description}; }
    };
}
