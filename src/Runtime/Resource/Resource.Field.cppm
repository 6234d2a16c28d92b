module;

#include <cassert>
#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

export module Resource:Field;

import :Errors;
import :Codec;

export namespace Resource
{
    // Encoded bytes for one array plus the dtype tag sent beside it.
    struct DirtyFile
    {
        std::vector<std::byte> Bytes;
        std::string DType;

        bool operator==(const DirtyFile&) const = default;
    };

    // Array identifier -> encoded payload. Ordered so iteration is stable.
    using DirtyFileSet = std::map<std::string, DirtyFile>;

    // -------------------------------------------------------------------------
    // FieldBase
    // -------------------------------------------------------------------------
    // One named attribute of an entity. Assignment is validated immediately;
    // the dirty flag records whether the current value differs (by content)
    // from the last value confirmed written to the remote store.
    class FieldBase
    {
    public:
        FieldBase(std::string name, bool required) : m_Name(std::move(name)), m_Required(required)
        {
        }

        virtual ~FieldBase() = default;

        FieldBase(const FieldBase&) = default;
        FieldBase& operator=(const FieldBase&) = default;
        FieldBase(FieldBase&&) noexcept = default;
        FieldBase& operator=(FieldBase&&) noexcept = default;

        [[nodiscard]] const std::string& Name() const noexcept { return m_Name; }
        [[nodiscard]] bool IsRequired() const noexcept { return m_Required; }
        [[nodiscard]] bool IsRequiredButMissing() const noexcept { return m_Required && !HasValue(); }

        [[nodiscard]] virtual bool HasValue() const noexcept = 0;
        [[nodiscard]] virtual bool IsDirty() const noexcept = 0;

        // Only called once the remote write is confirmed.
        virtual void ClearDirty() = 0;

        // Binary fields travel as files; everything else travels in JSON metadata.
        [[nodiscard]] virtual bool IsBinary() const noexcept { return false; }
        virtual void WriteJson(nlohmann::json& /*object*/) const {}
        [[nodiscard]] virtual Status ReadJson(const nlohmann::json& /*value*/) { return {}; }

        [[nodiscard]] virtual std::size_t ByteSize() const noexcept { return 0; }
        [[nodiscard]] virtual Status CheckSize(const Limits& /*limits*/) const { return {}; }
        virtual void CollectDirty(DirtyFileSet& /*files*/, bool /*force*/, std::string_view /*prefix*/) const {}

    private:
        std::string m_Name;
        bool m_Required;
    };

    template <class T>
    class ValueField : public FieldBase
    {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] bool HasValue() const noexcept override { return m_Value.has_value(); }
        [[nodiscard]] bool IsDirty() const noexcept override { return m_Dirty; }

        void ClearDirty() override
        {
            m_Synced = m_Value;
            m_EverSynced = true;
            m_Dirty = false;
        }

        [[nodiscard]] const T& Value() const
        {
            assert(m_Value.has_value());
            return *m_Value;
        }

        [[nodiscard]] const std::optional<T>& Get() const noexcept { return m_Value; }

        void Reset()
        {
            m_Value.reset();
            UpdateDirty();
        }

    protected:
        void Store(T value)
        {
            m_Value = std::move(value);
            UpdateDirty();
        }

    private:
        void UpdateDirty()
        {
            if (!m_EverSynced)
                m_Dirty = m_Value.has_value();
            else
                m_Dirty = m_Value != m_Synced;
        }

        std::optional<T> m_Value;
        std::optional<T> m_Synced;
        bool m_EverSynced{false};
        bool m_Dirty{false};
    };

    class StringField final : public ValueField<std::string>
    {
    public:
        explicit StringField(std::string name, bool required = false);

        [[nodiscard]] Status Set(std::string value);

        void WriteJson(nlohmann::json& object) const override;
        [[nodiscard]] Status ReadJson(const nlohmann::json& value) override;
    };

    // Finite number within [Min, Max].
    class NumberField final : public ValueField<double>
    {
    public:
        NumberField(std::string name, double min, double max, std::optional<double> defaultValue,
                    bool required = false);

        [[nodiscard]] Status Set(double value);

        void WriteJson(nlohmann::json& object) const override;
        [[nodiscard]] Status ReadJson(const nlohmann::json& value) override;

    private:
        double m_Min;
        double m_Max;
    };

    // "random" or a hex color, stored normalized as "#rrggbb".
    class ColorField final : public ValueField<std::string>
    {
    public:
        explicit ColorField(std::string name, std::optional<std::string> defaultValue = std::string("random"));

        [[nodiscard]] Status Set(std::string_view value);

        void WriteJson(nlohmann::json& object) const override;
        [[nodiscard]] Status ReadJson(const nlohmann::json& value) override;
    };

    struct Choice
    {
        std::string Canonical;
        std::vector<std::string> Aliases;
    };

    // Enumerated string. Matching is case-insensitive against the canonical
    // name and its aliases; the canonical name is stored.
    class ChoiceField final : public ValueField<std::string>
    {
    public:
        ChoiceField(std::string name, std::vector<Choice> choices, std::optional<std::string> defaultValue = std::nullopt,
                    bool required = true);

        [[nodiscard]] Status Set(std::string_view value);
        [[nodiscard]] std::optional<std::string> Resolve(std::string_view value) const;
        [[nodiscard]] const std::vector<Choice>& Choices() const noexcept { return m_Choices; }

        void WriteJson(nlohmann::json& object) const override;
        [[nodiscard]] Status ReadJson(const nlohmann::json& value) override;

    private:
        std::vector<Choice> m_Choices;
    };

    template <ArrayElement T>
    class ArrayField final : public ValueField<Array<T>>
    {
    public:
        ArrayField(std::string name, ShapeSpec shape, bool required = true)
            : ValueField<Array<T>>(std::move(name), required), m_Shape(std::move(shape))
        {
        }

        [[nodiscard]] Status Set(Array<T> value)
        {
            if (!value.IsConsistent())
            {
                return MakeError(ResourceError::ShapeMismatch,
                                 std::format("field '{}': shape {} does not describe {} elements", this->Name(),
                                             FormatShape(value.Shape), value.Values.size()),
                                 this->Name());
            }
            if (!m_Shape.Matches(value.Shape))
            {
                return MakeError(ResourceError::ShapeMismatch,
                                 std::format("field '{}': expected shape {}, got {}", this->Name(), m_Shape.ToString(),
                                             FormatShape(value.Shape)),
                                 this->Name());
            }
            this->Store(std::move(value));
            return {};
        }

        [[nodiscard]] bool IsBinary() const noexcept override { return true; }

        [[nodiscard]] const ShapeSpec& Shape() const noexcept { return m_Shape; }
        [[nodiscard]] std::size_t Rows() const noexcept { return this->HasValue() ? this->Value().Rows() : 0; }

        [[nodiscard]] std::size_t ByteSize() const noexcept override
        {
            return this->HasValue() ? ArrayCodec<T>::ByteSize(this->Value()) : 0;
        }

        [[nodiscard]] Status CheckSize(const Limits& limits) const override
        {
            return CheckPayloadSize(this->Name(), ByteSize(), limits);
        }

        // Adds the encoded array under prefix + Name() when dirty, or always when forced.
        void CollectDirty(DirtyFileSet& files, bool force, std::string_view prefix) const override
        {
            if (!this->HasValue()) return;
            if (!force && !this->IsDirty()) return;

            DirtyFile file;
            file.Bytes = ArrayCodec<T>::Encode(this->Value());
            file.DType = std::string(ArrayCodec<T>::DType());
            files.insert_or_assign(std::string(prefix) + this->Name(), std::move(file));
        }

    private:
        ShapeSpec m_Shape;
    };
}
