module;

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Resource:Field.Impl;

import :Field;
import :Errors;

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

        std::unexpected<Error> KindError(const std::string& field, std::string_view expected, std::string_view actual)
        {
            return MakeError(ResourceError::KindMismatch,
                             std::format("field '{}': expected {}, got {}", field, expected, actual), field);
        }

        bool IsHexDigits(std::string_view digits)
        {
            return std::all_of(digits.begin(), digits.end(),
                               [](unsigned char c) { return std::isxdigit(c) != 0; });
        }
    }

    // -------------------------------------------------------------------------
    // StringField
    // -------------------------------------------------------------------------

    StringField::StringField(std::string name, bool required) : ValueField<std::string>(std::move(name), required)
    {
    }

    Status StringField::Set(std::string value)
    {
        Store(std::move(value));
        return {};
    }

    void StringField::WriteJson(nlohmann::json& object) const
    {
        if (HasValue()) object[Name()] = Value();
    }

    Status StringField::ReadJson(const nlohmann::json& value)
    {
        if (value.is_null())
        {
            Reset();
            return {};
        }
        if (!value.is_string()) return KindError(Name(), "string", value.type_name());
        return Set(value.get<std::string>());
    }

    // -------------------------------------------------------------------------
    // NumberField
    // -------------------------------------------------------------------------

    NumberField::NumberField(std::string name, double min, double max, std::optional<double> defaultValue,
                             bool required)
        : ValueField<double>(std::move(name), required), m_Min(min), m_Max(max)
    {
        if (defaultValue) Store(*defaultValue);
    }

    Status NumberField::Set(double value)
    {
        if (!std::isfinite(value)) return KindError(Name(), "a finite number", "a non-finite value");
        if (value < m_Min || value > m_Max)
        {
            return KindError(Name(), std::format("a number in [{}, {}]", m_Min, m_Max), std::format("{}", value));
        }
        Store(value);
        return {};
    }

    void NumberField::WriteJson(nlohmann::json& object) const
    {
        if (HasValue()) object[Name()] = Value();
    }

    Status NumberField::ReadJson(const nlohmann::json& value)
    {
        if (value.is_null())
        {
            Reset();
            return {};
        }
        if (!value.is_number()) return KindError(Name(), "number", value.type_name());
        return Set(value.get<double>());
    }

    // -------------------------------------------------------------------------
    // ColorField
    // -------------------------------------------------------------------------

    ColorField::ColorField(std::string name, std::optional<std::string> defaultValue)
        : ValueField<std::string>(std::move(name), false)
    {
        if (defaultValue)
        {
            auto status = Set(*defaultValue);
            assert(status.has_value());
            (void)status;
        }
    }

    Status ColorField::Set(std::string_view value)
    {
        std::string lowered = ToLowerStr(value);
        if (lowered == "random")
        {
            Store(std::move(lowered));
            return {};
        }

        if (lowered.size() == 4 && lowered[0] == '#' && IsHexDigits(std::string_view(lowered).substr(1)))
        {
            Store(std::string{'#', lowered[1], lowered[1], lowered[2], lowered[2], lowered[3], lowered[3]});
            return {};
        }

        if (lowered.size() == 7 && lowered[0] == '#' && IsHexDigits(std::string_view(lowered).substr(1)))
        {
            Store(std::move(lowered));
            return {};
        }

        return KindError(Name(), "'random' or a hex color", std::format("'{}'", value));
    }

    void ColorField::WriteJson(nlohmann::json& object) const
    {
        if (HasValue()) object[Name()] = Value();
    }

    Status ColorField::ReadJson(const nlohmann::json& value)
    {
        if (value.is_null())
        {
            Reset();
            return {};
        }
        if (!value.is_string()) return KindError(Name(), "color string", value.type_name());
        return Set(value.get<std::string>());
    }

    // -------------------------------------------------------------------------
    // ChoiceField
    // -------------------------------------------------------------------------

    ChoiceField::ChoiceField(std::string name, std::vector<Choice> choices, std::optional<std::string> defaultValue,
                             bool required)
        : ValueField<std::string>(std::move(name), required), m_Choices(std::move(choices))
    {
        if (defaultValue)
        {
            auto status = Set(*defaultValue);
            assert(status.has_value());
            (void)status;
        }
    }

    std::optional<std::string> ChoiceField::Resolve(std::string_view value) const
    {
        const std::string key = ToLowerStr(value);
        for (const Choice& choice : m_Choices)
        {
            if (ToLowerStr(choice.Canonical) == key) return choice.Canonical;
            for (const std::string& alias : choice.Aliases)
            {
                if (ToLowerStr(alias) == key) return choice.Canonical;
            }
        }
        return std::nullopt;
    }

    Status ChoiceField::Set(std::string_view value)
    {
        if (auto canonical = Resolve(value))
        {
            Store(std::move(*canonical));
            return {};
        }

        std::string expected = "one of";
        for (std::size_t i = 0; i < m_Choices.size(); ++i)
        {
            expected += (i == 0 ? " " : ", ");
            expected += m_Choices[i].Canonical;
        }
        return KindError(Name(), expected, std::format("'{}'", value));
    }

    void ChoiceField::WriteJson(nlohmann::json& object) const
    {
        if (HasValue()) object[Name()] = Value();
    }

    Status ChoiceField::ReadJson(const nlohmann::json& value)
    {
        if (value.is_null())
        {
            Reset();
            return {};
        }
        if (!value.is_string()) return KindError(Name(), "string choice", value.type_name());
        return Set(value.get<std::string>());
    }
}
