module;

#include <string>
#include <vector>

export module Resource:Options;

import :Field;
import :PropertyObject;

export namespace Resource
{
    // Display options. Options never carry binary payloads; they travel in
    // the "meta" object of their owner.
    class Options : public PropertyObject
    {
    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override { return {}; }
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override { return {}; }
    };

    class ColorOptions : public Options
    {
    public:
        ColorField Color{"color"};
        NumberField Opacity{"opacity", 0.0, 1.0, 1.0};

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override { return {&Color, &Opacity}; }
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override { return {&Color, &Opacity}; }
    };

    class Mesh1DOptions : public Options
    {
    public:
        ChoiceField ViewType{"view_type",
                             {{"line", {"lines", "thin", "1d"}},
                              {"tube", {"tubes", "extruded line", "extruded lines", "borehole", "boreholes"}}},
                             std::string("line")};

    protected:
        [[nodiscard]] std::vector<FieldBase*> CollectFields() override { return {&ViewType}; }
        [[nodiscard]] std::vector<const FieldBase*> CollectFields() const override { return {&ViewType}; }
    };

    class LineOptions final : public ColorOptions
    {
    };

    class PointOptions final : public ColorOptions
    {
    };
}
