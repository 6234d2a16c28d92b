#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

import Resource;

#include "TestResourceBuilders.h"

using namespace Resource;

// -----------------------------------------------------------------------------
// Schema traversal
// -----------------------------------------------------------------------------

TEST(PropertyObject, FieldsAndChildren_AreExplicit)
{
    Mesh1D mesh;
    std::vector<std::string> names;
    for (const FieldBase* field : mesh.Fields()) names.push_back(field->Name());
    EXPECT_EQ(names, (std::vector<std::string>{"title", "description", "vertices", "segments"}));

    const auto children = mesh.Children();
    ASSERT_EQ(children.size(), 1u);
    EXPECT_EQ(children[0], &mesh.Opts);
}

TEST(PropertyObject, Validate_ReportsMissingRequiredField)
{
    DataArray data;
    auto status = data.Validate();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().Code, ResourceError::MissingRequired);
    EXPECT_EQ(status.error().Subject, "array");
}

TEST(PropertyObject, MarkSynced_RecursesIntoChildren)
{
    Mesh1D mesh = MakeLMesh();
    ASSERT_TRUE(mesh.Opts.ViewType.Set("tube").has_value());
    EXPECT_TRUE(mesh.IsDirty());

    mesh.MarkSynced();
    EXPECT_FALSE(mesh.IsDirty());
    EXPECT_FALSE(mesh.Opts.IsDirty());
    EXPECT_FALSE(mesh.Vertices.IsDirty());
}

TEST(PropertyObject, NBytes_SumsArrayFields)
{
    Mesh1D mesh = MakeLMesh();
    EXPECT_EQ(mesh.NBytes(), 3u * 3u * 4u + 2u * 2u * 4u);
    EXPECT_EQ(Mesh1D{}.NBytes(), 0u);
}

// -----------------------------------------------------------------------------
// Metadata
// -----------------------------------------------------------------------------

TEST(PropertyObject, Metadata_HoldsNonBinaryFields)
{
    LineOptions opts;
    const nlohmann::json meta = opts.Metadata();
    EXPECT_EQ(meta["color"], "random");
    EXPECT_DOUBLE_EQ(meta["opacity"].get<double>(), 1.0);

    Mesh1D mesh = MakeLMesh();
    const nlohmann::json meshMeta = mesh.Metadata();
    EXPECT_FALSE(meshMeta.contains("vertices"));
    EXPECT_FALSE(meshMeta.contains("segments"));
}

TEST(PropertyObject, ApplyMetadata_SetsKnownFields)
{
    PointOptions opts;
    auto status = opts.ApplyMetadata({{"color", "#00FF00"}, {"opacity", 0.25}, {"unknown", 3}});
    ASSERT_TRUE(status.has_value()) << status.error().Message;
    EXPECT_EQ(opts.Color.Value(), "#00ff00");
    EXPECT_DOUBLE_EQ(opts.Opacity.Value(), 0.25);
}

TEST(PropertyObject, ApplyMetadata_RejectsBadInput)
{
    LineOptions opts;
    auto notObject = opts.ApplyMetadata(nlohmann::json::array());
    ASSERT_FALSE(notObject.has_value());
    EXPECT_EQ(notObject.error().Code, ResourceError::MalformedDocument);

    auto wrongKind = opts.ApplyMetadata({{"opacity", "half"}});
    ASSERT_FALSE(wrongKind.has_value());
    EXPECT_EQ(wrongKind.error().Code, ResourceError::KindMismatch);
}

TEST(UserContent, SetContent_SkipsEmptyStrings)
{
    DataArray data = MakeData(2);
    ASSERT_TRUE(data.SetContent("temperature", "").has_value());
    EXPECT_EQ(data.Title.Value(), "temperature");
    EXPECT_FALSE(data.Description.HasValue());
}
