#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <vector>

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

import Resource;

using namespace Resource;

TEST(Interchange, LineSet_AppliesBothOrigins)
{
    InterchangeLineSet geometry;
    geometry.Vertices = {{0.0, 0.0, 0.0}, {1.0, 2.0, 3.0}};
    geometry.Segments = {{0, 1}};
    geometry.Origin = {10.0, 0.0, 0.0};

    InterchangeProject project;
    project.Origin = {0.0, 100.0, -5.0};

    auto mesh = ImportMesh1D(geometry, project);
    ASSERT_TRUE(mesh.has_value()) << mesh.error().Message;
    EXPECT_EQ(mesh->NodeCount(), 2u);
    EXPECT_EQ(mesh->CellCount(), 1u);

    const glm::vec3 v1 = VertexAt(mesh->Vertices.Value(), 1);
    EXPECT_FLOAT_EQ(v1.x, 11.0f);
    EXPECT_FLOAT_EQ(v1.y, 102.0f);
    EXPECT_FLOAT_EQ(v1.z, -2.0f);
}

TEST(Interchange, LineSet_SegmentsMustBePairwise)
{
    InterchangeLineSet geometry;
    geometry.Vertices = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}};
    geometry.Segments = {{0, 1}, {0, 1, 2}};

    auto mesh = ImportMesh1D(geometry, {});
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, ResourceError::ShapeMismatch);
    ASSERT_TRUE(mesh.error().Index.has_value());
    EXPECT_EQ(*mesh.error().Index, 1u);
}

TEST(Interchange, LineSet_IndicesMustFitInt32)
{
    InterchangeLineSet geometry;
    geometry.Vertices = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}};
    geometry.Segments = {{0, static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::max()) + 1}};

    auto mesh = ImportMesh1D(geometry, {});
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, ResourceError::KindMismatch);
}

TEST(Interchange, PointSet_AppliesOrigins)
{
    InterchangePointSet geometry;
    geometry.Vertices = {{1.0, 1.0, 1.0}};
    geometry.Origin = {1.0, 0.0, 0.0};

    auto mesh = ImportMesh0D(geometry, InterchangeProject{{0.0, 0.0, 1.0}});
    ASSERT_TRUE(mesh.has_value());
    const glm::vec3 v = VertexAt(mesh->Vertices.Value(), 0);
    EXPECT_FLOAT_EQ(v.x, 2.0f);
    EXPECT_FLOAT_EQ(v.y, 1.0f);
    EXPECT_FLOAT_EQ(v.z, 2.0f);
}

TEST(Interchange, ReadLineSetFromJson)
{
    const nlohmann::json doc = {
        {"vertices", {{"array", {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {1.0, 1.0, 0.0}}}}},
        {"segments", {{"array", {{0, 1}, {1, 2}}}}},
        {"origin", {5.0, 0.0, 0.0}},
    };

    auto geometry = ReadInterchangeLineSet(doc);
    ASSERT_TRUE(geometry.has_value()) << geometry.error().Message;
    EXPECT_EQ(geometry->Vertices.size(), 3u);
    EXPECT_EQ(geometry->Segments.size(), 2u);
    EXPECT_DOUBLE_EQ(geometry->Origin.x, 5.0);

    auto project = ReadInterchangeProject({{"origin", {0.0, 0.0, 10.0}}});
    ASSERT_TRUE(project.has_value());

    auto mesh = ImportMesh1D(*geometry, *project);
    ASSERT_TRUE(mesh.has_value());
    const glm::vec3 v2 = VertexAt(mesh->Vertices.Value(), 2);
    EXPECT_FLOAT_EQ(v2.x, 6.0f);
    EXPECT_FLOAT_EQ(v2.z, 10.0f);
}

TEST(Interchange, ReadLineSet_RejectsFloatIndices)
{
    const nlohmann::json doc = {
        {"vertices", {{"array", {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}}}}},
        {"segments", {{"array", {{0, 1.5}}}}},
    };

    auto geometry = ReadInterchangeLineSet(doc);
    ASSERT_FALSE(geometry.has_value());
    EXPECT_EQ(geometry.error().Code, ResourceError::KindMismatch);
}

TEST(Interchange, ReadLineSet_MissingVerticesIsMalformed)
{
    auto geometry = ReadInterchangeLineSet({{"segments", {{"array", nlohmann::json::array()}}}});
    ASSERT_FALSE(geometry.has_value());
    EXPECT_EQ(geometry.error().Code, ResourceError::MalformedDocument);
}

TEST(Interchange, ReadPointSetFromJson)
{
    const nlohmann::json doc = {
        {"vertices", {{"array", {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}}}}},
        {"origin", {1.0, 2.0, 3.0}},
    };

    auto geometry = ReadInterchangePointSet(doc);
    ASSERT_TRUE(geometry.has_value()) << geometry.error().Message;
    ASSERT_EQ(geometry->Vertices.size(), 2u);
    EXPECT_DOUBLE_EQ(geometry->Origin.z, 3.0);

    auto mesh = ImportMesh0D(*geometry, InterchangeProject{{0.0, 0.0, -3.0}});
    ASSERT_TRUE(mesh.has_value()) << mesh.error().Message;
    EXPECT_EQ(mesh->NodeCount(), 2u);
    const glm::vec3 v1 = VertexAt(mesh->Vertices.Value(), 1);
    EXPECT_FLOAT_EQ(v1.x, 2.0f);
    EXPECT_FLOAT_EQ(v1.y, 2.0f);
    EXPECT_FLOAT_EQ(v1.z, 0.0f);
}

TEST(Interchange, ReadPointSet_OriginIsOptional)
{
    auto geometry = ReadInterchangePointSet({{"vertices", {{"array", {{4.0, 5.0, 6.0}}}}}});
    ASSERT_TRUE(geometry.has_value()) << geometry.error().Message;
    EXPECT_EQ(geometry->Origin, glm::dvec3(0.0));
}

TEST(Interchange, ReadPointSet_MissingVerticesIsMalformed)
{
    auto geometry = ReadInterchangePointSet({{"origin", {0.0, 0.0, 0.0}}});
    ASSERT_FALSE(geometry.has_value());
    EXPECT_EQ(geometry.error().Code, ResourceError::MalformedDocument);
}
