#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

import Resource;

#include "TestResourceBuilders.h"

using namespace Resource;

TEST(Wire, RequireMember)
{
    const nlohmann::json doc = {{"a", 1}};
    auto found = RequireMember(doc, "a", "doc");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(**found, 1);

    auto missing = RequireMember(doc, "b", "doc");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().Code, ResourceError::MalformedDocument);
    EXPECT_EQ(missing.error().Subject, "b");

    auto notObject = RequireMember(nlohmann::json::array(), "a", "doc");
    ASSERT_FALSE(notObject.has_value());
    EXPECT_EQ(notObject.error().Code, ResourceError::MalformedDocument);
}

TEST(Wire, RequireTypedMembers)
{
    const nlohmann::json doc = {{"s", "text"}, {"o", nlohmann::json::object()}, {"a", nlohmann::json::array()}};

    EXPECT_EQ(RequireString(doc, "s", "doc").value(), "text");
    EXPECT_FALSE(RequireString(doc, "o", "doc").has_value());
    EXPECT_TRUE(RequireObject(doc, "o", "doc").has_value());
    EXPECT_FALSE(RequireObject(doc, "a", "doc").has_value());
    EXPECT_TRUE(RequireArray(doc, "a", "doc").has_value());
    EXPECT_FALSE(RequireArray(doc, "s", "doc").has_value());
}

TEST(Wire, OptionalString)
{
    const nlohmann::json doc = {{"title", "t"}, {"none", nullptr}, {"number", 3}};
    EXPECT_EQ(OptionalString(doc, "title", "doc").value(), "t");
    EXPECT_EQ(OptionalString(doc, "none", "doc").value(), "");
    EXPECT_EQ(OptionalString(doc, "absent", "doc").value(), "");

    auto wrong = OptionalString(doc, "number", "doc");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().Code, ResourceError::MalformedDocument);
}

TEST(Wire, FetchArray_DecodesWithDeclaredShape)
{
    MemoryFetcher fetcher;
    fetcher.Put("loc", MakeLMesh().Vertices.Value());

    auto array = FetchArray<float>(fetcher, {{"vertices", "loc"}}, "vertices", ShapeSpec{{kWildcard, 3}}, "mesh");
    ASSERT_TRUE(array.has_value());
    EXPECT_EQ(array->Rows(), 3u);
}

TEST(Wire, FetchArray_DecodeErrorNamesArray)
{
    MemoryFetcher fetcher;
    fetcher.Blobs["loc"] = std::vector<std::byte>(16);

    auto array = FetchArray<float>(fetcher, {{"vertices", "loc"}}, "vertices", ShapeSpec{{kWildcard, 3}}, "mesh");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().Code, ResourceError::DecodeError);
    EXPECT_EQ(array.error().Subject, "vertices");
    EXPECT_EQ(array.error().Message.rfind("mesh.vertices", 0), 0u) << array.error().Message;
}

TEST(Wire, FetchArray_LocationMustBeString)
{
    MemoryFetcher fetcher;
    auto array = FetchArray<float>(fetcher, {{"vertices", 12}}, "vertices", ShapeSpec{{kWildcard, 3}}, "mesh");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().Code, ResourceError::MalformedDocument);
    EXPECT_EQ(fetcher.FetchCount, 0);
}
