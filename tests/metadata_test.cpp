//! # Metadata Tests

#include "exemplar/core/metadata.hpp"

#include <gtest/gtest.h>

using namespace exemplar;
using namespace exemplar::core;

class MetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto outer = make_rc<GroupMetadata>();
        outer->description = "Stack";
        outer->tags = {{"speed", "fast"}, {"kind", "unit"}};

        auto inner = make_rc<GroupMetadata>();
        inner->description = "when empty";
        inner->tags = {{"kind", "edge"}};
        inner->parent = outer;

        group = inner;
    }

    Rc<const GroupMetadata> group;
};

TEST_F(MetadataTest, GroupFullDescriptionJoinsAncestors) {
    EXPECT_EQ(group->full_description(), "Stack when empty");
}

TEST_F(MetadataTest, GroupTagsInheritNearestFirst) {
    EXPECT_EQ(group->tag("kind"), "edge");
    EXPECT_EQ(group->tag("speed"), "fast");
    EXPECT_FALSE(group->tag("missing"));
}

TEST_F(MetadataTest, ExampleMetadataIsDerivedFromGroup) {
    ExampleOptions options;
    options.tags = {{"speed", "slow"}};
    Metadata metadata =
        Metadata::for_example(group, "pops nothing", options, SourceLocation{"stack_test.cpp", 12});

    EXPECT_EQ(metadata.group(), group);
    EXPECT_EQ(metadata.description(), "pops nothing");
    EXPECT_EQ(metadata.full_description(), "Stack when empty pops nothing");
    EXPECT_EQ(metadata.file_path(), "stack_test.cpp");
    EXPECT_EQ(metadata.line_number(), 12u);
    EXPECT_EQ(metadata.location(), "stack_test.cpp:12");

    // Example tags override group tags
    EXPECT_EQ(metadata.tag("speed"), "slow");
    EXPECT_EQ(metadata.tag("kind"), "edge");
    EXPECT_EQ(metadata.tags().size(), 1u);
}

TEST_F(MetadataTest, EmptyDescriptionHasNoArgs) {
    Metadata metadata = Metadata::for_example(group, "", {}, SourceLocation{});
    EXPECT_TRUE(metadata.description_args().empty());
    EXPECT_EQ(metadata.description(), "");
    EXPECT_EQ(metadata.full_description(), "Stack when empty");
    EXPECT_EQ(metadata.location(), "<unknown>");

    metadata.description_args().push_back("is expected to eq 3");
    EXPECT_EQ(metadata.full_description(), "Stack when empty is expected to eq 3");
}

TEST_F(MetadataTest, SkipDirectiveIsCopiedPendingIsNot) {
    Metadata skipped =
        Metadata::for_example(group, "a", ExampleOptions::skipped_because("slow"), SourceLocation{});
    EXPECT_EQ(skipped.skip(), "slow");
    EXPECT_FALSE(skipped.pending());

    Metadata pending =
        Metadata::for_example(group, "b", ExampleOptions::pending_because(), SourceLocation{});
    EXPECT_FALSE(pending.skip());
    // Declared pending is applied by the example itself
    EXPECT_FALSE(pending.pending());
    EXPECT_EQ(pending.execution_result().status(), Status::NotStarted);
}
