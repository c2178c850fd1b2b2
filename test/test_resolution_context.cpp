#include <gtest/gtest.h>

#include <apiref/core.h>

using namespace apiref;

TEST(ResolutionContext, StartsEmpty) {
    Components components;
    ResolutionContext context{components};
    EXPECT_EQ(context.depth(), 0UL);
    EXPECT_EQ(&context.components(), &components);
}

TEST(ResolutionContext, EnterAndLeave) {
    Components components;
    ResolutionContext context{components};
    {
        auto outer = context.enter(SCHEMAS, "A");
        EXPECT_TRUE(context.in_progress(SCHEMAS, "A"));
        EXPECT_FALSE(context.in_progress(EXAMPLES, "A"));
        {
            auto inner = context.enter(SCHEMAS, "B");
            EXPECT_EQ(context.depth(), 2UL);
        }
        EXPECT_FALSE(context.in_progress(SCHEMAS, "B"));
        EXPECT_EQ(context.depth(), 1UL);
    }
    EXPECT_EQ(context.depth(), 0UL);
}

TEST(ResolutionContext, ReenterThrowsRecursiveReference) {
    Components components;
    ResolutionContext context{components};
    auto entry = context.enter(HEADERS, "X");
    try {
        auto again = context.enter(HEADERS, "X");
        FAIL();
    } catch (const RecursiveReference& error) {
        EXPECT_EQ(error.kind(), ReferenceError::RECURSIVE_REFERENCE);
        EXPECT_EQ(error.category(), HEADERS);
        EXPECT_EQ(error.name(), "X");
    }
    EXPECT_EQ(context.depth(), 1UL);
}

TEST(ResolutionContext, SameNameInOtherCategoryIsNotRecursive) {
    Components components;
    ResolutionContext context{components};
    auto schema_entry = context.enter(SCHEMAS, "Pet");
    auto example_entry = context.enter(EXAMPLES, "Pet");
    EXPECT_EQ(context.depth(), 2UL);
}

TEST(ResolutionContext, MovedEntryLeavesOnce) {
    Components components;
    ResolutionContext context{components};
    {
        auto entry = context.enter(SCHEMAS, "A");
        auto moved = std::move(entry);
        EXPECT_TRUE(context.in_progress(SCHEMAS, "A"));
    }
    EXPECT_EQ(context.depth(), 0UL);
}

TEST(ResolutionContext, EmptyAfterFailedResolution) {
    Components components;
    components.add("A", Schema::reference("B"));
    components.add("B", Schema::reference("Missing"));

    ResolutionContext context{components};
    EXPECT_THROW(context.dereference(Reference<Schema>::local("A")), NotFound);
    EXPECT_EQ(context.depth(), 0UL);
}

TEST(ResolutionContext, EmptyAfterRecursiveFailure) {
    Components components;
    components.add("A", Schema::reference("B"));
    components.add("B", Schema::reference("A"));

    ResolutionContext context{components};
    EXPECT_THROW(context.dereference(Reference<Schema>::local("A")), RecursiveReference);
    EXPECT_EQ(context.depth(), 0UL);
}

TEST(ResolutionContext, ReusableAfterSuccess) {
    Components components;
    components.add("Name", Schema::of_type("string"));

    ResolutionContext context{components};
    auto first = context.dereference(Reference<Schema>::local("Name"));
    auto second = context.dereference(Reference<Schema>::local("Name"));
    EXPECT_EQ(first.type(), "string");
    EXPECT_EQ(second.type(), "string");
    EXPECT_EQ(context.depth(), 0UL);
}

TEST(ResolutionContext, DereferenceRefOr) {
    Components components;
    Example cat;
    cat.value = Object{"Tom"};
    components.add("cat", cat);

    ResolutionContext context{components};
    RefOr<Example> by_ref = Reference<Example>::local("cat");
    RefOr<Example> by_value = Example{};
    EXPECT_EQ(context.dereference(by_ref), cat);
    EXPECT_EQ(context.dereference(by_value), Example{});
}
