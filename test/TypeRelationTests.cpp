#include <gtest/gtest.h>
#include "../headers/facetCore.h"
#include <stdexcept>
#include <vector>

using namespace facet;

class TypeRelationTest : public ::testing::Test {
protected:
    facet::TypeSpace* space;
    const TypeDescriptor* instrument;
    const TypeDescriptor* chordophone;
    const TypeDescriptor* aerophone;
    const TypeDescriptor* guitar;
    const TypeDescriptor* hybrid;

    void SetUp() override {
        space = new facet::TypeSpace();
        instrument = space->newType("instrument");
        chordophone = space->newType("chordophone", {instrument});
        aerophone = space->newType("aerophone", {instrument});
        guitar = space->newType("guitar", {chordophone});
        hybrid = space->newType("hybrid", {chordophone, aerophone});
    }

    void TearDown() override {
        delete space;
    }

    std::vector<const TypeDescriptor*> all() const {
        return {instrument, chordophone, aerophone, guitar, hybrid};
    }
};

TEST_F(TypeRelationTest, Reflexivity) {
    for (const TypeDescriptor* t : all()) {
        ASSERT_TRUE(t->is(t)) << t->getName();
    }
    ASSERT_TRUE(FACET_ABSENT_TYPE->is(FACET_ABSENT_TYPE));
}

TEST_F(TypeRelationTest, DirectAndTransitiveSubtypes) {
    ASSERT_TRUE(instrument->is(chordophone));
    ASSERT_TRUE(chordophone->is(guitar));
    ASSERT_TRUE(instrument->is(guitar));

    // Subtype is not the other way around
    ASSERT_FALSE(guitar->is(instrument));
    ASSERT_FALSE(chordophone->is(instrument));

    // Siblings are unrelated
    ASSERT_FALSE(chordophone->is(aerophone));
    ASSERT_FALSE(aerophone->is(guitar));
}

TEST_F(TypeRelationTest, TransitivityOverAllTriples) {
    for (const TypeDescriptor* a : all()) {
        for (const TypeDescriptor* b : all()) {
            for (const TypeDescriptor* c : all()) {
                if (a->is(b) && b->is(c)) {
                    ASSERT_TRUE(a->is(c)) << a->getName() << " " << b->getName() << " " << c->getName();
                }
            }
        }
    }
}

/**
 * Diamond:
 *       instrument
 *        /      \
 * chordophone  aerophone
 *        \      /
 *         hybrid
 */
TEST_F(TypeRelationTest, MultipleParents) {
    ASSERT_TRUE(chordophone->is(hybrid));
    ASSERT_TRUE(aerophone->is(hybrid));
    ASSERT_TRUE(instrument->is(hybrid));
    ASSERT_FALSE(guitar->is(hybrid));
    ASSERT_TRUE(hybrid->isSubtypeOf(instrument));
    ASSERT_EQ(hybrid->getDepth(), 2u);
    ASSERT_EQ(hybrid->getParents().size(), 2u);
}

TEST_F(TypeRelationTest, AbsentTypeExclusion) {
    const TypeDescriptor* absent = FACET_ABSENT_TYPE;
    ASSERT_TRUE(absent->isAbsent());
    for (const TypeDescriptor* t : all()) {
        ASSERT_FALSE(t->isAbsent());
        ASSERT_FALSE(t->is(absent)) << t->getName();
        ASSERT_FALSE(absent->is(t)) << t->getName();
    }
    ASSERT_FALSE(instrument->is(nullptr));
    ASSERT_FALSE(absent->is(nullptr));
    ASSERT_EQ(absent->getName(), "absent");
    ASSERT_EQ(absent->getHash(), 0UL);
    ASSERT_EQ(absent->getSpace(), nullptr);
    ASSERT_TRUE(absent->getParents().empty());
}

TEST_F(TypeRelationTest, LookupNeverReturnsNull) {
    ASSERT_EQ(space->getType("guitar"), guitar);
    ASSERT_TRUE(space->isDeclared("guitar"));
    ASSERT_FALSE(space->isDeclared("lute"));

    const TypeDescriptor* missing = space->getType("lute");
    ASSERT_NE(missing, nullptr);
    ASSERT_TRUE(missing->isAbsent());
    ASSERT_EQ(space->getSize(), 5u);
}

TEST_F(TypeRelationTest, NotFoundCallback) {
    space->typeNotFoundCallback = [](TypeSpace* s, const std::string& name) -> const TypeDescriptor* {
        return s->newType(name, {s->getType("chordophone")});
    };
    const TypeDescriptor* lute = space->getType("lute");
    ASSERT_FALSE(lute->isAbsent());
    ASSERT_TRUE(chordophone->is(lute));
    ASSERT_EQ(space->getType("lute"), lute);
}

TEST_F(TypeRelationTest, RejectedDeclarations) {
    ASSERT_THROW(space->newType("guitar"), std::invalid_argument);
    ASSERT_THROW(space->newType("ghost", {FACET_ABSENT_TYPE}), std::invalid_argument);
    ASSERT_THROW(space->newType("ghost", {nullptr}), std::invalid_argument);

    facet::TypeSpace other;
    const TypeDescriptor* foreign = other.newType("instrument");
    ASSERT_THROW(space->newType("ghost", {foreign}), std::invalid_argument);
    ASSERT_FALSE(space->isDeclared("ghost"));

    // Same name in two spaces: distinct, unrelated types
    ASSERT_FALSE(instrument->is(foreign));
    ASSERT_FALSE(foreign->is(instrument));
}

TEST_F(TypeRelationTest, HierarchyDepthLimit) {
    space->maxHierarchyDepth = 3;
    const TypeDescriptor* level3 = space->newType("level3", {guitar});
    ASSERT_EQ(level3->getDepth(), 3u);
    ASSERT_THROW(space->newType("level4", {level3}), std::invalid_argument);
}

TEST_F(TypeRelationTest, DistinctHashes) {
    ASSERT_NE(instrument->getHash(), 0UL);
    ASSERT_NE(instrument->getHash(), chordophone->getHash());
    ASSERT_EQ(guitar->getSpace(), space);
}

namespace {
    struct Instrument {};
    struct Chordophone : Instrument {};
    struct Guitar : Chordophone {};
}

TEST_F(TypeRelationTest, TypedHandles) {
    Type<Instrument> instrumentType(instrument);
    Type<Chordophone> chordophoneType(chordophone);
    Type<Guitar> guitarType(guitar);

    ASSERT_TRUE(instrumentType.is(guitarType));
    ASSERT_TRUE(chordophoneType.is(guitarType));
    ASSERT_TRUE(guitarType.is(guitarType));

    Type<Guitar> unknown(nullptr);
    ASSERT_TRUE(unknown.getDescriptor()->isAbsent());
    ASSERT_FALSE(instrumentType.is(unknown));
}
