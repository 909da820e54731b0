// test_unit_builder.cpp - Construction, nesting and merging of units
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "nestgeom/basic/error.hpp"
#include "nestgeom/render/renderer.hpp"
#include "nestgeom/unit/unit.hpp"
#include "nestgeom/unit/unit_builder.hpp"
#include "nestgeom/unit/unit_context.hpp"

using namespace nestgeom;

class UnitBuilderTest : public ::testing::Test
{
protected:
  UnitContext ctx;
  UnitBuilder b{ctx};
};

// ============================================================================
// join
// ============================================================================

TEST_F(UnitBuilderTest, JoinSetsBothLinks)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");

  Unit * handle = b.join(a, u);

  EXPECT_EQ(handle, a);
  EXPECT_EQ(a->up, u);
  EXPECT_EQ(u->down, a);
  EXPECT_EQ(a->down, nullptr);
  EXPECT_EQ(u->up, nullptr);
}

TEST_F(UnitBuilderTest, JoinComposesLeftToRight)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  Unit * c = b.ucell("C");

  Unit * handle = b.join(b.join(a, u), c);

  EXPECT_EQ(handle, a);
  EXPECT_EQ(a->up, u);
  EXPECT_EQ(u->up, c);
  EXPECT_EQ(c->up, nullptr);
  EXPECT_EQ(c->down, u);
  EXPECT_EQ(u->down, a);
  EXPECT_EQ(outermost(a), c);
  EXPECT_EQ(innermost(c), a);
}

TEST_F(UnitBuilderTest, JoinRightNestedBuildsSameChain)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  Unit * c = b.ucell("C");

  Unit * handle = b.join(a, b.join(u, c));

  EXPECT_EQ(handle, a);
  EXPECT_EQ(a->up, u);
  EXPECT_EQ(u->up, c);
  EXPECT_EQ(c->down, u);
  EXPECT_EQ(u->down, a);
}

TEST_F(UnitBuilderTest, JoinFromMiddleNodeExtendsChain)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  Unit * c = b.ucell("C");
  (void)b.join(a, u);

  Unit * handle = b.join(u, c);

  EXPECT_EQ(handle, a);
  EXPECT_EQ(u->up, c);
  EXPECT_EQ(c->down, u);
}

TEST_F(UnitBuilderTest, JoinRejectsOuterThatAlreadyContainsAUnit)
{
  Unit * a = b.cell("A");
  Unit * x = b.cell("X");
  Unit * u = b.univ("B");
  (void)b.join(a, u);

  EXPECT_THROW((void)b.join(x, u), AlreadyNestedError);

  // Graph is unchanged
  EXPECT_EQ(x->up, nullptr);
  EXPECT_EQ(u->down, a);
  EXPECT_EQ(a->up, u);
}

TEST_F(UnitBuilderTest, JoinRejectsCycles)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  (void)b.join(a, u);

  EXPECT_THROW((void)b.join(u, a), AlreadyNestedError);
  EXPECT_EQ(a->down, nullptr);
  EXPECT_EQ(u->up, nullptr);
}

TEST_F(UnitBuilderTest, JoinRejectsSelf)
{
  Unit * a = b.cell("A");
  EXPECT_THROW((void)b.join(a, a), AlreadyNestedError);
  EXPECT_EQ(a->up, nullptr);
  EXPECT_EQ(a->down, nullptr);
}

TEST_F(UnitBuilderTest, AlreadyNestedCarriesErrorCode)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  (void)b.join(a, u);

  try {
    (void)b.join(b.cell("X"), u);
    FAIL() << "expected AlreadyNestedError";
  } catch (const NestError & e) {
    EXPECT_EQ(e.code(), ErrorCode::AlreadyNested);
    EXPECT_EQ(error_code_string(e.code()), "E001");
  }
}

TEST_F(UnitBuilderTest, JoinRejectsOuterUnionContainingInner)
{
  Unit * p = b.cell("P");
  UnionUnit * u = b.union_with(p, b.cell("Q"));

  EXPECT_THROW((void)b.join(p, u), AlreadyNestedError);
  EXPECT_EQ(p->up, nullptr);
  EXPECT_EQ(u->down, nullptr);
  EXPECT_EQ(render_comment(u), "union of (cell 'P', cell 'Q')");
}

TEST_F(UnitBuilderTest, JoinRejectsOuterContainingInnerThroughNestedMembers)
{
  Unit * p = b.cell("P");
  Unit * inner_chain = b.join(b.make_union({p, b.cell("Q")}), b.univ("U"));
  VectorUnit * outer = b.make_vector({inner_chain, b.cell("R")});

  EXPECT_THROW((void)b.join(p, outer), AlreadyNestedError);
  EXPECT_EQ(p->up, nullptr);
  EXPECT_EQ(outer->down, nullptr);
}

TEST_F(UnitBuilderTest, JoinRejectsOuterContainingAnyLevelOfInnerChain)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  (void)b.join(a, u);
  UnionUnit * outer = b.make_union({u, b.univ("C")});

  EXPECT_THROW((void)b.join(a, outer), AlreadyNestedError);
  EXPECT_EQ(u->up, nullptr);
  EXPECT_EQ(outer->down, nullptr);
}

TEST_F(UnitBuilderTest, SharedLeafInSeparateUnionIsAllowed)
{
  Unit * p = b.cell("P");
  (void)b.make_union({p, b.cell("Q")});

  Unit * handle = b.join(p, b.union_with(b.univ("U"), b.univ("V")));
  EXPECT_EQ(handle, p);
  EXPECT_NE(p->up, nullptr);
}

TEST_F(UnitBuilderTest, ChainFoldsJoinInnermostFirst)
{
  Unit * a = b.surf("A");
  Unit * c = b.ucell("C");
  Unit * u = b.univ("U");

  Unit * handle = b.chain({a, c, u});

  EXPECT_EQ(handle, a);
  EXPECT_EQ(a->up, c);
  EXPECT_EQ(c->up, u);
  EXPECT_EQ(u->down, c);
}

TEST_F(UnitBuilderTest, ChainOfOneLevelIsThatLevel)
{
  Unit * a = b.surf("A");
  EXPECT_EQ(b.chain({a}), a);
  EXPECT_TRUE(a->is_outermost());
  EXPECT_TRUE(a->is_innermost());
}

TEST_F(UnitBuilderTest, EmptyChainIsRejected)
{
  try {
    (void)b.chain(gsl::span<Unit * const>());
    FAIL() << "expected EmptyCombinatorError";
  } catch (const EmptyCombinatorError & e) {
    EXPECT_EQ(error_code_string(e.code()), "E004");
    EXPECT_EQ(std::string(e.what()), "nesting chain must contain at least one level");
  }
}

TEST_F(UnitBuilderTest, GroupBoundariesFollowLinks)
{
  Unit * a = b.cell("A");
  Unit * u = b.univ("B");
  Unit * c = b.ucell("C");
  (void)b.chain({a, u, c});

  EXPECT_TRUE(a->opens_group());
  EXPECT_FALSE(a->closes_group());
  EXPECT_FALSE(u->opens_group());
  EXPECT_FALSE(u->closes_group());
  EXPECT_FALSE(c->opens_group());
  EXPECT_TRUE(c->closes_group());

  Unit * lone = b.surf("S");
  EXPECT_FALSE(lone->opens_group());
  EXPECT_FALSE(lone->closes_group());
}

// ============================================================================
// union / vector
// ============================================================================

TEST_F(UnitBuilderTest, UnionOfTwoPlainUnitsWrapsBoth)
{
  Unit * a = b.surf("A");
  Unit * c = b.surf("C");

  UnionUnit * u = b.union_with(a, c);

  ASSERT_EQ(u->alternatives.size(), 2u);
  EXPECT_EQ(u->alternatives[0], a);
  EXPECT_EQ(u->alternatives[1], c);
}

TEST_F(UnitBuilderTest, UnionIsLeftFlattening)
{
  Unit * a = b.surf("A");
  Unit * bb = b.surf("B");
  Unit * c = b.surf("C");

  UnionUnit * first = b.union_with(a, bb);
  UnionUnit * merged = b.union_with(first, c);

  EXPECT_EQ(merged, first);
  ASSERT_EQ(merged->alternatives.size(), 3u);
  EXPECT_EQ(merged->alternatives[0], a);
  EXPECT_EQ(merged->alternatives[1], bb);
  EXPECT_EQ(merged->alternatives[2], c);
  for (const Unit * alt : merged->alternatives) {
    EXPECT_FALSE(isa<UnionUnit>(alt));
  }
}

TEST_F(UnitBuilderTest, VectorIsLeftFlattening)
{
  Unit * a = b.cell("A");
  Unit * bb = b.cell("B");
  Unit * c = b.cell("C");
  Unit * d = b.cell("D");

  VectorUnit * v = b.vector_with(b.vector_with(b.vector_with(a, bb), c), d);

  ASSERT_EQ(v->elements.size(), 4u);
  EXPECT_EQ(v->elements[0], a);
  EXPECT_EQ(v->elements[3], d);
}

TEST_F(UnitBuilderTest, UnionAndVectorDoNotFlattenIntoEachOther)
{
  Unit * a = b.surf("A");
  Unit * bb = b.surf("B");
  Unit * c = b.surf("C");

  VectorUnit * v = b.vector_with(a, bb);
  UnionUnit * u = b.union_with(v, c);

  ASSERT_EQ(u->alternatives.size(), 2u);
  EXPECT_EQ(u->alternatives[0], v);
  EXPECT_EQ(v->elements.size(), 2u);
}

TEST_F(UnitBuilderTest, MixedMemberKindsAreAccepted)
{
  UnionUnit * u = b.make_union({b.surf("S"), b.cell("C"), b.univ("U")});
  EXPECT_EQ(u->alternatives.size(), 3u);

  VectorUnit * v = b.make_vector({u, b.surf("T")});
  EXPECT_EQ(v->elements.size(), 2u);
}

TEST_F(UnitBuilderTest, MergingCombinatorIntoItselfIsRejected)
{
  UnionUnit * u = b.union_with(b.surf("A"), b.surf("B"));
  EXPECT_THROW((void)b.union_with(u, u), AlreadyNestedError);
  EXPECT_EQ(u->alternatives.size(), 2u);

  VectorUnit * v = b.vector_with(b.surf("A"), b.surf("B"));
  EXPECT_THROW((void)b.vector_with(v, v), AlreadyNestedError);
  EXPECT_EQ(v->elements.size(), 2u);
}

TEST_F(UnitBuilderTest, MergingMemberThatContainsLeftIsRejected)
{
  VectorUnit * v = b.vector_with(b.cell("A"), b.cell("B"));
  UnionUnit * wrapper = b.make_union({v});

  EXPECT_THROW((void)b.vector_with(v, wrapper), AlreadyNestedError);
  EXPECT_EQ(v->elements.size(), 2u);

  Unit * p = b.cell("P");
  EXPECT_THROW((void)b.union_with(p, p), AlreadyNestedError);
  EXPECT_THROW((void)b.union_with(p, b.make_vector({p})), AlreadyNestedError);
}

TEST_F(UnitBuilderTest, SingleMemberUnionIsAllowed)
{
  UnionUnit * u = b.make_union({b.univ("U")});
  ASSERT_EQ(u->alternatives.size(), 1u);
}

TEST_F(UnitBuilderTest, EmptyCombinatorsAreRejected)
{
  EXPECT_THROW((void)b.make_union(gsl::span<Unit * const>()), EmptyCombinatorError);
  EXPECT_THROW((void)b.make_vector(gsl::span<Unit * const>()), EmptyCombinatorError);
}

TEST_F(UnitBuilderTest, MakeUnionCopiesMembers)
{
  std::vector<Unit *> members = {b.surf("A"), b.surf("B")};
  UnionUnit * u = b.make_union(gsl::span<Unit * const>(members.data(), members.size()));
  members[0] = nullptr;

  EXPECT_NE(u->alternatives[0], nullptr);
}

// ============================================================================
// Lattice specs
// ============================================================================

TEST_F(UnitBuilderTest, RangeAxesDefaultToZero)
{
  IndexRangeSpec * r = b.lattice_range({0, 5}, {}, {0, 2});

  EXPECT_EQ(r->x.first, 0);
  EXPECT_EQ(r->x.last, 5);
  EXPECT_EQ(r->y.first, 0);
  EXPECT_EQ(r->y.last, 0);
  EXPECT_EQ(r->z.last, 2);
}

TEST_F(UnitBuilderTest, SinglePointIsStoredAsOnePointList)
{
  CoordinateListSpec * c = b.lattice_coords(LatticeIndex3{1, 2, 3});

  ASSERT_EQ(c->points.size(), 1u);
  EXPECT_EQ(c->points[0].i, 1);
  EXPECT_EQ(c->points[0].j, 2);
  EXPECT_EQ(c->points[0].k, 3);
}

TEST_F(UnitBuilderTest, PointListIsStoredAsGiven)
{
  CoordinateListSpec * c = b.lattice_coords({LatticeIndex3{1, 2, 3}, LatticeIndex3{-1, 3, -2}});

  ASSERT_EQ(c->points.size(), 2u);
  EXPECT_EQ(c->points[1].i, -1);
  EXPECT_EQ(c->points[1].k, -2);
}

TEST_F(UnitBuilderTest, EmptyPointListIsRejected)
{
  EXPECT_THROW(
    (void)b.lattice_coords(gsl::span<const LatticeIndex3>()), EmptyLatticeSelectionError);
}

TEST_F(UnitBuilderTest, LatticeAttachesToNestedCell)
{
  NestedCellRef * cell = b.ucell("lat");
  const LatticeSpec * spec = b.lattice_index(4);

  EXPECT_EQ(b.attach_lattice(cell, spec), cell);
  EXPECT_EQ(cell->latticeSpec, spec);
}

TEST_F(UnitBuilderTest, LatticeOnOtherKindsIsRejected)
{
  const LatticeSpec * spec = b.lattice_index(4);

  EXPECT_THROW((void)b.attach_lattice(b.cell("low"), spec), InvalidLatticeAttachmentError);
  EXPECT_THROW((void)b.attach_lattice(b.surf("s"), spec), InvalidLatticeAttachmentError);
  EXPECT_THROW((void)b.attach_lattice(b.univ("u"), spec), InvalidLatticeAttachmentError);
  EXPECT_THROW(
    (void)b.attach_lattice(b.make_union({b.ucell("x")}), spec), InvalidLatticeAttachmentError);
}

TEST_F(UnitBuilderTest, SecondLatticeIsRejected)
{
  NestedCellRef * cell = b.ucell("lat", b.lattice_index(1));

  EXPECT_THROW((void)b.attach_lattice(cell, b.lattice_index(2)), InvalidLatticeAttachmentError);
  EXPECT_TRUE(isa<LinearIndexSpec>(cell->latticeSpec));
  EXPECT_EQ(cast<LinearIndexSpec>(cell->latticeSpec)->index, 1);
}

// ============================================================================
// Names and bin counts
// ============================================================================

TEST_F(UnitBuilderTest, NamesAreInterned)
{
  auto * s1 = b.surf("wall");
  auto * s2 = b.surf("wall");

  EXPECT_NE(s1, s2);
  EXPECT_EQ(s1->name.data(), s2->name.data());
  EXPECT_TRUE(ctx.is_interned("wall"));
  EXPECT_EQ(unit_name(s1), "wall");
  EXPECT_TRUE(unit_name(b.make_union({s1})).empty());
}

TEST_F(UnitBuilderTest, BinCountOfPlainChainIsOne)
{
  Unit * handle = b.chain({b.cell("A"), b.univ("B"), b.ucell("C")});
  EXPECT_EQ(bin_count(handle), 1u);
}

TEST_F(UnitBuilderTest, BinCountMultipliesVectorLevels)
{
  Unit * inner = b.make_vector({b.surf("A"), b.surf("B")});
  Unit * outer = b.make_vector({b.ucell("D"), b.ucell("E")});
  Unit * handle = b.chain({inner, b.ucell("C"), outer});

  EXPECT_EQ(bin_count(handle), 4u);
}

TEST_F(UnitBuilderTest, BinCountTreatsUnionAsOneBin)
{
  Unit * handle = b.join(b.make_union({b.surf("A"), b.surf("B"), b.surf("C")}), b.ucell("D"));
  EXPECT_EQ(bin_count(handle), 1u);
}
