#include <gtest/gtest.h>
#include <lamination/shear.hpp>
#include <mutation/mutation.hpp>
#include <quiver/errors.hpp>
#include "test_helpers.hpp"

using namespace quiverkit;

TEST(Shear, CrossingSequence) {
    PolygonTriangulation t = test::make_octagon();

    std::vector<std::string> expected{"e1", "x5", "x1", "x3", "x2", "e4"};
    EXPECT_EQ(ShearCalculator::crossing_sequence(t, "e1", "e4"), expected);

    std::vector<std::string> reversed(expected.rbegin(), expected.rend());
    EXPECT_EQ(ShearCalculator::crossing_sequence(t, "e4", "e1"), reversed);
}

TEST(Shear, AdjacentSegmentsCrossNothing) {
    PolygonTriangulation t = test::make_octagon();
    std::vector<std::string> expected{"e0", "e1"};
    EXPECT_EQ(ShearCalculator::crossing_sequence(t, "e0", "e1"), expected);

    Quiver quiver = t.to_quiver();
    ShearVector zero(5, 0);
    EXPECT_EQ(ShearCalculator::shear_vector(quiver, t, {"u", "e0", "e1"}), zero);
}

TEST(Shear, OctagonExample) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();

    ShearVector expected{0, 0, -1, 0, 1};
    EXPECT_EQ(ShearCalculator::shear_vector(quiver, t, {"u", "e1", "e4"}), expected);
}

TEST(Shear, IndependentOfDirection) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();

    EXPECT_EQ(ShearCalculator::shear_vector(quiver, t, {"u", "e1", "e4"}),
              ShearCalculator::shear_vector(quiver, t, {"u", "e4", "e1"}));
    EXPECT_EQ(ShearCalculator::shear_vector(quiver, t, {"u", "e2", "e6"}),
              (ShearVector{1, 0, 0, -1, 0}));
}

TEST(Shear, PrincipalLaminationsGiveIdentity) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();
    auto laminations = t.principal_laminations();

    for (size_t i = 0; i < laminations.size(); ++i) {
        ShearVector row = ShearCalculator::shear_vector(quiver, t, laminations[i]);
        for (size_t j = 0; j < row.size(); ++j) {
            EXPECT_EQ(row[j], i == j ? 1 : 0) << laminations[i].name << " at " << j;
        }
    }
}

TEST(Shear, FlipAgreesWithExtendedMutation) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();
    Lamination lamination{"u", "e1", "e4"};

    ExtendedExchangeMatrix before = export_exchange_matrix(quiver, t, {lamination});
    ExtendedExchangeMatrix predicted = MutationEngine::mutate(before, 2);

    t.flip("x3");
    quiver.mutate("x3");

    ShearVector after = ShearCalculator::shear_vector(quiver, t, lamination);
    EXPECT_EQ(after, (ShearVector{-1, -1, 1, 0, 1}));
    EXPECT_EQ(after, predicted.shear_rows()[0].values);
}

TEST(Shear, ExportAppendsRows) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();

    ExtendedExchangeMatrix extended = export_exchange_matrix(quiver, t, t.principal_laminations());

    EXPECT_EQ(extended.row_count(), 10u);
    EXPECT_EQ(extended.column_count(), 5u);
    EXPECT_EQ(extended.principal().to_rows(), test::octagon_matrix());
    EXPECT_EQ(extended.row_labels()[5], "u_x1");
    EXPECT_EQ(extended.at(7, 2), 1);
    EXPECT_EQ(extended.at(7, 3), 0);
}

TEST(Shear, EndpointsMustBeFrozen) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();

    EXPECT_THROW(ShearCalculator::shear_vector(quiver, t, {"u", "x1", "e4"}), InvalidLaminationError);
    EXPECT_THROW(ShearCalculator::shear_vector(quiver, t, {"u", "e1", "nope"}), UnknownVertexError);
    EXPECT_THROW(ShearCalculator::crossing_sequence(t, "x1", "e4"), InvalidLaminationError);
}

TEST(Shear, DisconnectedEndpoints) {
    // A triangle has no diagonals, so its quiver has no arcs
    PolygonTriangulation t = PolygonTriangulation::standard(3);
    Quiver quiver = t.to_quiver();
    ASSERT_EQ(quiver.edge_count(), 0u);

    EXPECT_THROW(ShearCalculator::shear_vector(quiver, t, {"u", "e0", "e1"}), DisconnectedLaminationError);
}

TEST(Shear, QuiverMustMatchTriangulation) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = PolygonTriangulation::standard(8).to_quiver();
    quiver.add_vertex("extra", VertexKind::Cluster);

    EXPECT_THROW(ShearCalculator::shear_vector(quiver, t, {"u", "e1", "e4"}), EmbeddingError);
}

TEST(Shear, Connectivity) {
    Quiver quiver = test::make_a3_quiver();
    quiver.add_vertex("g", VertexKind::Frozen);

    EXPECT_TRUE(ShearCalculator::connected(quiver, quiver.index_of("f"), quiver.index_of("c")));
    EXPECT_FALSE(ShearCalculator::connected(quiver, quiver.index_of("f"), quiver.index_of("g")));
    EXPECT_TRUE(ShearCalculator::connected(quiver, quiver.index_of("g"), quiver.index_of("g")));
}

TEST(Shear, MutatedQuiverNeedsFlippedTriangulation) {
    PolygonTriangulation t = test::make_octagon();
    Quiver quiver = t.to_quiver();
    quiver.mutate("x3");

    Lamination lamination{"u", "e1", "e4"};
    EXPECT_THROW(ShearCalculator::shear_vector(quiver, t, lamination), EmbeddingError);

    t.flip("x3");
    EXPECT_EQ(ShearCalculator::shear_vector(quiver, t, lamination), (ShearVector{-1, -1, 1, 0, 1}));
}

TEST(Shear, ArrowsMustMatchTriangulation) {
    // Same names and kinds as the octagon, different diagonals
    PolygonTriangulation t = test::make_octagon();
    Quiver fan = PolygonTriangulation::standard(8).to_quiver();

    EXPECT_THROW(ShearCalculator::shear_vector(fan, t, {"u", "e1", "e4"}), EmbeddingError);
}
