#include <gtest/gtest.h>
#include <mutation/mutation.hpp>
#include <quiver/errors.hpp>
#include "test_helpers.hpp"
#include <limits>

using namespace quiverkit;

TEST(Mutation, ReversesArcsAtPivot) {
    Quiver quiver = test::make_a3_quiver();
    quiver.mutate("b");

    EXPECT_EQ(quiver.net_weight("b", "a"), 1);
    EXPECT_EQ(quiver.net_weight("c", "b"), 1);
    // Path a -> b -> c composes into a -> c
    EXPECT_EQ(quiver.net_weight("a", "c"), 1);
    // Arcs away from the pivot are untouched
    EXPECT_EQ(quiver.net_weight("f", "a"), 1);
}

TEST(Mutation, CompositionCancelsOppositeArc) {
    // Oriented 3-cycle a -> b -> c -> a
    Quiver quiver({{"a", VertexKind::Cluster}, {"b", VertexKind::Cluster}, {"c", VertexKind::Cluster}},
                  {{"a", "b"}, {"b", "c"}, {"c", "a"}});

    quiver.mutate("b");

    EXPECT_EQ(quiver.net_weight("a", "c"), 0);
    EXPECT_EQ(quiver.edge_count(), 2u);
    for (const auto& e : quiver.edges()) {
        EXPECT_GT(e.weight, 0);
    }
}

TEST(Mutation, MultipliesWeights) {
    Quiver quiver({{"a", VertexKind::Cluster}, {"b", VertexKind::Cluster}, {"c", VertexKind::Cluster}},
                  {{"a", "b", 2}, {"b", "c", 3}});

    quiver.mutate("b");

    EXPECT_EQ(quiver.net_weight("a", "c"), 6);
    EXPECT_EQ(quiver.net_weight("b", "a"), 2);
    EXPECT_EQ(quiver.net_weight("c", "b"), 3);
}

TEST(Mutation, FrozenVerticesGainArcs) {
    Quiver quiver = test::make_a3_quiver();
    quiver.mutate("a");

    // f -> a -> b gives f -> b
    EXPECT_EQ(quiver.net_weight("f", "b"), 1);
    EXPECT_EQ(quiver.net_weight("a", "f"), 1);
}

TEST(Mutation, IsAnInvolution) {
    Quiver original = test::make_octagon_quiver();

    for (const auto& name : {"x1", "x2", "x3", "x4", "x5"}) {
        Quiver quiver = original;
        quiver.mutate(name).mutate(name);
        EXPECT_EQ(quiver, original) << "mutating twice at " << name;
    }
}

TEST(Mutation, KeepsMatrixSkewSymmetric) {
    Quiver quiver = test::make_octagon_quiver();
    for (const auto& name : {"x3", "x1", "x5", "x2", "x4", "x3"}) {
        quiver.mutate(name);
        EXPECT_TRUE(quiver.exchange_matrix().is_skew_symmetric());
    }
}

TEST(Mutation, FrozenPivotLeavesQuiverUnchanged) {
    Quiver quiver = test::make_octagon_quiver();
    Quiver before = quiver;

    EXPECT_THROW(quiver.mutate("e1"), FrozenMutationError);
    EXPECT_THROW(quiver.mutate("nope"), UnknownVertexError);
    EXPECT_THROW(quiver.mutate(VertexId{99}), UnknownVertexError);
    EXPECT_EQ(quiver, before);
}

TEST(Mutation, SnapshotLeavesInputUntouched) {
    Quiver quiver = test::make_octagon_quiver();
    Quiver before = quiver;

    Quiver mutated = MutationEngine::mutate(quiver, "x3");

    EXPECT_EQ(quiver, before);
    EXPECT_NE(mutated, before);
    EXPECT_EQ(mutated, MutationEngine::mutate(before, quiver.index_of("x3")));
}

TEST(Mutation, IsDeterministic) {
    Quiver a = test::make_octagon_quiver();
    Quiver b = test::make_octagon_quiver();
    for (const auto& name : {"x2", "x4", "x1"}) {
        a.mutate(name);
        b.mutate(name);
    }
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.edges(), b.edges());
}

TEST(Mutation, MatrixRuleMatchesQuiver) {
    Quiver quiver = test::make_octagon_quiver();
    ExchangeMatrix before = quiver.exchange_matrix();

    for (size_t k = 0; k < before.size(); ++k) {
        Quiver mutated = MutationEngine::mutate(quiver, before.labels()[k]);
        EXPECT_EQ(MutationEngine::mutate(before, k), mutated.exchange_matrix()) << "at " << k;
    }
}

TEST(Mutation, MatrixIndexOutOfRange) {
    ExchangeMatrix matrix({"a", "b"}, {{0, 1}, {-1, 0}});
    EXPECT_THROW(MutationEngine::mutate(matrix, 2), std::out_of_range);
}

TEST(Mutation, ExtendedRowsTransformLikeFrozen) {
    ExtendedExchangeMatrix extended(ExchangeMatrix(
        {"x1", "x2", "x3", "x4", "x5"}, test::octagon_matrix()));
    extended.add_shear_row("u", {0, 0, -1, 0, 1});

    ExtendedExchangeMatrix mutated = MutationEngine::mutate(extended, 2);

    ShearVector expected{-1, -1, 1, 0, 1};
    EXPECT_EQ(mutated.shear_rows()[0].values, expected);
    EXPECT_EQ(mutated.shear_rows()[0].name, "u");
    EXPECT_EQ(mutated.principal(), MutationEngine::mutate(extended.principal(), 2));
}

TEST(Mutation, OverflowingWeightLeavesQuiverUnchanged) {
    Quiver quiver({{"a", VertexKind::Cluster}, {"b", VertexKind::Cluster}, {"c", VertexKind::Cluster}},
                  {{"a", "b", 50000}, {"b", "c", 50000}});
    Quiver before = quiver;

    EXPECT_THROW(quiver.mutate("b"), WeightOverflowError);
    EXPECT_EQ(quiver, before);
    EXPECT_EQ(quiver.net_weight("a", "c"), 0);
}

TEST(Mutation, LargeWeightsWithinRange) {
    Quiver quiver({{"a", VertexKind::Cluster}, {"b", VertexKind::Cluster}, {"c", VertexKind::Cluster}},
                  {{"a", "b", 40000}, {"b", "c", 50000}});

    quiver.mutate("b");
    EXPECT_EQ(quiver.net_weight("a", "c"), 2000000000);
}

TEST(Mutation, MatrixOverflowThrows) {
    ExchangeMatrix matrix({"a", "b", "c"}, {{0, 50000, 0}, {-50000, 0, 50000}, {0, -50000, 0}});
    EXPECT_THROW(MutationEngine::mutate(matrix, 1), WeightOverflowError);

    int lowest = std::numeric_limits<int>::min();
    ExchangeMatrix unbalanced({"a", "b"}, {{0, lowest}, {1, 0}});
    EXPECT_THROW(MutationEngine::mutate(unbalanced, 0), WeightOverflowError);
}
