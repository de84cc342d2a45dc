#include <gtest/gtest.h>
#include <serialization/document_json.hpp>
#include <serialization/matrix_json.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <quiver/errors.hpp>
#include "test_helpers.hpp"

using namespace quiverkit;

TEST(Serialization, QuiverRoundTrip) {
    Quiver quiver = test::make_octagon_quiver();
    quiver.mutate("x3");

    nlohmann::json j = quiver_to_json(quiver);
    EXPECT_EQ(j["vertices"].size(), 13u);
    EXPECT_EQ(j["vertices"][0]["kind"], "Frozen");
    EXPECT_EQ(j["vertices"][8]["name"], "x1");

    EXPECT_EQ(quiver_from_json(j), quiver);
}

TEST(Serialization, QuiverDefaults) {
    nlohmann::json j = {
        {"vertices", {{{"name", "a"}}, {{"name", "b"}}, {{"name", "f"}, {"kind", "Frozen"}}}},
        {"edges", {{{"source", "a"}, {"target", "b"}}}}
    };

    Quiver quiver = quiver_from_json(j);
    EXPECT_TRUE(quiver.vertex("a").is_cluster());
    EXPECT_TRUE(quiver.vertex("f").is_frozen());
    EXPECT_EQ(quiver.net_weight("a", "b"), 1);
}

TEST(Serialization, QuiverErrorsPropagate) {
    nlohmann::json duplicate = {
        {"vertices", {{{"name", "a"}}, {{"name", "a"}}}}
    };
    EXPECT_THROW(quiver_from_json(duplicate), DuplicateNameError);

    nlohmann::json loop = {
        {"vertices", {{{"name", "a"}}}},
        {"edges", {{{"source", "a"}, {"target", "a"}}}}
    };
    EXPECT_THROW(quiver_from_json(loop), SelfLoopError);
}

TEST(Serialization, TriangulationKeepsFlipCounts) {
    PolygonTriangulation t = test::make_octagon();
    t.flip("x3");

    PolygonTriangulation restored = triangulation_from_json(triangulation_to_json(t));
    EXPECT_EQ(restored.marked_point_count(), 8u);
    EXPECT_EQ(restored.arc("x3").p, 3u);
    EXPECT_EQ(restored.arc("x3").q, 6u);
    EXPECT_EQ(restored.label("x3"), "x_{3'}");
}

TEST(Serialization, DocumentWithTriangulationOnly) {
    nlohmann::json j = {
        {"triangulation", triangulation_to_json(test::make_octagon())},
        {"laminations", {{{"from", "e1"}, {"to", "e4"}}, {{"name", "w"}, {"from", "e2"}, {"to", "e6"}}}}
    };

    QuiverDocument doc = document_from_json(j);
    EXPECT_FALSE(doc.quiver.has_value());
    ASSERT_EQ(doc.laminations.size(), 2u);
    EXPECT_EQ(doc.laminations[0].name, "u_1");
    EXPECT_EQ(doc.laminations[1].name, "w");
    EXPECT_EQ(doc.resolve_quiver(), test::make_octagon_quiver());
}

TEST(Serialization, EmptyDocumentCannotResolve) {
    QuiverDocument doc = document_from_json(nlohmann::json::object());
    EXPECT_THROW(doc.resolve_quiver(), std::runtime_error);
}

TEST(Serialization, ExtendedMatrixRoundTrip) {
    ExtendedExchangeMatrix extended(ExchangeMatrix({"a", "b"}, {{0, 1}, {-1, 0}}));
    extended.add_shear_row("u", {1, 0});

    nlohmann::json j = extended;
    EXPECT_EQ(j["principal"]["labels"][1], "b");
    EXPECT_EQ(j["shear_rows"][0]["name"], "u");

    EXPECT_EQ(j.get<ExtendedExchangeMatrix>(), extended);
}

TEST(Serialization, ConfigDefaults) {
    QuiverkitConfig config = nlohmann::json::object().get<QuiverkitConfig>();
    EXPECT_FALSE(config.render.hide_frozen);
    EXPECT_TRUE(config.render.show_weights);
    EXPECT_EQ(config.render.rankdir, "LR");
    EXPECT_FALSE(config.principal_laminations);

    nlohmann::json j = {
        {"render", {{"hide_frozen", true}, {"rankdir", "TB"}}},
        {"principal_laminations", true}
    };
    config = j.get<QuiverkitConfig>();
    EXPECT_TRUE(config.render.hide_frozen);
    EXPECT_TRUE(config.render.show_weights);
    EXPECT_EQ(config.render.rankdir, "TB");
    EXPECT_TRUE(config.principal_laminations);
}

TEST(Serialization, EnvelopeAcceptsRawDocuments) {
    nlohmann::json raw = {{"quiver", quiver_to_json(test::make_a3_quiver())}};
    json::SerializedData data = json::SerializedData::from_json(raw);
    EXPECT_EQ(data.step, "input");
    EXPECT_EQ(data.data, raw);

    json::SerializedData wrapped = json::make_serialized("mutate", "in.json");
    wrapped.data = raw;
    json::SerializedData parsed = json::SerializedData::from_json(wrapped.to_json());
    EXPECT_EQ(parsed.step, "mutate");
    EXPECT_EQ(parsed.source_file, "in.json");
    EXPECT_EQ(parsed.version, json::SERIALIZATION_VERSION);
    EXPECT_EQ(parsed.data, raw);

    EXPECT_THROW(json::SerializedData::from_json(nlohmann::json::array()), std::runtime_error);
}
