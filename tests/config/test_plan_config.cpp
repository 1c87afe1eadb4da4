/**
 * @file test_plan_config.cpp
 * @brief Unit tests for plan file parsing and section validation
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config/json5.hpp"
#include "config/plan_config.hpp"
#include "exception/exception.hpp"

namespace tessera::config::test {

class PlanConfigTest : public ::testing::Test {
protected:
    static constexpr double EPSILON = 1e-12;

    static std::string minimalPlan() {
        return R"({"observation": {"target": "CALLISTO",
                                   "startTime": "2031-04-26T00:40:47"}})";
    }
};

// ============================================================================
// JSON5
// ============================================================================

TEST_F(PlanConfigTest, Json5CommentsAndTrailingCommas) {
    const std::string text = R"({
        // line comment
        "a": 1, /* block
                   comment */
        "b": [1, 2, ],
        "c": "keep // this",
    })";
    const auto j = json::parse(internal::convertJSON5toJSON(text));
    EXPECT_EQ(j["a"], 1);
    EXPECT_EQ(j["b"].size(), 2u);
    EXPECT_EQ(j["c"], "keep // this");
}

TEST_F(PlanConfigTest, Json5UnquotedKeys) {
    const auto j = json::parse(internal::convertJSON5toJSON(
        "{enabled: true, level_2 : null, name: \"x: y\", n: 1e-3}"));
    EXPECT_EQ(j["enabled"], true);
    EXPECT_TRUE(j["level_2"].is_null());
    EXPECT_EQ(j["name"], "x: y");
    EXPECT_DOUBLE_EQ(j["n"].get<double>(), 1e-3);
}

TEST_F(PlanConfigTest, Json5UnterminatedCommentThrows) {
    EXPECT_THROW((void)internal::convertJSON5toJSON("{\"a\": 1 /* open"),
                 InvalidConfiguration);
}

// ============================================================================
// Plan
// ============================================================================

TEST_F(PlanConfigTest, MinimalPlanUsesDefaults) {
    const auto plan = parsePlanConfig(minimalPlan());
    EXPECT_EQ(plan.observation.target, "CALLISTO");
    EXPECT_EQ(plan.observation.observer, "JUICE");
    EXPECT_EQ(tools::formatIsoTime(plan.observation.startTime),
              "2031-04-26T00:40:47");
    EXPECT_EQ(plan.observation.mode, ObservationMode::Mosaic);
    EXPECT_FALSE(plan.observation.sunside);
    EXPECT_DOUBLE_EQ(plan.observation.exposureTime, 15.0);
    EXPECT_EQ(plan.observation.filters, 4);
    EXPECT_EQ(plan.observation.timeUnit, tools::TimeUnit::Minutes);
    EXPECT_EQ(plan.observation.angularUnit, tools::AngularUnit::Degrees);

    EXPECT_EQ(plan.instrument.name, "JANUS");
    EXPECT_EQ(plan.instrument.kind, InstrumentKind::Framing);
    EXPECT_NEAR(plan.instrument.mbitsPerImage(), 42.112, EPSILON);
    EXPECT_TRUE(plan.logging.enableConsole);
    EXPECT_FALSE(plan.logging.enableFile);
}

TEST_F(PlanConfigTest, Json5PlanWithAllSections) {
    const auto plan = parsePlanConfig(R"({
        instrument: {preset: "MAJIS", slewRate: 0.05},
        observation: {
            target: "GANYMEDE",
            startTime: "2031-09-27 09:40:00",
            mode: "scan",
            sunside: true,
            exposureTime: 2.0,
            timeUnit: "sec",
            angularUnit: "arcMin",
            decimals: 5,
        },
        logging: {consoleLevel: "debug", consoleColor: false},
    })");
    EXPECT_EQ(plan.instrument.name, "MAJIS");
    EXPECT_EQ(plan.instrument.kind, InstrumentKind::Slit);
    EXPECT_DOUBLE_EQ(plan.instrument.fovWidth, 3.4);
    EXPECT_DOUBLE_EQ(plan.instrument.slewRate, 0.05);

    EXPECT_EQ(plan.observation.target, "GANYMEDE");
    EXPECT_EQ(plan.observation.mode, ObservationMode::Scan);
    EXPECT_TRUE(plan.observation.sunside);
    EXPECT_EQ(plan.observation.timeUnit, tools::TimeUnit::Seconds);
    EXPECT_EQ(plan.observation.angularUnit, tools::AngularUnit::ArcMinutes);
    EXPECT_EQ(plan.observation.decimals, 5);

    EXPECT_EQ(plan.logging.consoleLevel, LogLevel::Debug);
    EXPECT_FALSE(plan.logging.consoleColor);
}

TEST_F(PlanConfigTest, MajisPresetSlitHeight) {
    const auto majis = InstrumentConfig::majis();
    EXPECT_EQ(majis.kind, InstrumentKind::Slit);
    // 125 microradian slit expressed in degrees
    EXPECT_NEAR(majis.fovHeight, 0.0071619724391352901, EPSILON);
    EXPECT_NEAR(majis.fovHeight * tools::DEG_TO_RAD, 125e-6, EPSILON);
}

TEST_F(PlanConfigTest, InstrumentOverrides) {
    const auto plan = parsePlanConfig(R"({
        "instrument": {"name": "NAC", "fov": [0.5, 0.4],
                       "resolution": [1024, 1024], "bitsPerPixel": 12},
        "observation": {"target": "IO", "startTime": "2031-01-01T00:00:00"}
    })");
    EXPECT_EQ(plan.instrument.name, "NAC");
    EXPECT_DOUBLE_EQ(plan.instrument.fovHeight, 0.4);
    EXPECT_EQ(plan.instrument.resolutionX, 1024);
    EXPECT_NEAR(plan.instrument.mbitsPerImage(), 1024.0 * 1024.0 * 12.0 / 1e6,
                EPSILON);
}

TEST_F(PlanConfigTest, ToJsonParsesBack) {
    auto plan = parsePlanConfig(minimalPlan());
    plan.observation.overlap = 0.2;
    plan.instrument = InstrumentConfig::majis();
    const auto reparsed = parsePlanConfig(plan.toJson().dump());
    EXPECT_DOUBLE_EQ(reparsed.observation.overlap, 0.2);
    EXPECT_EQ(reparsed.instrument.kind, InstrumentKind::Slit);
    EXPECT_EQ(reparsed.observation.startTime, plan.observation.startTime);
}

TEST_F(PlanConfigTest, SectionsSatisfyConfigSectionConcept) {
    static_assert(ConfigSectionDerived<InstrumentConfig>);
    static_assert(ConfigSectionDerived<ObservationConfig>);
    static_assert(ConfigSectionDerived<LoggingConfig>);
    static_assert(!ConfigSectionDerived<PlanConfig>);

    const auto j = parsePlanConfig(minimalPlan()).toJson();
    ASSERT_TRUE(j.contains("observation"));
    EXPECT_EQ(j["observation"]["target"], "CALLISTO");
    EXPECT_TRUE(j.contains(std::string(InstrumentConfig::path())));
    EXPECT_TRUE(j.contains(std::string(LoggingConfig::path())));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(PlanConfigTest, StructuralErrorsThrow) {
    EXPECT_THROW((void)parsePlanConfig("{not json"), InvalidConfiguration);
    EXPECT_THROW((void)parsePlanConfig("[1, 2]"), InvalidConfiguration);
    EXPECT_THROW((void)parsePlanConfig(R"({"instrument": {}})"),
                 InvalidConfiguration);
    EXPECT_THROW((void)parsePlanConfig(R"({"observation": 3})"),
                 InvalidConfiguration);
    EXPECT_THROW((void)parsePlanConfig(R"({"observation": {"target": "IO"}})"),
                 InvalidConfiguration);
}

TEST_F(PlanConfigTest, BadObservationValuesThrow) {
    const auto withField = [](const std::string& field) {
        return R"({"observation": {"target": "IO",
                   "startTime": "2031-01-01T00:00:00", )" +
               field + "}}";
    };
    EXPECT_NO_THROW((void)parsePlanConfig(withField(R"("filters": 1)")));
    for (const auto* field :
         {R"("filters": 0)", R"("exposureTime": 0)", R"("overlap": 1.0)",
          R"("maxSmear": -1)", R"("extraMargin": -1)", R"("maxIterations": 0)",
          R"("tourPasses": -1)", R"("decimals": 13)", R"("mode": "sweep")",
          R"("timeUnit": "fortnight")", R"("filters": "four")"}) {
        EXPECT_THROW((void)parsePlanConfig(withField(field)), InvalidConfiguration)
            << field;
    }
    EXPECT_THROW((void)parsePlanConfig(
                     R"({"observation": {"target": "IO", "startTime": "soon"}})"),
                 InvalidConfiguration);
    EXPECT_THROW((void)parsePlanConfig(
                     R"({"observation": {"target": "",
                                         "startTime": "2031-01-01T00:00:00"}})"),
                 InvalidConfiguration);
}

TEST_F(PlanConfigTest, BadInstrumentValuesThrow) {
    const auto withInstrument = [](const std::string& body) {
        return R"({"instrument": )" + body +
               R"(, "observation": {"target": "IO",
                   "startTime": "2031-01-01T00:00:00"}})";
    };
    for (const auto* body :
         {R"({"preset": "HUBBLE"})", R"({"kind": "lens"})",
          R"({"fov": [0, 1]})", R"({"fov": [1]})", R"({"slewRate": 0})",
          R"({"resolution": [0, 10]})", R"({"filterSwitchTime": -1})"}) {
        EXPECT_THROW((void)parsePlanConfig(withInstrument(body)),
                     InvalidConfiguration)
            << body;
    }
}

TEST_F(PlanConfigTest, BadLogLevelThrows) {
    EXPECT_THROW((void)parsePlanConfig(
                     R"({"logging": {"consoleLevel": "loud"},
                         "observation": {"target": "IO",
                                         "startTime": "2031-01-01T00:00:00"}})"),
                 InvalidConfiguration);
}

TEST_F(PlanConfigTest, LoadFromFile) {
    const auto path =
        std::filesystem::temp_directory_path() / "tessera_test_plan.json5";
    {
        std::ofstream file(path);
        file << "// plan\n" << minimalPlan() << "\n";
    }
    const auto plan = loadPlanConfig(path);
    EXPECT_EQ(plan.observation.target, "CALLISTO");
    std::filesystem::remove(path);

    EXPECT_THROW((void)loadPlanConfig("/nonexistent/plan.json"),
                 InvalidConfiguration);
}

TEST_F(PlanConfigTest, SchemasListFields) {
    const auto observation = ObservationConfig::schema();
    EXPECT_EQ(observation["required"].size(), 2u);
    EXPECT_TRUE(observation["properties"].contains("maxSmear"));
    EXPECT_TRUE(InstrumentConfig::schema()["properties"].contains("preset"));
    EXPECT_TRUE(LoggingConfig::schema()["properties"].contains("fileLevel"));
}

}  // namespace tessera::config::test
