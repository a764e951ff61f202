// EN: Unit tests for matrix expansion of job templates
// FR: Tests unitaires pour l'expansion de matrice des templates de job

#include <gtest/gtest.h>
#include "orchestrator/matrix_expander.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace CDO;
using namespace CDO::Orchestrator;

class MatrixExpanderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
    }

    static JobTemplate matrixJob(std::vector<std::pair<std::string, std::vector<std::string>>> axes) {
        JobTemplate job;
        job.name = "build";
        MatrixSpec matrix;
        matrix.axes = std::move(axes);
        job.matrix = matrix;
        return job;
    }
};

TEST_F(MatrixExpanderTest, NoMatrixGivesSingleUnboundInstance) {
    JobTemplate job;
    job.name = "lint";

    auto instances = MatrixExpander::expand(job);
    ASSERT_EQ(instances.size(), 1u);
    EXPECT_EQ(instances[0].id, "lint");
    EXPECT_EQ(instances[0].template_name, "lint");
    EXPECT_TRUE(instances[0].bindings.empty());
    EXPECT_EQ(instances[0].status, JobStatus::PENDING);
}

// EN: The first axis varies slowest
// FR: Le premier axe varie le plus lentement
TEST_F(MatrixExpanderTest, CartesianProductInDeclaredOrder) {
    auto job = matrixJob({{"os", {"linux", "macos"}}, {"arch", {"x64", "arm64", "x86"}}});

    EXPECT_EQ(MatrixExpander::combinationCount(job), 6u);
    auto instances = MatrixExpander::expand(job);
    ASSERT_EQ(instances.size(), 6u);

    EXPECT_EQ(instances[0].id, "build (linux, x64)");
    EXPECT_EQ(instances[1].id, "build (linux, arm64)");
    EXPECT_EQ(instances[2].id, "build (linux, x86)");
    EXPECT_EQ(instances[3].id, "build (macos, x64)");
    EXPECT_EQ(instances[5].id, "build (macos, x86)");

    ASSERT_EQ(instances[4].bindings.size(), 2u);
    EXPECT_EQ(instances[4].bindings[0].first, "os");
    EXPECT_EQ(instances[4].bindings[0].second, "macos");
    EXPECT_EQ(instances[4].bindings[1].first, "arch");
    EXPECT_EQ(instances[4].bindings[1].second, "arm64");
}

TEST_F(MatrixExpanderTest, EmptyAxisGivesNoInstance) {
    auto job = matrixJob({{"os", {"linux"}}, {"arch", {}}});

    EXPECT_EQ(MatrixExpander::combinationCount(job), 0u);
    EXPECT_TRUE(MatrixExpander::expand(job).empty());
}

TEST_F(MatrixExpanderTest, ExpandIntoAppendsEveryTemplate) {
    PipelineDefinition definition;
    definition.name = "ci";
    definition.jobs.push_back(matrixJob({{"os", {"linux", "windows"}}}));
    JobTemplate test;
    test.name = "test";
    test.needs = {"build"};
    definition.jobs.push_back(test);

    PipelineRun run;
    MatrixExpander::expandInto(definition, run);

    ASSERT_EQ(run.instances.size(), 3u);
    EXPECT_EQ(run.instancesOf("build").size(), 2u);
    EXPECT_NE(run.findInstance("build (windows)"), nullptr);
    EXPECT_NE(run.findInstance("test"), nullptr);
    EXPECT_EQ(run.countWithStatus(JobStatus::PENDING), 3u);
}

TEST(MatrixInstanceIdTest, FormatsBindings) {
    EXPECT_EQ(MatrixExpander::instanceId("deploy", {}), "deploy");
    EXPECT_EQ(MatrixExpander::instanceId("deploy", {{"env", "prod"}}), "deploy (prod)");
}
