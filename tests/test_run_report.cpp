// EN: Unit tests for the JSON and text run reports
// FR: Tests unitaires pour les rapports de run JSON et texte

#include <gtest/gtest.h>
#include "orchestrator/run_report.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace CDO;
using namespace CDO::Orchestrator;

class RunReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);

        run_.run_id = "ci#0003";
        run_.pipeline_name = "ci";
        run_.event = TagEvent{"refs/tags/v1.0.0", "v1.0.0"};
        run_.variables = {{"ref", "refs/tags/v1.0.0"}, {"ref_name", "v1.0.0"}};

        JobInstance build;
        build.id = "build (linux)";
        build.template_name = "build";
        build.bindings = {{"os", "linux"}};
        build.status = JobStatus::SUCCEEDED;
        build.exit_code = 0;
        build.started_at = run_.created_at;
        build.finished_at = run_.created_at + std::chrono::milliseconds(1500);
        build.artifacts = {Artifact{"dist/app.tar.gz", "12345", "build (linux)"}};

        JobInstance release;
        release.id = "release";
        release.template_name = "release";
        release.status = JobStatus::FAILED;
        release.status_reason = "upload failed";
        release.publish_outcome = PublishOutcome::failed(PublishError::TRANSPORT_FAILURE, "upload failed");
        release.publish_outcome->orphaned_release_id = "rel-4";

        run_.instances = {build, release};
    }

    PipelineRun run_;
};

TEST_F(RunReportTest, JsonCarriesRunFields) {
    auto report = RunReport::toJson(run_);

    EXPECT_EQ(report["run_id"], "ci#0003");
    EXPECT_EQ(report["pipeline"], "ci");
    EXPECT_EQ(report["event"], "tag");
    EXPECT_TRUE(report["conclusion"].is_null());
    EXPECT_FALSE(report.contains("finished_at"));
    EXPECT_FALSE(report["cancel_requested"].get<bool>());
    EXPECT_EQ(report["variables"]["ref_name"], "v1.0.0");
    ASSERT_EQ(report["jobs"].size(), 2u);
}

TEST_F(RunReportTest, JsonDescribesEachInstance) {
    auto report = RunReport::toJson(run_);

    const auto& build = report["jobs"][0];
    EXPECT_EQ(build["id"], "build (linux)");
    EXPECT_EQ(build["template"], "build");
    EXPECT_EQ(build["status"], "SUCCEEDED");
    EXPECT_EQ(build["matrix"]["os"], "linux");
    EXPECT_EQ(build["exit_code"], 0);
    EXPECT_EQ(build["duration_ms"], 1500);
    EXPECT_FALSE(build.contains("reason"));
    ASSERT_EQ(build["artifacts"].size(), 1u);
    EXPECT_EQ(build["artifacts"][0]["name"], "dist/app.tar.gz");
    EXPECT_EQ(build["artifacts"][0]["size"], 5);

    const auto& release = report["jobs"][1];
    EXPECT_EQ(release["status"], "FAILED");
    EXPECT_EQ(release["reason"], "upload failed");
    EXPECT_TRUE(release["matrix"].empty());
    EXPECT_EQ(release["release"]["status"], "FAILED");
    EXPECT_EQ(release["release"]["error"], "TRANSPORT_FAILURE");
    EXPECT_EQ(release["release"]["orphaned_release_id"], "rel-4");
    EXPECT_FALSE(release["release"].contains("release_id"));
}

TEST_F(RunReportTest, FinishedRunHasConclusionAndDuration) {
    run_.conclusion = RunConclusion::FAILURE;
    run_.finished_at = run_.created_at + std::chrono::milliseconds(2500);

    auto report = RunReport::toJson(run_);
    EXPECT_EQ(report["conclusion"], "failure");
    EXPECT_EQ(report["duration_ms"], 2500);
    EXPECT_TRUE(report.contains("finished_at"));
}

TEST_F(RunReportTest, PublishedOutcomeListsAssets) {
    auto json = RunReport::publishOutcomeToJson(PublishOutcome::published("rel-1", {"dist/a", "dist/b"}));

    EXPECT_EQ(json["status"], "PUBLISHED");
    EXPECT_EQ(json["release_id"], "rel-1");
    EXPECT_FALSE(json.contains("error"));
    ASSERT_EQ(json["assets"].size(), 2u);
    EXPECT_EQ(json["assets"][1], "dist/b");
}

TEST_F(RunReportTest, TextListsInstancesThenConclusion) {
    std::string text = RunReport::toText(run_);
    EXPECT_EQ(text,
              "ci [ci#0003]\n"
              "  SUCCEEDED  build (linux)\n"
              "  FAILED     release - upload failed\n"
              "  conclusion: running\n");

    run_.conclusion = RunConclusion::FAILURE;
    text = RunReport::toText(run_);
    EXPECT_NE(text.find("  conclusion: failure\n"), std::string::npos);
}
