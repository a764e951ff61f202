// EN: Unit tests for ReleasePublisher (gating, all-or-nothing publish, rollback) on the in-memory endpoint
// FR: Tests unitaires pour ReleasePublisher (garde, publication atomique, rollback) sur l'endpoint en mémoire

#include <gtest/gtest.h>
#include "orchestrator/release_publisher.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace CDO;
using namespace CDO::Orchestrator;

class ReleasePublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);

        spec_.artifact_globs = {"dist/*"};
        spec_.name_template = "Release ${{ ref_name }}";
        spec_.tag_template = "${{ ref_name }}";

        context_.run_id = "ci#0001";
        context_.pipeline_name = "ci";
        context_.variables = {{"ref", "refs/tags/v1.2.3"}, {"ref_name", "v1.2.3"}, {"ref_type", "tag"}};
        context_.succeeded_jobs = {"build (linux)", "test"};

        artifacts_ = {
            Artifact{"dist/app-linux.tar.gz", "linux-bytes", "build (linux)"},
            Artifact{"dist/app-macos.tar.gz", "macos-bytes", "build (macos)"},
            Artifact{"logs/build.log", "log", "build (linux)"},
        };
    }

    InMemoryReleaseEndpoint endpoint_;
    ReleasePublisher publisher_{endpoint_};
    ReleaseSpec spec_;
    PublishContext context_;
    std::vector<Artifact> artifacts_;
};

TEST_F(ReleasePublisherTest, PublishesMatchingArtifacts) {
    auto outcome = publisher_.publish(spec_, context_, artifacts_);

    ASSERT_EQ(outcome.status, PublishStatus::PUBLISHED) << outcome.message;
    EXPECT_EQ(outcome.uploaded_assets.size(), 2u);

    auto releases = endpoint_.releases();
    ASSERT_EQ(releases.size(), 1u);
    EXPECT_EQ(releases[0].id, outcome.release_id);
    EXPECT_EQ(releases[0].metadata.name, "Release v1.2.3");
    EXPECT_EQ(releases[0].metadata.tag, "v1.2.3");
    EXPECT_EQ(endpoint_.assetContent(outcome.release_id, "dist/app-macos.tar.gz").value_or(""), "macos-bytes");
    EXPECT_FALSE(endpoint_.assetContent(outcome.release_id, "logs/build.log").has_value());
}

// EN: The second publish of the same identity must not create a duplicate
// FR: La deuxième publication de la même identité ne doit pas créer de doublon
TEST_F(ReleasePublisherTest, SecondPublishReportsAlreadyExists) {
    ASSERT_EQ(publisher_.publish(spec_, context_, artifacts_).status, PublishStatus::PUBLISHED);

    auto second = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(second.status, PublishStatus::FAILED);
    EXPECT_EQ(second.error, PublishError::ALREADY_EXISTS);
    EXPECT_EQ(endpoint_.releases().size(), 1u);
}

TEST_F(ReleasePublisherTest, UpdatesExistingDraftInPlace) {
    const std::string draft_id = endpoint_.addRelease(ReleaseMetadata{"Release v1.2.3", "v1.2.3", "old", true, false},
                                                      {"dist/old.zip"});
    spec_.on_existing = ExistingReleasePolicy::UPDATE_DRAFT;
    spec_.draft = true;
    spec_.body_template = "Built from ${{ ref }}";

    auto outcome = publisher_.publish(spec_, context_, artifacts_);

    ASSERT_EQ(outcome.status, PublishStatus::PUBLISHED) << outcome.message;
    EXPECT_EQ(outcome.release_id, draft_id);
    auto record = endpoint_.getRelease(draft_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->metadata.body, "Built from refs/tags/v1.2.3");
    EXPECT_EQ(record->assets.size(), 3u);
    EXPECT_EQ(endpoint_.releases().size(), 1u);
}

TEST_F(ReleasePublisherTest, PublishedReleaseIsNotUpdatedEvenWithUpdatePolicy) {
    endpoint_.addRelease(ReleaseMetadata{"Release v1.2.3", "v1.2.3", "", false, false});
    spec_.on_existing = ExistingReleasePolicy::UPDATE_DRAFT;

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.error, PublishError::ALREADY_EXISTS);
}

TEST_F(ReleasePublisherTest, ClosedGateSkipsWithoutTouchingEndpoint) {
    spec_.condition = Condition::parse("ref_type == 'branch'");
    EXPECT_FALSE(publisher_.isGateOpen(spec_, context_.variables));

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.status, PublishStatus::SKIPPED);
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

TEST_F(ReleasePublisherTest, NoMatchingArtifactFails) {
    spec_.artifact_globs = {"packages/*.deb"};

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.status, PublishStatus::FAILED);
    EXPECT_EQ(outcome.error, PublishError::NO_ARTIFACTS);
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

TEST_F(ReleasePublisherTest, EmptyTagIsInvalidSpec) {
    spec_.tag_template = "${{ tag_name }}";

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.error, PublishError::INVALID_SPEC);
}

// EN: Files from different directories with the same base name would collide on the host
// FR: Des fichiers de dossiers différents avec le même nom de base entreraient en collision
TEST_F(ReleasePublisherTest, AssetNameCollisionIsInvalidSpecBeforeCreation) {
    spec_.artifact_globs = {"**/app.zip"};
    artifacts_ = {
        Artifact{"linux/app.zip", "linux", "build (linux)"},
        Artifact{"windows/app.zip", "windows", "build (windows)"},
    };

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.status, PublishStatus::FAILED);
    EXPECT_EQ(outcome.error, PublishError::INVALID_SPEC);
    EXPECT_NE(outcome.message.find("'app.zip'"), std::string::npos);
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

TEST_F(ReleasePublisherTest, UnevaluableGateIsInvalidSpec) {
    spec_.condition = Condition::parse("matches(ref_name, pattern)");
    context_.variables["pattern"] = "v[9-0]";

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.error, PublishError::INVALID_SPEC);
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

// EN: A failed upload removes the staged release: nothing partial stays visible
// FR: Un upload en échec supprime la release préparée : rien de partiel ne reste visible
TEST_F(ReleasePublisherTest, UploadFailureRollsBack) {
    endpoint_.setFailUploadsAfter(1);

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.status, PublishStatus::FAILED);
    EXPECT_EQ(outcome.error, PublishError::TRANSPORT_FAILURE);
    EXPECT_TRUE(outcome.orphaned_release_id.empty());
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

TEST_F(ReleasePublisherTest, FailedRollbackLeavesMarkedDraft) {
    endpoint_.setFailUploadsAfter(0);
    endpoint_.setFailDelete(true);

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.error, PublishError::TRANSPORT_FAILURE);
    ASSERT_FALSE(outcome.orphaned_release_id.empty());

    auto orphan = endpoint_.getRelease(outcome.orphaned_release_id);
    ASSERT_TRUE(orphan.has_value());
    EXPECT_EQ(orphan->metadata.name, std::string("Release v1.2.3") + ReleasePublisher::kIncompleteMarker);
    EXPECT_TRUE(orphan->metadata.draft);
    EXPECT_TRUE(endpoint_.releases().empty());
}

TEST_F(ReleasePublisherTest, CreationFailureIsTransportFailure) {
    endpoint_.setFailCreate(true);

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    EXPECT_EQ(outcome.error, PublishError::TRANSPORT_FAILURE);
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

TEST_F(ReleasePublisherTest, CancellationDuringUploadRollsBack) {
    CancellationSource source;
    endpoint_.setUploadHook([&source](const std::string&) { source.cancel(); });

    auto outcome = publisher_.publish(spec_, context_, artifacts_, source.token());
    EXPECT_EQ(outcome.status, PublishStatus::FAILED);
    EXPECT_EQ(outcome.error, PublishError::CANCELLED);
    EXPECT_TRUE(endpoint_.allReleases().empty());
}

TEST_F(ReleasePublisherTest, GeneratedNotesListJobsAndFiles) {
    spec_.generate_notes = true;

    auto outcome = publisher_.publish(spec_, context_, artifacts_);
    ASSERT_EQ(outcome.status, PublishStatus::PUBLISHED);

    auto record = endpoint_.getRelease(outcome.release_id);
    ASSERT_TRUE(record.has_value());
    const std::string& body = record->metadata.body;
    EXPECT_NE(body.find("## Release v1.2.3"), std::string::npos);
    EXPECT_NE(body.find("run `ci#0001`"), std::string::npos);
    EXPECT_NE(body.find("- test"), std::string::npos);
    EXPECT_NE(body.find("- dist/app-linux.tar.gz (11 bytes)"), std::string::npos);
}

TEST(ReleaseArtifactsTest, AssetNameIsLastPathComponent) {
    EXPECT_EQ(ReleasePublisher::assetName("dist/linux/app.tar.gz"), "app.tar.gz");
    EXPECT_EQ(ReleasePublisher::assetName("app.zip"), "app.zip");
}

TEST(ReleaseArtifactsTest, FirstProducerWinsOnDuplicateNames) {
    std::vector<Artifact> artifacts = {
        Artifact{"dist/app.zip", "first", "build (linux)"},
        Artifact{"dist/app.zip", "second", "build (macos)"},
        Artifact{"README.md", "docs", "docs"},
    };

    auto matched = ReleasePublisher::resolveArtifacts({"dist/*", "*.md"}, artifacts);
    ASSERT_EQ(matched.size(), 2u);
    EXPECT_EQ(matched[0].content, "first");
    EXPECT_EQ(matched[1].name, "README.md");
}
