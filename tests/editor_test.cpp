// Dahu-Prod headers
#include "core/CaptureSession.hpp"
#include "core/EventBus.hpp"
#include "core/ProjectController.hpp"
#include "ui/EditorController.hpp"

// Dahu-Fake headers
#include "FakeCapture.hpp"
#include "FakeFileSystem.hpp"
#include "MockCollaborators.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace dahu::test {

  using dahu::core::CaptureSession;
  using dahu::core::EditorEvents;
  using dahu::core::ErrorCode;
  using dahu::core::ProjectController;
  using dahu::ui::EditorController;
  using ::testing::_;
  using ::testing::ElementsAre;
  using ::testing::HasSubstr;
  using ::testing::NiceMock;
  using ::testing::Throw;

  class EditorControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      projects = std::make_unique<ProjectController>(fs, events, logger);
      session = std::make_unique<CaptureSession>(*projects, keys, screen, pointer, events, logger);
      editor = std::make_unique<EditorController>(*projects, *session, events, logger, monitor);
      events.selectionChanged.subscribe([this](const std::string& p) { previews.push_back(p); });
    }

    std::shared_ptr<FakeFileSystem> fs = std::make_shared<FakeFileSystem>();
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockErrorMonitor>> monitor = std::make_shared<NiceMock<MockErrorMonitor>>();
    EditorEvents events;
    FakeKeyInput keys;
    FakeScreenCapture screen;
    FakePointer pointer;
    std::unique_ptr<ProjectController> projects;
    std::unique_ptr<CaptureSession> session;
    std::unique_ptr<EditorController> editor;
    std::vector<std::string> previews;
  };

  TEST_F(EditorControllerTest, ToggleCapture_RequiresInitializedProject) {
    EXPECT_FALSE(editor->projectInitialized());
    EXPECT_FALSE(editor->toggleCaptureMode());
    EXPECT_FALSE(session->armed());
    ASSERT_TRUE(editor->lastError().has_value());
    EXPECT_EQ(editor->lastError()->code(), ErrorCode::NoActiveProject);

    ASSERT_TRUE(editor->newProject("/tmp/p"));
    EXPECT_TRUE(editor->toggleCaptureMode());
    EXPECT_TRUE(session->armed());
    EXPECT_TRUE(editor->toggleCaptureMode());
    EXPECT_FALSE(session->armed());
  }

  TEST_F(EditorControllerTest, SaveWhileCapturing_ReportsInsteadOfThrowing) {
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    ASSERT_TRUE(editor->toggleCaptureMode());

    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("SaveWhileCapturing"))).Times(1);
    EXPECT_FALSE(editor->saveProject());
    ASSERT_TRUE(editor->lastError().has_value());
    EXPECT_EQ(editor->lastError()->code(), ErrorCode::SaveWhileCapturing);
  }

  TEST_F(EditorControllerTest, OpenMissingProject_SetsLastErrorWithPath) {
    EXPECT_FALSE(editor->openProject("/nowhere"));
    ASSERT_TRUE(editor->lastError().has_value());
    EXPECT_EQ(editor->lastError()->code(), ErrorCode::ProjectNotFound);
    EXPECT_EQ(editor->lastError()->path(), "/nowhere");
    EXPECT_FALSE(editor->projectInitialized());
  }

  TEST_F(EditorControllerTest, SuccessfulIntent_ClearsLastError) {
    EXPECT_FALSE(editor->saveProject());
    EXPECT_TRUE(editor->lastError().has_value());
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    EXPECT_FALSE(editor->lastError().has_value());
  }

  TEST_F(EditorControllerTest, RepeatedFailure_IsReportedEveryTime) {
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    fs->fail_writes = true;

    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("PersistenceFailed"))).Times(3);
    for (int i = 0; i < 3; ++i) {
      EXPECT_FALSE(editor->saveProject());
      ASSERT_TRUE(editor->lastError().has_value());
      EXPECT_EQ(editor->lastError()->code(), ErrorCode::PersistenceFailed);
    }
    EXPECT_EQ(editor->failureCount(), 3u);
  }

  TEST_F(EditorControllerTest, NewAndOpen_RefusedDuringCapture) {
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    ASSERT_TRUE(editor->toggleCaptureMode());

    EXPECT_FALSE(editor->newProject("/tmp/other"));
    EXPECT_EQ(editor->lastError()->code(), ErrorCode::CaptureInProgress);
    EXPECT_EQ(projects->projectDir(), "/tmp/p");
  }

  TEST_F(EditorControllerTest, KeyTriggeredCaptureFailure_ReachesMonitor) {
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    ASSERT_TRUE(editor->toggleCaptureMode());
    screen.fail = true;

    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("CaptureFailed"))).Times(1);
    keys.press("f7");
    EXPECT_EQ(editor->lastError()->code(), ErrorCode::CaptureFailed);
    EXPECT_TRUE(session->armed());
  }

  TEST_F(EditorControllerTest, ThrowingSubscriber_IsReportedAndOthersStillRun) {
    int delivered = 0;
    events.slideAdded.subscribe([](const std::string&) { throw std::runtime_error("thumbnail failed"); });
    events.slideAdded.subscribe([&](const std::string&) { ++delivered; });
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    ASSERT_TRUE(editor->toggleCaptureMode());

    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("thumbnail failed"))).Times(1);
    keys.press("f7");
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(projects->model().size(), 1u);
  }

  TEST_F(EditorControllerTest, SelectSlide_PublishesOnlyOnChange) {
    EXPECT_TRUE(editor->selectSlide("a.png"));
    EXPECT_FALSE(editor->selectSlide("a.png"));
    EXPECT_TRUE(editor->selectSlide("b.png"));
    EXPECT_FALSE(editor->selectSlide(""));

    EXPECT_THAT(previews, ElementsAre("a.png", "b.png"));
    EXPECT_EQ(editor->currentSlide(), "b.png");
  }

  TEST_F(EditorControllerTest, OpeningProject_ResetsSelection) {
    fs->files["/tmp/q/presentation.dahu"] = R"({"slides": [{"path": "q.png", "x": 0, "y": 0}]})";
    editor->selectSlide("old.png");
    ASSERT_TRUE(editor->openProject("/tmp/q"));
    EXPECT_FALSE(editor->currentSlide().has_value());
    EXPECT_TRUE(editor->selectSlide("old.png"));
  }

  TEST_F(EditorControllerTest, RequestExit_ReflectsUnsavedChanges) {
    ASSERT_TRUE(editor->newProject("/tmp/p"));
    EXPECT_FALSE(editor->requestExit().needsConfirmation);

    ASSERT_TRUE(editor->toggleCaptureMode());
    keys.press("f7");
    keys.press("escape");
    EXPECT_TRUE(editor->requestExit().needsConfirmation);

    ASSERT_TRUE(editor->saveProject());
    EXPECT_FALSE(editor->requestExit().needsConfirmation);
  }

  //---driver faults outside the error taxonomy -------------------------------

  TEST(EditorControllerDriverFault, UnexpectedException_ClearsStaleLastError) {
    auto fs = std::make_shared<NiceMock<MockFileSystem>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto monitor = std::make_shared<NiceMock<MockErrorMonitor>>();
    EditorEvents events;
    FakeKeyInput keys;
    FakeScreenCapture screen;
    FakePointer pointer;
    ProjectController projects(fs, events, logger);
    CaptureSession session(projects, keys, screen, pointer, events, logger);
    EditorController editor(projects, session, events, logger, monitor);

    EXPECT_FALSE(editor.saveProject());
    ASSERT_TRUE(editor.lastError().has_value());

    ON_CALL(*fs, exists(_)).WillByDefault(Throw(std::runtime_error("disk controller reset")));
    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("disk controller reset"))).Times(1);
    EXPECT_FALSE(editor.openProject("/tmp/p"));
    EXPECT_FALSE(editor.lastError().has_value());
    EXPECT_EQ(editor.failureCount(), 2u);
  }

} // namespace dahu::test
