// Dahu-Prod headers
#include "core/CaptureSession.hpp"
#include "core/EditorError.hpp"
#include "core/EventBus.hpp"
#include "core/ProjectController.hpp"

// Dahu-Fake headers
#include "FakeCapture.hpp"
#include "FakeFileSystem.hpp"
#include "MockCollaborators.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace dahu::test {

  using dahu::core::CaptureSession;
  using dahu::core::EditorError;
  using dahu::core::EditorEvents;
  using dahu::core::ErrorCode;
  using dahu::core::LogLevel;
  using dahu::core::ProjectController;
  using dahu::core::Slide;
  using dahu::core::TriggerKeys;
  using ::testing::_;
  using ::testing::AnyNumber;
  using ::testing::ElementsAre;
  using ::testing::NiceMock;

  class CaptureSessionTest : public ::testing::Test {
  protected:
    void SetUp() override {
      controller = std::make_unique<ProjectController>(fs, events, logger);
      session = std::make_unique<CaptureSession>(*controller, keys, screen, pointer, events, logger);
      session->registerFailureCallback([this](const EditorError& e) { failures.push_back(e.code()); });
      events.slideAdded.subscribe([this](const std::string& img) { published.push_back(img); });
    }

    std::shared_ptr<FakeFileSystem> fs = std::make_shared<FakeFileSystem>();
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    EditorEvents events;
    FakeKeyInput keys;
    FakeScreenCapture screen;
    FakePointer pointer;
    std::unique_ptr<ProjectController> controller;
    std::unique_ptr<CaptureSession> session;
    std::vector<ErrorCode> failures;
    std::vector<std::string> published;
  };

  TEST_F(CaptureSessionTest, StartsDisarmed) {
    EXPECT_EQ(session->state(), CaptureSession::State::Disarmed);
    EXPECT_EQ(keys.listenerCount(), 0u);
  }

  TEST_F(CaptureSessionTest, Enter_WithoutProjectFailsAndStaysDisarmed) {
    try {
      session->enter();
      FAIL() << "expected NoActiveProject";
    } catch (const EditorError& e) {
      EXPECT_EQ(e.code(), ErrorCode::NoActiveProject);
    }
    EXPECT_FALSE(session->armed());
    EXPECT_FALSE(controller->isCapturing());
    EXPECT_EQ(keys.listenerCount(), 0u);
  }

  TEST_F(CaptureSessionTest, Enter_IsIdempotent) {
    controller->createProject("/tmp/p");
    session->enter();
    session->enter();

    EXPECT_TRUE(session->armed());
    EXPECT_EQ(keys.listenerCount(), 1u);

    keys.press("f7");
    EXPECT_EQ(controller->model().size(), 1u); // one listener, one slide
  }

  TEST_F(CaptureSessionTest, Exit_BeforeEnterIsNoOp) {
    session->exit();
    EXPECT_FALSE(session->armed());
    EXPECT_EQ(keys.listenerCount(), 0u);
  }

  TEST_F(CaptureSessionTest, Exit_UnsubscribesAndDisarms) {
    controller->createProject("/tmp/p");
    session->enter();
    session->exit();

    EXPECT_FALSE(session->armed());
    EXPECT_FALSE(controller->isCapturing());
    EXPECT_EQ(keys.listenerCount(), 0u);
  }

  TEST_F(CaptureSessionTest, CaptureWhileDisarmed_ProducesNothing) {
    controller->createProject("/tmp/p");
    keys.press("f7");
    session->capture();

    EXPECT_TRUE(controller->model().empty());
    EXPECT_FALSE(controller->isDirty());
    EXPECT_TRUE(screen.target_dirs.empty());
    EXPECT_TRUE(published.empty());
  }

  TEST_F(CaptureSessionTest, CaptureTrigger_AppendsSlideMarksDirtyAndPublishes) {
    controller->createProject("/tmp/p");
    session->enter();
    pointer.pos = { 640, 480 };

    keys.press("f7");

    ASSERT_EQ(controller->model().size(), 1u);
    EXPECT_EQ(controller->model().at(0), (Slide{ "s1.png", 640, 480 }));
    EXPECT_TRUE(controller->isDirty());
    EXPECT_THAT(screen.target_dirs, ElementsAre("/tmp/p"));
    EXPECT_THAT(published, ElementsAre("s1.png"));
  }

  TEST_F(CaptureSessionTest, TwoTriggers_AppendInCallOrder) {
    controller->createProject("/tmp/p");
    session->enter();
    screen.next_names = { "first.png", "second.png" };

    pointer.pos = { 1, 1 };
    keys.press("f7");
    pointer.pos = { 2, 2 };
    keys.press("f7");

    EXPECT_THAT(controller->slidePaths().toVector(), ElementsAre("first.png", "second.png"));
    EXPECT_EQ(controller->model().at(1).cursorX, 2);
    EXPECT_THAT(published, ElementsAre("first.png", "second.png"));
  }

  TEST_F(CaptureSessionTest, CaptureFailure_IsReportedAndSessionStaysArmed) {
    controller->createProject("/tmp/p");
    session->enter();
    screen.fail = true;

    keys.press("f7");

    EXPECT_THAT(failures, ElementsAre(ErrorCode::CaptureFailed));
    EXPECT_TRUE(session->armed());
    EXPECT_TRUE(controller->model().empty());
    EXPECT_FALSE(controller->isDirty());

    screen.fail = false;
    keys.press("f7");
    EXPECT_EQ(controller->model().size(), 1u);
  }

  TEST_F(CaptureSessionTest, CaptureNow_ThrowsCaptureFailedWithProjectPath) {
    controller->createProject("/tmp/p");
    session->enter();
    screen.fail = true;
    try {
      session->capture();
      FAIL() << "expected CaptureFailed";
    } catch (const EditorError& e) {
      EXPECT_EQ(e.code(), ErrorCode::CaptureFailed);
      EXPECT_EQ(e.path(), "/tmp/p");
    }
    EXPECT_TRUE(session->armed());
  }

  TEST_F(CaptureSessionTest, EmptyImageName_IsCaptureFailed) {
    controller->createProject("/tmp/p");
    session->enter();
    screen.next_names = { "" };
    keys.press("f7");
    EXPECT_THAT(failures, ElementsAre(ErrorCode::CaptureFailed));
    EXPECT_TRUE(controller->model().empty());
  }

  TEST_F(CaptureSessionTest, ExitTrigger_Disarms) {
    controller->createProject("/tmp/p");
    session->enter();

    keys.press("Escape");
    EXPECT_FALSE(session->armed());
    EXPECT_EQ(keys.listenerCount(), 0u);

    keys.press("f7");
    EXPECT_TRUE(controller->model().empty());
  }

  TEST_F(CaptureSessionTest, KeysAreMatchedCaseInsensitively_OthersIgnored) {
    controller->createProject("/tmp/p");
    session->enter();
    keys.press("F7");
    keys.press("a");
    keys.press("f8");
    EXPECT_EQ(controller->model().size(), 1u);
    EXPECT_TRUE(session->armed());
  }

  TEST_F(CaptureSessionTest, Toggle_SwitchesBetweenStates) {
    controller->createProject("/tmp/p");
    session->toggle();
    EXPECT_TRUE(session->armed());
    session->toggle();
    EXPECT_FALSE(session->armed());
  }

  TEST_F(CaptureSessionTest, CustomTriggerKeys) {
    CaptureSession custom(*controller, keys, screen, pointer, events, logger, TriggerKeys{ "F9", "Q" });
    controller->createProject("/tmp/p");
    custom.enter();

    keys.press("f7");
    EXPECT_TRUE(controller->model().empty());
    keys.press("f9");
    EXPECT_EQ(controller->model().size(), 1u);
    keys.press("q");
    EXPECT_FALSE(custom.armed());
  }

  TEST_F(CaptureSessionTest, FailureWithoutCallback_IsLoggedSevere) {
    CaptureSession bare(*controller, keys, screen, pointer, events, logger);
    controller->createProject("/tmp/p");
    bare.enter();
    screen.fail = true;

    EXPECT_CALL(*logger, log(_)).Times(AnyNumber());
    EXPECT_CALL(*logger, log(LogLevelIs(LogLevel::Severe))).Times(1);
    keys.press("f7");
    EXPECT_TRUE(bare.armed());
    EXPECT_TRUE(controller->model().empty());
  }

  TEST_F(CaptureSessionTest, Destructor_ReleasesListenerAndCaptureFlag) {
    controller->createProject("/tmp/p");
    {
      CaptureSession scoped(*controller, keys, screen, pointer, events, logger);
      scoped.enter();
      EXPECT_EQ(keys.listenerCount(), 1u);
    }
    EXPECT_EQ(keys.listenerCount(), 0u);
    EXPECT_FALSE(controller->isCapturing());
  }

} // namespace dahu::test
