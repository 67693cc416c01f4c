#include "core/notifier.hpp"
#include "io/notify/file_dispatcher.hpp"
#include "io/notify/http_dispatcher.hpp"
#include "io/notify/mail_dispatcher.hpp"
#include "test_fakes.hpp"
#include "utils/utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

class NotifierTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("waf_notify_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  Notifier make_notifier(std::vector<RecordingDispatcher::Mode> modes,
                         uint32_t throttle_seconds = 0) {
    std::vector<std::unique_ptr<INotificationDispatcher>> dispatchers;
    recorders_.clear();
    for (auto mode : modes) {
      auto recorder = std::make_unique<RecordingDispatcher>(mode);
      recorders_.push_back(recorder.get());
      dispatchers.push_back(std::move(recorder));
    }
    return Notifier(std::move(dispatchers), throttle_seconds);
  }

  std::filesystem::path dir_;
  std::vector<RecordingDispatcher *> recorders_;
};

TEST_F(NotifierTest, ThrowingDispatcherDoesNotStopTheOthers) {
  Notifier notifier = make_notifier({RecordingDispatcher::Mode::THROW,
                                     RecordingDispatcher::Mode::FAIL,
                                     RecordingDispatcher::Mode::SUCCEED});

  size_t delivered = notifier.notify(Notification(
      NotificationKind::CLASSIFIER_ERROR, "fetch", "Classification run aborted"));

  EXPECT_EQ(delivered, 1u);
  for (auto *recorder : recorders_)
    EXPECT_EQ(recorder->received.size(), 1u);
}

TEST_F(NotifierTest, RepeatedAlertIsThrottledPerSubject) {
  Notifier notifier = make_notifier({RecordingDispatcher::Mode::SUCCEED}, 900);

  notifier.notify(Notification(NotificationKind::SEVERITY_THRESHOLD_EXCEEDED,
                               "attack_percentage", "Attack traffic above threshold"));
  size_t second = notifier.notify(Notification(
      NotificationKind::SEVERITY_THRESHOLD_EXCEEDED, "attack_percentage",
      "Attack traffic above threshold"));
  notifier.notify(Notification(NotificationKind::CLASSIFIER_ERROR, "fetch",
                               "Classification run aborted"));

  EXPECT_EQ(second, 0u);
  EXPECT_EQ(notifier.throttled_count(), 1u);
  EXPECT_EQ(recorders_[0]->received.size(), 2u);
}

TEST_F(NotifierTest, RuleSetChangesAreNeverThrottled) {
  Notifier notifier = make_notifier({RecordingDispatcher::Mode::SUCCEED}, 900);

  for (int i = 0; i < 3; ++i)
    notifier.notify(Notification(NotificationKind::RULESET_CHANGED, "version 2",
                                 "Hardened rule set changed"));

  EXPECT_EQ(recorders_[0]->count(NotificationKind::RULESET_CHANGED), 3u);
  EXPECT_EQ(notifier.throttled_count(), 0u);
}

TEST_F(NotifierTest, RecentNotificationsAreNewestFirst) {
  Notifier notifier = make_notifier({RecordingDispatcher::Mode::SUCCEED});
  notifier.notify(Notification(NotificationKind::CLASSIFIER_ERROR, "a", "first"));
  notifier.notify(Notification(NotificationKind::CLASSIFIER_ERROR, "b", "second"));

  auto recent = notifier.get_recent_notifications(1);
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_EQ(recent[0].summary, "second");
}

TEST_F(NotifierTest, ConfigBuildsEnabledDispatchersOnly) {
  Config::NotificationConfig config;
  config.file_enabled = true;
  config.file_path = (dir_ / "notifications.jsonl").string();
  config.http_enabled = true;
  config.http_webhook_url = "";
  config.mail_enabled = true;

  Notifier notifier(config);
  EXPECT_EQ(notifier.dispatcher_count(), 1u);
}

TEST_F(NotifierTest, FileDispatcherAppendsJsonLines) {
  const std::string path = (dir_ / "out" / "notifications.jsonl").string();
  {
    FileDispatcher dispatcher(path);
    Notification notification(NotificationKind::RULESET_CHANGED, "version 3",
                              "Hardened rule set changed",
                              {{"activated", {"942110"}}});
    EXPECT_TRUE(dispatcher.dispatch(notification));
    EXPECT_TRUE(dispatcher.dispatch(notification));
  }

  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["kind"], "RuleSetChanged");
    EXPECT_EQ(j["details"]["activated"][0], "942110");
    ++lines;
  }
  EXPECT_EQ(lines, 2);
}

TEST_F(NotifierTest, MailMessageCarriesHeadersAndDetails) {
  MailDispatcher dispatcher("/usr/sbin/sendmail -t", "waf@example.com",
                            {"ops@example.com", "sec@example.com"}, 5);
  Notification notification(NotificationKind::SEVERITY_THRESHOLD_EXCEEDED,
                            "attack_percentage", "Attack traffic above threshold",
                            {{"attack_percentage", 72.5}});

  std::string message = dispatcher.build_message(notification);

  EXPECT_NE(message.find("From: waf@example.com\r\n"), std::string::npos);
  EXPECT_NE(message.find("To: ops@example.com, sec@example.com\r\n"),
            std::string::npos);
  EXPECT_NE(message.find("Subject: [waf_hardener] SeverityThresholdExceeded"),
            std::string::npos);
  EXPECT_NE(message.find("\"attack_percentage\": 72.5"), std::string::npos);
}

TEST_F(NotifierTest, MailDispatcherPipesMessageToCommand) {
  const std::string sink = (dir_ / "mail.txt").string();
  MailDispatcher dispatcher("cat > " + sink, "waf@example.com",
                            {"ops@example.com"}, 5);

  EXPECT_TRUE(dispatcher.dispatch(Notification(
      NotificationKind::HARDENING_CYCLE_FAILED, "conflict", "Hardening cycle aborted")));

  auto content = Utils::read_file(sink);
  ASSERT_TRUE(content.has_value());
  EXPECT_NE(content->find("HardeningCycleFailed"), std::string::npos);
}

TEST_F(NotifierTest, MailDispatcherReportsFailingCommand) {
  MailDispatcher dispatcher("false", "waf@example.com", {"ops@example.com"}, 5);
  EXPECT_FALSE(dispatcher.dispatch(Notification(
      NotificationKind::CLASSIFIER_ERROR, "fetch", "Classification run aborted")));
}

TEST_F(NotifierTest, HttpDispatcherRejectsMalformedUrl) {
  HttpDispatcher valid("https://hooks.example.com/waf/notify", 5);
  EXPECT_TRUE(valid.is_valid());
  HttpDispatcher invalid("not a url", 5);
  EXPECT_FALSE(invalid.is_valid());
  EXPECT_FALSE(invalid.dispatch(Notification(NotificationKind::CLASSIFIER_ERROR,
                                             "fetch", "Classification run aborted")));
}
