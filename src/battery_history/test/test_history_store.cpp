#include "battery_history/history_store.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using battery_history::BatteryStatus;
using battery_history::ChartViewport;
using battery_history::HistoryStore;
using battery_history::Sample;

namespace
{

Sample reading(long long index, BatteryStatus status, double capacity)
{
  return battery_history::makeSample(
    battery_history::fromEpochMillis(1700000000000LL + index * 5000LL),
    capacity, 0.0, 12.0, 30.0, 57.0, status);
}

} // namespace

class HistoryStoreTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    dir_ = std::filesystem::temp_directory_path() /
      ("battery_history_store_" + std::to_string(::getpid()) + "_" +
       ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(dir_);
    path_ = (dir_ / "nested" / "history.json").string();
  }

  void TearDown() override
  {
    std::filesystem::remove_all(dir_);
  }

  std::filesystem::path dir_;
  std::string path_;
};

TEST_F(HistoryStoreTest, RecordAppendsInOrder)
{
  HistoryStore store(path_);
  store.recordSample(reading(0, BatteryStatus::Discharging, 50.0));
  store.recordSample(reading(1, BatteryStatus::Discharging, 49.0));

  ASSERT_EQ(store.size(), 2u);
  EXPECT_DOUBLE_EQ(store.samples()[0].capacity_percent, 50.0);
  ASSERT_NE(store.latest(), nullptr);
  EXPECT_DOUBLE_EQ(store.latest()->capacity_percent, 49.0);
  EXPECT_EQ(store.samplesSinceSave(), 2u);
}

TEST_F(HistoryStoreTest, EvictsOldestBeyondCap)
{
  HistoryStore store(path_);
  const size_t extra = 25;
  for (size_t i = 0; i < HistoryStore::MAX_SAMPLES + extra; ++i) {
    store.recordSample(reading(static_cast<long long>(i), BatteryStatus::Discharging, 50.0));
    ASSERT_LE(store.size(), HistoryStore::MAX_SAMPLES);
  }

  ASSERT_EQ(store.size(), HistoryStore::MAX_SAMPLES);
  EXPECT_EQ(store.samples().front().timestamp, reading(extra, BatteryStatus::Discharging, 0).timestamp);
  EXPECT_EQ(store.samples().back().timestamp,
            reading(HistoryStore::MAX_SAMPLES + extra - 1, BatteryStatus::Discharging, 0).timestamp);
  for (size_t i = 1; i < store.size(); i += 997) {
    EXPECT_LT(store.samples()[i - 1].timestamp, store.samples()[i].timestamp);
  }
}

TEST_F(HistoryStoreTest, ForwardsSamplesToSessionTracker)
{
  HistoryStore store(path_);
  store.recordSample(reading(0, BatteryStatus::Charging, 80.0));
  store.recordSample(reading(1, BatteryStatus::Charging, 92.0));
  EXPECT_TRUE(store.sessions().isCharging());

  store.recordSample(reading(2, BatteryStatus::Full, 100.0));
  EXPECT_FALSE(store.sessions().isCharging());
  ASSERT_EQ(store.completedSessions().size(), 1u);
  EXPECT_EQ(store.completedSessions().front().samples.size(), 2u);
}

TEST_F(HistoryStoreTest, SessionSamplesSurviveEviction)
{
  HistoryStore store(path_);
  store.recordSample(reading(0, BatteryStatus::Charging, 85.0));
  store.recordSample(reading(1, BatteryStatus::Charging, 95.0));
  store.recordSample(reading(2, BatteryStatus::Discharging, 94.0));

  for (size_t i = 0; i < HistoryStore::MAX_SAMPLES; ++i) {
    store.recordSample(reading(static_cast<long long>(i + 3), BatteryStatus::Discharging, 90.0));
  }

  ASSERT_EQ(store.completedSessions().size(), 1u);
  const auto& session = store.completedSessions().front();
  ASSERT_EQ(session.samples.size(), 2u);
  EXPECT_DOUBLE_EQ(session.samples[0].capacity_percent, 85.0);
  EXPECT_GT(store.samples().front().timestamp, session.end_time);
}

TEST_F(HistoryStoreTest, AutosavesEverySixtySamples)
{
  HistoryStore store(path_);
  for (size_t i = 0; i < HistoryStore::AUTOSAVE_INTERVAL - 1; ++i) {
    store.recordSample(reading(static_cast<long long>(i), BatteryStatus::Discharging, 60.0));
    EXPECT_FALSE(store.maybeAutosave());
  }
  EXPECT_FALSE(std::filesystem::exists(path_));

  store.recordSample(reading(100, BatteryStatus::Discharging, 59.0));
  EXPECT_TRUE(store.maybeAutosave());
  EXPECT_TRUE(std::filesystem::exists(path_));
  EXPECT_EQ(store.samplesSinceSave(), 0u);

  // Counter restarted
  store.recordSample(reading(101, BatteryStatus::Discharging, 58.0));
  EXPECT_FALSE(store.maybeAutosave());
}

TEST_F(HistoryStoreTest, SaveAndLoadRestoresSamplesAndSessions)
{
  {
    HistoryStore store(path_);
    store.recordSample(reading(0, BatteryStatus::Charging, 70.0));
    store.recordSample(reading(1, BatteryStatus::Charging, 90.0));
    store.recordSample(reading(2, BatteryStatus::Discharging, 89.0));
    // Active session is not persisted
    store.recordSample(reading(3, BatteryStatus::Charging, 89.5));
    ASSERT_TRUE(store.saveNow());
  }

  HistoryStore restored(path_);
  ASSERT_TRUE(restored.load());
  ASSERT_EQ(restored.size(), 4u);
  EXPECT_EQ(restored.samples()[2].status, BatteryStatus::Discharging);
  EXPECT_EQ(restored.samples()[3].timestamp, reading(3, BatteryStatus::Charging, 0).timestamp);
  ASSERT_EQ(restored.completedSessions().size(), 1u);
  EXPECT_EQ(restored.completedSessions().front().samples.size(), 2u);
  EXPECT_FALSE(restored.sessions().isCharging());
  EXPECT_EQ(restored.samplesSinceSave(), 0u);
}

TEST_F(HistoryStoreTest, MissingFileStartsEmpty)
{
  HistoryStore store(path_);
  EXPECT_FALSE(store.load());
  EXPECT_TRUE(store.empty());
  EXPECT_TRUE(store.completedSessions().empty());
}

TEST_F(HistoryStoreTest, CorruptFileStartsEmpty)
{
  std::filesystem::create_directories(std::filesystem::path(path_).parent_path());
  {
    std::ofstream file(path_);
    file << "{ \"samples\": [ {\"timestamp_ms\": ";
  }

  HistoryStore store(path_);
  EXPECT_FALSE(store.load());
  EXPECT_TRUE(store.empty());

  // Still usable afterwards
  store.recordSample(reading(0, BatteryStatus::Discharging, 40.0));
  EXPECT_TRUE(store.saveNow());
}

TEST_F(HistoryStoreTest, SaveFailureIsNotFatal)
{
  // A directory where the file should be makes the rename fail
  std::filesystem::create_directories(path_);

  HistoryStore store(path_);
  store.recordSample(reading(0, BatteryStatus::Discharging, 40.0));
  EXPECT_FALSE(store.saveNow());
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(store.samplesSinceSave(), 0u);

  store.recordSample(reading(1, BatteryStatus::Discharging, 39.0));
  EXPECT_EQ(store.size(), 2u);
}

TEST_F(HistoryStoreTest, VisibleSamplesFollowViewport)
{
  HistoryStore store(path_);
  for (int i = 0; i < 100; ++i) {
    store.recordSample(reading(i, BatteryStatus::Discharging, 100.0 - i * 0.5));
  }

  ChartViewport viewport;
  viewport.fitToData(store.size());
  EXPECT_EQ(store.visibleSamples(viewport).size(), 100u);

  viewport.zoomIn();
  auto visible = store.visibleSamples(viewport);
  auto window = viewport.currentWindow(store.size());
  ASSERT_EQ(visible.size(), window.width);
  EXPECT_EQ(visible.front().timestamp, store.samples()[window.start].timestamp);
}

TEST_F(HistoryStoreTest, VisibleSamplesOfEmptyStore)
{
  HistoryStore store(path_);
  ChartViewport viewport;
  viewport.fitToData(0);
  EXPECT_TRUE(store.visibleSamples(viewport).empty());
}
