#include <rclcpp/rclcpp.hpp>
#include "battery_history/history_storage.hpp"
#include "battery_history/history_store.hpp"
#include "battery_monitor/battery_reader.hpp"
#include "battery_monitor/monitor_context.hpp"
#include "battery_monitor/terminal_input.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;

class BatteryMonitorNode : public rclcpp::Node
{
public:
  BatteryMonitorNode()
  : Node("battery_monitor_node")
  {
    // Declare parameters
    this->declare_parameter("history_file", std::string(""));
    this->declare_parameter("power_supply_root",
      std::string(battery_monitor::BatteryReader::DEFAULT_POWER_SUPPLY_ROOT));
    this->declare_parameter("interactive", true);

    std::string history_file = this->get_parameter("history_file").as_string();
    std::string power_supply_root = this->get_parameter("power_supply_root").as_string();
    bool interactive = this->get_parameter("interactive").as_bool();

    if (history_file.empty()) {
      history_file = battery_history::HistoryStorage::defaultPath();
    }

    reader_ = std::make_unique<battery_monitor::BatteryReader>(power_supply_root);
    if (!reader_->open()) {
      throw std::runtime_error("No battery found in " + power_supply_root);
    }

    context_ = std::make_unique<battery_monitor::MonitorContext>(
      history_file, reader_->batteryName());

    if (context_->loadHistory()) {
      RCLCPP_INFO(this->get_logger(), "Loaded %zu samples and %zu charge sessions from %s",
                  context_->history().size(),
                  context_->history().completedSessions().size(),
                  history_file.c_str());
    } else {
      RCLCPP_INFO(this->get_logger(), "No usable history at %s, starting empty",
                  history_file.c_str());
    }

    // Take initial sample
    sampleBattery();

    sample_timer_ = this->create_wall_timer(
      SAMPLE_INTERVAL, std::bind(&BatteryMonitorNode::sampleBattery, this));

    if (interactive && input_.enable()) {
      input_timer_ = this->create_wall_timer(
        100ms, std::bind(&BatteryMonitorNode::pollInput, this));
      RCLCPP_INFO(this->get_logger(),
                  "Keys: [d] dashboard [h] history [1/2] session [+/-] zoom "
                  "[left/right] pan [f] fit [q] quit");
    } else {
      RCLCPP_INFO(this->get_logger(),
                  "Recording battery samples every %lds without terminal input (Ctrl+C to stop)",
                  static_cast<long>(SAMPLE_INTERVAL.count()));
    }

    RCLCPP_INFO(this->get_logger(), "Battery Monitor Node started for %s",
                context_->batteryName().c_str());
  }

  // Forced save; the only flush guaranteed to run on exit
  void saveOnExit()
  {
    if (context_->history().saveNow()) {
      RCLCPP_INFO(this->get_logger(), "Saved %zu samples to %s",
                  context_->history().size(),
                  context_->history().storagePath().c_str());
    } else {
      RCLCPP_WARN(this->get_logger(), "Final save to %s failed",
                  context_->history().storagePath().c_str());
    }
  }

private:
  static constexpr std::chrono::seconds SAMPLE_INTERVAL{5};

  void sampleBattery()
  {
    battery_history::Sample sample;
    if (!reader_->readSample(sample)) {
      RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), 60000,
                           "Battery reading unavailable, skipping sample");
      return;
    }

    context_->recordSample(sample);

    RCLCPP_DEBUG(this->get_logger(),
                 "Battery: %.1f%% %s %.2f W",
                 sample.capacity_percent,
                 battery_history::statusDisplayName(sample.status).c_str(),
                 sample.power_watts);

    auto& history = context_->history();
    if (history.samplesSinceSave() >= battery_history::HistoryStore::AUTOSAVE_INTERVAL) {
      if (history.maybeAutosave()) {
        RCLCPP_DEBUG(this->get_logger(), "Autosaved %zu samples", history.size());
      } else {
        RCLCPP_WARN(this->get_logger(), "Autosave to %s failed, keeping history in memory",
                    history.storagePath().c_str());
      }
    }
  }

  void pollInput()
  {
    for (auto command : input_.poll()) {
      if (!context_->apply(command)) {
        RCLCPP_INFO(this->get_logger(), "Quit requested");
        rclcpp::shutdown();
        return;
      }
      RCLCPP_INFO(this->get_logger(), "%s", context_->statusLine().c_str());
    }
  }

  rclcpp::TimerBase::SharedPtr sample_timer_;
  rclcpp::TimerBase::SharedPtr input_timer_;
  std::unique_ptr<battery_monitor::BatteryReader> reader_;
  std::unique_ptr<battery_monitor::MonitorContext> context_;
  battery_monitor::TerminalInput input_;
};

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);

  std::shared_ptr<BatteryMonitorNode> node;
  try {
    node = std::make_shared<BatteryMonitorNode>();
  } catch (const std::runtime_error& e) {
    RCLCPP_FATAL(rclcpp::get_logger("battery_monitor_node"), "%s", e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::spin(node);
  node->saveOnExit();
  rclcpp::shutdown();
  return 0;
}
