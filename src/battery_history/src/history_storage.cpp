#include "battery_history/history_storage.hpp"
#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace battery_history
{

namespace
{

Json::Value encodeSample(const Sample& sample)
{
  Json::Value value(Json::objectValue);
  value["timestamp_ms"] = Json::Int64(toEpochMillis(sample.timestamp));
  value["capacity"] = sample.capacity_percent;
  value["power_watts"] = sample.power_watts;
  value["voltage_volts"] = sample.voltage_volts;
  value["energy_wh"] = sample.energy_wh;
  value["energy_full_wh"] = sample.energy_full_wh;
  value["status"] = statusTag(sample.status);
  return value;
}

Json::Value encodeSamples(const std::vector<Sample>& samples)
{
  Json::Value array(Json::arrayValue);
  for (const auto& sample : samples) {
    array.append(encodeSample(sample));
  }
  return array;
}

Json::Value encodeSession(const ChargeSession& session)
{
  Json::Value value(Json::objectValue);
  value["start_time_ms"] = Json::Int64(toEpochMillis(session.start_time));
  value["end_time_ms"] = Json::Int64(toEpochMillis(session.end_time));
  value["start_capacity"] = session.start_capacity;
  value["end_capacity"] = session.end_capacity;
  value["reached_threshold"] = session.reached_threshold;
  value["completed"] = session.completed;
  value["samples"] = encodeSamples(session.samples);
  return value;
}

// Optional numeric field
double numberOr(const Json::Value& object, const char* key, double fallback)
{
  const Json::Value& field = object[key];
  return field.isNumeric() ? field.asDouble() : fallback;
}

// Epoch milliseconds, rejected when they do not fit the clock's duration
bool decodeTimestamp(const Json::Value& field, Timestamp& timestamp)
{
  if (!field.isNumeric()) {
    return false;
  }

  const int64_t limit = std::chrono::duration_cast<std::chrono::milliseconds>(
    Clock::duration::max()).count();
  int64_t millis = field.asInt64();
  if (millis > limit || millis < -limit) {
    return false;
  }
  timestamp = fromEpochMillis(millis);
  return true;
}

bool decodeSample(const Json::Value& value, Sample& sample)
{
  Timestamp timestamp;
  if (!value.isObject() || !decodeTimestamp(value["timestamp_ms"], timestamp) ||
      !value["capacity"].isNumeric())
  {
    return false;
  }

  sample = makeSample(
    timestamp,
    value["capacity"].asDouble(),
    numberOr(value, "power_watts", 0.0),
    numberOr(value, "voltage_volts", 0.0),
    numberOr(value, "energy_wh", 0.0),
    numberOr(value, "energy_full_wh", 0.0),
    statusFromTag(value.get("status", "unknown").asString()));
  return true;
}

bool decodeSamples(const Json::Value& array, std::vector<Sample>& samples)
{
  if (!array.isArray()) {
    return false;
  }
  samples.clear();
  samples.reserve(array.size());
  for (const auto& item : array) {
    Sample sample;
    if (!decodeSample(item, sample)) {
      return false;
    }
    samples.push_back(sample);
  }
  return true;
}

bool decodeSession(const Json::Value& value, ChargeSession& session)
{
  if (!value.isObject() || !decodeSamples(value["samples"], session.samples) ||
      session.samples.empty())
  {
    return false;
  }

  const Sample& first = session.samples.front();
  const Sample& last = session.samples.back();

  session.start_time = first.timestamp;
  session.end_time = last.timestamp;
  if ((value["start_time_ms"].isNumeric() &&
       !decodeTimestamp(value["start_time_ms"], session.start_time)) ||
      (value["end_time_ms"].isNumeric() &&
       !decodeTimestamp(value["end_time_ms"], session.end_time)))
  {
    return false;
  }
  session.start_capacity = numberOr(value, "start_capacity", first.capacity_percent);
  session.end_capacity = numberOr(value, "end_capacity", last.capacity_percent);
  session.reached_threshold = value.get("reached_threshold", true).asBool();
  session.completed = value.get("completed", true).asBool();
  return true;
}

} // namespace

std::string serializeHistory(const HistoryDocument& document)
{
  Json::Value root(Json::objectValue);
  root["version"] = HistoryStorage::FORMAT_VERSION;
  root["samples"] = encodeSamples(document.samples);

  Json::Value sessions(Json::arrayValue);
  for (const auto& session : document.completed_sessions) {
    sessions.append(encodeSession(session));
  }
  root["completed_sessions"] = sessions;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, root);
}

bool parseHistory(const std::string& text, HistoryDocument& document)
{
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    std::cerr << "History document is not valid JSON: " << errors << std::endl;
    return false;
  }

  try {
    if (!root.isObject()) {
      std::cerr << "History document root is not an object" << std::endl;
      return false;
    }

    HistoryDocument parsed;
    if (!decodeSamples(root["samples"], parsed.samples)) {
      std::cerr << "History document has malformed samples" << std::endl;
      return false;
    }

    const Json::Value& sessions = root["completed_sessions"];
    if (!sessions.isNull()) {
      if (!sessions.isArray()) {
        std::cerr << "History document has malformed sessions" << std::endl;
        return false;
      }
      for (const auto& item : sessions) {
        ChargeSession session;
        if (!decodeSession(item, session)) {
          std::cerr << "History document has a malformed session" << std::endl;
          return false;
        }
        parsed.completed_sessions.push_back(session);
      }
    }

    document = std::move(parsed);
    return true;
  } catch (const Json::Exception& e) {
    std::cerr << "History document has unexpected types: " << e.what() << std::endl;
    return false;
  }
}

HistoryStorage::HistoryStorage(const std::string& path)
: path_(path)
{
}

std::string HistoryStorage::defaultPath()
{
  std::filesystem::path base;

  const char* xdg_data = std::getenv("XDG_DATA_HOME");
  const char* home = std::getenv("HOME");
  if (xdg_data && xdg_data[0] != '\0') {
    base = xdg_data;
  } else if (home && home[0] != '\0') {
    base = std::filesystem::path(home) / ".local" / "share";
  } else {
    base = ".";
  }

  return (base / "battery_history" / "history.json").string();
}

bool HistoryStorage::read(HistoryDocument& document) const
{
  std::ifstream file(path_);
  if (!file.is_open()) {
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parseHistory(buffer.str(), document);
}

bool HistoryStorage::write(const HistoryDocument& document) const
{
  std::filesystem::path target(path_);
  std::error_code ec;

  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create " << target.parent_path() << ": " << ec.message() << std::endl;
      return false;
    }
  }

  std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      std::cerr << "Failed to open " << tmp_path << " for writing" << std::endl;
      return false;
    }
    file << serializeHistory(document);
    file.flush();
    if (!file) {
      std::cerr << "Failed to write " << tmp_path << std::endl;
      std::remove(tmp_path.c_str());
      return false;
    }
  }

  std::filesystem::rename(tmp_path, target, ec);
  if (ec) {
    std::cerr << "Failed to replace " << path_ << ": " << ec.message() << std::endl;
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

} // namespace battery_history
