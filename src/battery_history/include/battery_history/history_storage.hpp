#ifndef BATTERY_HISTORY__HISTORY_STORAGE_HPP_
#define BATTERY_HISTORY__HISTORY_STORAGE_HPP_

#include "battery_history/sample.hpp"
#include "battery_history/session_tracker.hpp"
#include <string>
#include <vector>

namespace battery_history
{

// Everything that survives a restart
struct HistoryDocument
{
  std::vector<Sample> samples;
  std::vector<ChargeSession> completed_sessions;   // oldest first
};

// JSON text of a document
std::string serializeHistory(const HistoryDocument& document);

// Parse JSON text; returns false (document untouched) on malformed input
bool parseHistory(const std::string& text, HistoryDocument& document);

class HistoryStorage
{
public:
  static constexpr int FORMAT_VERSION = 1;

  explicit HistoryStorage(const std::string& path);
  ~HistoryStorage() = default;

  // $XDG_DATA_HOME/battery_history/history.json, falling back to
  // ~/.local/share and finally the working directory
  static std::string defaultPath();

  // Returns false if the file is missing or cannot be parsed
  bool read(HistoryDocument& document) const;

  // Writes through a temporary sibling file that is renamed into place
  bool write(const HistoryDocument& document) const;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace battery_history

#endif // BATTERY_HISTORY__HISTORY_STORAGE_HPP_
