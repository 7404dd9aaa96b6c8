#ifndef AUTOPOIESIS_HISTORY_WRITER_H
#define AUTOPOIESIS_HISTORY_WRITER_H

#include "agent_types.h"
#include <string>
#include <vector>

namespace autopoiesis {

// One row per tick, header first. Returns false if the file cannot be written.
bool write_history_csv(const std::string& filename, const std::vector<HistoryRecord>& history);

// Terminal cause, step count and survival statistics as "Label: value" lines.
bool write_summary(const std::string& filename, const EpisodeOutcome& outcome);

} // namespace autopoiesis

#endif // AUTOPOIESIS_HISTORY_WRITER_H
