#pragma once

#include "model/baseline_stats.hpp"
#include "model/drift_event.hpp"
#include "model/trace_event.hpp"
#include "storage/connection_pool.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentwatch::core::logging {
class Logger;
}

namespace agentwatch::storage {

// `$HOME/.agentwatch/agentwatch.db`, or `./.agentwatch/agentwatch.db` when
// HOME is unset.
std::filesystem::path DefaultDbPath();

struct TraceQuery {
  std::optional<std::string> agent_id;
  std::optional<std::string> run_id;
  std::optional<double> since;
  std::size_t limit = 100;
};

struct DriftQuery {
  std::optional<std::string> agent_id;
  std::optional<double> since;
  std::optional<model::Severity> severity;
  std::size_t limit = 50;
};

// Durable store for trace events, drift events and per-agent baselines.
//
// Contract:
// - Safe for concurrent use. Every operation leases its own connection for
//   the duration of the call; no connection is shared between callers.
// - Saves are upserts on the primary key (`event_id` / `agent_id`) and each
//   save is atomic on its own. There is no cross-record transaction.
// - Writes return false with `error` populated on failure.
// - Reads never fail hard: storage or decode problems are logged as warnings
//   and produce an empty result. A malformed payload column decodes to an
//   empty object while the rest of the row is kept.
class TraceStore {
public:
  TraceStore(std::filesystem::path db_path, core::logging::Logger& logger);

  TraceStore(const TraceStore&) = delete;
  TraceStore& operator=(const TraceStore&) = delete;

  // Creates the parent directory and the schema (idempotent).
  bool Open(std::string& error);

  // Drops idle connections. The store may be used again afterwards.
  void Close();

  const std::filesystem::path& DbPath() const {
    return pool_.DbPath();
  }

  bool SaveTrace(const model::TraceEvent& event, std::string& error);

  // Newest first.
  std::vector<model::TraceEvent> GetTraces(const TraceQuery& query);

  // Whole run in chronological order.
  std::vector<model::TraceEvent> GetRunTraces(const std::string& agent_id,
                                              const std::string& run_id);

  // Names of the last `window` tool-call events of the run, oldest first.
  std::vector<std::string> GetRecentActions(const std::string& agent_id,
                                            const std::string& run_id, std::size_t window = 20);

  // Distinct run ids ordered by their latest event, most recent first.
  std::vector<std::string> GetRunIds(const std::string& agent_id, std::size_t limit = 50);

  model::RunStats GetRunStats(const std::string& agent_id, const std::string& run_id);

  bool SaveDrift(const model::DriftEvent& event, std::string& error);

  // Newest first.
  std::vector<model::DriftEvent> GetDriftEvents(const DriftQuery& query);

  bool SaveBaseline(const model::BaselineStats& baseline, std::string& error);
  std::optional<model::BaselineStats> GetBaseline(const std::string& agent_id);

private:
  bool LeaseForRead(ConnectionLease& lease, std::string_view operation);

  ConnectionPool pool_;
  core::logging::Logger& logger_;
};

} // namespace agentwatch::storage
