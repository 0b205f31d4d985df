#include "storage/trace_store.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <utility>

namespace fs = std::filesystem;

namespace agentwatch::storage {

namespace {

using core::json::Value;
using StepResult = SqliteStatement::StepResult;

constexpr const char* kSchemaSql = R"(
  CREATE TABLE IF NOT EXISTS trace_events (
    event_id TEXT PRIMARY KEY,
    agent_id TEXT NOT NULL,
    run_id TEXT NOT NULL,
    action_type TEXT NOT NULL,
    action_name TEXT NOT NULL,
    timestamp REAL NOT NULL,
    token_count INTEGER DEFAULT 0,
    input_data TEXT DEFAULT '{}',
    output_data TEXT DEFAULT '{}',
    duration_ms REAL DEFAULT 0.0,
    metadata TEXT DEFAULT '{}'
  );

  CREATE TABLE IF NOT EXISTS drift_events (
    event_id TEXT PRIMARY KEY,
    agent_id TEXT NOT NULL,
    run_id TEXT NOT NULL,
    detector TEXT NOT NULL,
    severity TEXT NOT NULL,
    score REAL NOT NULL,
    message TEXT NOT NULL,
    suggested_action TEXT NOT NULL,
    timestamp REAL NOT NULL,
    context TEXT DEFAULT '{}'
  );

  CREATE TABLE IF NOT EXISTS baselines (
    agent_id TEXT PRIMARY KEY,
    data TEXT NOT NULL,
    updated_at REAL NOT NULL
  );

  CREATE INDEX IF NOT EXISTS idx_traces_agent ON trace_events(agent_id, timestamp);
  CREATE INDEX IF NOT EXISTS idx_traces_run ON trace_events(run_id, timestamp);
  CREATE INDEX IF NOT EXISTS idx_drift_agent ON drift_events(agent_id, timestamp);
  CREATE INDEX IF NOT EXISTS idx_drift_severity ON drift_events(severity, timestamp);
)";

constexpr const char* kTraceColumns =
    "event_id, agent_id, run_id, action_type, action_name, timestamp, token_count, "
    "input_data, output_data, duration_ms, metadata";

constexpr const char* kDriftColumns =
    "event_id, agent_id, run_id, detector, severity, score, message, suggested_action, "
    "timestamp, context";

// Decodes one payload column. Malformed or non-object text becomes an empty
// object so one bad row never hides the rest of a result set.
Value DecodePayload(const std::string& text, std::string_view column, const std::string& event_id,
                    core::logging::Logger& logger) {
  if (text.empty()) {
    return core::json::MakeObject();
  }
  Value parsed;
  std::string error;
  if (!core::json::Parse(text, parsed, error)) {
    logger.Warn("malformed stored payload; using empty object",
                {{"column", column}, {"event_id", event_id}, {"error", error}});
    return core::json::MakeObject();
  }
  if (parsed.type != Value::Type::kObject) {
    logger.Warn("stored payload is not an object; using empty object",
                {{"column", column}, {"event_id", event_id}});
    return core::json::MakeObject();
  }
  return parsed;
}

bool RowToTrace(const SqliteStatement& stmt, model::TraceEvent& event,
                core::logging::Logger& logger) {
  event.event_id = stmt.ColumnText(0);
  event.agent_id = stmt.ColumnText(1);
  event.run_id = stmt.ColumnText(2);
  const std::string action_type = stmt.ColumnText(3);
  if (!model::ParseActionType(action_type, event.action_type)) {
    logger.Warn("skipping stored trace with unknown action_type",
                {{"event_id", event.event_id}, {"action_type", action_type}});
    return false;
  }
  event.action_name = stmt.ColumnText(4);
  event.timestamp = stmt.ColumnDouble(5);
  event.token_count = stmt.ColumnInt64(6);
  event.input_data = DecodePayload(stmt.ColumnText(7), "input_data", event.event_id, logger);
  event.output_data = DecodePayload(stmt.ColumnText(8), "output_data", event.event_id, logger);
  event.duration_ms = stmt.ColumnDouble(9);
  event.metadata = DecodePayload(stmt.ColumnText(10), "metadata", event.event_id, logger);
  return true;
}

bool RowToDrift(const SqliteStatement& stmt, model::DriftEvent& event,
                core::logging::Logger& logger) {
  event.event_id = stmt.ColumnText(0);
  event.agent_id = stmt.ColumnText(1);
  event.run_id = stmt.ColumnText(2);
  const std::string detector = stmt.ColumnText(3);
  const std::string severity = stmt.ColumnText(4);
  if (!model::ParseDetectorType(detector, event.detector) ||
      !model::ParseSeverity(severity, event.severity)) {
    logger.Warn("skipping stored drift with unknown detector or severity",
                {{"event_id", event.event_id}, {"detector", detector}, {"severity", severity}});
    return false;
  }
  event.score = stmt.ColumnDouble(5);
  event.message = stmt.ColumnText(6);
  event.suggested_action = stmt.ColumnText(7);
  event.timestamp = stmt.ColumnDouble(8);
  event.context = DecodePayload(stmt.ColumnText(9), "context", event.event_id, logger);
  return true;
}

// Binds positional filters collected while building a dynamic WHERE clause.
struct FilterBinding {
  enum class Kind {
    kText,
    kDouble,
    kInt64,
  };

  Kind kind = Kind::kText;
  std::string text;
  double number = 0.0;
  std::int64_t integer = 0;
};

bool BindAll(SqliteStatement& stmt, const std::vector<FilterBinding>& bindings) {
  int index = 1;
  for (const auto& binding : bindings) {
    bool ok = false;
    switch (binding.kind) {
    case FilterBinding::Kind::kText:
      ok = stmt.BindText(index, binding.text);
      break;
    case FilterBinding::Kind::kDouble:
      ok = stmt.BindDouble(index, binding.number);
      break;
    case FilterBinding::Kind::kInt64:
      ok = stmt.BindInt64(index, binding.integer);
      break;
    }
    if (!ok) {
      return false;
    }
    ++index;
  }
  return true;
}

FilterBinding TextBinding(std::string text) {
  FilterBinding binding;
  binding.kind = FilterBinding::Kind::kText;
  binding.text = std::move(text);
  return binding;
}

FilterBinding DoubleBinding(const double number) {
  FilterBinding binding;
  binding.kind = FilterBinding::Kind::kDouble;
  binding.number = number;
  return binding;
}

FilterBinding LimitBinding(const std::size_t limit) {
  FilterBinding binding;
  binding.kind = FilterBinding::Kind::kInt64;
  binding.integer = static_cast<std::int64_t>(limit);
  return binding;
}

} // namespace

fs::path DefaultDbPath() {
  const char* home = std::getenv("HOME");
  const fs::path root = (home != nullptr && home[0] != '\0') ? fs::path(home) : fs::path(".");
  return root / ".agentwatch" / "agentwatch.db";
}

TraceStore::TraceStore(fs::path db_path, core::logging::Logger& logger)
    : pool_(std::move(db_path)), logger_(logger) {}

bool TraceStore::Open(std::string& error) {
  if (!core::EnsureParentDirectory(pool_.DbPath(), error)) {
    return false;
  }

  pool_.Reopen();
  ConnectionLease lease;
  if (!pool_.Acquire(lease, error)) {
    return false;
  }
  if (!lease->Exec(kSchemaSql, error)) {
    error = "failed to create schema in '" + pool_.DbPath().string() + "': " + error;
    return false;
  }
  return true;
}

void TraceStore::Close() {
  pool_.Close();
}

bool TraceStore::LeaseForRead(ConnectionLease& lease, std::string_view operation) {
  std::string error;
  if (!pool_.Acquire(lease, error)) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", operation}, {"error", error}});
    return false;
  }
  return true;
}

bool TraceStore::SaveTrace(const model::TraceEvent& event, std::string& error) {
  ConnectionLease lease;
  if (!pool_.Acquire(lease, error)) {
    return false;
  }

  SqliteStatement stmt;
  if (!stmt.Prepare(*lease,
                    "INSERT OR REPLACE INTO trace_events (event_id, agent_id, run_id, "
                    "action_type, action_name, timestamp, token_count, input_data, output_data, "
                    "duration_ms, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                    error)) {
    return false;
  }

  const bool bound = stmt.BindText(1, event.event_id) && stmt.BindText(2, event.agent_id) &&
                     stmt.BindText(3, event.run_id) &&
                     stmt.BindText(4, model::ToString(event.action_type)) &&
                     stmt.BindText(5, event.action_name) && stmt.BindDouble(6, event.timestamp) &&
                     stmt.BindInt64(7, event.token_count) &&
                     stmt.BindText(8, core::json::Serialize(event.input_data)) &&
                     stmt.BindText(9, core::json::Serialize(event.output_data)) &&
                     stmt.BindDouble(10, event.duration_ms) &&
                     stmt.BindText(11, core::json::Serialize(event.metadata));
  if (!bound) {
    error = "failed to bind trace event '" + event.event_id + "': " + lease->LastErrorMessage();
    return false;
  }

  if (stmt.Step(error) != StepResult::kDone) {
    error = "failed to save trace event '" + event.event_id + "': " + error;
    return false;
  }
  return true;
}

std::vector<model::TraceEvent> TraceStore::GetTraces(const TraceQuery& query) {
  std::vector<model::TraceEvent> traces;
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_traces")) {
    return traces;
  }

  std::string sql = std::string("SELECT ") + kTraceColumns + " FROM trace_events WHERE 1=1";
  std::vector<FilterBinding> bindings;
  if (query.agent_id.has_value()) {
    sql += " AND agent_id = ?";
    bindings.push_back(TextBinding(query.agent_id.value()));
  }
  if (query.run_id.has_value()) {
    sql += " AND run_id = ?";
    bindings.push_back(TextBinding(query.run_id.value()));
  }
  if (query.since.has_value()) {
    sql += " AND timestamp >= ?";
    bindings.push_back(DoubleBinding(query.since.value()));
  }
  sql += " ORDER BY timestamp DESC, rowid DESC LIMIT ?";
  bindings.push_back(LimitBinding(query.limit));

  std::string error;
  SqliteStatement stmt;
  if (!stmt.Prepare(*lease, sql, error) || !BindAll(stmt, bindings)) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_traces"}, {"error", error}});
    return traces;
  }

  StepResult step = StepResult::kDone;
  while ((step = stmt.Step(error)) == StepResult::kRow) {
    model::TraceEvent event;
    if (RowToTrace(stmt, event, logger_)) {
      traces.push_back(std::move(event));
    }
  }
  if (step == StepResult::kError) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_traces"}, {"error", error}});
    traces.clear();
  }
  return traces;
}

std::vector<model::TraceEvent> TraceStore::GetRunTraces(const std::string& agent_id,
                                                        const std::string& run_id) {
  std::vector<model::TraceEvent> traces;
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_run_traces")) {
    return traces;
  }

  std::string error;
  SqliteStatement stmt;
  const std::string sql = std::string("SELECT ") + kTraceColumns +
                          " FROM trace_events WHERE agent_id = ? AND run_id = ?"
                          " ORDER BY timestamp ASC, rowid ASC";
  if (!stmt.Prepare(*lease, sql, error) || !stmt.BindText(1, agent_id) ||
      !stmt.BindText(2, run_id)) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_run_traces"}, {"error", error}});
    return traces;
  }

  StepResult step = StepResult::kDone;
  while ((step = stmt.Step(error)) == StepResult::kRow) {
    model::TraceEvent event;
    if (RowToTrace(stmt, event, logger_)) {
      traces.push_back(std::move(event));
    }
  }
  if (step == StepResult::kError) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_run_traces"}, {"error", error}});
    traces.clear();
  }
  return traces;
}

std::vector<std::string> TraceStore::GetRecentActions(const std::string& agent_id,
                                                      const std::string& run_id,
                                                      const std::size_t window) {
  std::vector<std::string> actions;
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_recent_actions")) {
    return actions;
  }

  std::string error;
  SqliteStatement stmt;
  if (!stmt.Prepare(*lease,
                    "SELECT action_name FROM trace_events WHERE agent_id = ? AND run_id = ? "
                    "AND action_type = 'tool_call' ORDER BY timestamp DESC, rowid DESC LIMIT ?",
                    error) ||
      !stmt.BindText(1, agent_id) || !stmt.BindText(2, run_id) ||
      !stmt.BindInt64(3, static_cast<std::int64_t>(window))) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_recent_actions"}, {"error", error}});
    return actions;
  }

  StepResult step = StepResult::kDone;
  while ((step = stmt.Step(error)) == StepResult::kRow) {
    actions.push_back(stmt.ColumnText(0));
  }
  if (step == StepResult::kError) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_recent_actions"}, {"error", error}});
    actions.clear();
    return actions;
  }

  // Query walks newest first; callers consume oldest first.
  std::reverse(actions.begin(), actions.end());
  return actions;
}

std::vector<std::string> TraceStore::GetRunIds(const std::string& agent_id,
                                               const std::size_t limit) {
  std::vector<std::string> run_ids;
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_run_ids")) {
    return run_ids;
  }

  std::string error;
  SqliteStatement stmt;
  if (!stmt.Prepare(*lease,
                    "SELECT run_id FROM trace_events WHERE agent_id = ? GROUP BY run_id "
                    "ORDER BY MAX(timestamp) DESC, MAX(rowid) DESC LIMIT ?",
                    error) ||
      !stmt.BindText(1, agent_id) || !stmt.BindInt64(2, static_cast<std::int64_t>(limit))) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_run_ids"}, {"error", error}});
    return run_ids;
  }

  StepResult step = StepResult::kDone;
  while ((step = stmt.Step(error)) == StepResult::kRow) {
    run_ids.push_back(stmt.ColumnText(0));
  }
  if (step == StepResult::kError) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_run_ids"}, {"error", error}});
    run_ids.clear();
  }
  return run_ids;
}

model::RunStats TraceStore::GetRunStats(const std::string& agent_id, const std::string& run_id) {
  model::RunStats stats;
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_run_stats")) {
    return stats;
  }

  std::string error;
  SqliteStatement stmt;
  if (!stmt.Prepare(*lease,
                    "SELECT COUNT(*), "
                    "COALESCE(SUM(token_count), 0), "
                    "COALESCE(SUM(CASE WHEN action_type = 'tool_call' THEN 1 ELSE 0 END), 0), "
                    "COALESCE(SUM(CASE WHEN action_type = 'llm_request' THEN 1 ELSE 0 END), 0), "
                    "COALESCE(MIN(timestamp), 0), "
                    "COALESCE(MAX(timestamp), 0), "
                    "COALESCE(SUM(duration_ms), 0) "
                    "FROM trace_events WHERE agent_id = ? AND run_id = ?",
                    error) ||
      !stmt.BindText(1, agent_id) || !stmt.BindText(2, run_id)) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_run_stats"}, {"error", error}});
    return stats;
  }

  if (stmt.Step(error) != StepResult::kRow) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_run_stats"}, {"error", error}});
    return stats;
  }

  stats.event_count = static_cast<std::uint64_t>(stmt.ColumnInt64(0));
  stats.total_tokens = stmt.ColumnInt64(1);
  stats.tool_calls = static_cast<std::uint64_t>(stmt.ColumnInt64(2));
  stats.llm_calls = static_cast<std::uint64_t>(stmt.ColumnInt64(3));
  stats.start_time = stmt.ColumnDouble(4);
  stats.end_time = stmt.ColumnDouble(5);
  stats.total_duration_ms = stmt.ColumnDouble(6);
  return stats;
}

bool TraceStore::SaveDrift(const model::DriftEvent& event, std::string& error) {
  ConnectionLease lease;
  if (!pool_.Acquire(lease, error)) {
    return false;
  }

  SqliteStatement stmt;
  if (!stmt.Prepare(*lease,
                    "INSERT OR REPLACE INTO drift_events (event_id, agent_id, run_id, detector, "
                    "severity, score, message, suggested_action, timestamp, context) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                    error)) {
    return false;
  }

  const bool bound = stmt.BindText(1, event.event_id) && stmt.BindText(2, event.agent_id) &&
                     stmt.BindText(3, event.run_id) &&
                     stmt.BindText(4, model::ToString(event.detector)) &&
                     stmt.BindText(5, model::ToString(event.severity)) &&
                     stmt.BindDouble(6, event.score) && stmt.BindText(7, event.message) &&
                     stmt.BindText(8, event.suggested_action) &&
                     stmt.BindDouble(9, event.timestamp) &&
                     stmt.BindText(10, core::json::Serialize(event.context));
  if (!bound) {
    error = "failed to bind drift event '" + event.event_id + "': " + lease->LastErrorMessage();
    return false;
  }

  if (stmt.Step(error) != StepResult::kDone) {
    error = "failed to save drift event '" + event.event_id + "': " + error;
    return false;
  }
  return true;
}

std::vector<model::DriftEvent> TraceStore::GetDriftEvents(const DriftQuery& query) {
  std::vector<model::DriftEvent> drifts;
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_drift_events")) {
    return drifts;
  }

  std::string sql = std::string("SELECT ") + kDriftColumns + " FROM drift_events WHERE 1=1";
  std::vector<FilterBinding> bindings;
  if (query.agent_id.has_value()) {
    sql += " AND agent_id = ?";
    bindings.push_back(TextBinding(query.agent_id.value()));
  }
  if (query.since.has_value()) {
    sql += " AND timestamp >= ?";
    bindings.push_back(DoubleBinding(query.since.value()));
  }
  if (query.severity.has_value()) {
    sql += " AND severity = ?";
    bindings.push_back(TextBinding(model::ToString(query.severity.value())));
  }
  sql += " ORDER BY timestamp DESC, rowid DESC LIMIT ?";
  bindings.push_back(LimitBinding(query.limit));

  std::string error;
  SqliteStatement stmt;
  if (!stmt.Prepare(*lease, sql, error) || !BindAll(stmt, bindings)) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_drift_events"}, {"error", error}});
    return drifts;
  }

  StepResult step = StepResult::kDone;
  while ((step = stmt.Step(error)) == StepResult::kRow) {
    model::DriftEvent event;
    if (RowToDrift(stmt, event, logger_)) {
      drifts.push_back(std::move(event));
    }
  }
  if (step == StepResult::kError) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_drift_events"}, {"error", error}});
    drifts.clear();
  }
  return drifts;
}

bool TraceStore::SaveBaseline(const model::BaselineStats& baseline, std::string& error) {
  ConnectionLease lease;
  if (!pool_.Acquire(lease, error)) {
    return false;
  }

  SqliteStatement stmt;
  if (!stmt.Prepare(*lease,
                    "INSERT OR REPLACE INTO baselines (agent_id, data, updated_at) "
                    "VALUES (?, ?, ?)",
                    error)) {
    return false;
  }

  if (!stmt.BindText(1, baseline.agent_id) || !stmt.BindText(2, model::ToJson(baseline)) ||
      !stmt.BindDouble(3, core::NowEpochSeconds())) {
    error = "failed to bind baseline for '" + baseline.agent_id + "': " +
            lease->LastErrorMessage();
    return false;
  }

  if (stmt.Step(error) != StepResult::kDone) {
    error = "failed to save baseline for '" + baseline.agent_id + "': " + error;
    return false;
  }
  return true;
}

std::optional<model::BaselineStats> TraceStore::GetBaseline(const std::string& agent_id) {
  ConnectionLease lease;
  if (!LeaseForRead(lease, "get_baseline")) {
    return std::nullopt;
  }

  std::string error;
  SqliteStatement stmt;
  if (!stmt.Prepare(*lease, "SELECT data FROM baselines WHERE agent_id = ?", error) ||
      !stmt.BindText(1, agent_id)) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_baseline"}, {"error", error}});
    return std::nullopt;
  }

  const StepResult step = stmt.Step(error);
  if (step == StepResult::kDone) {
    return std::nullopt;
  }
  if (step == StepResult::kError) {
    logger_.Warn("store read degraded to empty result",
                 {{"operation", "get_baseline"}, {"error", error}});
    return std::nullopt;
  }

  Value parsed;
  model::BaselineStats baseline;
  if (!core::json::Parse(stmt.ColumnText(0), parsed, error) ||
      !model::ParseBaselineStats(parsed, baseline, error)) {
    logger_.Warn("malformed stored baseline; ignoring it",
                 {{"agent_id", agent_id}, {"error", error}});
    return std::nullopt;
  }
  return baseline;
}

} // namespace agentwatch::storage
