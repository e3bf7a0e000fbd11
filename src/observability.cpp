#include "h5gate/observability.hpp"

#include <cstdio>
#include <iostream>

#include "h5gate/jsonlite.hpp"

namespace h5gate {

std::string batch_event_to_json(const BatchEvent& ev) {
  std::string line;
  line.reserve(192);
  line += "{\"fixture\":\"";
  line += jsonlite::escape(ev.fixture);
  line += "\",\"mode\":\"";
  line += ev.mode;
  line += "\",\"engine\":\"";
  line += jsonlite::escape(ev.engine);
  line += "\",\"cases\":";
  line += std::to_string(ev.case_count);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.ok ? "" : to_string(ev.error_code);
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"bytes_in\":";
  line += std::to_string(ev.bytes_in);
  line += ",\"bytes_out\":";
  line += std::to_string(ev.bytes_out);
  line += "}";
  return line;
}

void RunStats::record(const BatchEvent& ev) {
  ++batches_;
  cases_submitted_ += ev.case_count;
  total_duration_ns_ += ev.duration_ns;
  if (!ev.ok) {
    ++failed_batches_;
    ++failures_by_code_[ev.error_code];
  }
}

std::string RunStats::summary_line() const {
  return "batches=" + std::to_string(batches_) + " failed=" + std::to_string(failed_batches_) +
         " cases=" + std::to_string(cases_submitted_) +
         " engine_ms=" + std::to_string(total_duration_ns_ / 1000000);
}

std::string RunStats::to_json() const {
  jsonlite::Object failures;
  for (const auto& [code, n] : failures_by_code_) {
    failures[to_string(code)] = jsonlite::Value(static_cast<std::uint64_t>(n));
  }
  jsonlite::Object o;
  o["batches"] = jsonlite::Value(batches_);
  o["failed_batches"] = jsonlite::Value(failed_batches_);
  o["cases_submitted"] = jsonlite::Value(cases_submitted_);
  o["total_duration_ns"] = jsonlite::Value(total_duration_ns_);
  o["failures_by_code"] = jsonlite::Value(std::move(failures));
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void EventLog::emit(const BatchEvent& ev) {
  stats_.record(ev);
  if (path_.empty() || write_failed_) return;

  const std::string line = batch_event_to_json(ev) + "\n";
  FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) {
    // Reported once; the run itself is unaffected.
    write_failed_ = true;
    std::cerr << "warning: cannot open event log " << path_ << "\n";
    return;
  }
  const std::size_t n = std::fwrite(line.data(), 1, line.size(), f);
  std::fclose(f);
  if (n != line.size()) {
    write_failed_ = true;
    std::cerr << "warning: short write to event log " << path_ << "\n";
  }
}

}  // namespace h5gate
