#include "artifacts/digest_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace linkwatch::artifacts {

namespace {

std::string FormatPercent(const std::uint64_t part, const std::uint64_t total) {
  std::ostringstream out;
  const double percent =
      total == 0U ? 0.0 : (static_cast<double>(part) * 100.0) / static_cast<double>(total);
  out << std::fixed << std::setprecision(2) << percent;
  return out.str();
}

std::string FormatLocalStamp(const health::Clock::time_point ts) {
  return core::FormatLocalDate(ts) + " " + core::FormatLocalClock(ts);
}

void WritePeriodTable(std::ostringstream& out, const std::vector<health::LifecycleEvent>& periods,
                      const char* count_label) {
  out << "| # | started | ended | duration (min) | " << count_label << " |\n";
  out << "|---|---|---|---|---|\n";
  std::size_t index = 1;
  for (const auto& period : periods) {
    out << "| " << index << " | "
        << (period.started_at.has_value() ? FormatLocalStamp(period.started_at.value()) : "-")
        << " | " << FormatLocalStamp(period.ts) << " | "
        << (period.duration.has_value() ? core::FormatMinutes(period.duration.value()) : "-")
        << " | " << period.probe_count << " |\n";
    ++index;
  }
  out << '\n';
}

} // namespace

std::string RenderDigestMarkdown(const health::DigestSummary& summary, const std::string& target) {
  std::ostringstream out;
  out << "# Daily digest " << summary.date << "\n\n";
  out << "- target: `" << target << "`\n";
  out << "- period_start: `" << FormatLocalStamp(summary.period_start) << "` ("
      << core::FormatUtcTimestamp(summary.period_start) << ")\n";
  out << "- period_end: `" << FormatLocalStamp(summary.period_end) << "` ("
      << core::FormatUtcTimestamp(summary.period_end) << ")\n";
  out << "- probes: " << summary.probes_total << " sent, " << summary.probes_failed
      << " missed (" << FormatPercent(summary.probes_failed, summary.probes_total) << "%)\n\n";

  out << "## Outages\n\n";
  out << "- Number of outages: " << summary.outage_count << "\n\n";
  if (!summary.outage_details.empty()) {
    WritePeriodTable(out, summary.outage_details, "missed probes");
  }

  out << "## Latency anomaly periods\n\n";
  out << "- Number of high-latency periods: " << summary.anomaly_count << "\n\n";
  if (!summary.anomaly_details.empty()) {
    WritePeriodTable(out, summary.anomaly_details, "slow replies");
  }
  return out.str();
}

bool WriteDigestMarkdown(const health::DigestSummary& summary, const std::string& target,
                         const fs::path& output_dir, fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  if (summary.date.empty()) {
    error = "digest has no date; cannot name the digest file";
    return false;
  }

  written_path = output_dir / ("digest-" + summary.date + ".md");
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open digest file '" + written_path.string() + "' for writing";
    return false;
  }

  out_file << RenderDigestMarkdown(summary, target) << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while writing digest file '" + written_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace linkwatch::artifacts
