#pragma once

#include "health/digest_aggregator.hpp"

#include <filesystem>
#include <string>

namespace linkwatch::artifacts {

// Renders one digest section as markdown. Shared by the writer and by
// `linkwatch replay`, which prints it to stdout.
std::string RenderDigestMarkdown(const health::DigestSummary& summary, const std::string& target);

// Writes the digest for `summary.date` to `<output_dir>/digest-YYYYMMDD.md`.
//
// Contract:
// - creates `output_dir` when missing.
// - appends when the file already exists (a shutdown flush and the midnight
//   digest can land on the same date), so earlier sections are never lost.
// - returns false and sets `error` on failure.
bool WriteDigestMarkdown(const health::DigestSummary& summary, const std::string& target,
                         const std::filesystem::path& output_dir,
                         std::filesystem::path& written_path, std::string& error);

} // namespace linkwatch::artifacts
