#pragma once

#include "health/probe_outcome.hpp"

#include <istream>
#include <string>
#include <vector>

namespace linkwatch::runtime {

// Reads recorded probe outcomes for `linkwatch replay`.
//
// Format, one outcome per line:
//   ts_ms,status,value
// - ts_ms: fire time, milliseconds since the Unix epoch.
// - status: `ok` (value = latency in ms, decimals allowed) or `fail`
//   (value = timeout | unresolvable | other; empty means other).
// Blank lines and lines starting with '#' are skipped, as is a first line
// whose first field is `ts_ms`. Rows must be in non-decreasing ts order.
bool ParseOutcomeCsv(std::istream& input, std::vector<health::ProbeOutcome>& outcomes,
                     std::string& error);

} // namespace linkwatch::runtime
