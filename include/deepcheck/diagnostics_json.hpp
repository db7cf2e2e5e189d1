// diagnostics_json.hpp - JSON serialization for check results and comparison verdicts
#pragma once
#include "deepcheck/checks.hpp"
#include "deepcheck/compare.hpp"
#include <string>

namespace deepcheck {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a check result to a compact JSON string.
std::string check_result_to_json(const CheckResult& r);

// Serialize a raw comparator verdict (values rendered with to_string).
std::string verdict_to_json(const EqualityVerdict& v);

// If DEEPCHECK_DIAG_JSON=1 and the result failed, print its JSON to stderr.
void maybe_print_json(const CheckResult& r);

} // namespace deepcheck
