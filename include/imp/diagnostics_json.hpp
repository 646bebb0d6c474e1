// diagnostics_json.hpp - diagnostics reported by the impc driver, with JSON serialization
#pragma once
#include <string>
#include <vector>

namespace imp {

// E0001 lex error, E0002 parse error (no position), E0003 evaluation error
struct Diagnostic { std::string code; std::string message; int line=-1; int col=-1; };

// file is the source path the driver was given; omitted from JSON when empty
struct DiagnosticReport { bool success=true; std::string file; std::vector<Diagnostic> errors; };

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const DiagnosticReport& r);

// If enabled (IMP_DIAG_JSON=1), print diagnostics JSON to stderr.
void maybe_print_json(const DiagnosticReport& r, bool enabled);

} // namespace imp
