#pragma once

#include "pystyle/core/rules.hpp"
#include "pystyle/core/source_document.hpp"
#include "pystyle/core/violation.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pystyle {

// A fixer's re-derived target no longer matches what the report promised.
// what() is the reason.
class FixerConflictError : public std::runtime_error {
public:
    FixerConflictError(const Violation& violation, const std::string& reason);

    auto violation() const -> const Violation& { return violation_; }

private:
    Violation violation_;
};

// Pipeline stages, in application order (character -> token -> block)
enum class FixerKind {
    TRAILING_WHITESPACE,
    INDENTATION,
    OPERATOR_SPACING,
    IMPORT_ORDER
};

struct FixerConflict {
    Violation violation;
    std::string reason;
};

// Result of running one fixer over a document
struct FixOutcome {
    std::vector<Line> lines;
    std::vector<Violation> fixed;
    std::vector<FixerConflict> conflicts;
};

struct CorrectionResult {
    std::string text;
    std::vector<Violation> resolved;         // Sorted
    std::vector<Violation> manual;           // Manual-only codes plus conflicts, sorted
    std::vector<FixerConflict> conflicts;
    bool rolled_back = false;                // Final verification failed
};

auto fixer_pipeline() -> const std::vector<FixerKind>&;
auto fixer_name(FixerKind kind) -> std::string;
auto fixer_codes(FixerKind kind) -> std::vector<RuleCode>;

// Re-derive the targets from `document` and rewrite what can be fixed safely
auto apply_fixer(FixerKind kind, const SourceDocument& document,
                 const std::vector<Violation>& targets, const AnalysisOptions& options)
    -> FixOutcome;

using FixerFunction = std::function<FixOutcome(FixerKind, const SourceDocument&,
                                              const std::vector<Violation>&,
                                              const AnalysisOptions&)>;

// A stage may only remove its own codes, and exactly as many as it claims
auto stage_is_sound(FixerKind kind, const std::vector<Violation>& before,
                    const std::vector<Violation>& after, const std::vector<Violation>& fixed)
    -> bool;

auto run_corrector(const SourceDocument& document, const ViolationReport& report,
                   const AnalysisOptions& options) -> CorrectionResult;

// Same pipeline with each stage delegated to `fixer`
auto run_corrector(const SourceDocument& document, const ViolationReport& report,
                   const AnalysisOptions& options, const FixerFunction& fixer)
    -> CorrectionResult;

} // namespace pystyle
