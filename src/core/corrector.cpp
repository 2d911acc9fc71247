#include "pystyle/core/corrector.hpp"
#include "pystyle/core/import_classifier.hpp"
#include "pystyle/parsers/indentation.hpp"
#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace pystyle {

namespace {

auto count_code(const std::vector<Violation>& violations, RuleCode code) -> size_t {
    return static_cast<size_t>(
        std::count_if(violations.begin(), violations.end(),
                      [code](const Violation& violation) { return violation.code == code; }));
}

auto target_line(std::vector<Line>& lines, const Violation& target) -> Line& {
    if (target.line == 0 || target.line > lines.size()) {
        throw FixerConflictError(target, "line " + std::to_string(target.line)
                                             + " does not exist");
    }
    return lines[target.line - 1];
}

// Edits may not push a line over the limit
auto check_length(const Violation& target, const std::string& before, const std::string& after)
    -> void {
    if (rules::display_width(after) > rules::max_line_length
        && rules::display_width(before) <= rules::max_line_length) {
        throw FixerConflictError(target, "fix would make the line longer than "
                                             + std::to_string(rules::max_line_length)
                                             + " characters");
    }
}

auto record_conflict(FixOutcome& outcome, const Violation& violation, const std::string& reason)
    -> void {
    outcome.conflicts.push_back(FixerConflict{.violation = violation, .reason = reason});
}

auto group_by_line(const std::vector<Violation>& targets)
    -> std::map<size_t, std::vector<Violation>> {
    std::map<size_t, std::vector<Violation>> grouped;
    for (const auto& target : targets) {
        grouped[target.line].push_back(target);
    }
    return grouped;
}

auto fix_trailing_whitespace(const SourceDocument& document,
                             const std::vector<Violation>& targets) -> FixOutcome {
    FixOutcome outcome{.lines = document.lines};
    auto interior = rules::string_interior_lines(document);

    for (const auto& target : targets) {
        try {
            auto& line = target_line(outcome.lines, target);
            if (interior.contains(target.line)) {
                throw FixerConflictError(target, "whitespace belongs to a string literal");
            }
            auto start = rules::trailing_whitespace_start(line.text);
            if (!start) {
                throw FixerConflictError(target, "line has no trailing whitespace");
            }
            // "\ " is not a continuation; stripping would make it one
            if (*start > 0 && line.text[*start - 1] == '\\') {
                throw FixerConflictError(target, "whitespace follows a backslash");
            }
            line.text.erase(*start);
            outcome.fixed.push_back(target);
        } catch (const FixerConflictError& e) {
            record_conflict(outcome, e.violation(), e.what());
        }
    }
    return outcome;
}

auto fix_indentation(const SourceDocument& document, const std::vector<Violation>& targets)
    -> FixOutcome {
    FixOutcome outcome{.lines = document.lines};

    auto sites = rules::indentation_sites(document);
    std::vector<std::string> indents;
    std::map<size_t, size_t> site_of_line;
    for (size_t i = 0; i < sites.size(); ++i) {
        indents.push_back(sites[i].indent);
        site_of_line[sites[i].line] = i;
    }
    auto original = compute_indent_levels(indents);

    // Resolve every target to a site with a known block level
    std::map<size_t, std::vector<Violation>> targets_by_site;
    for (const auto& target : targets) {
        try {
            auto it = site_of_line.find(target.line);
            if (it == site_of_line.end()) {
                throw FixerConflictError(target, "line does not start a statement");
            }
            if (!rules::is_bad_indentation(sites[it->second].indent)) {
                throw FixerConflictError(target, "indentation is already consistent");
            }
            if (it->second >= original.levels.size()) {
                throw FixerConflictError(target, "block structure is ambiguous: "
                                                     + original.failure);
            }
            targets_by_site[it->second].push_back(target);
        } catch (const FixerConflictError& e) {
            record_conflict(outcome, e.violation(), e.what());
        }
    }

    // Segments start at each module-level statement
    size_t begin = 0;
    while (begin < original.levels.size()) {
        size_t end = begin + 1;
        while (end < original.levels.size() && original.levels[end] != 0) {
            ++end;
        }

        auto segment_indents = std::vector<std::string>(indents.begin() + begin,
                                                        indents.begin() + end);
        std::vector<Violation> rewritten;
        std::map<size_t, std::string> new_indents;

        for (size_t i = begin; i < end; ++i) {
            auto found = targets_by_site.find(i);
            if (found == targets_by_site.end()) {
                continue;
            }
            const auto& line = outcome.lines[sites[i].line - 1];
            std::string indent(original.levels[i] * rules::indent_size, ' ');
            try {
                check_length(found->second.front(), line.text,
                             indent + line.text.substr(sites[i].indent.size()));
                new_indents[i] = indent;
                segment_indents[i - begin] = indent;
                rewritten.insert(rewritten.end(), found->second.begin(), found->second.end());
            } catch (const FixerConflictError& e) {
                for (const auto& target : found->second) {
                    record_conflict(outcome, target, e.what());
                }
            }
        }

        if (!new_indents.empty()) {
            auto recomputed = compute_indent_levels(segment_indents);
            bool same_structure =
                !recomputed.failed_index
                && std::equal(recomputed.levels.begin(), recomputed.levels.end(),
                              original.levels.begin() + begin, original.levels.begin() + end);
            if (same_structure) {
                for (const auto& [index, indent] : new_indents) {
                    auto& line = outcome.lines[sites[index].line - 1];
                    line.text = indent + line.text.substr(sites[index].indent.size());
                }
                outcome.fixed.insert(outcome.fixed.end(), rewritten.begin(), rewritten.end());
            } else {
                for (const auto& target : rewritten) {
                    record_conflict(outcome, target,
                                    "re-indenting would change the block structure");
                }
            }
        }

        begin = end;
    }

    return outcome;
}

auto fix_operator_spacing(const SourceDocument& document, const std::vector<Violation>& targets)
    -> FixOutcome {
    FixOutcome outcome{.lines = document.lines};

    std::map<size_t, std::vector<rules::OperatorSite>> sites_by_line;
    for (auto& site : rules::operator_spacing_sites(document)) {
        sites_by_line[site.line].push_back(std::move(site));
    }

    for (const auto& [number, line_targets] : group_by_line(targets)) {
        try {
            auto& line = target_line(outcome.lines, line_targets.front());
            auto& sites = sites_by_line[number];
            if (sites.size() != line_targets.size()) {
                throw FixerConflictError(line_targets.front(),
                                         "operators on the line changed since analysis");
            }

            // Right to left so earlier columns stay valid
            std::string text = line.text;
            for (auto it = sites.rbegin(); it != sites.rend(); ++it) {
                if (!it->space_after) {
                    text.insert(it->column + it->op.size(), " ");
                }
                if (!it->space_before) {
                    text.insert(it->column, " ");
                }
            }
            check_length(line_targets.front(), line.text, text);

            line.text = std::move(text);
            outcome.fixed.insert(outcome.fixed.end(), line_targets.begin(), line_targets.end());
        } catch (const FixerConflictError& e) {
            for (const auto& target : line_targets) {
                record_conflict(outcome, target, e.what());
            }
        }
    }
    return outcome;
}

// Misplaced statements of one block, by start line
auto misplaced_lines(const ImportBlock& block) -> std::set<size_t> {
    std::set<size_t> misplaced;
    auto expected = expected_order(block);
    for (size_t i = 0; i < block.statements.size(); ++i) {
        if (block.statements[i].start_line != expected[i].start_line) {
            misplaced.insert(block.statements[i].start_line);
        }
    }
    return misplaced;
}

// Refill the statement slots in sorted order; blank gaps keep their positions
auto reorder_block(std::vector<Line>& lines, const ImportBlock& block) -> void {
    const auto& statements = block.statements;
    auto expected = expected_order(block);

    size_t first = statements.front().start_line;
    size_t last = statements.back().end_line;

    std::vector<Line> rebuilt;
    for (size_t i = 0; i < statements.size(); ++i) {
        for (size_t n = expected[i].start_line; n <= expected[i].end_line; ++n) {
            rebuilt.push_back(lines[n - 1]);
        }
        if (i + 1 < statements.size()) {
            for (size_t n = statements[i].end_line + 1; n < statements[i + 1].start_line; ++n) {
                rebuilt.push_back(lines[n - 1]);
            }
        }
    }

    // Endings stay with positions so a moved final line never loses its terminator
    for (size_t n = first; n <= last; ++n) {
        auto& slot = lines[n - 1];
        auto ending = slot.ending;
        slot = std::move(rebuilt[n - first]);
        slot.number = n;
        slot.ending = std::move(ending);
    }
}

auto fix_import_order(const SourceDocument& document, const std::vector<Violation>& targets,
                      const AnalysisOptions& options) -> FixOutcome {
    FixOutcome outcome{.lines = document.lines};
    auto blocks = find_import_blocks(document, options.local_packages);

    std::map<size_t, std::vector<Violation>> targets_by_block;
    for (const auto& target : targets) {
        try {
            auto block = std::find_if(blocks.begin(), blocks.end(), [&](const ImportBlock& b) {
                return misplaced_lines(b).contains(target.line);
            });
            if (block == blocks.end()) {
                throw FixerConflictError(target, "import is no longer out of order");
            }
            targets_by_block[static_cast<size_t>(block - blocks.begin())].push_back(target);
        } catch (const FixerConflictError& e) {
            record_conflict(outcome, e.violation(), e.what());
        }
    }

    for (const auto& [index, block_targets] : targets_by_block) {
        const auto& block = blocks[index];
        if (misplaced_lines(block).size() != block_targets.size()) {
            for (const auto& target : block_targets) {
                record_conflict(outcome, target, "import block changed since analysis");
            }
            continue;
        }
        reorder_block(outcome.lines, block);
        outcome.fixed.insert(outcome.fixed.end(), block_targets.begin(), block_targets.end());
    }
    return outcome;
}

} // namespace

FixerConflictError::FixerConflictError(const Violation& violation, const std::string& reason)
    : std::runtime_error(reason), violation_(violation) {}

auto fixer_pipeline() -> const std::vector<FixerKind>& {
    static const std::vector<FixerKind> pipeline{FixerKind::TRAILING_WHITESPACE,
                                                 FixerKind::INDENTATION,
                                                 FixerKind::OPERATOR_SPACING,
                                                 FixerKind::IMPORT_ORDER};
    return pipeline;
}

auto fixer_name(FixerKind kind) -> std::string {
    switch (kind) {
    case FixerKind::TRAILING_WHITESPACE:
        return "trailing-whitespace";
    case FixerKind::INDENTATION:
        return "bad-indentation";
    case FixerKind::OPERATOR_SPACING:
        return "missing-operator-space";
    case FixerKind::IMPORT_ORDER:
        return "import-order";
    }
    return "unknown";
}

auto fixer_codes(FixerKind kind) -> std::vector<RuleCode> {
    switch (kind) {
    case FixerKind::TRAILING_WHITESPACE:
        return {RuleCode::TRAILING_WHITESPACE};
    case FixerKind::INDENTATION:
        return {RuleCode::BAD_INDENTATION};
    case FixerKind::OPERATOR_SPACING:
        return {RuleCode::MISSING_OPERATOR_SPACE};
    case FixerKind::IMPORT_ORDER:
        return {RuleCode::IMPORT_ORDER};
    }
    return {};
}

auto apply_fixer(FixerKind kind, const SourceDocument& document,
                 const std::vector<Violation>& targets, const AnalysisOptions& options)
    -> FixOutcome {
    switch (kind) {
    case FixerKind::TRAILING_WHITESPACE:
        return fix_trailing_whitespace(document, targets);
    case FixerKind::INDENTATION:
        return fix_indentation(document, targets);
    case FixerKind::OPERATOR_SPACING:
        return fix_operator_spacing(document, targets);
    case FixerKind::IMPORT_ORDER:
        return fix_import_order(document, targets, options);
    }
    return FixOutcome{.lines = document.lines};
}

auto stage_is_sound(FixerKind kind, const std::vector<Violation>& before,
                    const std::vector<Violation>& after, const std::vector<Violation>& fixed)
    -> bool {
    auto own = fixer_codes(kind);
    for (auto code : rules::registry()) {
        size_t count_before = count_code(before, code);
        size_t count_after = count_code(after, code);
        if (std::find(own.begin(), own.end(), code) == own.end()) {
            if (count_after > count_before) {
                return false;
            }
            continue;
        }
        size_t claimed = count_code(fixed, code);
        if (claimed > count_before || count_after != count_before - claimed) {
            return false;
        }
    }
    return true;
}

auto run_corrector(const SourceDocument& document, const ViolationReport& report,
                   const AnalysisOptions& options) -> CorrectionResult {
    return run_corrector(document, report, options, apply_fixer);
}

auto run_corrector(const SourceDocument& document, const ViolationReport& report,
                   const AnalysisOptions& options, const FixerFunction& fixer)
    -> CorrectionResult {
    CorrectionResult result;

    std::vector<Violation> autofixable;
    for (const auto& violation : report.violations) {
        if (is_autofixable(violation)) {
            autofixable.push_back(violation);
        } else {
            result.manual.push_back(violation);
        }
    }

    auto baseline = rules::run_all_rules(document, options);
    auto current = document;
    auto current_violations = baseline;

    for (auto kind : fixer_pipeline()) {
        auto codes = fixer_codes(kind);
        std::vector<Violation> targets;
        std::copy_if(autofixable.begin(), autofixable.end(), std::back_inserter(targets),
                     [&](const Violation& v) {
                         return std::find(codes.begin(), codes.end(), v.code) != codes.end();
                     });
        if (targets.empty()) {
            continue;
        }

        auto outcome = fixer(kind, current, targets, options);
        result.conflicts.insert(result.conflicts.end(), outcome.conflicts.begin(),
                                outcome.conflicts.end());
        if (outcome.fixed.empty()) {
            continue;
        }

        auto candidate = build_source_document(outcome.lines);
        auto candidate_violations = rules::run_all_rules(candidate, options);

        if (stage_is_sound(kind, current_violations, candidate_violations, outcome.fixed)) {
            current = std::move(candidate);
            current_violations = std::move(candidate_violations);
            result.resolved.insert(result.resolved.end(), outcome.fixed.begin(),
                                   outcome.fixed.end());
        } else {
            for (const auto& violation : outcome.fixed) {
                result.conflicts.push_back(FixerConflict{
                    .violation = violation,
                    .reason = fixer_name(kind) + " fix changed other violations; reverted"});
            }
        }
    }

    // Resolved codes must not reappear
    bool sound = true;
    for (auto kind : fixer_pipeline()) {
        for (auto code : fixer_codes(kind)) {
            size_t before = count_code(baseline, code);
            size_t resolved = std::min(count_code(result.resolved, code), before);
            if (count_code(current_violations, code) > before - resolved) {
                sound = false;
            }
        }
    }

    if (!sound) {
        result.text = document.text;
        result.resolved.clear();
        result.manual = report.violations;
        result.rolled_back = true;
    } else {
        result.text = current.text;
        for (const auto& conflict : result.conflicts) {
            result.manual.push_back(conflict.violation);
        }
    }

    sort_violations(result.resolved);
    sort_violations(result.manual);
    return result;
}

} // namespace pystyle
