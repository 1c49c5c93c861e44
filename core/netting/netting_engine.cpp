#include "netting/netting_engine.hpp"

#include "cycles/cycle_enumerator.hpp"
#include "cycles/exploration_budget.hpp"
#include "netting/netting_calculator.hpp"
#include "scc/scc_detector.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "verification/conservation.hpp"

#include <chrono>
#include <limits>
#include <optional>

namespace netclear {

namespace {

// Statistics only: saturate instead of failing the run.
void addSaturating(uint64_t& total, uint64_t amount, size_t times) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    if (amount != 0 && times > max / amount) {
        total = max;
        return;
    }
    uint64_t product = amount * times;
    total = product > max - total ? max : total + product;
}

} // namespace

NettingEngine::NettingEngine(NettingConfig config)
    : config_(config) {
    config_.validate();
}

NettingReport NettingEngine::netGraph(ObligationGraph& graph) const {
    NettingReport report;
    report.parties = graph.partyCount();
    report.edges = graph.edgeCount();
    report.gross_before = graph.grossAmount();

    // ── Detect SCCs ──
    SccDetector detector;
    std::vector<Scc> sccs = detector.detect(graph);
    report.sccs_found = sccs.size();
    logInfo("Netting " + std::to_string(report.edges) + " edges across " +
            std::to_string(report.parties) + " parties, " +
            std::to_string(sccs.size()) + " cyclic components");

    ExplorationBudget budget(config_.max_cycles, config_.max_expansions,
                             config_.budget_seconds);
    budget.start();
    CycleEnumerator enumerator(config_.max_cycle_length, config_.dedupe_rotations);

    for (const Scc& scc : sccs) {
        // ── Enumerate cycles ──
        std::vector<Cycle> cycles;
        try {
            cycles = enumerator.enumerate(graph, scc, budget);
        } catch (const ExplorationLimitError& e) {
            logError(std::string(e.what()) + " in component of " +
                     std::to_string(scc.size()) + " parties");
            throw;
        }
        report.cycles_found += cycles.size();
        logDebug("Component of " + std::to_string(scc.size()) + " parties has " +
                 std::to_string(cycles.size()) + " cycles");

        // ── Net each token on each cycle ──
        for (const Cycle& cycle : cycles) {
            for (const std::string& token : tokensOnCycle(graph, cycle)) {
                std::optional<uint64_t> amount = calculateNettingAmount(graph, cycle, token);
                if (!amount || *amount == 0) continue;

                applyNetting(graph, cycle, token, *amount);
                report.nettings_applied++;
                addSaturating(report.netted_by_token[token], *amount, cycle.size());
                if (logEnabled(LogLevel::Debug)) {
                    logDebug("Netted " + std::to_string(*amount) + " " + token +
                             " around " + cycleToString(graph, cycle));
                }
            }
        }
    }

    report.gross_after = graph.grossAmount();
    report.elapsed_seconds = budget.elapsedSeconds();
    logInfo("Applied " + std::to_string(report.nettings_applied) + " nettings over " +
            std::to_string(report.cycles_found) + " cycles; gross " +
            std::to_string(report.gross_before) + " -> " +
            std::to_string(report.gross_after));
    return report;
}

NettingReport NettingEngine::run(const std::vector<Intent>& intents) const {
    auto started = std::chrono::steady_clock::now();

    ObligationGraph graph = ObligationGraph::fromIntents(intents);
    NettingReport report = netGraph(graph);
    report.intents = graph.toIntents();

    if (config_.verify_conservation) {
        for (const ConservationResult& r : checkConservation(intents, report.intents)) {
            if (!r.passed) throw NettingInvariantError(r.message);
        }
    }

    // Replace netGraph's stage timing with the whole run.
    report.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    return report;
}

std::vector<Intent> processNetting(const std::vector<Intent>& intents,
                                   const NettingConfig& config) {
    return NettingEngine(config).run(intents).intents;
}

} // namespace netclear
