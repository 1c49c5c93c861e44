#pragma once

#include "graph/intent.hpp"
#include "graph/obligation_graph.hpp"
#include "netting/netting_config.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace netclear {

/// Outcome of one netting run.
struct NettingReport {
    std::vector<Intent> intents;        // Residual obligations, amount > 0
    size_t parties = 0;
    size_t edges = 0;                   // Distinct (from, to, token) before netting
    size_t sccs_found = 0;              // Components with >= 2 parties
    size_t cycles_found = 0;
    size_t nettings_applied = 0;        // (cycle, token) pairs actually reduced
    std::map<std::string, uint64_t> netted_by_token;  // Sum of amount * cycle length
    uint64_t gross_before = 0;
    uint64_t gross_after = 0;
    double elapsed_seconds = 0.0;       // run(): whole run; netGraph(): its stages only
};

/// Netting pipeline: build graph, find SCCs, enumerate cycles per SCC,
/// net every token present on each cycle, extract the residual.
/// Single pass with no rollback; a failure mid-run leaves nothing behind
/// since the graph is local to the run.
class NettingEngine {
public:
    explicit NettingEngine(NettingConfig config = {});

    NettingReport run(const std::vector<Intent>& intents) const;

    /// Net every cycle of `graph` in place. Exposed so a caller that owns
    /// the graph can drive the stages itself. Returns the statistics part
    /// of the report (intents left empty); elapsed_seconds covers SCC
    /// detection through netting, not graph construction or extraction.
    NettingReport netGraph(ObligationGraph& graph) const;

    const NettingConfig& config() const { return config_; }

private:
    NettingConfig config_;
};

/// Residual intents after netting `intents` with `config`.
std::vector<Intent> processNetting(const std::vector<Intent>& intents,
                                   const NettingConfig& config = {});

} // namespace netclear
