#pragma once

namespace rw {

struct ConfidenceBand {
    double floor = 0.0;
    double ceiling = 0.0;
};

// Confidence bands per execution outcome. Routing confidence is mapped
// linearly into the selected band. The bands must keep their order:
// a clean success never scores below a fallback or a failure at the
// same routing confidence.
struct ScoringBands {
    ConfidenceBand clean{0.80, 0.95};     // success, no fallback, simple question
    ConfidenceBand complex{0.70, 0.89};   // success, no fallback, filter/comparison
    ConfidenceBand fallback{0.50, 0.79};  // success through the fallback path
    ConfidenceBand failed{0.00, 0.49};    // failure, timeout or empty result

    // Answers from general web search are never presented as more
    // reliable than this.
    double webSearchCeiling = 0.80;
};

} // namespace rw
