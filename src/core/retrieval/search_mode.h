#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace hr {

// The five retrieval strategies. Closed set: every switch over it is
// exhaustive and unknown wire names never map to a default.
enum class SearchMode {
    LexicalOnly,
    DenseOnly,
    SparseOnly,
    DenseLexical,
    FullHybrid,
};

enum class RetrievalSignal {
    Lexical,
    Dense,
    Sparse,
};

QString searchModeToString(SearchMode mode);

// Exact, case-sensitive match on the wire names ("lexical_only", ...).
std::optional<SearchMode> parseSearchMode(const QString& name);

QString signalToString(RetrievalSignal signal);

// Signals a mode queries, in fusion order.
std::vector<RetrievalSignal> signalsForMode(SearchMode mode);

// True for modes that combine more than one signal.
bool isFusedMode(SearchMode mode);

} // namespace hr
