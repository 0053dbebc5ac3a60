#include "core/retrieval/search_mode.h"

namespace hr {

QString searchModeToString(SearchMode mode)
{
    switch (mode) {
    case SearchMode::LexicalOnly:  return QStringLiteral("lexical_only");
    case SearchMode::DenseOnly:    return QStringLiteral("dense_only");
    case SearchMode::SparseOnly:   return QStringLiteral("sparse_only");
    case SearchMode::DenseLexical: return QStringLiteral("dense_lexical");
    case SearchMode::FullHybrid:   return QStringLiteral("full_hybrid");
    }
    return QStringLiteral("full_hybrid");
}

std::optional<SearchMode> parseSearchMode(const QString& name)
{
    static const SearchMode kAll[] = {
        SearchMode::LexicalOnly,
        SearchMode::DenseOnly,
        SearchMode::SparseOnly,
        SearchMode::DenseLexical,
        SearchMode::FullHybrid,
    };
    for (SearchMode mode : kAll) {
        if (name == searchModeToString(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

QString signalToString(RetrievalSignal signal)
{
    switch (signal) {
    case RetrievalSignal::Lexical: return QStringLiteral("lexical");
    case RetrievalSignal::Dense:   return QStringLiteral("dense");
    case RetrievalSignal::Sparse:  return QStringLiteral("sparse");
    }
    return QStringLiteral("lexical");
}

std::vector<RetrievalSignal> signalsForMode(SearchMode mode)
{
    switch (mode) {
    case SearchMode::LexicalOnly:
        return {RetrievalSignal::Lexical};
    case SearchMode::DenseOnly:
        return {RetrievalSignal::Dense};
    case SearchMode::SparseOnly:
        return {RetrievalSignal::Sparse};
    case SearchMode::DenseLexical:
        return {RetrievalSignal::Lexical, RetrievalSignal::Dense};
    case SearchMode::FullHybrid:
        return {RetrievalSignal::Lexical, RetrievalSignal::Dense, RetrievalSignal::Sparse};
    }
    return {};
}

bool isFusedMode(SearchMode mode)
{
    return signalsForMode(mode).size() > 1;
}

} // namespace hr
