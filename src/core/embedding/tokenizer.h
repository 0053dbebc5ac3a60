#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hr {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

// Row-major [batchSize x seqLength], right-padded.
struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// BERT-style uncased WordPiece tokenizer over a one-token-per-line vocab.
// Special token ids are looked up in the vocab ([PAD], [UNK], [CLS],
// [SEP], [MASK]) and fall back to the bert-base-uncased ids.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 512);

    bool isLoaded() const;
    int vocabSize() const { return static_cast<int>(m_idToToken.size()); }
    int maxSequenceLength() const { return m_maxSequenceLength; }

    TokenizerOutput tokenize(const QString& text, int padToLength = 0) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

    // Reverse lookup; empty string for ids outside the vocab.
    QString tokenForId(int64_t id) const;
    bool isSpecialToken(int64_t id) const;

    int64_t padTokenId() const { return m_padId; }
    int64_t unkTokenId() const { return m_unkId; }
    int64_t clsTokenId() const { return m_clsId; }
    int64_t sepTokenId() const { return m_sepId; }

private:
    QString normalize(const QString& text) const;
    std::vector<int64_t> tokenizeContent(const QString& normalizedText) const;
    void appendWordPieces(const QString& word, std::vector<int64_t>* output) const;
    int64_t lookupSpecial(const char* token, int64_t fallback) const;

    std::unordered_map<std::string, int> m_vocab;
    std::vector<QString> m_idToToken;
    std::unordered_set<int64_t> m_specialIds;
    int64_t m_padId = 0;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    int m_maxSequenceLength = 512;
    bool m_loaded = false;
};

} // namespace hr
