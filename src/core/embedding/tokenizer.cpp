#include <QDebug>
#include <QFile>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

#include "core/embedding/tokenizer.h"

namespace hr {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(3, maxSequenceLength))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "WordPieceTokenizer failed to open vocab:" << vocabPath;
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        m_idToToken.push_back(token);
        ++index;
    }

    if (m_vocab.empty()) {
        qWarning() << "WordPieceTokenizer loaded empty vocab from" << vocabPath;
        return;
    }

    m_padId = lookupSpecial("[PAD]", 0);
    m_unkId = lookupSpecial("[UNK]", 100);
    m_clsId = lookupSpecial("[CLS]", 101);
    m_sepId = lookupSpecial("[SEP]", 102);
    const int64_t maskId = lookupSpecial("[MASK]", 103);
    m_specialIds = {m_padId, m_unkId, m_clsId, m_sepId, maskId};

    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int64_t WordPieceTokenizer::lookupSpecial(const char* token, int64_t fallback) const
{
    const auto it = m_vocab.find(token);
    return it != m_vocab.end() ? it->second : fallback;
}

QString WordPieceTokenizer::tokenForId(int64_t id) const
{
    if (id < 0 || id >= static_cast<int64_t>(m_idToToken.size())) {
        return {};
    }
    return m_idToToken[static_cast<size_t>(id)];
}

bool WordPieceTokenizer::isSpecialToken(int64_t id) const
{
    if (m_specialIds.count(id) > 0) {
        return true;
    }
    // [unused123] style placeholders are never meaningful terms.
    const QString token = tokenForId(id);
    return token.startsWith(QLatin1Char('[')) && token.endsWith(QLatin1Char(']'));
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    // Strip accents, put spaces around punctuation, collapse whitespace.
    QString out;
    out.reserve(decomposed.size() + 16);
    bool lastWasSpace = true;
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        if (category == QChar::Mark_NonSpacing
            || category == QChar::Mark_SpacingCombining
            || category == QChar::Mark_Enclosing) {
            continue;
        }
        if (ch.isSpace()) {
            if (!lastWasSpace) {
                out.append(QLatin1Char(' '));
                lastWasSpace = true;
            }
            continue;
        }
        if (ch.isPunct() || ch.isSymbol()) {
            if (!lastWasSpace) {
                out.append(QLatin1Char(' '));
            }
            out.append(ch);
            out.append(QLatin1Char(' '));
            lastWasSpace = true;
            continue;
        }
        out.append(ch);
        lastWasSpace = false;
    }
    return out.trimmed();
}

void WordPieceTokenizer::appendWordPieces(const QString& word, std::vector<int64_t>* output) const
{
    const int maxContent = m_maxSequenceLength - 2;
    if (word.isEmpty() || static_cast<int>(output->size()) >= maxContent) {
        return;
    }

    // Greedy longest-match-first; a word with any unmatched piece becomes one [UNK].
    std::vector<int64_t> pieces;
    const int wordLength = static_cast<int>(word.size());
    int start = 0;
    while (start < wordLength) {
        int end = wordLength;
        int matchedId = -1;
        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }
            --end;
        }
        if (matchedId < 0) {
            pieces.assign(1, m_unkId);
            break;
        }
        pieces.push_back(matchedId);
        start = end;
    }

    for (int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= maxContent) {
            break;
        }
        output->push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::tokenizeContent(const QString& normalizedText) const
{
    std::vector<int64_t> content;
    if (!m_loaded || normalizedText.isEmpty()) {
        return content;
    }

    const QStringList words = normalizedText.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (static_cast<int>(content.size()) >= m_maxSequenceLength - 2) {
            break;
        }
        appendWordPieces(word, &content);
    }
    return content;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text, int padToLength) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    const std::vector<int64_t> content = tokenizeContent(normalize(text));

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(m_clsId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(m_sepId);

    const int unpaddedLength = static_cast<int>(output.inputIds.size());
    const int targetLength = std::max(unpaddedLength, std::min(padToLength, m_maxSequenceLength));

    output.inputIds.resize(static_cast<size_t>(targetLength), m_padId);
    output.attentionMask.assign(static_cast<size_t>(targetLength), 0);
    std::fill_n(output.attentionMask.begin(), unpaddedLength, 1);
    output.tokenTypeIds.assign(static_cast<size_t>(targetLength), 0);
    output.seqLength = targetLength;
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!m_loaded || texts.empty()) {
        return batch;
    }

    std::vector<TokenizerOutput> rows;
    rows.reserve(texts.size());
    int maxLength = 0;
    for (const QString& text : texts) {
        TokenizerOutput row = tokenize(text);
        maxLength = std::max(maxLength, row.seqLength);
        rows.push_back(std::move(row));
    }

    batch.batchSize = static_cast<int>(texts.size());
    batch.seqLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (TokenizerOutput& row : rows) {
        row.inputIds.resize(static_cast<size_t>(maxLength), m_padId);
        row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
        row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);

        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(), row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }

    return batch;
}

} // namespace hr
