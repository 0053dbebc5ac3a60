#include "core/models/tokenizer_factory.h"

#include "core/shared/logging.h"

#include <QFile>

namespace hr {

std::unique_ptr<WordPieceTokenizer> TokenizerFactory::create(const ModelManifestEntry& entry,
                                                             const QString& modelsDir)
{
    if (entry.tokenizer.compare(QStringLiteral("wordpiece"), Qt::CaseInsensitive) != 0) {
        LOG_WARN(hrEmbedding, "TokenizerFactory: unsupported tokenizer '%s' for %s",
                 qUtf8Printable(entry.tokenizer), qUtf8Printable(entry.name));
        return nullptr;
    }

    if (entry.vocab.isEmpty()) {
        LOG_WARN(hrEmbedding, "TokenizerFactory: no vocab for %s", qUtf8Printable(entry.name));
        return nullptr;
    }

    const QString vocabPath = modelsDir + QLatin1Char('/') + entry.vocab;
    if (!QFile::exists(vocabPath)) {
        LOG_WARN(hrEmbedding, "TokenizerFactory: vocab not found at %s", qUtf8Printable(vocabPath));
        return nullptr;
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath, entry.maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return nullptr;
    }
    return tokenizer;
}

} // namespace hr
