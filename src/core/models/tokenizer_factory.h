#pragma once

#include "core/embedding/tokenizer.h"
#include "core/models/model_manifest.h"

#include <QString>

#include <memory>

namespace hr {

class TokenizerFactory {
public:
    // Only "wordpiece" is supported. nullptr when the type is unknown or
    // the vocab file is missing or empty.
    static std::unique_ptr<WordPieceTokenizer> create(const ModelManifestEntry& entry,
                                                      const QString& modelsDir);
};

} // namespace hr
