#pragma once

#include <QString>

namespace hr {

// TextCleaner: normalizes extracted document text before chunking.
//
//  - control characters (except tab/newline) and zero-width marks are dropped
//  - \r\n and \r become \n; no-break spaces become plain spaces
//  - runs of spaces/tabs collapse to one space, runs of 3+ newlines to 2
//  - leading/trailing whitespace is trimmed
//
// Paragraph breaks survive so the chunker can split on them.
class TextCleaner {
public:
    static QString clean(const QString& raw);
};

} // namespace hr
