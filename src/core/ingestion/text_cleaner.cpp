#include "core/ingestion/text_cleaner.h"

namespace hr {

namespace {

bool isDroppedCodePoint(char16_t code)
{
    if (code < 0x20) {
        return code != u'\t' && code != u'\n';
    }
    return code == 0x7F || code == 0x200B || code == 0x200C
        || code == 0x200D || code == 0xFEFF;
}

} // anonymous namespace

QString TextCleaner::clean(const QString& raw)
{
    QString out;
    out.reserve(raw.size());

    int pendingNewlines = 0;
    bool pendingSpace = false;

    auto flushPending = [&]() {
        if (pendingNewlines > 0) {
            out.append(pendingNewlines >= 2 ? QStringLiteral("\n\n") : QStringLiteral("\n"));
        } else if (pendingSpace) {
            out.append(QLatin1Char(' '));
        }
        pendingNewlines = 0;
        pendingSpace = false;
    };

    for (int i = 0; i < raw.size(); ++i) {
        char16_t code = raw.at(i).unicode();

        if (code == u'\r') {
            if (i + 1 < raw.size() && raw.at(i + 1) == QLatin1Char('\n')) {
                ++i;
            }
            code = u'\n';
        }
        if (code == 0x00A0) {
            code = u' ';
        }

        if (code == u'\n') {
            ++pendingNewlines;
            continue;
        }
        if (code == u' ' || code == u'\t') {
            pendingSpace = true;
            continue;
        }
        if (isDroppedCodePoint(code)) {
            continue;
        }

        if (!out.isEmpty()) {
            flushPending();
        } else {
            pendingNewlines = 0;
            pendingSpace = false;
        }
        out.append(QChar(code));
    }

    return out;
}

} // namespace hr
