#pragma once

#include <QString>
#include <QStringList>

namespace mdk {

/// Phrases that identify the outcome of a bridge command from its stdout.
/// Matching is case-insensitive substring search. Success is checked first.
struct PhraseGroups {
    QStringList success;
    QStringList failure;
};

enum class OutputVerdict {
    Success,
    Failure,
    Unrecognized
};

bool containsAnyPhrase(const QString& haystack, const QStringList& phrases);

OutputVerdict classifyOutput(const QString& output, const PhraseGroups& phrases);

} // namespace mdk
