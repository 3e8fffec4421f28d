#include "OutputClassifier.hpp"

namespace mdk {

bool containsAnyPhrase(const QString& haystack, const QStringList& phrases)
{
    for (const auto& phrase : phrases) {
        if (!phrase.isEmpty() && haystack.contains(phrase, Qt::CaseInsensitive))
            return true;
    }
    return false;
}

OutputVerdict classifyOutput(const QString& output, const PhraseGroups& phrases)
{
    if (containsAnyPhrase(output, phrases.success))
        return OutputVerdict::Success;
    if (containsAnyPhrase(output, phrases.failure))
        return OutputVerdict::Failure;
    return OutputVerdict::Unrecognized;
}

} // namespace mdk
