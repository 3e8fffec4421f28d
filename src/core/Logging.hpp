#pragma once

#include <QString>

namespace mdk {

/// Apply a Boost.Log severity filter by name ("trace", "debug", "info",
/// "warning", "error", "fatal"). Unknown names fall back to "info".
/// Returns false when the name was not recognized.
bool setLogLevel(const QString& name);

} // namespace mdk
