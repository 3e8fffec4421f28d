#pragma once

#include <QString>

namespace mdk {

struct Device {
    QString id;     // serial number or "host:port"
    QString state;  // as reported by the bridge tool: "device", "unauthorized", "offline", ...

    bool isOnline() const { return state == QLatin1String("device"); }

    bool operator==(const Device& other) const
    {
        return id == other.id && state == other.state;
    }
};

} // namespace mdk
