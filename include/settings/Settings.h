#pragma once

#include <QSettings>

namespace DeskProbe {

inline constexpr const char* kOrganizationName = "DeskProbe";
inline constexpr const char* kApplicationName = "DeskProbe";

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace DeskProbe
