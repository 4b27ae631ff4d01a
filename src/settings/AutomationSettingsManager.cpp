#include "settings/AutomationSettingsManager.h"
#include "settings/Settings.h"
#include "raster/RasterBudget.h"

#include <QSettings>
#include <QDebug>

AutomationSettingsManager& AutomationSettingsManager::instance()
{
    static AutomationSettingsManager instance;
    return instance;
}

int AutomationSettingsManager::loadMaxLiveRasters() const
{
    auto settings = DeskProbe::getSettings();
    int count = settings.value(kSettingsKeyMaxLiveRasters, kDefaultMaxLiveRasters).toInt();
    return qBound(1, count, 1000);
}

void AutomationSettingsManager::saveMaxLiveRasters(int count)
{
    auto settings = DeskProbe::getSettings();
    settings.setValue(kSettingsKeyMaxLiveRasters, count);
}

int AutomationSettingsManager::loadClusterRadius() const
{
    auto settings = DeskProbe::getSettings();
    int radius = settings.value(kSettingsKeyClusterRadius, kDefaultClusterRadius).toInt();
    return qBound(1, radius, 64);
}

void AutomationSettingsManager::saveClusterRadius(int radius)
{
    auto settings = DeskProbe::getSettings();
    settings.setValue(kSettingsKeyClusterRadius, radius);
}

int AutomationSettingsManager::loadRequestTimeoutMs() const
{
    auto settings = DeskProbe::getSettings();
    int timeoutMs = settings.value(kSettingsKeyRequestTimeoutMs, kDefaultRequestTimeoutMs).toInt();
    return qBound(0, timeoutMs, 600000);
}

void AutomationSettingsManager::saveRequestTimeoutMs(int timeoutMs)
{
    auto settings = DeskProbe::getSettings();
    settings.setValue(kSettingsKeyRequestTimeoutMs, timeoutMs);
}

std::shared_ptr<DeskProbe::RasterBudget> AutomationSettingsManager::makeRasterBudget() const
{
    const int capacity = loadMaxLiveRasters();
    qDebug() << "AutomationSettingsManager: Raster budget capacity" << capacity;
    return DeskProbe::RasterBudget::create(capacity);
}
