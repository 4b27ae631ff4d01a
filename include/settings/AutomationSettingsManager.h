#ifndef AUTOMATIONSETTINGSMANAGER_H
#define AUTOMATIONSETTINGSMANAGER_H

#include <QtGlobal>
#include <memory>

namespace DeskProbe {
class RasterBudget;
}

/**
 * @brief Singleton class for capture and matching tunables.
 *
 * Values are read from QSettings on every load call so that tests and
 * external edits are picked up without a restart.
 */
class AutomationSettingsManager
{
public:
    static AutomationSettingsManager& instance();

    // Maximum simultaneously live rasters (1 - 1000)
    int loadMaxLiveRasters() const;
    void saveMaxLiveRasters(int count);

    // Clustering radius for colour features, in pixels (1 - 64)
    int loadClusterRadius() const;
    void saveClusterRadius(int radius);

    // Native API reply wait in ms, 0 = wait forever (0 - 600000)
    int loadRequestTimeoutMs() const;
    void saveRequestTimeoutMs(int timeoutMs);

    // Budget sized from loadMaxLiveRasters()
    std::shared_ptr<DeskProbe::RasterBudget> makeRasterBudget() const;

    // Default values
    static constexpr int kDefaultMaxLiveRasters = 20;
    static constexpr int kDefaultClusterRadius = 5;
    static constexpr int kDefaultRequestTimeoutMs = 0;

private:
    AutomationSettingsManager() = default;
    AutomationSettingsManager(const AutomationSettingsManager&) = delete;
    AutomationSettingsManager& operator=(const AutomationSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyMaxLiveRasters = "capture/maxLiveRasters";
    static constexpr const char* kSettingsKeyClusterRadius = "matching/clusterRadius";
    static constexpr const char* kSettingsKeyRequestTimeoutMs = "nativeApi/requestTimeoutMs";
};

#endif // AUTOMATIONSETTINGSMANAGER_H
