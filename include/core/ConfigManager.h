#ifndef HOLDPLAY_CORE_CONFIGMANAGER_H
#define HOLDPLAY_CORE_CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QVariant>
#include <QVariantMap>
#include <QReadWriteLock>
#include <memory>
#include "core/PlaybackRate.h"
#include "input/KeyBindings.h"

namespace HoldPlay::Core {

/**
 * @brief Read-only access to the INI configuration
 * Values missing from the file fall back to built-in defaults. Nothing is
 * written back, so no session state outlives the process.
 */
class ConfigManager : public QObject
{
    Q_OBJECT

public:
    // An empty path selects <AppConfigLocation>/HoldPlay.conf.
    explicit ConfigManager(const QString& filePath = QString(), QObject* parent = nullptr);
    ~ConfigManager() override = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    [[nodiscard]] QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    [[nodiscard]] bool contains(const QString& key) const noexcept;
    [[nodiscard]] QString fileName() const noexcept;

    // Typed views with validation; invalid entries fall back to the default.
    [[nodiscard]] Input::KeyBindings keyBindings() const;
    [[nodiscard]] PlaybackRate defaultRate() const;
    [[nodiscard]] QString loggingRules() const;

    [[nodiscard]] bool isValidKey(const QString& key) const noexcept;

signals:
    void errorOccurred(const QString& error) const;

private:
    void setupDefaults();
    [[nodiscard]] int keyValue(const QString& key, int fallback) const;
    [[nodiscard]] double boundedValue(const QString& key, double fallback, double maximum) const;
    void emitError(const QString& error) const noexcept;

    std::unique_ptr<QSettings> m_settings;
    QVariantMap m_defaults;
    mutable QReadWriteLock m_lock;
};

} // namespace HoldPlay::Core

#endif // HOLDPLAY_CORE_CONFIGMANAGER_H
