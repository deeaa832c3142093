#include "core/ConfigManager.h"
#include "core/Logging.h"
#include <QKeySequence>
#include <QReadLocker>
#include <QStandardPaths>

namespace HoldPlay::Core {

namespace {
// One hour; anything longer is a typo, not a skip.
constexpr double MaxSkipSeconds = 3600.0;
}

ConfigManager::ConfigManager(const QString& filePath, QObject* parent)
    : QObject(parent)
{
    setupDefaults();

    const QString configFile = filePath.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/HoldPlay.conf"
        : filePath;

    m_settings = std::make_unique<QSettings>(configFile, QSettings::IniFormat);

    if (m_settings->status() != QSettings::NoError) {
        emitError(QString("Failed to read settings file: %1").arg(configFile));
        return;
    }

    qCDebug(lcConfig) << "Configuration loaded from" << configFile;
}

QVariant ConfigManager::getValue(const QString& key, const QVariant& defaultValue) const
{
    const QVariant fallback = defaultValue.isValid() ? defaultValue : m_defaults.value(key);
    if (!isValidKey(key)) {
        return fallback;
    }

    QReadLocker locker(&m_lock);

    if (!m_settings) {
        return fallback;
    }

    return m_settings->value(key, fallback);
}

bool ConfigManager::contains(const QString& key) const noexcept
{
    if (!isValidKey(key)) {
        return false;
    }

    QReadLocker locker(&m_lock);
    return m_settings ? m_settings->contains(key) : false;
}

QString ConfigManager::fileName() const noexcept
{
    QReadLocker locker(&m_lock);
    return m_settings ? m_settings->fileName() : QString();
}

Input::KeyBindings ConfigManager::keyBindings() const
{
    const Input::KeyBindings defaults;
    Input::KeyBindings bindings;
    bindings.togglePlay = keyValue("input/togglePlayKey", defaults.togglePlay);
    bindings.skipBackSmall = keyValue("input/skipBackSmallKey", defaults.skipBackSmall);
    bindings.skipForwardSmall = keyValue("input/skipForwardSmallKey", defaults.skipForwardSmall);
    bindings.skipBackLarge = keyValue("input/skipBackLargeKey", defaults.skipBackLarge);
    bindings.skipForwardLarge = keyValue("input/skipForwardLargeKey", defaults.skipForwardLarge);
    bindings.hold = keyValue("input/holdKey", defaults.hold);
    bindings.smallSkipSeconds = boundedValue("playback/smallSkipSeconds", defaults.smallSkipSeconds,
                                             MaxSkipSeconds);
    bindings.largeSkipSeconds = boundedValue("playback/largeSkipSeconds", defaults.largeSkipSeconds,
                                             MaxSkipSeconds);
    return bindings;
}

PlaybackRate ConfigManager::defaultRate() const
{
    bool ok = false;
    const double factor = getValue("playback/defaultRate").toDouble(&ok);
    if (ok) {
        if (const auto rate = rateFromFactor(factor)) {
            return *rate;
        }
    }

    emitError(QString("Unsupported playback/defaultRate '%1', using 1.0")
                  .arg(getValue("playback/defaultRate").toString()));
    return PlaybackRate::Normal;
}

QString ConfigManager::loggingRules() const
{
    // Semicolons are the rule separator but QSettings would read them as list
    // separators, so accept both forms.
    const QVariant rules = getValue("logging/rules");
    if (rules.typeId() == QMetaType::QStringList) {
        return rules.toStringList().join('\n');
    }
    return rules.toString().replace(';', '\n');
}

bool ConfigManager::isValidKey(const QString& key) const noexcept
{
    return !key.isEmpty() && !key.startsWith('/') && !key.endsWith('/') && !key.contains("//");
}

void ConfigManager::setupDefaults()
{
    m_defaults = {
        {"input/togglePlayKey", "Space"},
        {"input/skipBackSmallKey", "X"},
        {"input/skipForwardSmallKey", "C"},
        {"input/skipBackLargeKey", "S"},
        {"input/skipForwardLargeKey", "D"},
        {"input/holdKey", "Z"},
        {"playback/smallSkipSeconds", 1.0},
        {"playback/largeSkipSeconds", 10.0},
        {"playback/defaultRate", 1.0},
        {"logging/rules", QString()}
    };
}

int ConfigManager::keyValue(const QString& key, int fallback) const
{
    const QString text = getValue(key).toString().trimmed();
    const QKeySequence sequence = QKeySequence::fromString(text, QKeySequence::PortableText);

    if (sequence.count() != 1 || sequence[0].keyboardModifiers() != Qt::NoModifier) {
        emitError(QString("Invalid key '%1' for %2, using default").arg(text, key));
        return fallback;
    }
    return sequence[0].key();
}

double ConfigManager::boundedValue(const QString& key, double fallback, double maximum) const
{
    bool ok = false;
    const double value = getValue(key).toDouble(&ok);
    if (!ok || !(value > 0.0) || value > maximum) {
        emitError(QString("Invalid value for %1, using %2").arg(key).arg(fallback));
        return fallback;
    }
    return value;
}

void ConfigManager::emitError(const QString& error) const noexcept
{
    qCWarning(lcConfig) << error;
    emit errorOccurred(error);
}

} // namespace HoldPlay::Core
