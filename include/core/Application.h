#ifndef HOLDPLAY_CORE_APPLICATION_H
#define HOLDPLAY_CORE_APPLICATION_H

#include <QApplication>
#include <memory>

namespace HoldPlay::Core {

class ConfigManager;

/**
 * @brief QApplication owning the configuration and the logging setup
 */
class Application : public QApplication
{
    Q_OBJECT

public:
    Application(int &argc, char **argv);
    ~Application() override;

    // Null when the running QCoreApplication is not a HoldPlay Application.
    [[nodiscard]] static Application* instance();

    [[nodiscard]] ConfigManager* configManager() const noexcept { return m_config.get(); }

    // Reads the INI file and applies its logging rules. Safe to call again.
    bool loadConfiguration();

private:
    void applyLoggingRules();

    std::unique_ptr<ConfigManager> m_config;
};

} // namespace HoldPlay::Core

#endif // HOLDPLAY_CORE_APPLICATION_H
