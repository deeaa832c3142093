#include "core/Application.h"
#include "core/ConfigManager.h"
#include "core/Logging.h"
#include <QLoggingCategory>

namespace HoldPlay::Core {

Application::Application(int &argc, char **argv)
    : QApplication(argc, argv)
{
    setApplicationName("HoldPlay");
    setApplicationVersion("0.1.0");
    setOrganizationName("HoldPlay");

    qSetMessagePattern("%{time hh:mm:ss.zzz} %{if-category}%{category}: %{endif}"
                       "%{if-warning}W %{endif}%{if-critical}C %{endif}%{message}");
}

Application::~Application()
{
    if (m_config) {
        qCInfo(lcSession) << "Shutting down";
    }
}

Application* Application::instance()
{
    return qobject_cast<Application*>(QCoreApplication::instance());
}

bool Application::loadConfiguration()
{
    try {
        m_config = std::make_unique<ConfigManager>();
    } catch (const std::exception& e) {
        qCCritical(lcConfig) << "Cannot load configuration:" << e.what();
        return false;
    }

    applyLoggingRules();
    qCInfo(lcSession) << "HoldPlay" << applicationVersion() << "started, config:"
                      << m_config->fileName();
    return true;
}

void Application::applyLoggingRules()
{
    const QString rules = m_config->loggingRules();
    if (!rules.isEmpty()) {
        QLoggingCategory::setFilterRules(rules);
    }
}

} // namespace HoldPlay::Core
