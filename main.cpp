#include "core/Application.h"
#include "core/Logging.h"
#include "ui/MainWindow.h"
#include <QMessageBox>
#include <exception>

namespace {

int reportStartupFailure(const QString& detail, int exitCode)
{
    qCCritical(lcSession).noquote() << detail;
    QMessageBox::critical(nullptr, "HoldPlay", detail);
    return exitCode;
}

} // namespace

int main(int argc, char *argv[])
{
    HoldPlay::Core::Application app(argc, argv);

    if (!app.loadConfiguration()) {
        return reportStartupFailure("The configuration could not be loaded.", 1);
    }

    try {
        HoldPlay::UI::MainWindow window;
        window.show();
        return QApplication::exec();
    } catch (const std::exception& e) {
        return reportStartupFailure(QString("HoldPlay stopped: %1").arg(e.what()), 2);
    }
}
