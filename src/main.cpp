#include <QApplication>

#include "typemaster/logging.hpp"
#include "typemaster/main_window.hpp"

#ifndef TYPEMASTER_VERSION
#define TYPEMASTER_VERSION "0.0.0"
#endif

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("TypeMaster"));
    QApplication::setApplicationDisplayName(QStringLiteral("TypeMaster"));
    QApplication::setOrganizationName(QStringLiteral("TypeMaster"));
    QApplication::setApplicationVersion(QStringLiteral(TYPEMASTER_VERSION));

    qCInfo(lcApp) << "TypeMaster" << TYPEMASTER_VERSION << "starting";

    typemaster::MainWindow window;
    window.show();
    return app.exec();
}
