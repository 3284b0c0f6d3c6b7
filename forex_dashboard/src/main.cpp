#include <QApplication>
#include "ForexConfig.h"
#include "ForexWindow.h"

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("Forex Rate Fetcher");
    QApplication::setOrganizationName("forex-dashboard");
    qApp->setStyleSheet("QWidget { background-color: #0c0c0c; color: white; font-family: -apple-system, 'SF Pro Text', 'Helvetica Neue', Arial, sans-serif; }");
    const ForexConfig config = ForexConfig::load();
    ForexWindow w(config); w.show();
    return app.exec();
}
