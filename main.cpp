#include <QApplication>
#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("FocusTimer");

#ifdef Q_OS_MACOS
    MainWindow w(ButtonStyle::MacOS);
#else
    MainWindow w(ButtonStyle::Flat);
#endif
    w.show();
    return app.exec();
}
