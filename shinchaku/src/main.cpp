#include <QtWidgets/QApplication>
#include "window.h"
#include "applicationsettings.h"
#include "logger.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    
    app.setApplicationName("Shinchaku");
    app.setApplicationVersion("1.0.0");
    
    LOG("Shinchaku application starting [main.cpp]");
    
    ApplicationSettings settings;
    Window window(settings);
    window.show();
    return app.exec();
}
