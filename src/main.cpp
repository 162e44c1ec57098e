#include "core/Application.h"
#include <cstdlib>

using namespace TerminalMouse;

int main() {
    Core::Application app;

    if (!app.Initialize()) {
        app.Shutdown();
        return EXIT_FAILURE;
    }

    int exitCode = app.Run();

    app.Shutdown();

    return exitCode;
}
