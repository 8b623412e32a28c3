#include "app/App.h"

#if defined(GHOSTLEDGER_WITH_IMGUI)
  // SDL may redefine main on some platforms.
  #include "ui/SDLDetect.h"
#endif

int main(int argc, char** argv)
{
    ghostledger::app::App app;
    return app.run(argc, argv);
}
