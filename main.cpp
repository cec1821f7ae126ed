#include "app/CollectorApp.hpp"

int main(int argc, char* argv[]) {
    lancollect::app::CollectorApp app;
    return app.Run(argc, argv);
}
