#include "app/App.h"

int main(int argc, char* argv[]) {
    cptree::App app;

    if (!app.init(argc, argv)) {
        return 1;
    }

    return app.run();
}
