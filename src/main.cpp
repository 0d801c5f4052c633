#include "app.h"

int main(int argc, char** argv) {
    ntree::App app;
    return app.run(argc, argv);
}
