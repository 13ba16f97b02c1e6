#include "app/SmartOcrApp.hpp"

int main(int argc, char** argv) {
    smartocr::app::SmartOcrApp app;
    return app.Run(argc, argv);
}
