#include <iostream>

#include "app.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

void run() {
    LOG_INFO("Starting cursor_halo");

    App app;
    app.run();
    app.stop();
}

int main() {
    try {
        run();
        LOG_INFO("Application shutting down normally");
        return 0;
    } catch (const halo::HaloException &e) {
        LOG_ERROR("Halo error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
