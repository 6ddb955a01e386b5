#include "sheetbinder/SheetBinder.hpp"
#include <iostream>

namespace sheetbinder {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        SHEETBINDER_LOG_INFO("SheetBinder {} initialized", getVersion());
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize SheetBinder: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    SHEETBINDER_LOG_DEBUG("SheetBinder cleanup");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

} // namespace sheetbinder
