#include "Core/Serial/SerialPortEnumerator.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

std::vector<std::string> ListSerialPorts(const std::string& devDir) {
    namespace fs = std::filesystem;
    std::vector<std::string> result;

    std::error_code ec;
    fs::directory_iterator it(devDir, ec);
    if (ec) return result;

    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0) {
            result.push_back(entry.path().string());
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}
