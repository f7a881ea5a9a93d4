#pragma once
#include <string>
#include "Core/LinkConfig.hpp"

struct AppConfig {
    // "serial.port" = "auto": porte rilevate all'avvio con ListSerialPorts()
    bool autoPort = false;
    LinkConfig link;
};
