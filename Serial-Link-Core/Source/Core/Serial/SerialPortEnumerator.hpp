#pragma once
#include <string>
#include <vector>

// Elenca le seriali USB presenti (/dev/ttyUSB*, /dev/ttyACM*), ordinate per nome.
std::vector<std::string> ListSerialPorts(const std::string& devDir = "/dev");
