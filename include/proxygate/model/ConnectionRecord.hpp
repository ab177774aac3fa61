#pragma once

#include <chrono>
#include <string>

namespace proxygate::model {

struct ConnectionRecord {
    std::string target;
    std::string path;
    std::string method;
    std::chrono::system_clock::time_point timestamp;
    std::string agent;
};

} // namespace proxygate::model
