#pragma once

#include <string>

namespace efb::core {

struct LoggingConfig {
    std::string loggerName{"efbnav"};
    bool verbose{false};
    bool quiet{false};
    std::string logFile;  // 为空时不写文件
};

// 安装默认 spdlog 记录器
void setupLogging(const LoggingConfig& config);

} // namespace efb::core
