// Logging.h — настройка spdlog для fileTT

#pragma once

#include "export.h"
#include <string>

namespace FileTT {

/// trace, debug, info, warn, error, critical, off
FTT_API bool parseLogLevel(const std::string& level);

/// Глобальный logger: цветная консоль и, если задан, файл.
/// Неизвестный уровень → info.
FTT_API void configureLogging(const std::string& level, const std::string& logFile = "");

} // namespace FileTT
