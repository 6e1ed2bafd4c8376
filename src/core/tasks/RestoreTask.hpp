#pragma once
#include <string>
#include "../Types.hpp"
#include "../../utils/ILogger.hpp"

// 将一个归档解压到目标路径的父目录下
class RestoreTask {
private:
    std::string archivePath;
    std::string destination;
    TaskStatus status;
    ILogger* logger;
    std::string errorMessage;
    bool formatRecognized;

public:
    RestoreTask(const std::string& archive, const std::string& destinationPath, ILogger* log);

    // 格式由文件名后缀决定（.tar.gz / .zip）
    bool execute();
    TaskStatus getStatus() const;

    const std::string& getErrorMessage() const { return errorMessage; }
    bool isFormatRecognized() const { return formatRecognized; }
};
