#include "CrashHandler.hpp"
#include "mainwindow.h"
#include "utils/AppSettings.hpp"

#include <QApplication>
#include <QMessageBox>
#include <iostream>
#include <string>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[]) {
  try {
    // 创建文件日志记录器
    auto file_logger = spdlog::basic_logger_mt("file_logger", "logs/app.log");
    spdlog::set_default_logger(file_logger);
    spdlog::flush_on(spdlog::level::warn);
  } catch (const spdlog::spdlog_ex &e) {
    std::cerr << "Log initialization failed: " << e.what() << std::endl;
    return 1;
  }

  CrashHandler::Config crashConfig;
  crashConfig.crashLogPath = "logs/crash.log";
  CrashHandler::init(crashConfig);

  QApplication app(argc, argv);
  QApplication::setOrganizationName("QRGenerator");
  QApplication::setApplicationName("QRGenerator");

  try {
    const AppConfig config = AppSettings::load();
    const std::string levelName = config.logLevel.toStdString();
    auto level = spdlog::level::from_str(levelName);
    if (level == spdlog::level::off && levelName != "off")
      level = spdlog::level::info;
    spdlog::set_level(level);
    spdlog::info("Application started");

    MainWindow mainWindow(config);
    mainWindow.show();
    spdlog::info("Main window shown");

    const int status = app.exec();
    spdlog::info("Application exiting with status {}", status);
    return status;
  } catch (const std::exception &e) {
    spdlog::critical("Initialization failed: {}", e.what());
    QMessageBox::critical(nullptr, QObject::tr("QR Code Generator"),
                          QObject::tr("Initialization failed: %1")
                              .arg(QString::fromUtf8(e.what())));
    return 1;
  }
}
