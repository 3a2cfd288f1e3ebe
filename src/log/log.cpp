#include "skillpack/log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "skillpack/core/config.hpp"

namespace skillpack {

namespace {

namespace fs = std::filesystem;

// 每次启动时轮转日志文件
// 策略：<stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const fs::path& current_log, size_t max_files) {
  std::error_code ec;
  if (!fs::exists(current_log, ec) || max_files == 0) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto backup = [&](size_t index) { return log_dir / (stem + "." + std::to_string(index) + ".log"); };

  // 删除最旧的日志文件
  fs::remove(backup(max_files - 1), ec);

  // 从后往前依次重命名
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name, ec)) {
      fs::rename(old_name, backup(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, backup(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t /* max_size */, size_t max_files, const std::string& level) {
  try {
    // 确定日志目录和文件路径
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "skillpack.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    // 每次启动都是新的干净文件
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);

    // 已存在同名 logger 时先移除（重复初始化）
    spdlog::drop("skillpack");
    auto logger = std::make_shared<spdlog::logger>("skillpack", file_sink);

    // 未知级别按 info 处理
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // 日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新
    logger->flush_on(spdlog::level::trace);

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== skillpack started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace skillpack
