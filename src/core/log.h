#pragma once

#include <string_view>

namespace eos_miner {

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/**
 * @brief 输出 WARN 级日志
 *
 * 用于“可自愈”的运行态事件（例如暂停一轮挖矿），输出到 `stdout`。
 */
void LogWarn(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stderr`；
 * 3. 自动附加本地时间戳和 `[ERROR]` 前缀。
 */
void LogError(std::string_view message);

}  // namespace eos_miner
