#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.h"

namespace eos_miner {

/// 交易头字段（与链上二进制布局一一对应）。
struct TransactionHeader {
  std::uint32_t expiration{0};  ///< UTC 秒。
  std::uint16_t ref_block_num{0};
  std::uint32_t ref_block_prefix{0};
  std::uint32_t max_net_usage_words{0};
  std::uint8_t max_cpu_usage_ms{0};
  std::uint32_t delay_sec{0};
};

/**
 * @brief EOS 名称编码
 *
 * 最多 13 个字符：前 12 个字符每个 5 bit，第 13 个字符 4 bit。
 * 字符集为 `.1-5a-z`；非法字符或超长返回 false。
 */
bool EncodeName(const std::string& name, std::uint64_t* out_value);

/**
 * @brief 资产编码（例如 "0.0001 EOS"）
 *
 * 输出 16 字节：int64 金额（按小数位缩放）+ uint64 符号（精度 | 符号字符）。
 */
bool EncodeAsset(const std::string& text, std::string* out_bytes,
                 std::string* out_error);

/// 编码一笔 `eosio.token::transfer` 的 action data。
bool PackTransferData(const TransferAction& action, std::string* out_bytes,
                      std::string* out_error);

/**
 * @brief 打包整笔交易
 *
 * 所有动作使用 `from@active` 授权，无 context-free 动作与扩展字段。
 */
bool PackTransaction(const TransactionHeader& header,
                     const std::vector<TransferAction>& actions,
                     std::string* out_packed,
                     std::string* out_error);

/// 小写十六进制编码。
std::string ToHex(const std::string& bytes);
/// 十六进制解码；长度为奇数或含非法字符返回 false。
bool FromHex(const std::string& hex, std::string* out_bytes);

/**
 * @brief 解析区块时间戳（`YYYY-MM-DDTHH:MM:SS[.fff]`，UTC）
 *
 * 小数部分按截断处理，返回 Unix 秒。
 */
bool ParseBlockTimestamp(const std::string& text, std::int64_t* out_seconds);

/// `ceil(actions / actions_per_ms) + base_ms`，并裁剪到 uint8 范围。
int ComputeMaxCpuUsageMs(int num_actions, int actions_per_ms, int base_ms);

}  // namespace eos_miner
