#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/config.h"
#include "core/json_utils.h"
#include "core/types.h"

namespace eos_miner {

/// HTTP 响应统一结构，便于 mock 与真实传输层复用。
struct EosHttpResponse {
  int status_code{0};
  std::string body;
  std::string error;
};

/**
 * @brief HTTP 传输抽象
 *
 * 作用：
 * 1. RPC 层不直接依赖 libcurl；
 * 2. 单元测试可注入脚本化 transport。
 */
class EosHttpTransport {
 public:
  virtual ~EosHttpTransport() = default;
  virtual EosHttpResponse Post(const std::string& url,
                               const std::string& body) const = 0;
};

class CurlEosHttpTransport final : public EosHttpTransport {
 public:
  explicit CurlEosHttpTransport(HttpConfig config = {}) : config_(config) {}

  /// 使用 libcurl 发送 JSON POST 请求。
  EosHttpResponse Post(const std::string& url,
                       const std::string& body) const override;

 private:
  HttpConfig config_;
};

/// `get_info` 中本项目关心的字段。
struct ChainInfo {
  std::string chain_id;
  std::int64_t head_block_num{0};
};

/// 引用块信息：交易头的 TaPoS 字段来源。
struct BlockRef {
  std::int64_t block_num{0};
  std::uint32_t ref_block_prefix{0};
  std::string timestamp;
};

/**
 * @brief nodeos chain API 客户端（单节点）
 *
 * 负责：
 * 1. 请求体拼装与 HTTP 状态码校验；
 * 2. 非 2xx 响应中 `error.{code,name,what}` 的结构化提取；
 * 3. 业务字段解析。
 */
class EosRpcClient {
 public:
  explicit EosRpcClient(std::string base_url,
                        std::unique_ptr<EosHttpTransport> transport =
                            std::make_unique<CurlEosHttpTransport>());

  const std::string& base_url() const { return base_url_; }

  bool GetInfo(ChainInfo* out_info, std::string* out_error) const;
  bool GetBlock(std::int64_t block_num, BlockRef* out_block,
                std::string* out_error) const;
  bool GetAccountLimits(const std::string& account, AccountLimits* out_limits,
                        std::string* out_error) const;
  /// 账户无该代币记录时（返回空数组）余额记为 0。
  bool GetCurrencyBalance(const std::string& contract,
                          const std::string& account,
                          const std::string& symbol,
                          double* out_balance,
                          std::string* out_error) const;
  /// 推送已签名的打包交易（无压缩）。
  bool PushTransaction(const std::string& signature,
                       const std::string& packed_trx_hex,
                       SubmitReceipt* out_receipt,
                       LedgerError* out_error) const;

  /// 从 nodeos 错误响应体提取结构化错误；格式不符返回 false。
  static bool ParseErrorBody(const std::string& body, LedgerError* out_error);

 private:
  /// 统一请求入口：POST JSON，校验状态码并解析响应体。
  bool Call(const std::string& path,
            const std::string& body,
            JsonValue* out_json,
            LedgerError* out_error) const;

  std::string base_url_;  ///< 节点根地址（不含结尾 `/`）。
  std::unique_ptr<EosHttpTransport> transport_;  ///< HTTP 传输实现。
};

}  // namespace eos_miner
