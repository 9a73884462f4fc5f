#pragma once

#include <array>
#include <string>
#include <vector>

namespace eos_miner {

using Sha256Digest = std::array<unsigned char, 32>;
using PrivateKeyBytes = std::array<unsigned char, 32>;

/// SHA-256（OpenSSL EVP）；失败返回 false。
bool Sha256(const std::string& data, Sha256Digest* out_digest);

/// Base58（比特币字母表）编码。
std::string Base58Encode(const std::vector<unsigned char>& bytes);
/// Base58 解码；出现字母表外字符返回 false。
bool Base58Decode(const std::string& text, std::vector<unsigned char>* out_bytes);

/**
 * @brief 解码 EOS 私钥
 *
 * 支持两种格式：
 * 1. 传统 WIF：`0x80 + 32 字节私钥 + double-SHA256 前 4 字节校验`；
 * 2. `PVT_K1_` 前缀：`32 字节私钥 + RIPEMD160(key + "K1") 前 4 字节校验`。
 */
bool DecodeWifPrivateKey(const std::string& text,
                         PrivateKeyBytes* out_key,
                         std::string* out_error);

/// 私钥格式是否合法（校验和通过且落在 secp256k1 阶范围内）。
bool IsValidWifPrivateKey(const std::string& text);

/**
 * @brief secp256k1 交易签名器
 *
 * 持有私钥字节与派生出的 `EOS...` 公钥；签名输出 `SIG_K1_...`，
 * 满足 EOS 对 canonical 签名（low-S 且 r/s 首字节约束）的要求。
 */
class EosSigner {
 public:
  /// 从私钥文本构造；私钥非法或公钥派生失败返回 false。
  static bool FromPrivateKey(const std::string& private_key_text,
                             EosSigner* out_signer,
                             std::string* out_error);

  /// 传统格式公钥（`EOS` + base58(压缩点 + RIPEMD160 校验)）。
  const std::string& public_key() const { return public_key_; }

  /// 对 32 字节摘要做可恢复 ECDSA 签名。
  bool SignDigest(const Sha256Digest& digest,
                  std::string* out_signature,
                  std::string* out_error) const;

 private:
  PrivateKeyBytes secret_{};
  std::string public_key_;
};

}  // namespace eos_miner
