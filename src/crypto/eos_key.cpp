#include "crypto/eos_key.h"

#include <algorithm>
#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

namespace eos_miner {

namespace {

constexpr char kBase58Alphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr unsigned char kWifVersion = 0x80;
constexpr int kMaxSignAttempts = 64;

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct EcGroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct EcPointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

BnPtr NewBn() {
  return BnPtr(BN_new());
}

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

bool Digest(const EVP_MD* md, const unsigned char* data, std::size_t size,
            unsigned char* out, unsigned int* out_len) {
  return md != nullptr &&
         EVP_Digest(data, size, out, out_len, md, nullptr) == 1;
}

// RIPEMD160 前 4 字节，作为 EOS 公钥/签名/PVT 私钥的校验和。
bool Ripemd160Checksum(const std::vector<unsigned char>& data,
                       unsigned char out_checksum[4]) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!Digest(EVP_ripemd160(), data.data(), data.size(), digest, &digest_len) ||
      digest_len < 4U) {
    return false;
  }
  std::memcpy(out_checksum, digest, 4);
  return true;
}

std::string EncodeWithRipemdChecksum(const std::string& prefix,
                                     std::vector<unsigned char> payload,
                                     const std::string& suffix) {
  std::vector<unsigned char> checked = payload;
  checked.insert(checked.end(), suffix.begin(), suffix.end());
  unsigned char checksum[4];
  if (!Ripemd160Checksum(checked, checksum)) {
    return {};
  }
  payload.insert(payload.end(), checksum, checksum + 4);
  return prefix + Base58Encode(payload);
}

// EOS canonical 约束：r、s 的首字节不得带符号位，且不得有多余前导零。
bool IsCanonical(const unsigned char* sig65) {
  return (sig65[1] & 0x80U) == 0U &&
         !(sig65[1] == 0U && (sig65[2] & 0x80U) == 0U) &&
         (sig65[33] & 0x80U) == 0U &&
         !(sig65[33] == 0U && (sig65[34] & 0x80U) == 0U);
}

EcGroupPtr NewSecp256k1Group() {
  return EcGroupPtr(EC_GROUP_new_by_curve_name(NID_secp256k1));
}

bool IsScalarInRange(const PrivateKeyBytes& key) {
  EcGroupPtr group = NewSecp256k1Group();
  BnPtr d(BN_bin2bn(key.data(), static_cast<int>(key.size()), nullptr));
  if (group == nullptr || d == nullptr) {
    return false;
  }
  return !BN_is_zero(d.get()) &&
         BN_cmp(d.get(), EC_GROUP_get0_order(group.get())) < 0;
}

}  // namespace

bool Sha256(const std::string& data, Sha256Digest* out_digest) {
  if (out_digest == nullptr) {
    return false;
  }
  unsigned int len = 0;
  return Digest(EVP_sha256(),
                reinterpret_cast<const unsigned char*>(data.data()),
                data.size(), out_digest->data(), &len) &&
         len == out_digest->size();
}

std::string Base58Encode(const std::vector<unsigned char>& bytes) {
  std::size_t leading_zeros = 0;
  while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0U) {
    ++leading_zeros;
  }
  // 逐字节做 256 -> 58 进制的大数转换，digits 为小端序。
  std::vector<unsigned char> digits;
  digits.reserve(bytes.size() * 138U / 100U + 1U);
  for (std::size_t i = leading_zeros; i < bytes.size(); ++i) {
    unsigned int carry = bytes[i];
    for (auto& digit : digits) {
      carry += static_cast<unsigned int>(digit) << 8U;
      digit = static_cast<unsigned char>(carry % 58U);
      carry /= 58U;
    }
    while (carry > 0U) {
      digits.push_back(static_cast<unsigned char>(carry % 58U));
      carry /= 58U;
    }
  }
  std::string out(leading_zeros, '1');
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

bool Base58Decode(const std::string& text, std::vector<unsigned char>* out_bytes) {
  if (out_bytes == nullptr) {
    return false;
  }
  std::size_t leading_ones = 0;
  while (leading_ones < text.size() && text[leading_ones] == '1') {
    ++leading_ones;
  }
  std::vector<unsigned char> bytes;  // 小端序
  bytes.reserve(text.size() * 733U / 1000U + 1U);
  for (std::size_t i = leading_ones; i < text.size(); ++i) {
    const char* pos = std::strchr(kBase58Alphabet, text[i]);
    if (pos == nullptr || text[i] == '\0') {
      return false;
    }
    unsigned int carry = static_cast<unsigned int>(pos - kBase58Alphabet);
    for (auto& byte : bytes) {
      carry += static_cast<unsigned int>(byte) * 58U;
      byte = static_cast<unsigned char>(carry & 0xFFU);
      carry >>= 8U;
    }
    while (carry > 0U) {
      bytes.push_back(static_cast<unsigned char>(carry & 0xFFU));
      carry >>= 8U;
    }
  }
  out_bytes->assign(leading_ones, 0U);
  out_bytes->insert(out_bytes->end(), bytes.rbegin(), bytes.rend());
  return true;
}

bool DecodeWifPrivateKey(const std::string& text,
                         PrivateKeyBytes* out_key,
                         std::string* out_error) {
  if (out_key == nullptr) {
    return Fail("out_key 为空", out_error);
  }

  static const std::string kPvtPrefix = "PVT_K1_";
  std::vector<unsigned char> raw;
  if (text.rfind(kPvtPrefix, 0) == 0) {
    if (!Base58Decode(text.substr(kPvtPrefix.size()), &raw) || raw.size() != 36U) {
      return Fail("PVT_K1 私钥 base58 解码失败或长度非法", out_error);
    }
    std::vector<unsigned char> checked(raw.begin(), raw.begin() + 32);
    checked.push_back('K');
    checked.push_back('1');
    unsigned char checksum[4];
    if (!Ripemd160Checksum(checked, checksum) ||
        std::memcmp(checksum, raw.data() + 32, 4) != 0) {
      return Fail("PVT_K1 私钥校验和不匹配", out_error);
    }
    std::copy(raw.begin(), raw.begin() + 32, out_key->begin());
  } else {
    if (!Base58Decode(text, &raw) || raw.size() != 37U) {
      return Fail("WIF 私钥 base58 解码失败或长度非法", out_error);
    }
    if (raw[0] != kWifVersion) {
      return Fail("WIF 私钥版本字节非法", out_error);
    }
    Sha256Digest first{};
    Sha256Digest second{};
    if (!Sha256(std::string(raw.begin(), raw.begin() + 33), &first) ||
        !Sha256(std::string(first.begin(), first.end()), &second)) {
      return Fail("SHA-256 计算失败", out_error);
    }
    if (std::memcmp(second.data(), raw.data() + 33, 4) != 0) {
      return Fail("WIF 私钥校验和不匹配", out_error);
    }
    std::copy(raw.begin() + 1, raw.begin() + 33, out_key->begin());
  }

  if (!IsScalarInRange(*out_key)) {
    return Fail("私钥超出 secp256k1 阶范围", out_error);
  }
  return true;
}

bool IsValidWifPrivateKey(const std::string& text) {
  PrivateKeyBytes key{};
  return DecodeWifPrivateKey(text, &key, nullptr);
}

bool EosSigner::FromPrivateKey(const std::string& private_key_text,
                               EosSigner* out_signer,
                               std::string* out_error) {
  if (out_signer == nullptr) {
    return Fail("out_signer 为空", out_error);
  }
  PrivateKeyBytes secret{};
  if (!DecodeWifPrivateKey(private_key_text, &secret, out_error)) {
    return false;
  }

  EcGroupPtr group = NewSecp256k1Group();
  BnCtxPtr ctx(BN_CTX_new());
  BnPtr d(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
  if (group == nullptr || ctx == nullptr || d == nullptr) {
    return Fail("OpenSSL secp256k1 初始化失败", out_error);
  }
  EcPointPtr pub(EC_POINT_new(group.get()));
  if (pub == nullptr ||
      EC_POINT_mul(group.get(), pub.get(), d.get(), nullptr, nullptr,
                   ctx.get()) != 1) {
    return Fail("公钥派生失败", out_error);
  }
  std::vector<unsigned char> compressed(33);
  if (EC_POINT_point2oct(group.get(), pub.get(), POINT_CONVERSION_COMPRESSED,
                         compressed.data(), compressed.size(),
                         ctx.get()) != compressed.size()) {
    return Fail("公钥压缩编码失败", out_error);
  }

  const std::string public_key =
      EncodeWithRipemdChecksum("EOS", compressed, /*suffix=*/"");
  if (public_key.empty()) {
    return Fail("RIPEMD160 计算失败", out_error);
  }
  out_signer->secret_ = secret;
  out_signer->public_key_ = public_key;
  return true;
}

bool EosSigner::SignDigest(const Sha256Digest& digest,
                           std::string* out_signature,
                           std::string* out_error) const {
  if (out_signature == nullptr) {
    return Fail("out_signature 为空", out_error);
  }

  EcGroupPtr group = NewSecp256k1Group();
  BnCtxPtr ctx(BN_CTX_new());
  if (group == nullptr || ctx == nullptr) {
    return Fail("OpenSSL secp256k1 初始化失败", out_error);
  }
  const BIGNUM* order = EC_GROUP_get0_order(group.get());
  BnPtr d(BN_bin2bn(secret_.data(), static_cast<int>(secret_.size()), nullptr));
  BnPtr e(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr));
  BnPtr half_order(BN_dup(order));
  BnPtr k = NewBn();
  BnPtr x = NewBn();
  BnPtr y = NewBn();
  BnPtr r = NewBn();
  BnPtr s = NewBn();
  EcPointPtr point(EC_POINT_new(group.get()));
  if (d == nullptr || e == nullptr || half_order == nullptr || k == nullptr ||
      x == nullptr || y == nullptr || r == nullptr || s == nullptr ||
      point == nullptr || BN_rshift1(half_order.get(), half_order.get()) != 1) {
    return Fail("OpenSSL 大数分配失败", out_error);
  }

  // 随机 nonce 直到得到 canonical 签名；EOS 节点会拒绝非 canonical 签名。
  for (int attempt = 0; attempt < kMaxSignAttempts; ++attempt) {
    if (BN_priv_rand_range(k.get(), order) != 1 || BN_is_zero(k.get())) {
      continue;
    }
    if (EC_POINT_mul(group.get(), point.get(), k.get(), nullptr, nullptr,
                     ctx.get()) != 1 ||
        EC_POINT_get_affine_coordinates(group.get(), point.get(), x.get(),
                                        y.get(), ctx.get()) != 1 ||
        BN_nnmod(r.get(), x.get(), order, ctx.get()) != 1 ||
        BN_is_zero(r.get())) {
      continue;
    }
    int recovery_id = BN_is_odd(y.get()) ? 1 : 0;
    if (BN_cmp(x.get(), order) >= 0) {
      recovery_id |= 2;
    }

    // s = k^-1 * (e + r * d) mod n
    BnPtr k_inv(BN_mod_inverse(nullptr, k.get(), order, ctx.get()));
    if (k_inv == nullptr ||
        BN_mod_mul(s.get(), r.get(), d.get(), order, ctx.get()) != 1 ||
        BN_mod_add(s.get(), s.get(), e.get(), order, ctx.get()) != 1 ||
        BN_mod_mul(s.get(), s.get(), k_inv.get(), order, ctx.get()) != 1 ||
        BN_is_zero(s.get())) {
      continue;
    }
    if (BN_cmp(s.get(), half_order.get()) > 0) {
      if (BN_sub(s.get(), order, s.get()) != 1) {
        continue;
      }
      recovery_id ^= 1;
    }

    std::vector<unsigned char> sig(65);
    sig[0] = static_cast<unsigned char>(27 + 4 + recovery_id);
    if (BN_bn2binpad(r.get(), sig.data() + 1, 32) != 32 ||
        BN_bn2binpad(s.get(), sig.data() + 33, 32) != 32) {
      continue;
    }
    if (!IsCanonical(sig.data())) {
      continue;
    }
    *out_signature = EncodeWithRipemdChecksum("SIG_K1_", sig, "K1");
    if (out_signature->empty()) {
      return Fail("RIPEMD160 计算失败", out_error);
    }
    return true;
  }
  return Fail("未能在限定次数内得到 canonical 签名", out_error);
}

}  // namespace eos_miner
