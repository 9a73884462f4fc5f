#include "ledger/transaction_packer.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <limits>

namespace eos_miner {

namespace {

void AppendUint8(std::uint8_t value, std::string* out) {
  out->push_back(static_cast<char>(value));
}

void AppendUint16(std::uint16_t value, std::string* out) {
  for (int i = 0; i < 2; ++i) {
    out->push_back(static_cast<char>((value >> (8 * i)) & 0xFFU));
  }
}

void AppendUint32(std::uint32_t value, std::string* out) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<char>((value >> (8 * i)) & 0xFFU));
  }
}

void AppendUint64(std::uint64_t value, std::string* out) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<char>((value >> (8 * i)) & 0xFFU));
  }
}

void AppendVarUint32(std::uint32_t value, std::string* out) {
  do {
    std::uint8_t byte = static_cast<std::uint8_t>(value & 0x7FU);
    value >>= 7U;
    if (value != 0U) {
      byte |= 0x80U;
    }
    out->push_back(static_cast<char>(byte));
  } while (value != 0U);
}

void AppendBytes(const std::string& bytes, std::string* out) {
  AppendVarUint32(static_cast<std::uint32_t>(bytes.size()), out);
  out->append(bytes);
}

std::uint64_t NameCharValue(char ch) {
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<std::uint64_t>(ch - 'a') + 6U;
  }
  if (ch >= '1' && ch <= '5') {
    return static_cast<std::uint64_t>(ch - '1') + 1U;
  }
  return 0;
}

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

bool EncodeName(const std::string& name, std::uint64_t* out_value) {
  if (out_value == nullptr || name.size() > 13U) {
    return false;
  }
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char ch = name[i];
    const bool valid = ch == '.' || (ch >= 'a' && ch <= 'z') ||
                       (ch >= '1' && ch <= '5');
    if (!valid) {
      return false;
    }
    const std::uint64_t c = NameCharValue(ch);
    if (i < 12U) {
      value |= (c & 0x1FU) << (64U - 5U * (i + 1U));
    } else {
      // 第 13 个字符只有 4 bit 可用。
      if (c > 0x0FU) {
        return false;
      }
      value |= c & 0x0FU;
    }
  }
  *out_value = value;
  return true;
}

bool EncodeAsset(const std::string& text, std::string* out_bytes,
                 std::string* out_error) {
  if (out_bytes == nullptr) {
    return Fail("out_bytes 为空", out_error);
  }
  const std::size_t space = text.find(' ');
  if (space == std::string::npos) {
    return Fail("资产格式非法，缺少符号: " + text, out_error);
  }
  const std::string amount_text = text.substr(0, space);
  const std::string symbol = text.substr(space + 1);
  if (symbol.empty() || symbol.size() > 7U ||
      !std::all_of(symbol.begin(), symbol.end(),
                   [](char ch) { return ch >= 'A' && ch <= 'Z'; })) {
    return Fail("资产符号非法: " + symbol, out_error);
  }

  bool negative = false;
  std::size_t pos = 0;
  if (!amount_text.empty() && amount_text[0] == '-') {
    negative = true;
    pos = 1;
  }
  std::int64_t amount = 0;
  std::uint8_t precision = 0;
  bool seen_dot = false;
  bool seen_digit = false;
  for (; pos < amount_text.size(); ++pos) {
    const char ch = amount_text[pos];
    if (ch == '.') {
      if (seen_dot) {
        return Fail("资产金额非法: " + amount_text, out_error);
      }
      seen_dot = true;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return Fail("资产金额非法: " + amount_text, out_error);
    }
    if (amount > (std::numeric_limits<std::int64_t>::max() - 9) / 10) {
      return Fail("资产金额溢出: " + amount_text, out_error);
    }
    amount = amount * 10 + (ch - '0');
    seen_digit = true;
    if (seen_dot) {
      ++precision;
    }
  }
  if (!seen_digit || precision > 18U) {
    return Fail("资产金额非法: " + amount_text, out_error);
  }

  std::uint64_t symbol_code = precision;
  for (std::size_t i = 0; i < symbol.size(); ++i) {
    symbol_code |= static_cast<std::uint64_t>(symbol[i]) << (8U * (i + 1U));
  }
  out_bytes->clear();
  AppendUint64(static_cast<std::uint64_t>(negative ? -amount : amount),
               out_bytes);
  AppendUint64(symbol_code, out_bytes);
  return true;
}

bool PackTransferData(const TransferAction& action, std::string* out_bytes,
                      std::string* out_error) {
  if (out_bytes == nullptr) {
    return Fail("out_bytes 为空", out_error);
  }
  std::uint64_t from = 0;
  std::uint64_t to = 0;
  if (!EncodeName(action.from, &from)) {
    return Fail("transfer.from 非法: " + action.from, out_error);
  }
  if (!EncodeName(action.to, &to)) {
    return Fail("transfer.to 非法: " + action.to, out_error);
  }
  std::string asset;
  if (!EncodeAsset(action.quantity, &asset, out_error)) {
    return false;
  }
  out_bytes->clear();
  AppendUint64(from, out_bytes);
  AppendUint64(to, out_bytes);
  out_bytes->append(asset);
  AppendBytes(action.memo, out_bytes);
  return true;
}

bool PackTransaction(const TransactionHeader& header,
                     const std::vector<TransferAction>& actions,
                     std::string* out_packed,
                     std::string* out_error) {
  if (out_packed == nullptr) {
    return Fail("out_packed 为空", out_error);
  }
  std::uint64_t transfer_name = 0;
  std::uint64_t active_name = 0;
  EncodeName("transfer", &transfer_name);
  EncodeName("active", &active_name);

  std::string packed;
  AppendUint32(header.expiration, &packed);
  AppendUint16(header.ref_block_num, &packed);
  AppendUint32(header.ref_block_prefix, &packed);
  AppendVarUint32(header.max_net_usage_words, &packed);
  AppendUint8(header.max_cpu_usage_ms, &packed);
  AppendVarUint32(header.delay_sec, &packed);
  AppendVarUint32(0, &packed);  // context_free_actions

  AppendVarUint32(static_cast<std::uint32_t>(actions.size()), &packed);
  for (const auto& action : actions) {
    std::uint64_t contract = 0;
    std::uint64_t actor = 0;
    if (!EncodeName(action.contract, &contract)) {
      return Fail("action.account 非法: " + action.contract, out_error);
    }
    if (!EncodeName(action.from, &actor)) {
      return Fail("authorization.actor 非法: " + action.from, out_error);
    }
    std::string data;
    if (!PackTransferData(action, &data, out_error)) {
      return false;
    }
    AppendUint64(contract, &packed);
    AppendUint64(transfer_name, &packed);
    AppendVarUint32(1, &packed);
    AppendUint64(actor, &packed);
    AppendUint64(active_name, &packed);
    AppendBytes(data, &packed);
  }
  AppendVarUint32(0, &packed);  // transaction_extensions

  *out_packed = std::move(packed);
  return true;
}

std::string ToHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(bytes.size() * 2U);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const auto v = static_cast<unsigned char>(bytes[i]);
    out[i * 2U] = kHex[(v >> 4U) & 0x0FU];
    out[i * 2U + 1U] = kHex[v & 0x0FU];
  }
  return out;
}

bool FromHex(const std::string& hex, std::string* out_bytes) {
  if (out_bytes == nullptr || hex.size() % 2U != 0U) {
    return false;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = nibble(hex[i]);
    const int lo = nibble(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  *out_bytes = std::move(out);
  return true;
}

bool ParseBlockTimestamp(const std::string& text, std::int64_t* out_seconds) {
  if (out_seconds == nullptr) {
    return false;
  }
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &year, &month, &day,
                  &hour, &minute, &second) != 6) {
    return false;
  }
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
#if defined(_WIN32)
  const std::time_t t = _mkgmtime(&tm);
#else
  const std::time_t t = timegm(&tm);
#endif
  if (t == static_cast<std::time_t>(-1)) {
    return false;
  }
  *out_seconds = static_cast<std::int64_t>(t);
  return true;
}

int ComputeMaxCpuUsageMs(int num_actions, int actions_per_ms, int base_ms) {
  if (actions_per_ms <= 0) {
    actions_per_ms = 1;
  }
  const int actions = std::max(0, num_actions);
  const int value = (actions + actions_per_ms - 1) / actions_per_ms + base_ms;
  return std::clamp(value, 0, 255);
}

}  // namespace eos_miner
