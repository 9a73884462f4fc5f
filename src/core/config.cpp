#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "crypto/eos_key.h"

namespace eos_miner {

namespace {

// 以下工具函数用于“轻量 YAML 解析”：
// - 顶层 `section:` + 两空格缩进的 `key: value`；
// - `endpoints` 段额外支持 `- url` 块列表与 `[a, b]` 行内列表。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释，避免误伤字符串内容。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
    } else if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
    } else if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::string ToLowerCopy(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ParseDouble(const std::string& text, double* out_value) {
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& text, int* out_value) {
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInlineList(const std::string& text, std::vector<std::string>* out_items) {
  std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  trimmed = trimmed.substr(1, trimmed.size() - 2);
  out_items->clear();
  std::string token;
  std::istringstream iss(trimmed);
  while (std::getline(iss, token, ',')) {
    const std::string item = Trim(Unquote(Trim(token)));
    if (!item.empty()) {
      out_items->push_back(item);
    }
  }
  return true;
}

std::string LineError(const std::string& path, int line_no) {
  return path + " 解析失败，行号: " + std::to_string(line_no);
}

bool AssignDouble(const std::string& value, const std::string& path,
                  int line_no, double* out_field, std::string* out_error) {
  if (!ParseDouble(value, out_field)) {
    if (out_error != nullptr) {
      *out_error = LineError(path, line_no);
    }
    return false;
  }
  return true;
}

bool AssignInt(const std::string& value, const std::string& path,
               int line_no, int* out_field, std::string* out_error) {
  if (!ParseInt(value, out_field)) {
    if (out_error != nullptr) {
      *out_error = LineError(path, line_no);
    }
    return false;
  }
  return true;
}

// 按 section.key 把一个标量写入配置；未知键静默忽略，保持向前兼容。
bool ApplyScalar(const std::string& section, const std::string& key,
                 const std::string& value, int line_no,
                 MinerConfig* config, std::string* out_error) {
  const std::string path = section + "." + key;
  if (section == "miner") {
    if (key == "account") {
      config->account = value;
    } else if (key == "mine_type") {
      config->mine_type = value;
    } else if (key == "num_actions") {
      return AssignInt(value, path, line_no, &config->num_actions, out_error);
    } else if (key == "ledger") {
      config->ledger = ToLowerCopy(value);
    } else if (key == "private_key_env") {
      config->private_key_env = value;
    }
    return true;
  }

  if (section == "controller") {
    ControllerConfig& c = config->controller;
    if (key == "target_rate") {
      return AssignDouble(value, path, line_no, &c.target_rate, out_error);
    }
    if (key == "red_rate") {
      return AssignDouble(value, path, line_no, &c.red_rate, out_error);
    }
    if (key == "min_batch") {
      return AssignInt(value, path, line_no, &c.min_batch, out_error);
    }
    if (key == "max_batch") {
      return AssignInt(value, path, line_no, &c.max_batch, out_error);
    }
    if (key == "fast_decay") {
      return AssignDouble(value, path, line_no, &c.fast_decay, out_error);
    }
    if (key == "slow_decay") {
      return AssignDouble(value, path, line_no, &c.slow_decay, out_error);
    }
    if (key == "trend_threshold") {
      return AssignDouble(value, path, line_no, &c.trend_threshold, out_error);
    }
    return true;
  }

  if (section == "schedule") {
    ScheduleConfig& s = config->schedule;
    if (key == "submit_interval_ms") {
      return AssignInt(value, path, line_no, &s.submit_interval_ms, out_error);
    }
    if (key == "retune_interval_ms") {
      return AssignInt(value, path, line_no, &s.retune_interval_ms, out_error);
    }
    if (key == "funding_wait_ms") {
      return AssignInt(value, path, line_no, &s.funding_wait_ms, out_error);
    }
    return true;
  }

  if (section == "transaction") {
    TransactionConfig& t = config->transaction;
    if (key == "blocks_behind") {
      return AssignInt(value, path, line_no, &t.blocks_behind, out_error);
    }
    if (key == "expire_seconds") {
      return AssignInt(value, path, line_no, &t.expire_seconds, out_error);
    }
    if (key == "cpu_ms_actions_per_ms") {
      return AssignInt(value, path, line_no, &t.cpu_ms_actions_per_ms, out_error);
    }
    if (key == "cpu_ms_base") {
      return AssignInt(value, path, line_no, &t.cpu_ms_base, out_error);
    }
    if (key == "quantity") {
      t.quantity = value;
    } else if (key == "memo") {
      t.memo = value;
    }
    return true;
  }

  if (section == "funding" && key == "min_base_balance") {
    return AssignDouble(value, path, line_no, &config->min_base_balance,
                        out_error);
  }

  if (section == "http") {
    if (key == "connect_timeout_ms") {
      return AssignInt(value, path, line_no, &config->http.connect_timeout_ms,
                       out_error);
    }
    if (key == "request_timeout_ms") {
      return AssignInt(value, path, line_no, &config->http.request_timeout_ms,
                       out_error);
    }
  }
  return true;
}

}  // namespace

std::vector<std::string> DefaultEndpoints() {
  return {
      "https://eospush.tokenpocket.pro",
      "https://mainnet.eos.dfuse.io",
      "https://eos.greymass.com",
      "https://api.eosn.io",
      "http://openapi.eos.ren",
      "https://mainnet.meet.one",
      "https://nodes.get-scatter.com",
      "https://api1.eosasia.one",
      "https://mainnet-tw.meet.one",
      "https://eos.eoscafeblock.com",
      "https://api.eosdetroit.io",
      "https://eos.newdex.one",
      "https://api.eosnewyork.io",
      "https://api.main.alohaeos.com",
      "https://api.redpacketeos.com",
      "https://api.eoseoul.io",
      "https://eos.infstones.io",
      "https://api.eossweden.se",
      "https://api.eossweden.org",
      "https://mainnet.eoscannon.io",
      "https://bp.whaleex.com",
      "https://api.helloeos.com.cn",
      "https://api.zbeos.com",
      "https://api.eosrio.io",
      "https://mainnet.eoscanada.com",
      "https://api.eoslaomao.com",
  };
}

bool LoadMinerConfigFromYaml(const std::string& file_path,
                             MinerConfig* out_config,
                             std::string* out_error) {
  if (out_config == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_config 为空";
    }
    return false;
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开配置文件: " + file_path;
    }
    return false;
  }

  MinerConfig config = *out_config;
  std::string current_section;
  // 文件中出现 endpoints 段时整体替换默认列表，而不是追加。
  bool endpoints_overridden = false;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string content = Trim(StripInlineComment(line));
    if (content.empty()) {
      continue;
    }
    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0) {
      const std::size_t colon_pos = content.find(':');
      if (colon_pos == std::string::npos) {
        if (out_error != nullptr) {
          *out_error = "顶层行缺少 ':'，行号: " + std::to_string(line_no);
        }
        return false;
      }
      current_section = Trim(content.substr(0, colon_pos));
      const std::string inline_value = Trim(content.substr(colon_pos + 1));
      if (current_section == "endpoints" && !inline_value.empty()) {
        std::vector<std::string> items;
        if (!ParseInlineList(inline_value, &items)) {
          if (out_error != nullptr) {
            *out_error = LineError("endpoints", line_no);
          }
          return false;
        }
        config.endpoints = std::move(items);
        endpoints_overridden = true;
      }
      continue;
    }

    if (current_section == "endpoints") {
      if (content.rfind("- ", 0) != 0) {
        if (out_error != nullptr) {
          *out_error = LineError("endpoints", line_no);
        }
        return false;
      }
      if (!endpoints_overridden) {
        config.endpoints.clear();
        endpoints_overridden = true;
      }
      const std::string url = Unquote(Trim(content.substr(2)));
      if (!url.empty()) {
        config.endpoints.push_back(url);
      }
      continue;
    }

    const std::size_t colon_pos = content.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(content.substr(0, colon_pos));
    const std::string raw_value = Trim(content.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    if (!ApplyScalar(current_section, key, Unquote(raw_value), line_no,
                     &config, out_error)) {
      return false;
    }
  }

  *out_config = std::move(config);
  return true;
}

bool ResolvePrivateKeyFromEnv(MinerConfig* config, std::string* out_error) {
  if (config == nullptr) {
    return false;
  }
  if (config->private_key_env.empty()) {
    if (out_error != nullptr) {
      *out_error = "miner.private_key_env 为空";
    }
    return false;
  }
  const char* value = std::getenv(config->private_key_env.c_str());
  if (value == nullptr || *value == '\0') {
    if (out_error != nullptr) {
      *out_error = "环境变量未设置私钥: " + config->private_key_env;
    }
    return false;
  }
  config->private_key = Trim(value);
  return true;
}

bool ParseMineToken(const std::string& text, MineToken* out_token) {
  if (out_token == nullptr) {
    return false;
  }
  const std::string symbol = Trim(text);
  if (symbol == "EIDOS") {
    *out_token = MineToken::kEidos;
    return true;
  }
  if (symbol == "POW") {
    *out_token = MineToken::kPow;
    return true;
  }
  return false;
}

bool IsValidAccountName(const std::string& name) {
  if (name.empty() || name.size() > 12U || name.back() == '.') {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= '1' && ch <= '5') || ch == '.';
  });
}

bool ValidateMinerConfig(const MinerConfig& config, std::string* out_error) {
  auto fail = [out_error](const std::string& message) {
    if (out_error != nullptr) {
      *out_error = message;
    }
    return false;
  };

  if (!IsValidAccountName(config.account)) {
    return fail("account 非法: '" + config.account + "'");
  }
  MineToken token = MineToken::kEidos;
  if (!ParseMineToken(config.mine_type, &token)) {
    return fail("mine_type 非法，必须为 <EIDOS|POW>: '" + config.mine_type + "'");
  }
  if (config.ledger != "eos" && config.ledger != "mock") {
    return fail("ledger 非法，必须为 <eos|mock>: '" + config.ledger + "'");
  }
  // mock 账本为本地演练模式，不需要真实私钥。
  if (config.ledger == "eos" && !IsValidWifPrivateKey(config.private_key)) {
    return fail("private_key 非法");
  }
  if (config.ledger == "eos" && config.endpoints.empty()) {
    return fail("endpoints 为空");
  }
  if (config.num_actions < 0) {
    return fail("num_actions 不能为负数");
  }

  const ControllerConfig& c = config.controller;
  if (c.min_batch <= 0 || c.max_batch < c.min_batch) {
    return fail("controller.min_batch/max_batch 非法");
  }
  if (!(c.target_rate > 0.0) || c.red_rate < c.target_rate) {
    return fail("controller.target_rate/red_rate 非法");
  }
  if (!(c.fast_decay >= 0.0 && c.fast_decay < 1.0) ||
      !(c.slow_decay >= 0.0 && c.slow_decay < 1.0)) {
    return fail("controller.fast_decay/slow_decay 必须位于 [0, 1)");
  }
  if (c.trend_threshold < 0.0) {
    return fail("controller.trend_threshold 不能为负数");
  }

  if (config.schedule.submit_interval_ms <= 0 ||
      config.schedule.retune_interval_ms <= 0 ||
      config.schedule.funding_wait_ms < 0) {
    return fail("schedule 节拍参数非法");
  }
  if (config.transaction.blocks_behind < 0 ||
      config.transaction.expire_seconds <= 0 ||
      config.transaction.cpu_ms_actions_per_ms <= 0 ||
      config.transaction.cpu_ms_base < 0) {
    return fail("transaction 参数非法");
  }
  return true;
}

}  // namespace eos_miner
