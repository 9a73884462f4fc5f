#include "ledger/eos_rpc_client.h"

#include <exception>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace eos_miner {

namespace {

std::size_t WriteToString(char* ptr, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  if (ptr == nullptr || userdata == nullptr) {
    return 0;
  }
  std::string* out = static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

void SetTextError(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

bool ReadNumberField(const JsonValue* root, const std::vector<std::string>& path,
                     double* out_value) {
  const auto number = JsonAsNumber(JsonFindPath(root, path));
  if (!number.has_value()) {
    return false;
  }
  *out_value = *number;
  return true;
}

std::string JoinPath(const std::vector<std::string>& path) {
  std::string out;
  for (const auto& part : path) {
    if (!out.empty()) {
      out.push_back('.');
    }
    out += part;
  }
  return out;
}

}  // namespace

EosHttpResponse CurlEosHttpTransport::Post(const std::string& url,
                                           const std::string& body) const {
  // 进程级初始化一次，后续请求复用。
  static const bool kCurlGlobalInit = []() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  }();

  EosHttpResponse out;
  if (!kCurlGlobalInit) {
    out.error = "curl_global_init 失败";
    return out;
  }

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    out.error = "curl_easy_init 失败";
    return out;
  }

  struct curl_slist* header_list = nullptr;
  header_list = curl_slist_append(header_list, "Content-Type: application/json");
  header_list = curl_slist_append(header_list, "Accept: application/json");

  std::string response_body;
  char curl_error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config_.connect_timeout_ms));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(config_.request_timeout_ms));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "eos-miner/0.1");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  const CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  out.status_code = static_cast<int>(status_code);
  out.body = std::move(response_body);
  if (code != CURLE_OK) {
    const std::string detailed = (curl_error[0] != '\0')
                                     ? std::string(curl_error)
                                     : std::string(curl_easy_strerror(code));
    out.error = "curl_easy_perform 失败: " + detailed;
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);
  return out;
}

EosRpcClient::EosRpcClient(std::string base_url,
                           std::unique_ptr<EosHttpTransport> transport)
    : base_url_(std::move(base_url)), transport_(std::move(transport)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
  if (transport_ == nullptr) {
    transport_ = std::make_unique<CurlEosHttpTransport>();
  }
}

bool EosRpcClient::ParseErrorBody(const std::string& body,
                                  LedgerError* out_error) {
  JsonValue root;
  if (!ParseJson(body, &root, nullptr)) {
    return false;
  }
  const JsonValue* error = JsonObjectField(&root, "error");
  const auto code = JsonAsNumber(JsonObjectField(error, "code"));
  if (!code.has_value()) {
    return false;
  }
  if (out_error != nullptr) {
    out_error->code = static_cast<std::int64_t>(*code);
    out_error->name = JsonAsString(JsonObjectField(error, "name")).value_or("");
    out_error->what = JsonAsString(JsonObjectField(error, "what")).value_or("");
  }
  return true;
}

bool EosRpcClient::Call(const std::string& path,
                        const std::string& body,
                        JsonValue* out_json,
                        LedgerError* out_error) const {
  const EosHttpResponse response = transport_->Post(base_url_ + path, body);
  if (!response.error.empty() && response.status_code == 0) {
    if (out_error != nullptr) {
      *out_error = LedgerError{0, "transport_error", response.error};
    }
    return false;
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    // 优先使用链端结构化错误；解析失败时退化为 HTTP 状态描述。
    LedgerError parsed;
    if (!ParseErrorBody(response.body, &parsed)) {
      parsed = LedgerError{response.status_code, "http_error",
                           "HTTP 状态异常: " +
                               std::to_string(response.status_code)};
    }
    if (out_error != nullptr) {
      *out_error = std::move(parsed);
    }
    return false;
  }

  std::string parse_error;
  if (!ParseJson(response.body, out_json, &parse_error)) {
    if (out_error != nullptr) {
      *out_error = LedgerError{0, "parse_error", path + " 响应解析失败: " +
                                                     parse_error};
    }
    return false;
  }
  return true;
}

bool EosRpcClient::GetInfo(ChainInfo* out_info, std::string* out_error) const {
  if (out_info == nullptr) {
    SetTextError("out_info 为空", out_error);
    return false;
  }
  JsonValue root;
  LedgerError error;
  if (!Call("/v1/chain/get_info", "{}", &root, &error)) {
    SetTextError(error.ToString(), out_error);
    return false;
  }
  const auto chain_id = JsonAsString(JsonObjectField(&root, "chain_id"));
  double head = 0.0;
  if (!chain_id.has_value() ||
      !ReadNumberField(&root, {"head_block_num"}, &head)) {
    SetTextError("get_info 缺少 chain_id/head_block_num", out_error);
    return false;
  }
  out_info->chain_id = *chain_id;
  out_info->head_block_num = static_cast<std::int64_t>(head);
  return true;
}

bool EosRpcClient::GetBlock(std::int64_t block_num, BlockRef* out_block,
                            std::string* out_error) const {
  if (out_block == nullptr) {
    SetTextError("out_block 为空", out_error);
    return false;
  }
  JsonValue root;
  LedgerError error;
  const std::string body =
      "{\"block_num_or_id\":" + std::to_string(block_num) + "}";
  if (!Call("/v1/chain/get_block", body, &root, &error)) {
    SetTextError(error.ToString(), out_error);
    return false;
  }
  double number = 0.0;
  double prefix = 0.0;
  const auto timestamp = JsonAsString(JsonObjectField(&root, "timestamp"));
  if (!ReadNumberField(&root, {"block_num"}, &number) ||
      !ReadNumberField(&root, {"ref_block_prefix"}, &prefix) ||
      !timestamp.has_value()) {
    SetTextError("get_block 缺少 block_num/ref_block_prefix/timestamp",
                 out_error);
    return false;
  }
  out_block->block_num = static_cast<std::int64_t>(number);
  out_block->ref_block_prefix = static_cast<std::uint32_t>(prefix);
  out_block->timestamp = *timestamp;
  return true;
}

bool EosRpcClient::GetAccountLimits(const std::string& account,
                                    AccountLimits* out_limits,
                                    std::string* out_error) const {
  if (out_limits == nullptr) {
    SetTextError("out_limits 为空", out_error);
    return false;
  }
  JsonValue root;
  LedgerError error;
  const std::string body = "{\"account_name\":" + JsonQuote(account) + "}";
  if (!Call("/v1/chain/get_account", body, &root, &error)) {
    SetTextError(error.ToString(), out_error);
    return false;
  }
  const std::vector<std::string> used_path{"cpu_limit", "used"};
  const std::vector<std::string> max_path{"cpu_limit", "max"};
  AccountLimits limits;
  if (!ReadNumberField(&root, used_path, &limits.used)) {
    SetTextError("get_account 缺少 " + JoinPath(used_path), out_error);
    return false;
  }
  if (!ReadNumberField(&root, max_path, &limits.max)) {
    SetTextError("get_account 缺少 " + JoinPath(max_path), out_error);
    return false;
  }
  *out_limits = limits;
  return true;
}

bool EosRpcClient::GetCurrencyBalance(const std::string& contract,
                                      const std::string& account,
                                      const std::string& symbol,
                                      double* out_balance,
                                      std::string* out_error) const {
  if (out_balance == nullptr) {
    SetTextError("out_balance 为空", out_error);
    return false;
  }
  JsonValue root;
  LedgerError error;
  const std::string body = "{\"code\":" + JsonQuote(contract) +
                           ",\"account\":" + JsonQuote(account) +
                           ",\"symbol\":" + JsonQuote(symbol) + "}";
  if (!Call("/v1/chain/get_currency_balance", body, &root, &error)) {
    SetTextError(error.ToString(), out_error);
    return false;
  }
  if (root.type != JsonType::kArray) {
    SetTextError("get_currency_balance 响应不是数组", out_error);
    return false;
  }
  if (root.array_value.empty()) {
    *out_balance = 0.0;
    return true;
  }
  // 形如 "1.2345 EOS"：取空格前的金额部分。
  const auto text = JsonAsString(JsonArrayAt(&root, 0));
  if (!text.has_value()) {
    SetTextError("get_currency_balance 元素不是字符串", out_error);
    return false;
  }
  const std::string amount = text->substr(0, text->find(' '));
  try {
    *out_balance = std::stod(amount);
  } catch (const std::exception&) {
    SetTextError("余额解析失败: " + *text, out_error);
    return false;
  }
  return true;
}

bool EosRpcClient::PushTransaction(const std::string& signature,
                                   const std::string& packed_trx_hex,
                                   SubmitReceipt* out_receipt,
                                   LedgerError* out_error) const {
  JsonValue root;
  const std::string body =
      "{\"signatures\":[" + JsonQuote(signature) + "]," +
      "\"compression\":\"none\"," +
      "\"packed_context_free_data\":\"\"," +
      "\"packed_trx\":" + JsonQuote(packed_trx_hex) + "}";
  if (!Call("/v1/chain/push_transaction", body, &root, out_error)) {
    return false;
  }
  if (out_receipt != nullptr) {
    SubmitReceipt receipt;
    receipt.transaction_id =
        JsonAsString(JsonObjectField(&root, "transaction_id")).value_or("");
    double value = 0.0;
    if (ReadNumberField(&root, {"processed", "block_num"}, &value)) {
      receipt.block_num = static_cast<std::int64_t>(value);
    }
    if (ReadNumberField(&root, {"processed", "receipt", "cpu_usage_us"},
                        &value)) {
      receipt.cpu_usage_us = static_cast<std::int64_t>(value);
    }
    *out_receipt = std::move(receipt);
  }
  return true;
}

}  // namespace eos_miner
