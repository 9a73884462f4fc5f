#include "core/json_utils.h"

#include <cctype>
#include <cstdio>
#include <exception>

namespace eos_miner {

namespace {

void AppendUtf8(unsigned int codepoint, std::string* out) {
  if (codepoint <= 0x7FU) {
    out->push_back(static_cast<char>(codepoint));
  } else if (codepoint <= 0x7FFU) {
    out->push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
    out->push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
  } else {
    out->push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
    out->push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
  }
}

int HexDigitValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// 递归下降解析器：一次解析一个完整文档，出错即停止并记录偏移量。
class JsonReader {
 public:
  explicit JsonReader(const std::string& text) : text_(text) {}

  bool ReadDocument(JsonValue* out_value, std::string* out_error) {
    SkipSpaces();
    if (!ReadValue(out_value, /*depth=*/0, out_error)) {
      return false;
    }
    SkipSpaces();
    if (pos_ != text_.size()) {
      return Error("JSON 尾部存在多余字符", out_error);
    }
    return true;
  }

 private:
  static constexpr int kMaxDepth = 64;

  bool ReadValue(JsonValue* out, int depth, std::string* out_error) {
    if (depth > kMaxDepth) {
      return Error("JSON 嵌套层级过深", out_error);
    }
    if (pos_ >= text_.size()) {
      return Error("JSON 意外结束", out_error);
    }
    switch (text_[pos_]) {
      case '{':
        return ReadObject(out, depth, out_error);
      case '[':
        return ReadArray(out, depth, out_error);
      case '"':
        out->type = JsonType::kString;
        return ReadString(&out->string_value, out_error);
      case 't':
      case 'f':
        out->type = JsonType::kBool;
        out->bool_value = text_[pos_] == 't';
        if (TakeWord(out->bool_value ? "true" : "false")) {
          return true;
        }
        return Error("JSON 布尔值解析失败", out_error);
      case 'n':
        out->type = JsonType::kNull;
        if (TakeWord("null")) {
          return true;
        }
        return Error("JSON null 解析失败", out_error);
      default:
        break;
    }
    out->type = JsonType::kNumber;
    return ReadNumber(&out->number_value, out_error);
  }

  bool ReadObject(JsonValue* out, int depth, std::string* out_error) {
    ++pos_;
    out->type = JsonType::kObject;
    out->object_value.clear();
    SkipSpaces();
    if (Take('}')) {
      return true;
    }
    while (true) {
      SkipSpaces();
      std::string key;
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return Error("JSON 对象键必须为字符串", out_error);
      }
      if (!ReadString(&key, out_error)) {
        return false;
      }
      SkipSpaces();
      if (!Take(':')) {
        return Error("JSON 对象缺少 ':'", out_error);
      }
      SkipSpaces();
      JsonValue member;
      if (!ReadValue(&member, depth + 1, out_error)) {
        return false;
      }
      out->object_value[std::move(key)] = std::move(member);
      SkipSpaces();
      if (Take('}')) {
        return true;
      }
      if (!Take(',')) {
        return Error("JSON 对象缺少 ',' 或 '}'", out_error);
      }
    }
  }

  bool ReadArray(JsonValue* out, int depth, std::string* out_error) {
    ++pos_;
    out->type = JsonType::kArray;
    out->array_value.clear();
    SkipSpaces();
    if (Take(']')) {
      return true;
    }
    while (true) {
      SkipSpaces();
      JsonValue item;
      if (!ReadValue(&item, depth + 1, out_error)) {
        return false;
      }
      out->array_value.push_back(std::move(item));
      SkipSpaces();
      if (Take(']')) {
        return true;
      }
      if (!Take(',')) {
        return Error("JSON 数组缺少 ',' 或 ']'", out_error);
      }
    }
  }

  bool ReadString(std::string* out, std::string* out_error) {
    ++pos_;
    out->clear();
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out->push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      switch (esc) {
        case '"':
        case '\\':
        case '/':
          out->push_back(esc);
          break;
        case 'b':
          out->push_back('\b');
          break;
        case 'f':
          out->push_back('\f');
          break;
        case 'n':
          out->push_back('\n');
          break;
        case 'r':
          out->push_back('\r');
          break;
        case 't':
          out->push_back('\t');
          break;
        case 'u': {
          if (pos_ + 4 > text_.size()) {
            return Error("JSON unicode 转义不完整", out_error);
          }
          unsigned int codepoint = 0;
          for (int i = 0; i < 4; ++i) {
            const int digit = HexDigitValue(text_[pos_++]);
            if (digit < 0) {
              return Error("JSON unicode 转义非法", out_error);
            }
            codepoint = (codepoint << 4U) | static_cast<unsigned int>(digit);
          }
          AppendUtf8(codepoint, out);
          break;
        }
        default:
          return Error("JSON 字符串转义字符非法", out_error);
      }
    }
    return Error("JSON 字符串缺少结束引号", out_error);
  }

  bool ReadNumber(double* out, std::string* out_error) {
    const std::size_t begin = pos_;
    Take('-');
    if (!TakeDigits()) {
      return Error("JSON 非法值起始字符", out_error);
    }
    if (Take('.') && !TakeDigits()) {
      return Error("JSON 小数解析失败", out_error);
    }
    if (Take('e') || Take('E')) {
      if (!Take('+')) {
        Take('-');
      }
      if (!TakeDigits()) {
        return Error("JSON 指数解析失败", out_error);
      }
    }
    try {
      *out = std::stod(text_.substr(begin, pos_ - begin));
    } catch (const std::exception&) {
      return Error("JSON 数字转换失败", out_error);
    }
    return true;
  }

  bool TakeDigits() {
    const std::size_t begin = pos_;
    while (pos_ < text_.size() &&
           std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    return pos_ > begin;
  }

  bool TakeWord(const std::string& word) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool Take(char ch) {
    if (pos_ < text_.size() && text_[pos_] == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  void SkipSpaces() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool Error(const std::string& message, std::string* out_error) const {
    if (out_error != nullptr) {
      *out_error = message + "，offset=" + std::to_string(pos_);
    }
    return false;
  }

  const std::string& text_;
  std::size_t pos_{0};
};

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  if (out_value == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_value 为空";
    }
    return false;
  }
  JsonReader reader(text);
  return reader.ReadDocument(out_value, out_error);
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  return it == value->object_value.end() ? nullptr : &it->second;
}

const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index) {
  if (value == nullptr || value->type != JsonType::kArray ||
      index >= value->array_value.size()) {
    return nullptr;
  }
  return &value->array_value[index];
}

const JsonValue* JsonFindPath(const JsonValue* value,
                              const std::vector<std::string>& object_path) {
  const JsonValue* cursor = value;
  for (const auto& key : object_path) {
    cursor = JsonObjectField(cursor, key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

std::optional<std::string> JsonAsString(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kString) {
    return value->string_value;
  }
  if (value->type == JsonType::kNumber) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value->number_value);
    return std::string(buffer);
  }
  return std::nullopt;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kNumber) {
    return value->number_value;
  }
  if (value->type == JsonType::kString && !value->string_value.empty()) {
    try {
      std::size_t consumed = 0;
      const double parsed = std::stod(value->string_value, &consumed);
      if (consumed == value->string_value.size()) {
        return parsed;
      }
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::string JsonQuote(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2U);
  out.push_back('"');
  for (const char ch : text) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out += buffer;
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  out.push_back('"');
  return out;
}

}  // namespace eos_miner
