// SPDX-License-Identifier: MIT
// Minimal JSON writer implementation

#include <yapb/snapshot/json_writer.h>

#include <cstdio>

namespace yapb::json {

std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 8);

  for (const char c : s) {
    switch (c) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b"; break;
      case '\f': result += "\\f"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          result += buf;
        } else {
          result += c;
        }
        break;
    }
  }

  return result;
}

void ObjectBuilder::maybeComma() {
  if (!first_) {
    ss_ << ", ";
  }
  first_ = false;
}

void ObjectBuilder::addString(const std::string& key, const std::string& value) {
  maybeComma();
  ss_ << "\"" << escape(key) << "\": \"" << escape(value) << "\"";
}

void ObjectBuilder::addOptionalString(const std::string& key, const std::optional<std::string>& value) {
  if (value) {
    addString(key, *value);
  }
}

void ObjectBuilder::addUnsigned(const std::string& key, unsigned long long value) {
  maybeComma();
  ss_ << "\"" << escape(key) << "\": " << value;
}

void ObjectBuilder::addRaw(const std::string& key, const std::string& json) {
  maybeComma();
  ss_ << "\"" << escape(key) << "\": " << json;
}

std::string ObjectBuilder::build() const {
  return "{" + ss_.str() + "}";
}

void ArrayBuilder::addRaw(const std::string& json) {
  if (!first_) {
    ss_ << ", ";
  }
  first_ = false;
  ss_ << json;
}

std::string ArrayBuilder::build() const {
  return "[" + ss_.str() + "]";
}

}  // namespace yapb::json
