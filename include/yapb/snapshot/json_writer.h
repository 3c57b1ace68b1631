// SPDX-License-Identifier: MIT
// Minimal JSON writer for demo snapshots

#pragma once

#include <optional>
#include <sstream>
#include <string>

namespace yapb::json {

/// Escape a string for JSON output. Bytes >= 0x80 pass through, so UTF-8
/// glyphs stay readable.
std::string escape(const std::string& s);

/// JSON object builder.
class ObjectBuilder {
public:
  void addString(const std::string& key, const std::string& value);

  /// Omitted if nullopt.
  void addOptionalString(const std::string& key, const std::optional<std::string>& value);

  void addUnsigned(const std::string& key, unsigned long long value);

  /// Add an already-serialized JSON value (object, array).
  void addRaw(const std::string& key, const std::string& json);

  std::string build() const;

private:
  std::ostringstream ss_;
  bool first_ = true;

  void maybeComma();
};

/// JSON array builder.
class ArrayBuilder {
public:
  void addRaw(const std::string& json);

  std::string build() const;

private:
  std::ostringstream ss_;
  bool first_ = true;
};

}  // namespace yapb::json
