#pragma once
/********************************************************************************
 *                               Cadence Project                                *
 *                         Lossless Source Verification                         *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/types.hpp>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace libcadence::torrent::bencode
{

struct Value;

using Integer = i64;
using String  = std::string; // byte strings, not necessarily UTF-8
using List    = std::vector<Value>;
using Dict    = std::map<std::string, Value>;

struct Value
{
  std::variant<Integer, String, List, Dict> data;

  Value() : data(Integer{0}) {}
  Value(Integer i) : data(i) {}
  Value(int i) : data(Integer{i}) {}
  Value(String s) : data(std::move(s)) {}
  Value(const char* s) : data(String{s}) {}
  Value(List l) : data(std::move(l)) {}
  Value(Dict d) : data(std::move(d)) {}

  [[nodiscard]] auto is_int() const -> bool { return std::holds_alternative<Integer>(data); }
  [[nodiscard]] auto is_string() const -> bool { return std::holds_alternative<String>(data); }
  [[nodiscard]] auto is_list() const -> bool { return std::holds_alternative<List>(data); }
  [[nodiscard]] auto is_dict() const -> bool { return std::holds_alternative<Dict>(data); }

  [[nodiscard]] auto as_int() const -> const Integer* { return std::get_if<Integer>(&data); }
  [[nodiscard]] auto as_string() const -> const String* { return std::get_if<String>(&data); }
  [[nodiscard]] auto as_list() const -> const List* { return std::get_if<List>(&data); }
  [[nodiscard]] auto as_dict() const -> const Dict* { return std::get_if<Dict>(&data); }

  // Dictionary lookup, nullptr when this is not a dictionary or the key is absent
  [[nodiscard]] auto find(const std::string& key) const -> const Value*;
};

/**
 * Decodes one complete bencoded value. Trailing bytes, truncated input,
 * malformed integers or string lengths and excessive nesting throw
 * libcadence::Error (Torrent).
 */
CADENCE_API auto decode(std::span<const TorrentByte> data) -> Value;

// Raw encoded bytes of the value stored under `key` in the top level dictionary
CADENCE_API auto raw_value(std::span<const TorrentByte> data, std::string_view key)
  -> std::optional<std::span<const TorrentByte>>;

// Canonical encoding (dictionary keys in sorted order)
CADENCE_API auto encode(const Value& value) -> std::string;

} // namespace libcadence::torrent::bencode
