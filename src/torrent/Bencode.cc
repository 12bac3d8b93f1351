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

#include <charconv>
#include <libcadence/common/error.hpp>
#include <libcadence/torrent/bencode.hpp>

namespace libcadence::torrent::bencode
{

namespace
{

constexpr int MaxNestingDepth = 64;

class Parser
{
public:
  Parser(std::span<const TorrentByte> data, std::string_view capture_key)
      : m_data(data), m_captureKey(capture_key)
  {
  }

  auto parse_document() -> Value
  {
    Value root = parse_value(0);
    if (m_pos != m_data.size())
      fail("trailing data after the top level value");
    return root;
  }

  [[nodiscard]] auto captured() const -> std::optional<std::span<const TorrentByte>>
  {
    return m_captured;
  }

private:
  std::span<const TorrentByte>                m_data;
  std::size_t                                 m_pos = 0;
  std::string_view                            m_captureKey;
  std::optional<std::span<const TorrentByte>> m_captured;

  [[noreturn]] void fail(std::string_view what) const
  {
    throw Error(ErrorKind::Torrent, std::format("Malformed bencode at byte {}: {}", m_pos, what));
  }

  [[nodiscard]] auto peek() const -> char
  {
    if (m_pos >= m_data.size())
      fail("unexpected end of data");
    return static_cast<char>(m_data[m_pos]);
  }

  void expect(char c)
  {
    if (peek() != c)
      fail(std::format("expected '{}'", c));
    ++m_pos;
  }

  auto parse_number(char terminator) -> Integer
  {
    const auto  begin = m_pos;
    std::size_t end   = begin;
    while (end < m_data.size() && static_cast<char>(m_data[end]) != terminator)
      ++end;
    if (end >= m_data.size())
      fail("unterminated number");

    std::string_view digits(reinterpret_cast<const char*>(m_data.data()) + begin, end - begin);
    if (digits.empty() || digits == "-" || digits == "-0" ||
        (digits.size() > 1 && digits.front() == '0') || digits.starts_with("-0"))
      fail(std::format("invalid number '{}'", digits));

    Integer value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
      fail(std::format("invalid number '{}'", digits));

    m_pos = end + 1;
    return value;
  }

  auto parse_string() -> String
  {
    const auto length = parse_number(':');
    if (length < 0 || static_cast<std::size_t>(length) > m_data.size() - m_pos)
      fail("string length out of range");

    String out(reinterpret_cast<const char*>(m_data.data()) + m_pos,
               static_cast<std::size_t>(length));
    m_pos += static_cast<std::size_t>(length);
    return out;
  }

  auto parse_value(int depth) -> Value
  {
    if (depth > MaxNestingDepth)
      fail("nesting too deep");

    const char c = peek();
    if (c == 'i')
    {
      ++m_pos;
      return parse_number('e');
    }
    if (c >= '0' && c <= '9')
      return parse_string();
    if (c == 'l')
    {
      ++m_pos;
      List list;
      while (peek() != 'e')
        list.push_back(parse_value(depth + 1));
      expect('e');
      return list;
    }
    if (c == 'd')
    {
      ++m_pos;
      Dict dict;
      while (peek() != 'e')
      {
        if (peek() < '0' || peek() > '9')
          fail("dictionary key is not a string");
        auto key = parse_string();

        const auto value_begin = m_pos;
        auto       value       = parse_value(depth + 1);
        if (depth == 0 && !m_captureKey.empty() && key == m_captureKey)
          m_captured = m_data.subspan(value_begin, m_pos - value_begin);

        dict.insert_or_assign(std::move(key), std::move(value));
      }
      expect('e');
      return dict;
    }
    fail(std::format("unexpected character '{}'", c));
  }
};

void encode_into(const Value& value, std::string& out)
{
  if (auto i = value.as_int())
  {
    out += std::format("i{}e", *i);
  }
  else if (auto s = value.as_string())
  {
    out += std::format("{}:", s->size());
    out += *s;
  }
  else if (auto l = value.as_list())
  {
    out += 'l';
    for (const auto& item : *l)
      encode_into(item, out);
    out += 'e';
  }
  else if (auto d = value.as_dict())
  {
    out += 'd';
    for (const auto& [key, item] : *d)
    {
      out += std::format("{}:", key.size());
      out += key;
      encode_into(item, out);
    }
    out += 'e';
  }
}

} // namespace

auto Value::find(const std::string& key) const -> const Value*
{
  const auto* dict = as_dict();
  if (!dict)
    return nullptr;
  auto it = dict->find(key);
  return it == dict->end() ? nullptr : &it->second;
}

auto decode(std::span<const TorrentByte> data) -> Value
{
  Parser parser(data, {});
  return parser.parse_document();
}

auto raw_value(std::span<const TorrentByte> data, std::string_view key)
  -> std::optional<std::span<const TorrentByte>>
{
  Parser parser(data, key);
  parser.parse_document();
  return parser.captured();
}

auto encode(const Value& value) -> std::string
{
  std::string out;
  encode_into(value, out);
  return out;
}

} // namespace libcadence::torrent::bencode
