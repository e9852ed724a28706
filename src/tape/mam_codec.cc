/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2025-2026 Bareos GmbH & Co. KG

   This program is Free Software; you can redistribute it and/or
   modify it under the terms of version three of the GNU Affero General Public
   License as published by the Free Software Foundation and included
   in the file LICENSE.

   This program is distributed in the hope that it will be useful, but
   WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
   Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
   02110-1301, USA.
*/
/**
 * @file
 * Adaptive decoding of MAM attribute values
 */

#include "include/tapectl.h"
#include "tape/mam_codec.h"
#include "lib/scsi_cdb.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>

namespace tapectl {

static constexpr int debuglevel{200};

static constexpr std::array<std::size_t, 5> kHeaderSkipOffsets{0, 2, 4, 6, 8};
static constexpr std::array<TextEncoding, 3> kEncodings{
    TextEncoding::kAscii, TextEncoding::kUtf8, TextEncoding::kLatin1};

static const char* const kKnownEmptySerials[] = {
    "00028000080040000000000000", "00000000000000000000000000",
    "0002800008004000", "00000000"};

const char* TextEncodingToString(TextEncoding encoding)
{
  switch (encoding) {
    case TextEncoding::kAscii:
      return "ascii";
    case TextEncoding::kUtf8:
      return "utf-8";
    case TextEncoding::kLatin1:
      return "latin-1";
  }
  return "unknown";
}

const char* DecodeModeToString(DecodeMode mode)
{
  switch (mode) {
    case DecodeMode::kAligned:
      return "aligned";
    case DecodeMode::kScan:
      return "scan";
    case DecodeMode::kUnparsed:
      return "unparsed";
  }
  return "unknown";
}

std::string DecodeStrategy::ToString() const
{
  if (mode == DecodeMode::kUnparsed) { return "unparsed"; }
  return fmt::format("offset {} {} ({})", offset, TextEncodingToString(encoding),
                     DecodeModeToString(mode));
}

static inline bool IsContinuation(uint8_t c) { return (c & 0xc0) == 0x80; }

/*
 * Decode one UTF-8 sequence at data[i]. Returns the sequence length or 0
 * if the byte at data[i] does not start a valid sequence.
 */
static std::size_t DecodeUtf8Sequence(const uint8_t* data,
                                      std::size_t len,
                                      std::size_t i,
                                      char32_t& cp)
{
  uint8_t c = data[i];
  std::size_t need;
  uint8_t lo = 0x80, hi = 0xbf;

  if (c < 0x80) {
    cp = c;
    return 1;
  } else if (c >= 0xc2 && c <= 0xdf) {
    need = 1;
    cp = c & 0x1f;
  } else if (c >= 0xe0 && c <= 0xef) {
    need = 2;
    cp = c & 0x0f;
    if (c == 0xe0) { lo = 0xa0; }
    if (c == 0xed) { hi = 0x9f; }
  } else if (c >= 0xf0 && c <= 0xf4) {
    need = 3;
    cp = c & 0x07;
    if (c == 0xf0) { lo = 0x90; }
    if (c == 0xf4) { hi = 0x8f; }
  } else {
    return 0;
  }

  if (i + need >= len) { return 0; }
  for (std::size_t k = 1; k <= need; k++) {
    uint8_t cc = data[i + k];
    if (k == 1 && (cc < lo || cc > hi)) { return 0; }
    if (!IsContinuation(cc)) { return 0; }
    cp = (cp << 6) | (cc & 0x3f);
  }
  return need + 1;
}

std::u32string DecodeText(const uint8_t* data,
                          std::size_t len,
                          TextEncoding encoding)
{
  std::u32string text;

  text.reserve(len);
  switch (encoding) {
    case TextEncoding::kAscii:
      for (std::size_t i = 0; i < len; i++) {
        if (data[i] < 0x80) { text.push_back(data[i]); }
      }
      break;
    case TextEncoding::kUtf8: {
      std::size_t i = 0;
      while (i < len) {
        char32_t cp = 0;
        std::size_t n = DecodeUtf8Sequence(data, len, i, cp);
        if (n == 0) {
          i++;
          continue;
        }
        text.push_back(cp);
        i += n;
      }
      break;
    }
    case TextEncoding::kLatin1:
      for (std::size_t i = 0; i < len; i++) { text.push_back(data[i]); }
      break;
  }
  return text;
}

static inline bool IsIdentifierChar(char32_t c)
{
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
         || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

static inline std::size_t RunLength(const std::u32string& text, std::size_t pos)
{
  std::size_t end = pos;
  while (end < text.size() && IsIdentifierChar(text[end])) { end++; }
  return end - pos;
}

/* Longest identifier run of at least kMinimumRunLength, first one on ties */
static std::optional<std::string> LongestRun(const std::u32string& text)
{
  std::size_t best_pos = 0, best_len = 0;
  std::size_t pos = 0;

  while (pos < text.size()) {
    std::size_t run = RunLength(text, pos);
    if (run == 0) {
      pos++;
      continue;
    }
    if (run > best_len) {
      best_pos = pos;
      best_len = run;
    }
    pos += run;
  }

  if (best_len < kMinimumRunLength) { return std::nullopt; }

  std::string value;
  value.reserve(best_len);
  for (std::size_t i = best_pos; i < best_pos + best_len; i++) {
    value.push_back(static_cast<char>(text[i]));
  }
  return value;
}

std::string HexEncode(const std::vector<uint8_t>& data, bool upper)
{
  static const char lower_digits[] = "0123456789abcdef";
  static const char upper_digits[] = "0123456789ABCDEF";
  const char* digits = upper ? upper_digits : lower_digits;
  std::string hex;

  hex.reserve(data.size() * 2);
  for (uint8_t c : data) {
    hex.push_back(digits[c >> 4]);
    hex.push_back(digits[c & 0x0f]);
  }
  return hex;
}

MamAttributeRecord Decode(const std::vector<uint8_t>& raw,
                          uint16_t attribute_id,
                          uint8_t partition)
{
  MamAttributeRecord record;

  record.attribute_id = attribute_id;
  record.partition = partition;
  record.raw = raw;
  record.raw_hex = HexEncode(raw);

  // Header skip offsets, the text must start with a run.
  for (std::size_t offset : kHeaderSkipOffsets) {
    if (offset >= raw.size()) { break; }
    for (TextEncoding encoding : kEncodings) {
      std::u32string text
          = DecodeText(raw.data() + offset, raw.size() - offset, encoding);
      if (RunLength(text, 0) < kMinimumRunLength) { continue; }

      std::optional<std::string> value = LongestRun(text);
      if (!value) { continue; }

      record.parsed = true;
      record.value = *value;
      record.strategy = DecodeStrategy{offset, encoding, DecodeMode::kAligned};
      Dmsg3(debuglevel, "attribute 0x%04x decoded as \"%s\" by %s\n",
            attribute_id, record.value.c_str(),
            record.strategy.ToString().c_str());
      return record;
    }
  }

  // A run anywhere in the payload.
  for (TextEncoding encoding : kEncodings) {
    std::optional<std::string> value
        = LongestRun(DecodeText(raw.data(), raw.size(), encoding));
    if (!value) { continue; }

    record.parsed = true;
    record.value = *value;
    record.strategy = DecodeStrategy{0, encoding, DecodeMode::kScan};
    Dmsg3(debuglevel, "attribute 0x%04x decoded as \"%s\" by %s\n",
          attribute_id, record.value.c_str(),
          record.strategy.ToString().c_str());
    return record;
  }

  record.strategy = DecodeStrategy{};
  Dmsg2(debuglevel, "attribute 0x%04x unparsed, raw %s\n", attribute_id,
        record.raw_hex.c_str());
  return record;
}

bool IsKnownEmptySerial(const std::vector<uint8_t>& raw)
{
  std::string hex = HexEncode(raw);

  for (const char* pattern : kKnownEmptySerials) {
    if (hex == pattern) { return true; }
  }
  return false;
}

std::string SerialFromRecord(const MamAttributeRecord& record)
{
  if (IsKnownEmptySerial(record.raw)) { return std::string(); }
  if (record.parsed) { return record.value; }
  if (record.raw.size() <= 4) { return std::string(); }
  if (record.raw.size() <= 16) { return HexEncode(record.raw, true); }
  return std::string();
}

std::optional<uint64_t> RawAttribute::NumericValue() const
{
  if (format != MAM_FORMAT_BINARY || value.empty() || value.size() > 8) {
    return std::nullopt;
  }

  uint64_t number = 0;
  for (uint8_t c : value) { number = (number << 8) | c; }
  return number;
}

std::optional<std::vector<RawAttribute>> ParseAttributeList(
    const std::vector<uint8_t>& data)
{
  std::vector<RawAttribute> attributes;

  if (data.size() < 4) { return std::nullopt; }

  std::size_t available = Get4ByteValue(data.data());
  bool truncated = available + 4 > data.size();
  std::size_t end = truncated ? data.size() : available + 4;
  std::size_t pos = 4;

  while (pos < end) {
    if (pos + 5 > end) {
      if (truncated) { break; }
      return std::nullopt;
    }

    RawAttribute attribute;
    attribute.id = static_cast<uint16_t>(Get2ByteValue(&data[pos]));
    attribute.read_only = (data[pos + 2] & 0x80) != 0;
    attribute.format = data[pos + 2] & 0x03;
    std::size_t length = Get2ByteValue(&data[pos + 3]);

    if (pos + 5 + length > end) {
      if (truncated) { break; }
      return std::nullopt;
    }

    attribute.value.assign(data.begin() + pos + 5,
                           data.begin() + pos + 5 + length);
    attributes.push_back(std::move(attribute));
    pos += 5 + length;
  }

  return attributes;
}

std::vector<uint8_t> BuildAttributeList(const RawAttribute& attribute)
{
  std::size_t entry_length = 5 + attribute.value.size();
  std::vector<uint8_t> list(4 + entry_length, 0);

  Set4ByteValue(&list[0], static_cast<uint32_t>(entry_length));
  Set2ByteValue(&list[4], attribute.id);
  list[6] = attribute.format & 0x03;
  Set2ByteValue(&list[7], static_cast<uint32_t>(attribute.value.size()));
  std::copy(attribute.value.begin(), attribute.value.end(), list.begin() + 9);

  return list;
}

}  // namespace tapectl
