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
 * Best effort decoding of Medium Auxiliary Memory attribute values.
 *
 * The byte layout of attribute values as returned by drives and vendor
 * tools is not documented well enough to be parsed exactly, so values
 * are decoded by an ordered chain of strategies and the raw bytes are
 * always kept.
 */

#ifndef TAPECTL_TAPE_MAM_CODEC_H_
#define TAPECTL_TAPE_MAM_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tapectl {

/* MAM attribute identifiers */
enum
{
  MAM_ATTR_REMAINING_CAPACITY = 0x0000,
  MAM_ATTR_MAXIMUM_CAPACITY = 0x0001,
  MAM_ATTR_LOAD_COUNT = 0x0003,
  MAM_ATTR_MEDIUM_MANUFACTURER = 0x0400,
  MAM_ATTR_MEDIUM_SERIAL_NUMBER = 0x0401,
  MAM_ATTR_MEDIUM_MANUFACTURE_DATE = 0x0406,
  MAM_ATTR_USER_MEDIUM_TEXT_LABEL = 0x0803,
  MAM_ATTR_BARCODE = 0x0806
};

/*
 * Attribute ids as used by the cartridge identity queries of ITDT
 * readattr. These are vendor tool ids, not SPC attribute ids.
 */
enum
{
  IDENTITY_ATTR_MANUFACTURER = 0x0001,
  IDENTITY_ATTR_SERIAL = 0x0002,
  IDENTITY_ATTR_BARCODE = 0x0009
};

enum class TextEncoding
{
  kAscii,
  kUtf8,
  kLatin1
};

const char* TextEncodingToString(TextEncoding encoding);

enum class DecodeMode
{
  kAligned,  /**< the run starts right after the skipped header */
  kScan,     /**< the run was found somewhere in the payload */
  kUnparsed  /**< nothing plausible, only raw_hex is valid */
};

const char* DecodeModeToString(DecodeMode mode);

struct DecodeStrategy {
  std::size_t offset{0};
  TextEncoding encoding{TextEncoding::kAscii};
  DecodeMode mode{DecodeMode::kUnparsed};

  std::string ToString() const;
};

struct MamAttributeRecord {
  uint16_t attribute_id{0};
  uint8_t partition{0};
  bool parsed{false};
  std::string value;
  DecodeStrategy strategy;
  std::vector<uint8_t> raw;
  std::string raw_hex; /**< lower case, always set */
};

/* Shortest identifier run taken as a value */
static constexpr std::size_t kMinimumRunLength = 3;

/*
 * Decode raw attribute bytes. Header skip offsets 0, 2, 4, 6, 8 are
 * tried with ASCII, UTF-8 and Latin-1, the first combination whose text
 * starts with an identifier run of at least kMinimumRunLength wins and
 * the longest run of that text is the value. Without such a combination
 * the whole payload is scanned per encoding. If that fails too the record
 * is returned unparsed, which is a valid outcome and not an error.
 */
MamAttributeRecord Decode(const std::vector<uint8_t>& raw,
                          uint16_t attribute_id = 0,
                          uint8_t partition = 0);

/* Text of raw under encoding, undecodable bytes are dropped */
std::u32string DecodeText(const uint8_t* data,
                          std::size_t len,
                          TextEncoding encoding);

std::string HexEncode(const std::vector<uint8_t>& data, bool upper = false);

/* Serial values drives report for cartridges without a set serial */
bool IsKnownEmptySerial(const std::vector<uint8_t>& raw);

/*
 * The cartridge serial for a decoded serial attribute. Empty for the
 * known empty patterns and for values too short to be a serial, the
 * upper case hex of the raw bytes for short binary values.
 */
std::string SerialFromRecord(const MamAttributeRecord& record);

/* One entry of a READ ATTRIBUTE parameter list */
struct RawAttribute {
  uint16_t id{0};
  uint8_t format{0}; /**< 0 binary, 1 ascii, 2 text */
  bool read_only{false};
  std::vector<uint8_t> value;

  /* big-endian value of binary attributes of at most 8 bytes */
  std::optional<uint64_t> NumericValue() const;
};

enum
{
  MAM_FORMAT_BINARY = 0x00,
  MAM_FORMAT_ASCII = 0x01,
  MAM_FORMAT_TEXT = 0x02
};

/*
 * Parse a READ ATTRIBUTE (service action ATTRIBUTE VALUES) response.
 * Returns std::nullopt if the header or an entry is truncated.
 */
std::optional<std::vector<RawAttribute>> ParseAttributeList(
    const std::vector<uint8_t>& data);

/* Build a WRITE ATTRIBUTE parameter list holding one attribute */
std::vector<uint8_t> BuildAttributeList(const RawAttribute& attribute);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_MAM_CODEC_H_
