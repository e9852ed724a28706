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
#include "include/tapectl.h"
#include "tape/drive_info.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace tapectl {

static constexpr uint64_t kTiB = 1024ULL * 1024 * 1024 * 1024;

std::string TrimField(const uint8_t* field, std::size_t len)
{
  std::string value;

  for (std::size_t i = 0; i < len; i++) {
    if (field[i] == 0) { break; }
    value.push_back(std::isprint(field[i]) ? static_cast<char>(field[i]) : ' ');
  }

  std::size_t begin = value.find_first_not_of(' ');
  if (begin == std::string::npos) { return std::string(); }
  std::size_t end = value.find_last_not_of(' ');
  return value.substr(begin, end - begin + 1);
}

std::optional<InquiryData> ParseInquiry(const std::vector<uint8_t>& data)
{
  if (data.size() < kInquiryLength) { return std::nullopt; }

  InquiryData inquiry;
  inquiry.peripheral_type = data[0] & 0x1f;
  inquiry.vendor = TrimField(&data[8], 8);
  inquiry.product = TrimField(&data[16], 16);
  inquiry.revision = TrimField(&data[32], 4);

  return inquiry;
}

std::optional<std::string> ParseUnitSerialVpd(const std::vector<uint8_t>& data)
{
  if (data.size() < 4 || data[1] != kVpdUnitSerialNumber) {
    return std::nullopt;
  }

  std::size_t length = std::min<std::size_t>(data[3], data.size() - 4);
  return TrimField(&data[4], length);
}

int LtoGeneration(const std::string& product)
{
  std::string upper(product);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  for (int generation = 9; generation >= 5; generation--) {
    std::string hh = "HH" + std::to_string(generation);
    std::string lto = "LTO-" + std::to_string(generation);
    if (upper.find(hh) != std::string::npos
        || upper.find(lto) != std::string::npos) {
      return generation;
    }
  }

  static const std::regex hh_generation("HH([0-9]+)");
  std::smatch match;
  if (std::regex_search(upper, match, hh_generation)) {
    const std::string digits = match[1].str();
    if (digits.size() <= 2) { return std::stoi(digits); }
  }
  return 0;
}

uint64_t LtoNativeCapacity(int generation)
{
  switch (generation) {
    case 5:
      return kTiB * 3 / 2;
    case 6:
      return kTiB * 5 / 2;
    case 7:
      return kTiB * 6;
    case 8:
      return kTiB * 12;
    case 9:
      return kTiB * 18;
    default:
      return 0;
  }
}

}  // namespace tapectl
