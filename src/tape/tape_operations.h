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
 * Multi step tape flows (mount and unmount) over the LTFS tools and the
 * collaborators they report to.
 */

#ifndef TAPECTL_TAPE_TAPE_OPERATIONS_H_
#define TAPECTL_TAPE_TAPE_OPERATIONS_H_

#include "tape/ltfs_tools.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tapectl {

/* Durable record of which label was written to which cartridge */
class LabelMappingStore {
 public:
  virtual ~LabelMappingStore() = default;

  /* false and error set if the mapping could not be stored */
  virtual bool UpdateLabelMapping(const std::string& drive,
                                  const std::string& label,
                                  const std::string& serial,
                                  std::string& error)
      = 0;
};

/* Appends "time drive label serial" lines to a file */
class FileLabelMappingStore : public LabelMappingStore {
 public:
  explicit FileLabelMappingStore(std::string filename);

  bool UpdateLabelMapping(const std::string& drive,
                          const std::string& label,
                          const std::string& serial,
                          std::string& error) override;

 private:
  std::string filename_;
  std::mutex mutex_;
};

/* Fire and forget reporting of conditions that need an operator */
class CriticalNotifier {
 public:
  virtual ~CriticalNotifier() = default;
  virtual void ReportCriticalCondition(const std::string& source,
                                       const std::string& message)
      = 0;
};

/* Reports as M_ALERT message */
class MessageNotifier : public CriticalNotifier {
 public:
  void ReportCriticalCondition(const std::string& source,
                               const std::string& message) override;
};

struct FlowStep {
  std::string name;
  bool success{false};
  bool warning{false}; /**< failed, but does not fail the flow */
  std::string message;
  std::optional<ProgramResult> result;
};

struct FlowResult {
  bool success{false};
  std::string error;
  std::string label; /**< volume label written by mount */
  std::vector<FlowStep> steps;

  std::vector<std::string> Warnings() const;
};

static constexpr const char* kDefaultLabelFormat = "BK%Y%m%d_%H%M";

/*
 * Label from a strftime style format at time now. Falls back to
 * kDefaultLabelFormat if format is empty or invalid.
 */
std::string GenerateVolumeLabel(const std::string& format,
                                std::chrono::system_clock::time_point now
                                = std::chrono::system_clock::now());

struct MountOptions {
  bool format{true};
  std::string label; /**< generated from label_format if empty */
  std::string serial;
  std::string label_format{kDefaultLabelFormat};
};

class TapeOperations {
 public:
  /* store and notifier may be nullptr */
  TapeOperations(LtfsTools& ltfs,
                 LabelMappingStore* store,
                 CriticalNotifier* notifier);

  /*
   * load, assign and optionally format. The first failed step ends the
   * flow. A failed label mapping update after a successful format is
   * recorded as warning, the flow stays successful.
   */
  FlowResult Mount(const MountOptions& options);

  /* unassign and eject, both are attempted */
  FlowResult Unmount();

 private:
  bool RunStep(FlowResult& flow,
               const char* name,
               const std::string& message,
               const ProgramResult& result);

  LtfsTools& ltfs_;
  LabelMappingStore* store_;
  CriticalNotifier* notifier_;
};

}  // namespace tapectl

#endif  // TAPECTL_TAPE_TAPE_OPERATIONS_H_
