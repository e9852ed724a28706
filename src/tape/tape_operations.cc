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
#include "tape/tape_operations.h"
#include "lib/berrno.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cstdio>
#include <ctime>
#include <exception>

namespace tapectl {

static constexpr int debuglevel{50};

FileLabelMappingStore::FileLabelMappingStore(std::string filename)
    : filename_(std::move(filename))
{
}

bool FileLabelMappingStore::UpdateLabelMapping(const std::string& drive,
                                               const std::string& label,
                                               const std::string& serial,
                                               std::string& error)
{
  std::lock_guard<std::mutex> lg(mutex_);

  FILE* fp = fopen(filename_.c_str(), "a");
  if (!fp) {
    BErrNo be;
    error = fmt::format("cannot open {}: {}", filename_, be.bstrerror());
    return false;
  }

  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::string line = fmt::format("{:%Y-%m-%d %H:%M:%S} {} {} {}\n",
                                 fmt::localtime(now), drive, label,
                                 serial.empty() ? "-" : serial);

  bool ok = fputs(line.c_str(), fp) >= 0;
  if (fclose(fp) != 0) { ok = false; }
  if (!ok) {
    BErrNo be;
    error = fmt::format("cannot write {}: {}", filename_, be.bstrerror());
  }
  return ok;
}

void MessageNotifier::ReportCriticalCondition(const std::string& source,
                                              const std::string& message)
{
  Emsg2(M_ALERT, 0, "%s: %s\n", source.c_str(), message.c_str());
}

std::vector<std::string> FlowResult::Warnings() const
{
  std::vector<std::string> warnings;

  for (const FlowStep& step : steps) {
    if (step.warning) { warnings.push_back(step.name + ": " + step.message); }
  }
  return warnings;
}

std::string GenerateVolumeLabel(const std::string& format,
                                std::chrono::system_clock::time_point now)
{
  std::tm tm = fmt::localtime(std::chrono::system_clock::to_time_t(now));

  if (!format.empty()) {
    try {
      return fmt::format(fmt::runtime("{:" + format + "}"), tm);
    } catch (const fmt::format_error& e) {
      Emsg2(M_WARNING, 0, "invalid label format \"%s\": %s\n", format.c_str(),
            e.what());
    }
  }
  return fmt::format(fmt::runtime(std::string("{:") + kDefaultLabelFormat + "}"),
                     tm);
}

TapeOperations::TapeOperations(LtfsTools& ltfs,
                               LabelMappingStore* store,
                               CriticalNotifier* notifier)
    : ltfs_(ltfs), store_(store), notifier_(notifier)
{
}

bool TapeOperations::RunStep(FlowResult& flow,
                             const char* name,
                             const std::string& message,
                             const ProgramResult& result)
{
  FlowStep step;

  step.name = name;
  step.success = result.success();
  step.message = step.success
                     ? message
                     : fmt::format("{}: {}", message,
                                   DescribeProgramResult(result));
  step.result = result;
  flow.steps.push_back(step);

  Dmsg3(debuglevel, "%s step %s: %s\n", name,
        step.success ? "succeeded" : "failed", step.message.c_str());

  if (result.timed_out && notifier_) {
    notifier_->ReportCriticalCondition(
        ltfs_.options().drive_address,
        fmt::format("{} did not finish in time and was killed", name));
  }
  return step.success;
}

FlowResult TapeOperations::Mount(const MountOptions& options)
{
  FlowResult flow;
  const LtfsOptions& ltfs = ltfs_.options();

  if (!RunStep(flow, "load", "load cartridge", ltfs_.Load())) {
    flow.error = "load failed";
    return flow;
  }

  if (!RunStep(flow, "assign", fmt::format("assign to {}:", ltfs.drive_letter),
               ltfs_.Assign())) {
    flow.error = "assign failed";
    return flow;
  }

  if (options.format) {
    flow.label = options.label.empty()
                     ? GenerateVolumeLabel(options.label_format)
                     : options.label;

    if (!RunStep(flow, "format", fmt::format("format as {}", flow.label),
                 ltfs_.Format(flow.label, options.serial))) {
      flow.error = "format failed";
      return flow;
    }

    if (store_) {
      FlowStep step;
      std::string error;
      step.name = "label mapping";
      try {
        step.success = store_->UpdateLabelMapping(
            ltfs.drive_address, flow.label, options.serial, error);
      } catch (const std::exception& e) {
        step.success = false;
        error = e.what();
      }
      step.warning = !step.success;
      step.message = step.success ? "label mapping updated" : error;
      if (step.warning) {
        Emsg2(M_WARNING, 0, "label %s not recorded: %s\n", flow.label.c_str(),
              error.c_str());
      }
      flow.steps.push_back(step);
    }
  }

  flow.success = true;
  return flow;
}

FlowResult TapeOperations::Unmount()
{
  FlowResult flow;

  bool unassigned = RunStep(flow, "unassign",
                            fmt::format("unassign {}:", ltfs_.options().drive_letter),
                            ltfs_.Unassign());
  bool ejected = RunStep(flow, "eject", "eject cartridge", ltfs_.Eject());

  flow.success = unassigned && ejected;
  if (!flow.success) {
    flow.error = unassigned ? "eject failed"
                 : ejected  ? "unassign failed"
                            : "unassign and eject failed";
  }
  return flow;
}

}  // namespace tapectl
