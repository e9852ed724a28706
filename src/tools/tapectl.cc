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
 * Command line front end for tape drive control, presence monitoring
 * and the vendor tape tools
 */

#include "include/tapectl.h"
#include "lib/cli.h"
#include "lib/scsi_lli.h"
#include "lib/scsi_tapealert.h"
#include "lib/signal.h"
#include "tape/cartridge_identity.h"
#include "tape/command_dispatch.h"
#include "tape/device_enumerator.h"
#include "tape/device_monitor.h"
#include "tape/drive_info.h"
#include "tape/itdt_tool.h"
#include "tape/ltfs_tools.h"
#include "tape/process_supervisor.h"
#include "tape/tape_config.h"
#include "tape/tape_drive.h"
#include "tape/tape_operations.h"

#include <fmt/format.h>

#include <chrono>
#include <clocale>
#include <memory>
#include <stdexcept>

using namespace tapectl;

static constexpr int debuglevel{50};

namespace {

/* Everything needed to talk to the configured drive over SCSI */
class ScsiSession {
 public:
  explicit ScsiSession(const TapeConfig& config)
      : transport_(CreatePlatformTransport()), dispatcher_(*transport_)
  {
    handle_ = transport_->Open(config.device);
    if (handle_) {
      drive_ = std::make_unique<TapeDrive>(dispatcher_, handle_, config.retry,
                                           config.Timeouts());
    }
  }
  ~ScsiSession()
  {
    if (handle_) { transport_->Close(handle_); }
  }

  TapeDrive* drive() { return drive_.get(); }

 private:
  std::unique_ptr<ScsiTransport> transport_;
  CommandDispatcher dispatcher_;
  std::shared_ptr<DeviceHandle> handle_;
  std::unique_ptr<TapeDrive> drive_;
};

bool ReportDriveResult(TapeDrive& drive, bool ok, const char* what)
{
  if (ok) {
    fmt::print("{}: {} ok\n", drive.identity(), what);
  } else {
    fmt::print(stderr, "{}: {} failed: {}\n", drive.identity(), what,
               drive.errmsg());
  }
  return ok;
}

bool ReportProgramResult(const ProgramResult& result, const char* what)
{
  if (verbose && !result.std_out.empty()) { fmt::print("{}", result.std_out); }
  if (result.success()) {
    fmt::print("{} ok\n", what);
    return true;
  }
  fmt::print(stderr, "{} failed: {}\n", what, DescribeProgramResult(result));
  return false;
}

void PrintFlow(const char* name, const FlowResult& flow)
{
  for (const FlowStep& step : flow.steps) {
    fmt::print("  {:<16} {}{}\n", step.name,
               step.success ? "ok" : (step.warning ? "warning" : "failed"),
               step.message.empty() ? "" : ": " + step.message);
  }
  if (flow.success) {
    fmt::print("{} ok{}\n", name,
               flow.label.empty() ? "" : ", label " + flow.label);
  } else {
    fmt::print(stderr, "{} failed: {}\n", name, flow.error);
  }
}

bool ListDevices()
{
  std::optional<PresenceSnapshot> snapshot = EnumeratePlatformTapeDevices();
  if (!snapshot) {
    fmt::print(stderr, "tape device enumeration failed\n");
    return false;
  }
  for (const TapeDeviceInfo& device : *snapshot) {
    fmt::print("{:<16} {:<8} {:<16} {}\n", device.identity, device.vendor,
               device.model, device.serial);
  }
  if (snapshot->empty()) { fmt::print("no tape devices found\n"); }
  return true;
}

bool MonitorDevices(const TapeConfig& config, int seconds)
{
  DevicePresenceMonitor monitor(EnumeratePlatformTapeDevices,
                                config.monitor_interval);

  monitor.AddListener([](const DeviceEvent& event) {
    fmt::print("{} {} {} {}\n", PresenceChangeToString(event.change),
               event.device.identity, event.device.vendor,
               event.device.model);
  });

  if (!monitor.Start()) { return false; }
  Dmsg1(debuglevel, "monitoring tape devices every %lld s\n",
        static_cast<long long>(config.monitor_interval.count()));

  InitTerminationSignals();
  std::chrono::milliseconds duration = std::chrono::seconds(seconds);
  if (seconds <= 0) { duration = std::chrono::milliseconds(-1); }
  if (WaitForTermination(duration)) {
    Dmsg1(debuglevel, "stopping device monitor on signal %d\n",
          TerminationSignal());
  }
  monitor.Stop();

  int failed = monitor.FailedTicks();
  if (failed) { fmt::print(stderr, "{} enumerations failed\n", failed); }
  return true;
}

bool ShowInquiry(TapeDrive& drive)
{
  std::optional<InquiryData> inquiry = drive.Inquiry();
  if (!inquiry) { return ReportDriveResult(drive, false, "inquiry"); }

  int generation = LtoGeneration(inquiry->product);
  fmt::print("vendor:     {}\n", inquiry->vendor);
  fmt::print("product:    {}\n", inquiry->product);
  fmt::print("revision:   {}\n", inquiry->revision);
  fmt::print("tape:       {}\n", inquiry->IsTape() ? "yes" : "no");
  if (generation) {
    fmt::print("generation: LTO-{}\n", generation);
    fmt::print("capacity:   {} bytes native\n",
               LtoNativeCapacity(generation));
  }
  if (std::optional<std::string> serial = drive.UnitSerialNumber()) {
    fmt::print("serial:     {}\n", *serial);
  }
  return true;
}

bool ShowPosition(TapeDrive& drive)
{
  std::optional<PositionData> position = drive.ReadPosition();
  if (!position) { return ReportDriveResult(drive, false, "read position"); }

  fmt::print("partition:        {}\n", position->partition);
  if (position->block_position_unknown) {
    fmt::print("block position:   unknown\n");
  } else {
    fmt::print("first block:      {}\n", position->first_block);
    fmt::print("last block:       {}\n", position->last_block);
  }
  fmt::print("blocks in buffer: {}\n", position->blocks_in_buffer);
  fmt::print("bytes in buffer:  {}\n", position->bytes_in_buffer);
  fmt::print("bop: {} eop: {}\n", position->bop, position->eop);
  return true;
}

bool ShowTapeAlerts(TapeDrive& drive)
{
  std::optional<uint64_t> flags = drive.TapeAlerts();
  if (!flags) { return ReportDriveResult(drive, false, "tape alerts"); }

  std::vector<uint32_t> alerts = TapeAlertFlagsToList(*flags);
  for (uint32_t flag : alerts) {
    fmt::print("{:>2} {}{}\n", flag, TapeAlertFlagToString(flag),
               IsCriticalTapeAlert(flag) ? " (critical)" : "");
  }
  if (alerts.empty()) { fmt::print("no tape alerts\n"); }
  return true;
}

void PrintRecord(const MamAttributeRecord& record)
{
  fmt::print("attribute 0x{:04X} partition {}\n", record.attribute_id,
             static_cast<int>(record.partition));
  if (record.parsed) {
    fmt::print("  value:    {}\n", record.value);
  } else {
    fmt::print("  value:    (not decodable)\n");
  }
  fmt::print("  strategy: {}\n", record.strategy.ToString());
  fmt::print("  raw:      {}\n", record.raw_hex);
}

bool ReadAttributeCommand(const TapeConfig& config,
                          ProcessSupervisor& supervisor,
                          bool use_itdt,
                          uint8_t partition,
                          uint16_t attribute_id)
{
  if (use_itdt) {
    ItdtTool itdt(supervisor, config.Itdt());
    std::optional<MamAttributeRecord> record;
    ProgramResult result = itdt.ReadAttribute(partition, attribute_id, record);
    if (!record) { return ReportProgramResult(result, "readattr"); }
    PrintRecord(*record);
    return true;
  }

  ScsiSession session(config);
  if (!session.drive()) {
    fmt::print(stderr, "cannot open {}\n", config.device);
    return false;
  }

  std::optional<MamAttributeRecord> record
      = session.drive()->ReadAttribute(partition, attribute_id);
  if (!record) {
    return ReportDriveResult(*session.drive(), false, "read attribute");
  }
  PrintRecord(*record);
  return true;
}

bool PrintIdentity(const std::string& device,
                   const CartridgeIdentity& identity)
{
  for (const std::string& error : identity.errors) {
    fmt::print(stderr, "{}\n", error);
  }
  if (identity.empty()) {
    fmt::print(stderr, "{}: no cartridge identity\n", device);
    return false;
  }
  fmt::print("serial:       {}\n", identity.serial);
  fmt::print("barcode:      {}\n", identity.barcode);
  fmt::print("manufacturer: {}\n", identity.manufacturer);
  return true;
}

bool ShowTapeUsage(const TapeConfig& config, ProcessSupervisor& supervisor)
{
  ItdtTool itdt(supervisor, config.Itdt());
  TapeUsage usage;
  ProgramResult result = itdt.QueryTapeUsage(usage);

  if (!result.success()) { return ReportProgramResult(result, "tapeusage"); }

  fmt::print("threads:                  {}\n", usage.thread_count);
  fmt::print("data sets read/written:   {}/{}\n", usage.data_sets_read,
             usage.data_sets_written);
  fmt::print("read/write retries:       {}/{}\n", usage.read_retries,
             usage.write_retries);
  fmt::print("unrecovered read/write:   {}/{}\n",
             usage.unrecovered_read_errors, usage.unrecovered_write_errors);
  fmt::print("suspended read/write:     {}/{}\n", usage.suspended_reads,
             usage.suspended_writes);
  fmt::print("fatal suspended r/w:      {}/{}\n", usage.fatal_suspended_reads,
             usage.fatal_suspended_writes);
  fmt::print("health score:             {}\n", usage.health_score);
  fmt::print("result:                   {} ({})\n", usage.result, usage.code);
  return true;
}

bool ShowTools(const TapeConfig& config, ProcessSupervisor& supervisor)
{
  ItdtTool itdt(supervisor, config.Itdt());
  LtfsTools ltfs(supervisor, config.Ltfs());
  bool all = true;

  bool itdt_available = itdt.IsAvailable();
  fmt::print("{:<20} {:<8} {}\n", "itdt", itdt_available ? "found" : "missing",
             config.itdt_path);
  all = all && itdt_available;

  for (const ToolAvailability& tool : ltfs.CheckAvailability()) {
    fmt::print("{:<20} {:<8} {}\n", tool.name,
               tool.available ? "found" : "missing", tool.path);
    all = all && tool.available;
  }
  return all;
}

std::optional<uint16_t> ParseAttributeId(const std::string& text)
{
  try {
    std::size_t pos = 0;
    unsigned long id = std::stoul(text, &pos, 0);
    if (pos != text.size() || id > 0xffff) { return std::nullopt; }
    return static_cast<uint16_t>(id);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

}  // namespace

int main(int argc, char* argv[])
{
  setlocale(LC_ALL, "");

  MyNameIs(argc, argv, TAPECTL_PROG_NAME);

  CLI::App tapectl_app;
  InitCLIApp(tapectl_app, "Tape drive control and monitoring.", 2026);

  std::string config_file{};
  tapectl_app
      .add_option("-c,--config", config_file,
                  "Use <file> as configuration file.")
      ->check(CLI::ExistingFile)
      ->type_name("<file>");

  AddDebugOptions(tapectl_app);
  AddVerboseOption(tapectl_app);

  tapectl_app.require_subcommand(1);

  auto devices_cmd
      = tapectl_app.add_subcommand("devices", "List the attached tape devices.");

  int monitor_seconds = 0;
  auto monitor_cmd = tapectl_app.add_subcommand(
      "monitor", "Report tape devices being attached and detached.");
  monitor_cmd
      ->add_option("--seconds", monitor_seconds,
                   "Stop after <seconds>, 0 runs until interrupted.")
      ->check(CLI::NonNegativeNumber)
      ->type_name("<seconds>");

  auto tur_cmd
      = tapectl_app.add_subcommand("tur", "Test whether the drive is ready.");
  auto inquiry_cmd = tapectl_app.add_subcommand(
      "inquiry", "Show drive identification and LTO generation.");
  auto position_cmd = tapectl_app.add_subcommand(
      "position", "Show the current tape position.");
  auto rewind_cmd = tapectl_app.add_subcommand("rewind", "Rewind the tape.");
  auto load_cmd = tapectl_app.add_subcommand("load", "Load the cartridge.");
  auto unload_cmd
      = tapectl_app.add_subcommand("unload", "Unload the cartridge.");

  bool long_erase = false;
  auto erase_cmd = tapectl_app.add_subcommand("erase", "Erase the tape.");
  erase_cmd->add_flag("--long", long_erase,
                      "Erase the whole medium instead of writing an EOD.");

  auto alerts_cmd
      = tapectl_app.add_subcommand("alerts", "Show the active tape alerts.");

  int attribute_partition = 0;
  std::string attribute_id_text{};
  bool attribute_itdt = false;
  auto read_attribute_cmd = tapectl_app.add_subcommand(
      "read-attribute", "Read and decode one medium auxiliary attribute.");
  read_attribute_cmd
      ->add_option("-p,--partition", attribute_partition, "Partition number.")
      ->check(CLI::Range(0, 255))
      ->type_name("<partition>");
  read_attribute_cmd
      ->add_option("-a,--attribute", attribute_id_text,
                   "Attribute id, decimal or 0x prefixed hex.")
      ->required()
      ->type_name("<id>");
  read_attribute_cmd->add_flag("--itdt", attribute_itdt,
                               "Read the attribute with ITDT instead of SCSI.");

  bool identity_itdt = false;
  auto identity_cmd = tapectl_app.add_subcommand(
      "identity", "Show serial, barcode and manufacturer of the cartridge.");
  identity_cmd->add_flag("--itdt", identity_itdt,
                         "Read the attributes with ITDT instead of SCSI.");

  std::string mount_label{};
  std::string mount_serial{};
  bool mount_no_format = false;
  auto mount_cmd = tapectl_app.add_subcommand(
      "mount", "Load, assign and format the cartridge with the LTFS tools.");
  mount_cmd->add_option("--label", mount_label, "Volume label.")
      ->type_name("<label>");
  mount_cmd->add_option("--serial", mount_serial, "Volume serial.")
      ->type_name("<serial>");
  mount_cmd->add_flag("--no-format", mount_no_format,
                      "Do not format the cartridge.");

  auto unmount_cmd = tapectl_app.add_subcommand(
      "unmount", "Unassign and eject the cartridge with the LTFS tools.");
  auto usage_cmd = tapectl_app.add_subcommand(
      "usage", "Show tape usage counters reported by ITDT.");
  auto tools_cmd = tapectl_app.add_subcommand(
      "tools", "Check that the vendor tape tools are installed.");
  auto config_cmd = tapectl_app.add_subcommand(
      "config", "Print the effective configuration.");

  CLI11_PARSE(tapectl_app, argc, argv);

  TapeConfig config;
  std::string error;
  if (!LoadTapeConfig(config_file, config, error)) {
    Emsg1(M_ERROR, 0, "%s\n", error.c_str());
    return 1;
  }
  if (!config.trace_file.empty() && !SetTraceFile(config.trace_file)) {
    Emsg1(M_WARNING, 0, "cannot open trace file %s\n",
          config.trace_file.c_str());
  }

  ProcessSupervisor supervisor(config.kill_grace);
  bool ok = false;

  if (*devices_cmd) {
    ok = ListDevices();
  } else if (*monitor_cmd) {
    ok = MonitorDevices(config, monitor_seconds);
  } else if (*read_attribute_cmd) {
    std::optional<uint16_t> id = ParseAttributeId(attribute_id_text);
    if (!id) {
      fmt::print(stderr, "invalid attribute id {}\n", attribute_id_text);
      return 1;
    }
    ok = ReadAttributeCommand(config, supervisor, attribute_itdt,
                              static_cast<uint8_t>(attribute_partition), *id);
  } else if (*identity_cmd && identity_itdt) {
    ItdtTool itdt(supervisor, config.Itdt());
    ok = PrintIdentity(config.device, ReadCartridgeIdentity(itdt));
  } else if (*mount_cmd || *unmount_cmd) {
    LtfsTools ltfs(supervisor, config.Ltfs());
    std::unique_ptr<FileLabelMappingStore> store;
    MessageNotifier notifier;

    if (!config.label_mapping_file.empty()) {
      store = std::make_unique<FileLabelMappingStore>(
          config.label_mapping_file);
    }
    TapeOperations operations(ltfs, store.get(), &notifier);

    if (*mount_cmd) {
      MountOptions options;
      options.format = !mount_no_format;
      options.label = mount_label;
      options.serial = mount_serial;
      options.label_format = config.label_format;
      FlowResult flow = operations.Mount(options);
      PrintFlow("mount", flow);
      ok = flow.success;
    } else {
      FlowResult flow = operations.Unmount();
      PrintFlow("unmount", flow);
      ok = flow.success;
    }
  } else if (*usage_cmd) {
    ok = ShowTapeUsage(config, supervisor);
  } else if (*tools_cmd) {
    ok = ShowTools(config, supervisor);
  } else if (*config_cmd) {
    std::string dump = DumpTapeConfig(config_file);
    fmt::print("{}", dump);
    ok = !dump.empty();
  } else {
    ScsiSession session(config);
    TapeDrive* drive = session.drive();
    if (!drive) {
      fmt::print(stderr, "cannot open {}\n", config.device);
      return 1;
    }

    if (*tur_cmd) {
      ok = ReportDriveResult(*drive, drive->TestUnitReady(), "test unit ready");
    } else if (*inquiry_cmd) {
      ok = ShowInquiry(*drive);
    } else if (*position_cmd) {
      ok = ShowPosition(*drive);
    } else if (*rewind_cmd) {
      ok = ReportDriveResult(*drive, drive->Rewind(), "rewind");
    } else if (*load_cmd) {
      ok = ReportDriveResult(*drive, drive->Load(), "load");
    } else if (*unload_cmd) {
      ok = ReportDriveResult(*drive, drive->Unload(), "unload");
    } else if (*erase_cmd) {
      ok = ReportDriveResult(*drive, drive->Erase(long_erase), "erase");
    } else if (*alerts_cmd) {
      ok = ShowTapeAlerts(*drive);
    } else if (*identity_cmd) {
      ok = PrintIdentity(drive->identity(), ReadCartridgeIdentity(*drive));
    }
  }

  return ok ? 0 : 1;
}
