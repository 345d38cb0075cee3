#include <unity.h>

#include <string>

#include "btmonitor.h"
#include "btmonitor-log.h"
#include "fakes/fake_system.h"

void test_poll_until_satisfied() {
  FakeSystem host;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);
  int calls = 0;

  PollResult result = PollUntil(host, log, [&calls]() { return ++calls == 3; }, 1, 15);
  TEST_ASSERT_EQUAL(PollResult::Satisfied, result);
  TEST_ASSERT_EQUAL(3, calls);
  TEST_ASSERT_EQUAL(2, host.slept_seconds);
}

void test_poll_until_times_out() {
  FakeSystem host;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  PollResult result = PollUntil(host, log, []() { return false; }, 1, 15, "Still waiting for device...");
  TEST_ASSERT_EQUAL(PollResult::TimedOut, result);
  TEST_ASSERT_EQUAL(15, host.slept_seconds);
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.RecoveryLogFileName()), "Still waiting for device... 5s elapsed"));
}

void test_wait_for_enumeration() {
  FakeSystem host;
  host.AddDirectory("/sys/class/bluetooth");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(WaitForEnumeration(host, config, log, 15));
  TEST_ASSERT_EQUAL(15, host.slept_seconds);

  host.AddDirectory("/sys/class/bluetooth/hci0");
  host.slept_seconds = 0;
  TEST_ASSERT_TRUE(WaitForEnumeration(host, config, log, 15));
  TEST_ASSERT_EQUAL(1, host.slept_seconds);
}

void test_locate_usb_device_by_ancestry() {
  FakeSystem host;
  BuildController(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  UsbDevice device;
  TEST_ASSERT_TRUE(LocateUSBDevice(host, config, log, device));
  TEST_ASSERT_EQUAL_STRING(kUSBDevicePath, device.Path.string().c_str());
  TEST_ASSERT_EQUAL_STRING("05ac", device.Vendor.c_str());
  TEST_ASSERT_EQUAL_STRING("3", device.DeviceNumber.c_str());
}

void test_locate_usb_device_by_product_id() {
  FakeSystem host;
  host.AddDirectory("/sys/class/bluetooth/hci0/device");
  host.AddFile("/sys/class/bluetooth/hci0/device/uevent", "DRIVER=btusb\nPRODUCT=5ac/8294/125\n");
  host.AddFile("/sys/bus/usb/devices/2-1/idVendor", "1d6b\n");
  host.AddFile("/sys/bus/usb/devices/2-1/idProduct", "0002\n");
  host.AddFile("/sys/bus/usb/devices/1-1/idVendor", "05AC\n");
  host.AddFile("/sys/bus/usb/devices/1-1/idProduct", "8294\n");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  UsbDevice device;
  TEST_ASSERT_TRUE(LocateUSBDevice(host, config, log, device));
  TEST_ASSERT_EQUAL_STRING("/sys/bus/usb/devices/1-1", device.Path.string().c_str());
}

void test_restart_service_stops_then_starts() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryRestartService(host, config, log));
  int stop = host.IndexOf("systemctl stop bluetooth");
  int start = host.IndexOf("systemctl start bluetooth");
  TEST_ASSERT_TRUE(stop >= 0);
  TEST_ASSERT_TRUE(start > stop);
  TEST_ASSERT_TRUE(host.IndexOf("systemctl is-active bluetooth") > start);
}

void test_restart_service_uses_sudo_when_not_root() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.root = false;
  host.sudo = true;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryRestartService(host, config, log));
  TEST_ASSERT_TRUE(host.Ran("sudo -n systemctl stop bluetooth"));
  TEST_ASSERT_TRUE(host.Ran("sudo -n systemctl start bluetooth"));
}

void test_restart_service_without_privileges_fails_fast() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.root = false;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(RecoveryRestartService(host, config, log));
  TEST_ASSERT_EQUAL(-1, host.IndexOf("systemctl stop"));
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.EventLogFileName()), "[ERROR]"));
}

void test_restart_service_with_service_command() {
  FakeSystem host;
  host.commands = {"service"};
  host.processes.insert("bluetoothd");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryRestartService(host, config, log));
  TEST_ASSERT_TRUE(host.Ran("service bluetooth restart"));
}

void test_power_management_switches_auto_to_on() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryFixPowerManagement(host, config, log));
  TEST_ASSERT_EQUAL_STRING("on", host.Contents(std::string(kUSBDevicePath) + "/power/control").c_str());
  std::string rule = host.Contents(config.UdevRulesFile);
  TEST_ASSERT_TRUE(Contains(rule, "ATTR{idVendor}==\"05ac\", ATTR{idProduct}==\"8294\", ATTR{power/control}=\"on\""));
  TEST_ASSERT_TRUE(host.Ran("udevadm control --reload-rules"));
}

void test_power_management_creates_missing_rules_directory() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.root = false;
  host.sudo = true;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(host.IsDirectory("/etc/udev/rules.d"));
  TEST_ASSERT_TRUE(RecoveryFixPowerManagement(host, config, log));
  TEST_ASSERT_TRUE(host.Ran("sudo -n mkdir -p /etc/udev/rules.d"));
  TEST_ASSERT_TRUE(host.IsDirectory("/etc/udev/rules.d"));
  TEST_ASSERT_TRUE(Contains(host.Contents(config.UdevRulesFile), "ATTR{power/control}=\"on\""));
  TEST_ASSERT_TRUE(host.IndexOf("mkdir") < host.IndexOf("tee /etc/udev/rules.d"));
}

void test_power_management_already_on() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.AddFile(std::string(kUSBDevicePath) + "/power/control", "on\n");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryFixPowerManagement(host, config, log));
  TEST_ASSERT_TRUE(host.writes.empty());
}

void test_power_management_resumes_suspended_device() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.AddFile(std::string(kUSBDevicePath) + "/power/control", "on\n");
  host.AddFile(std::string(kUSBDevicePath) + "/power/runtime_status", "suspended\n");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryFixPowerManagement(host, config, log));
  TEST_ASSERT_EQUAL_STRING("0", host.Contents(std::string(kUSBDevicePath) + "/power/runtime_suspended").c_str());
}

void test_power_management_fails_when_write_does_not_stick() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.unwritable.insert(std::string(kUSBDevicePath) + "/power/control");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(RecoveryFixPowerManagement(host, config, log));
}

void test_usb_reset_with_authorized_flag() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.AddFile(std::string(kUSBDevicePath) + "/authorized", "1\n");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryResetUSB(host, config, log));
  TEST_ASSERT_EQUAL(2, host.writes.size());
  TEST_ASSERT_EQUAL_STRING("0", host.writes[0].second.c_str());
  TEST_ASSERT_EQUAL_STRING("1", host.writes[1].second.c_str());
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.EventLogFileName()), "USB reset"));
}

void test_usb_reset_rebinds_driver() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryResetUSB(host, config, log));
  TEST_ASSERT_EQUAL_STRING("/sys/bus/usb/drivers/btusb/unbind", host.writes[0].first.c_str());
  TEST_ASSERT_EQUAL_STRING("1-1:1.0", host.writes[0].second.c_str());
  TEST_ASSERT_EQUAL_STRING("/sys/bus/usb/drivers/btusb/bind", host.writes[1].first.c_str());
}

void test_usb_reset_with_reset_utility() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.links.erase(std::string(kInterfacePath) + "/driver");
  host.commands.insert("usb_modeswitch");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryResetUSB(host, config, log));
  TEST_ASSERT_TRUE(host.Ran("usb_modeswitch -v 0x05ac -p 0x8294 -R -b 1 -g 3"));
  std::string events = ReadTextFile(config.EventLogFileName());
  TEST_ASSERT_TRUE(Contains(events, "USB reset"));
  TEST_ASSERT_TRUE(Contains(events, "Device successfully reset using usb_modeswitch"));
}

void test_usb_reset_with_usbreset_device_node() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.links.erase(std::string(kInterfacePath) + "/driver");
  host.commands.insert("usbreset");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryResetUSB(host, config, log));
  TEST_ASSERT_TRUE(host.Ran("usbreset /dev/bus/usb/001/003"));
}

void test_usb_reset_power_cycle_as_last_resort() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.links.erase(std::string(kInterfacePath) + "/driver");
  host.AddFile(std::string(kUSBDevicePath) + "/power/autosuspend", "2\n");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryResetUSB(host, config, log));
  TEST_ASSERT_EQUAL(3, host.writes.size());
  TEST_ASSERT_EQUAL_STRING("1", host.writes[0].second.c_str());
  TEST_ASSERT_EQUAL_STRING("auto", host.writes[1].second.c_str());
  TEST_ASSERT_EQUAL_STRING("on", host.writes[2].second.c_str());
}

void test_usb_reset_fails_without_device() {
  FakeSystem host;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(RecoveryResetUSB(host, config, log));
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.EventLogFileName()), "Could not find Bluetooth USB device path"));
}

void test_module_reload_order() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryReloadModules(host, config, log));
  int unload_btusb = host.IndexOf("modprobe -r btusb");
  int unload_bluetooth = host.IndexOf("modprobe -r bluetooth");
  int load_bluetooth = host.IndexOf("modprobe bluetooth");
  int load_btusb = host.IndexOf("modprobe btusb");
  TEST_ASSERT_TRUE(unload_btusb >= 0);
  TEST_ASSERT_TRUE(unload_bluetooth > unload_btusb);
  TEST_ASSERT_TRUE(load_bluetooth > unload_bluetooth);
  TEST_ASSERT_TRUE(load_btusb > load_bluetooth);
}

void test_module_reload_unload_failure_is_only_a_warning() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.Script("modprobe -r btusb", CommandResult(1, "modprobe: FATAL: Module btusb is in use."));
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryReloadModules(host, config, log));
}

void test_module_reload_load_failure_fails() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.Script("modprobe btusb", CommandResult(1, "modprobe: FATAL: Module btusb not found."));
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(RecoveryReloadModules(host, config, log));
}

void test_bcm_fix_reloads_driver_with_reset_delay() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryFixBCMReset(host, config, log));
  TEST_ASSERT_TRUE(host.IndexOf("modprobe btusb reset_delay=1") > host.IndexOf("modprobe -r btusb"));
  TEST_ASSERT_TRUE(host.Ran("systemctl restart bluetooth"));
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.RecoveryLogFileName()), "BCM20702A1-05ac-8294.hcd"));
}

void test_bcm_fix_power_cycles_when_reload_fails() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.Script("modprobe -r btusb", CommandResult(1, "modprobe: FATAL: Module btusb is in use."));
  host.AddDirectory("/sys/bus/usb/drivers/usb");
  host.AddLink(std::string(kUSBDevicePath) + "/driver", "/sys/bus/usb/drivers/usb");
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_TRUE(RecoveryFixBCMReset(host, config, log));
  TEST_ASSERT_FALSE(host.Ran("modprobe btusb reset_delay=1"));
  TEST_ASSERT_EQUAL_STRING("/sys/bus/usb/drivers/usb/unbind", host.writes[0].first.c_str());
  TEST_ASSERT_EQUAL_STRING("1-1", host.writes[0].second.c_str());
}

void test_bcm_fix_suggests_remedies_on_failure() {
  FakeSystem host;
  host.commands = {"modprobe"};
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  TEST_ASSERT_FALSE(RecoveryFixBCMReset(host, config, log));
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.RecoveryLogFileName()), "btusb.reset_delay=1"));
}

void test_full_ladder_runs_every_action() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);
  HealthReport report;
  report.BCMResetDetected = true;

  RecoverySummary summary = RunRecoveryLadder(host, config, log, report);
  TEST_ASSERT_TRUE(summary.Success());
  TEST_ASSERT_EQUAL(5, summary.Attempted);
  TEST_ASSERT_EQUAL(RecoveryActionType::BCMFix, summary.Outcomes[0].Type);
  TEST_ASSERT_EQUAL(RecoveryActionType::PowerManagement, summary.Outcomes[1].Type);
  TEST_ASSERT_EQUAL(RecoveryActionType::USBReset, summary.Outcomes[2].Type);
  TEST_ASSERT_EQUAL(RecoveryActionType::ServiceRestart, summary.Outcomes[3].Type);
  TEST_ASSERT_EQUAL(RecoveryActionType::ModuleReload, summary.Outcomes[4].Type);
  std::string events = ReadTextFile(config.EventLogFileName());
  TEST_ASSERT_TRUE(Contains(events, "USB reset"));
  TEST_ASSERT_TRUE(Contains(events, "Stopping bluetooth service"));
  std::string recovery = ReadTextFile(config.RecoveryLogFileName());
  TEST_ASSERT_TRUE(Contains(recovery, "Recovery Sequence Summary:"));
  TEST_ASSERT_TRUE(Contains(recovery, "  - USB reset: SUCCESS"));
  TEST_ASSERT_TRUE(Contains(recovery, "Summary: 5 out of 5 actions succeeded"));
}

void test_ladder_skips_bcm_fix_without_detection() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  RecoverySummary summary = RunRecoveryLadder(host, config, log, HealthReport());
  TEST_ASSERT_EQUAL(4, summary.Attempted);
  TEST_ASSERT_FALSE(summary.Contains(RecoveryActionType::BCMFix));
}

void test_ladder_continues_after_failures() {
  FakeSystem host;
  BuildHealthyHost(host);
  host.root = false;
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  RecoverySummary summary = RunRecoveryLadder(host, config, log, HealthReport());
  TEST_ASSERT_FALSE(summary.Success());
  TEST_ASSERT_EQUAL(4, summary.Attempted);
  TEST_ASSERT_EQUAL(0, summary.Succeeded);
  TEST_ASSERT_TRUE(Contains(ReadTextFile(config.EventLogFileName()), "All recovery actions failed (0/4)"));
}

void test_recovery_subset_runs_three_actions() {
  FakeSystem host;
  BuildHealthyHost(host);
  MonitorConfig config = MakeTestConfig();
  MonitorLog log(config);

  RecoverySummary summary = RunRecoverySubset(host, config, log);
  TEST_ASSERT_TRUE(summary.Success());
  TEST_ASSERT_EQUAL(3, summary.Attempted);
  TEST_ASSERT_TRUE(summary.Contains(RecoveryActionType::USBReset));
  TEST_ASSERT_TRUE(summary.Contains(RecoveryActionType::ServiceRestart));
  TEST_ASSERT_FALSE(summary.Contains(RecoveryActionType::ModuleReload));
}
