#include "fake_system.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

const char* const kUSBDevicePath = "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-1";
const char* const kInterfacePath = "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-1/1-1:1.0";
const char* const kAppleLsusbLine = "Bus 001 Device 003: ID 05ac:8294 Apple, Inc. Bluetooth USB Host Controller";

namespace {
std::string Normal(const std::filesystem::path& Path) {
  std::string text(Path.lexically_normal().string());
  while (text.length() > 1 && text.back() == '/')
    text.pop_back();
  return text;
}
} // namespace

std::string FakeSystem::Resolve(const std::filesystem::path& Path) const {
  std::string text(Normal(Path));
  // follow the longest matching link, repeatedly, like the kernel would
  for (int depth = 0; depth < 8; depth++) {
    std::string best;
    for (auto& link : links)
      if ((text == link.first || text.compare(0, link.first.length() + 1, link.first + "/") == 0) &&
          link.first.length() > best.length())
        best = link.first;
    if (best.empty())
      break;
    text = Normal(links.at(best) + text.substr(best.length()));
  }
  return text;
}

CommandResult FakeSystem::Run(const std::vector<std::string>& Arguments, const int TimeoutSeconds, const std::string& Input) {
  (void)TimeoutSeconds;
  const std::string line(JoinArguments(Arguments));
  invocations.push_back(line);
  if (on_run)
    on_run(*this, Arguments);
  // sudo tee writes through to the tree
  if (Arguments.size() == 4 && Arguments[0] == "sudo" && Arguments[2] == "tee") {
    std::string value(Input);
    while (!value.empty() && value.back() == '\n')
      value.pop_back();
    return WriteFile(Arguments[3], value) ? CommandResult(0, Input) : CommandResult(1, "tee: Permission denied");
  }
  auto it = scripted.find(line);
  if (it != scripted.end())
    return it->second;
  // sudo -n runs the same scripted command
  std::vector<std::string> command(Arguments);
  if (sudo && command.size() > 2 && command[0] == "sudo" && command[1] == "-n")
    command.erase(command.begin(), command.begin() + 2);
  it = scripted.find(JoinArguments(command));
  if (it != scripted.end())
    return it->second;
  if (command.size() == 3 && command[0] == "mkdir" && command[1] == "-p")
    return CreateDirectory(command[2]) ? CommandResult(0, "") : CommandResult(1, "mkdir: Permission denied");
  if (command.empty() || !CommandExists(command.front()))
    return CommandResult(127, "command not found");
  return CommandResult(0, "");
}

bool FakeSystem::Exists(const std::filesystem::path& Path) {
  const std::string key(Resolve(Path));
  return files.count(key) > 0 || directories.count(key) > 0;
}

bool FakeSystem::IsDirectory(const std::filesystem::path& Path) {
  return directories.count(Resolve(Path)) > 0;
}

std::vector<std::filesystem::path> FakeSystem::ListDirectory(const std::filesystem::path& Path) {
  const std::string key(Resolve(Path));
  std::set<std::string> names;
  if (directories.count(key) == 0)
    return {};
  for (auto& file : files)
    if (std::filesystem::path(file.first).parent_path().string() == key)
      names.insert(std::filesystem::path(file.first).filename().string());
  for (auto& directory : directories)
    if (directory != key && std::filesystem::path(directory).parent_path().string() == key)
      names.insert(std::filesystem::path(directory).filename().string());
  for (auto& link : links)
    if (std::filesystem::path(link.first).parent_path().string() == key)
      names.insert(std::filesystem::path(link.first).filename().string());
  // entries are named through the path asked for, not the resolved one
  std::vector<std::filesystem::path> rval;
  for (auto& name : names)
    rval.push_back(std::filesystem::path(Normal(Path)) / name);
  return rval;
}

std::filesystem::path FakeSystem::Canonical(const std::filesystem::path& Path) {
  if (!Exists(Path))
    return std::filesystem::path();
  return std::filesystem::path(Resolve(Path));
}

bool FakeSystem::ReadFile(const std::filesystem::path& Path, std::string& Contents) {
  auto it = files.find(Resolve(Path));
  if (it == files.end())
    return false;
  Contents = it->second;
  while (!Contents.empty() && Contents.back() == '\n')
    Contents.pop_back();
  return true;
}

bool FakeSystem::WriteFile(const std::filesystem::path& Path, const std::string& Contents) {
  const std::string key(Resolve(Path));
  writes.push_back(std::make_pair(key, Contents));
  if (unwritable.count(key) > 0)
    return false;
  if (directories.count(std::filesystem::path(key).parent_path().string()) == 0)
    return false;
  files[key] = Contents;
  return true;
}

bool FakeSystem::CreateDirectory(const std::filesystem::path& Path) {
  const std::string key(Resolve(Path));
  if (unwritable.count(key) > 0)
    return false;
  AddDirectory(key);
  return true;
}

void FakeSystem::Sleep(const int Seconds) {
  slept_seconds += Seconds;
  if (on_sleep)
    on_sleep(*this);
}

ServiceState FakeSystem::QueryService(const std::string& Unit) {
  invocations.push_back("systemctl is-active " + Unit);
  return service_state;
}

void FakeSystem::AddDirectory(const std::filesystem::path& Path) {
  std::filesystem::path current(Normal(Path));
  while (!current.empty() && current != current.root_path()) {
    directories.insert(current.string());
    current = current.parent_path();
  }
  directories.insert("/");
}

void FakeSystem::AddFile(const std::filesystem::path& Path, const std::string& Contents) {
  AddDirectory(std::filesystem::path(Normal(Path)).parent_path());
  files[Normal(Path)] = Contents;
}

void FakeSystem::AddLink(const std::filesystem::path& Link, const std::filesystem::path& Target) {
  AddDirectory(std::filesystem::path(Normal(Link)).parent_path());
  links[Normal(Link)] = Normal(Target);
}

bool FakeSystem::Ran(const std::string& CommandLine) const {
  return std::find(invocations.begin(), invocations.end(), CommandLine) != invocations.end();
}

int FakeSystem::IndexOf(const std::string& Text) const {
  for (size_t index = 0; index < invocations.size(); index++)
    if (invocations[index].find(Text) != std::string::npos)
      return int(index);
  return -1;
}

std::string FakeSystem::Contents(const std::filesystem::path& Path) {
  std::string value;
  ReadFile(Path, value);
  return value;
}

void BuildController(FakeSystem& System) {
  const std::string device(kUSBDevicePath);
  const std::string interface(kInterfacePath);
  System.AddDirectory("/sys/class/bluetooth/hci0");
  System.AddLink("/sys/class/bluetooth/hci0/device", interface);
  System.AddFile(interface + "/uevent", "DEVTYPE=usb_interface\nDRIVER=btusb\nPRODUCT=5ac/8294/125\nTYPE=224/1/1\n");
  System.AddLink(interface + "/driver", "/sys/bus/usb/drivers/btusb");
  System.AddDirectory("/sys/bus/usb/drivers/btusb");
  System.AddFile(device + "/idVendor", "05ac\n");
  System.AddFile(device + "/idProduct", "8294\n");
  System.AddFile(device + "/busnum", "1\n");
  System.AddFile(device + "/devnum", "3\n");
  System.AddFile(device + "/power/control", "auto\n");
  System.AddFile(device + "/power/runtime_status", "active\n");
  System.AddLink("/sys/bus/usb/devices/1-1", device);
  System.hci.push_back(HciDevice("hci0", "AA:BB:CC:DD:EE:FF", true, true));
}

void BuildHealthyHost(FakeSystem& System) {
  BuildController(System);
  System.modules = {"bluetooth", "btusb"};
  System.commands = {"lsusb", "bluetoothctl", "systemctl", "service", "dmesg", "modprobe", "udevadm"};
  System.service_state = ServiceState::Active;
  System.processes.insert("bluetoothd");
  System.Script("lsusb", CommandResult(0, std::string("Bus 001 Device 001: ID 1d6b:0002 Linux Foundation 2.0 root hub\n") + kAppleLsusbLine + "\n"));
  System.Script("bluetoothctl show", CommandResult(0, "Controller AA:BB:CC:DD:EE:FF (public)\n\tName: MacBook\n\tPowered: yes\n"));
  System.Script("dmesg", CommandResult(0, "[    2.101] usb 1-1: new full-speed USB device number 3 using xhci_hcd\n[    3.412] Bluetooth: hci0: BCM: chip id 63\n"));
  System.AddFile("/lib/firmware/brcm/BCM20702A1-05ac-8294.hcd", "firmware");
}

namespace {
std::vector<std::filesystem::path> test_directories;
} // namespace

MonitorConfig MakeTestConfig(void) {
  MonitorConfig config;
  char name[] = "/tmp/btmonitor-test-XXXXXX";
  const char* directory = mkdtemp(name);
  config.LogDirectory = (directory != nullptr) ? std::filesystem::path(directory) : std::filesystem::path();
  if (directory != nullptr)
    test_directories.push_back(config.LogDirectory);
  config.ConsoleVerbosity = 0;
  return config;
}

void RemoveTestDirectories(void) {
  for (auto& directory : test_directories) {
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
  }
  test_directories.clear();
}

std::string ReadTextFile(const std::filesystem::path& Path) {
  std::ifstream file(Path);
  std::ostringstream text;
  text << file.rdbuf();
  return text.str();
}

bool Contains(const std::string& Haystack, const std::string& Needle) {
  return Haystack.find(Needle) != std::string::npos;
}
