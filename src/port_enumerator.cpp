// ============================================================================
// port_enumerator.cpp — implementation for port_enumerator.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file port_enumerator.cpp
 */

#include "port_enumerator.hpp"   // PortBackend, SysfsPortBackend, PortEnumerator
#include "meshlink/connection.hpp"
#include "meshlink/errors.hpp"

#include <algorithm>             // std::any_of
#include <cctype>                // std::tolower
#include <cstdio>                // snprintf for the hwid string
#include <cstdlib>               // strtoul for hex ids
#include <filesystem>            // walking /sys/class/tty
#include <fstream>               // reading one-line sysfs attributes
#include <system_error>          // std::error_code for non-throwing filesystem ops
#include <utility>               // std::move

namespace fs = std::filesystem;
namespace meshlink {

// ---------------------------------------------------------------------------
// Known radio USB ids.
// - CP210x / CH34x / CH9102: bridges on ESP32 boards (T-Beam, Heltec, T-Lora).
// - Espressif native USB: ESP32-S3 boards without a bridge chip.
// - Adafruit/RAK nRF52840 bootloader ids: RAK4631, T-Echo.
// - Raspberry Pi RP2040: Pico-based nodes.
// - Seeed nRF52840: XIAO / Wio trackers.
// ---------------------------------------------------------------------------
const std::vector<VidPid>& known_radio_ids() {
    static const std::vector<VidPid> ids = {
        {0x10C4, 0xEA60},   // Silicon Labs CP210x
        {0x1A86, 0x55D4},   // WCH CH9102
        {0x1A86, 0x7523},   // WCH CH340
        {0x1A86, 0x55D3},   // WCH CH343
        {0x303A, 0x1001},   // Espressif USB JTAG/serial (ESP32-S3/C3)
        {0x303A, 0x0002},   // Espressif ESP32-S2/S3 CDC
        {0x239A, 0x8029},   // RAK4631 / nRF52840 (Adafruit bootloader)
        {0x239A, 0x0029},   // nRF52840 DFU
        {0x2E8A, 0x000A},   // Raspberry Pi RP2040
        {0x2886, 0x8045},   // Seeed XIAO nRF52840
        {0x0403, 0x6001},   // FTDI FT232R
    };
    return ids;
}

bool is_known_radio(uint16_t vid, uint16_t pid) {
    const auto& ids = known_radio_ids();
    return std::any_of(ids.begin(), ids.end(),
                       [&](const VidPid& p) { return p.vid == vid && p.pid == pid; });
}

std::vector<std::string> default_ignored_prefixes() {
    return {"/dev/ttyS"};
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool should_ignore_port(const std::string& device,
                        const std::optional<std::string>& description,
                        const std::vector<std::string>& ignored_prefixes) {
    for (const auto& prefix : ignored_prefixes) {
        if (!prefix.empty() && device.rfind(prefix, 0) == 0) return true;
    }
    if (description && lower(*description).find("virtualbox") != std::string::npos) return true;
    return false;
}


// -------- sysfs helpers --------

/*
 * read_line()
 * -----------
 * Read the first line of a sysfs attribute file. Missing or unreadable
 * attributes are normal (not every USB device has a serial number), so this
 * quietly returns {} instead of failing.
 */
static std::optional<std::string> read_line(const fs::path& dir, const char* attr) {
    std::ifstream in(dir / attr);
    if (!in) return std::nullopt;
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' '))
        line.pop_back();
    if (line.empty()) return std::nullopt;
    return line;
}

static std::optional<uint16_t> read_hex16(const fs::path& dir, const char* attr) {
    auto s = read_line(dir, attr);
    if (!s) return std::nullopt;
    char* end = nullptr;
    unsigned long v = std::strtoul(s->c_str(), &end, 16);
    if (!end || *end || v > 0xFFFF) return std::nullopt;
    return static_cast<uint16_t>(v);
}

/*
 * describe_usb()
 * --------------
 * Fill USB attributes for a tty whose device hangs off a USB interface.
 *
 * Layout (sysfs):
 *   /sys/class/tty/ttyACM0/device -> .../usb1/1-1/1-1:1.0          (usb, CDC ACM)
 *   /sys/class/tty/ttyUSB0/device -> .../usb1/1-2/1-2:1.0/ttyUSB0  (usb-serial)
 * The USB *device* directory (idVendor, idProduct, ...) is the parent of the
 * interface directory.
 */
static void describe_usb(UsbPortInfo& p, const fs::path& iface_dir, const std::string& tty_name) {
    const fs::path usb_dev = iface_dir.parent_path();

    p.vid           = read_hex16(usb_dev, "idVendor");
    p.pid           = read_hex16(usb_dev, "idProduct");
    p.serial_number = read_line(usb_dev, "serial");
    p.manufacturer  = read_line(usb_dev, "manufacturer");
    p.product       = read_line(usb_dev, "product");

    // Location: bus path, plus the interface number on composite devices.
    std::string location = usb_dev.filename().string();
    auto num_if = read_line(usb_dev, "bNumInterfaces");
    if (num_if && std::strtol(num_if->c_str(), nullptr, 10) > 1) {
        const std::string iface = iface_dir.filename().string();
        auto colon = iface.find(':');
        if (colon != std::string::npos) location += iface.substr(colon);
    }
    p.location = location;

    p.description = p.product ? *p.product : tty_name;

    char ids[32];
    std::snprintf(ids, sizeof(ids), "USB VID:PID=%04X:%04X",
                  (unsigned)p.vid.value_or(0), (unsigned)p.pid.value_or(0));
    std::string hwid = ids;
    if (p.serial_number) hwid += " SER=" + *p.serial_number;
    hwid += " LOCATION=" + location;
    p.hwid = hwid;
}


// -------- SysfsPortBackend --------

SysfsPortBackend::SysfsPortBackend(std::string sys_class_tty, std::string dev_dir)
: sys_root_(std::move(sys_class_tty)), dev_dir_(std::move(dev_dir)) {}

/*
 * comports()
 * ----------
 * Walk every tty class entry; entries without a "device" link are virtual
 * terminals (tty0..63, ptmx, console) and are skipped. Sorted by name so
 * the order is stable across calls.
 */
std::vector<UsbPortInfo> SysfsPortBackend::comports() const {
    std::error_code ec;
    fs::directory_iterator it(sys_root_, ec);
    if (ec) throw MeshError(ErrorCode::SerialBackendUnavailable, sys_root_ + ": " + ec.message());

    // A failed increment() sets ec and turns it into the end iterator.
    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec))
        names.push_back(it->path().filename().string());
    if (ec) throw MeshError(ErrorCode::SerialBackendUnavailable, sys_root_ + ": " + ec.message());
    std::sort(names.begin(), names.end());

    std::vector<UsbPortInfo> out;
    for (const auto& name : names) {
        const fs::path dev_link = fs::path(sys_root_) / name / "device";
        if (!fs::exists(dev_link, ec)) continue;

        fs::path device_dir = fs::canonical(dev_link, ec);
        if (ec) continue;

        std::string subsystem;
        fs::path sub = fs::canonical(device_dir / "subsystem", ec);
        if (!ec) subsystem = sub.filename().string();
        ec.clear();

        UsbPortInfo p;
        p.device = (fs::path(dev_dir_) / name).string();

        if (subsystem == "usb-serial") {
            describe_usb(p, device_dir.parent_path(), name);
        } else if (subsystem == "usb") {
            describe_usb(p, device_dir, name);
        } else {
            p.description = name;
            if (subsystem == "pnp") p.hwid = read_line(device_dir, "id");
        }
        out.push_back(std::move(p));
    }
    return out;
}


// -------- PortEnumerator --------

PortEnumerator::PortEnumerator(std::shared_ptr<const PortBackend> backend,
                               std::vector<std::string> ignored_prefixes)
: backend_(std::move(backend)), ignored_(std::move(ignored_prefixes)) {}

std::vector<UsbPortInfo> PortEnumerator::list_ports() const {
    if (!backend_) throw MeshError(ErrorCode::SerialBackendUnavailable);

    std::vector<UsbPortInfo> result;
    for (auto& p : backend_->comports()) {
        if (should_ignore_port(p.device, p.description, ignored_)) continue;   // rules 1, 2
        if (!p.vid || !p.pid) continue;                                         // rule 3
        if (!is_known_radio(*p.vid, *p.pid)) continue;                          // rule 4
        result.push_back(std::move(p));
    }
    return result;
}

std::optional<UsbPortInfo> PortEnumerator::find_port(const std::string& port) const {
    auto ports = list_ports();
    if (port.empty() || port == AUTODETECT_SERIAL) {
        if (ports.empty()) return std::nullopt;
        return ports.front();
    }
    for (auto& p : ports) {
        if (p.device == port) return p;
    }
    return std::nullopt;
}

} // namespace meshlink
