#pragma once
/**
 * @file port_enumerator.hpp
 * @brief Enumerate local serial ports and keep the ones that look like mesh radios.
 *
 * @details
 * PURPOSE
 * -------
 * Before a serial connection can be opened, "auto" has to become a concrete
 * device path, and an explicit path has to be confirmed as a radio port. This
 * header is that step: it lists the host's serial ports through a PortBackend,
 * then filters them with a fixed policy.
 *
 * FILTER POLICY (applied in order)
 * --------------------------------
 *  1. Path starts with an ignored prefix (default "/dev/ttyS": on-board UARTs,
 *     never a USB radio)                                        -> dropped
 *  2. Description contains "virtualbox" (any case)              -> dropped
 *  3. No vendor id or no product id                             -> dropped
 *  4. (vid, pid) not in the known-radio allow-list              -> dropped
 *
 * The allow-list is data, not logic: supporting a new board family means
 * adding its (vid, pid) pair to known_radio_ids() in port_enumerator.cpp.
 *
 * BACKENDS
 * --------
 * - SysfsPortBackend walks /sys/class/tty the same way pyserial's Linux
 *   backend does: follow <tty>/device, work out whether it hangs off USB, and
 *   read idVendor/idProduct/manufacturer/product/serial from the USB device.
 *   No libudev dependency; plain filesystem reads.
 * - Tests supply their own backend with canned entries.
 *
 * FAILURE
 * -------
 * list_ports() throws MeshError(SerialBackendUnavailable) when the backend
 * cannot list ports at all (no backend, /sys not mounted). An empty result is
 * not a failure: it just means no radio is plugged in.
 *
 * EXAMPLE
 * -------
 * @code
 *   meshlink::PortEnumerator ports(std::make_shared<meshlink::SysfsPortBackend>());
 *   for (const auto& p : ports.list_ports())
 *       std::cout << p.device << "\n";
 *
 *   if (auto first = ports.find_port("auto")) open(first->device);
 * @endcode
 *
 * @note Recomputed on every call. Nothing is cached between resolves, since
 *       USB paths move around when cables are swapped.
 */

#include "meshlink/telemetry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshlink {

/**
 * @brief OS serial-port listing capability.
 *
 * comports() returns every serial port the OS knows about, unfiltered.
 * Throws MeshError(SerialBackendUnavailable) if the listing is impossible.
 */
class PortBackend {
public:
    virtual ~PortBackend() = default;
    virtual std::vector<UsbPortInfo> comports() const = 0;
};

/**
 * @brief Linux sysfs backend.
 *
 * @param sys_class_tty  Root to scan (default "/sys/class/tty"); overridable so
 *                       tests can point it at a fixture tree.
 * @param dev_dir        Directory device nodes live in (default "/dev").
 */
class SysfsPortBackend : public PortBackend {
public:
    explicit SysfsPortBackend(std::string sys_class_tty = "/sys/class/tty",
                              std::string dev_dir = "/dev");
    std::vector<UsbPortInfo> comports() const override;

private:
    std::string sys_root_;
    std::string dev_dir_;
};

struct VidPid {
    uint16_t vid;
    uint16_t pid;
};

/// (vid, pid) pairs of USB-serial bridges used by known radio boards.
const std::vector<VidPid>& known_radio_ids();

bool is_known_radio(uint16_t vid, uint16_t pid);

/// {"/dev/ttyS"}.
std::vector<std::string> default_ignored_prefixes();

/// Filter rules 1 and 2.
bool should_ignore_port(const std::string& device,
                        const std::optional<std::string>& description,
                        const std::vector<std::string>& ignored_prefixes);

class PortEnumerator {
public:
    explicit PortEnumerator(std::shared_ptr<const PortBackend> backend,
                            std::vector<std::string> ignored_prefixes = default_ignored_prefixes());

    /**
     * @brief Radio ports, in OS enumeration order.
     * @throws MeshError(SerialBackendUnavailable)
     */
    std::vector<UsbPortInfo> list_ports() const;

    /**
     * @brief Resolve "auto" (or empty) to the first radio port, or confirm an explicit path.
     *
     * With several radios attached, which one "auto" picks depends on the OS
     * order. Callers that care must configure an explicit path.
     *
     * @throws MeshError(SerialBackendUnavailable)
     */
    std::optional<UsbPortInfo> find_port(const std::string& port) const;

    const std::vector<std::string>& ignored_prefixes() const { return ignored_; }

private:
    std::shared_ptr<const PortBackend> backend_;
    std::vector<std::string>           ignored_;
};

} // namespace meshlink
