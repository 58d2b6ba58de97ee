#include <doctest/doctest.h>
#include "fakes.hpp"
#include "port_enumerator.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace meshlink;
using namespace meshlink::testing;
namespace fs = std::filesystem;

TEST_CASE("list_ports applies prefix, virtualbox, missing-id and allow-list rules") {
    auto b = std::make_shared<FakePortBackend>();
    b->ports = {
        usb_port("/dev/ttyS0",   0x10C4, 0xEA60),                                  // ignored prefix
        usb_port("/dev/ttyUSB1", 0x10C4, 0xEA60, std::string("VirtualBox USB")),   // virtualbox
        usb_port("/dev/ttyUSB2", std::nullopt, 0xEA60),                            // no vid
        usb_port("/dev/ttyUSB3", 0x10C4, std::nullopt),                            // no pid
        usb_port("/dev/ttyUSB4", 0x1234, 0x5678),                                  // unknown pair
        usb_port("/dev/ttyACM0", 0x1A86, 0x55D4, std::string("USB Single Serial")),
    };
    PortEnumerator ports(b);

    auto found = ports.list_ports();
    REQUIRE(found.size() == 1);
    CHECK(found[0].device == "/dev/ttyACM0");
}

TEST_CASE("virtualbox match is case-insensitive") {
    CHECK(should_ignore_port("/dev/ttyUSB0", std::string("vIrTuAlBoX serial"), {}));
    CHECK_FALSE(should_ignore_port("/dev/ttyUSB0", std::string("CP2102"), {}));
    CHECK_FALSE(should_ignore_port("/dev/ttyUSB0", std::nullopt, {"/dev/ttyS"}));
}

TEST_CASE("ignored prefixes come from configuration") {
    auto b = two_radio_backend();
    PortEnumerator ports(b, {"/dev/ttyUSB"});
    auto found = ports.list_ports();
    REQUIRE(found.size() == 1);
    CHECK(found[0].device == "/dev/ttyACM0");
}

TEST_CASE("find_port auto picks the first listed radio") {
    PortEnumerator ports(two_radio_backend());

    auto first = ports.find_port("auto");
    REQUIRE(first.has_value());
    CHECK(first->device == "/dev/ttyUSB0");
    CHECK(ports.find_port("")->device == "/dev/ttyUSB0");
}

TEST_CASE("find_port with an explicit path matches exactly or returns nothing") {
    PortEnumerator ports(two_radio_backend());
    CHECK(ports.find_port("/dev/ttyACM0")->device == "/dev/ttyACM0");
    CHECK_FALSE(ports.find_port("/dev/ttyACM9").has_value());
}

TEST_CASE("find_port auto with no radios returns nothing") {
    PortEnumerator ports(std::make_shared<FakePortBackend>());
    CHECK_FALSE(ports.find_port("auto").has_value());
}

TEST_CASE("listing failures are typed") {
    auto b = std::make_shared<FakePortBackend>();
    b->broken = true;
    PortEnumerator ports(b);
    try {
        ports.list_ports();
        FAIL("expected SerialBackendUnavailable");
    } catch (const MeshError& e) {
        CHECK(e.code() == ErrorCode::SerialBackendUnavailable);
    }

    PortEnumerator none(nullptr);
    CHECK_THROWS_AS(none.list_ports(), MeshError);
}

// ---------- sysfs backend against a synthetic tree ----------

namespace {

struct TempTree {
    fs::path root;
    TempTree() {
        char tmpl[] = "/tmp/meshlink-sysfs-XXXXXX";
        root = ::mkdtemp(tmpl);
    }
    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    void write(const fs::path& rel, const std::string& text) {
        fs::create_directories((root / rel).parent_path());
        std::ofstream(root / rel) << text << "\n";
    }
    void link(const fs::path& rel, const fs::path& target_rel) {
        fs::create_directories((root / rel).parent_path());
        fs::create_directories(root / target_rel);
        fs::create_directory_symlink(root / target_rel, root / rel);
    }
};

} // namespace

TEST_CASE("sysfs backend reads USB attributes for a CDC ACM port") {
    TempTree t;
    // USB device 1-1 with one CDC interface.
    t.write("devices/usb1/1-1/idVendor", "239a");
    t.write("devices/usb1/1-1/idProduct", "8029");
    t.write("devices/usb1/1-1/manufacturer", "RAKwireless");
    t.write("devices/usb1/1-1/product", "WisCore RAK4631 Board");
    t.write("devices/usb1/1-1/serial", "E2A1B3C4");
    t.write("devices/usb1/1-1/bNumInterfaces", " 1");
    t.link("devices/usb1/1-1/1-1:1.0/subsystem", "bus/usb");
    t.link("class/tty/ttyACM0/device", "devices/usb1/1-1/1-1:1.0");
    // Virtual console: no device link.
    fs::create_directories(t.root / "class/tty/tty0");

    SysfsPortBackend backend((t.root / "class/tty").string(), "/dev");
    auto ports = backend.comports();

    REQUIRE(ports.size() == 1);
    const auto& p = ports[0];
    CHECK(p.device == "/dev/ttyACM0");
    CHECK(p.vid == uint16_t{0x239A});
    CHECK(p.pid == uint16_t{0x8029});
    CHECK(p.manufacturer == std::string("RAKwireless"));
    CHECK(p.description == std::string("WisCore RAK4631 Board"));
    CHECK(p.serial_number == std::string("E2A1B3C4"));
    CHECK(p.location == std::string("1-1"));
    CHECK(p.hwid == std::string("USB VID:PID=239A:8029 SER=E2A1B3C4 LOCATION=1-1"));
}

TEST_CASE("sysfs backend walks up from a usb-serial port") {
    TempTree t;
    t.write("devices/usb1/1-2/idVendor", "10c4");
    t.write("devices/usb1/1-2/idProduct", "ea60");
    t.write("devices/usb1/1-2/bNumInterfaces", " 1");
    t.link("devices/usb1/1-2/1-2:1.0/ttyUSB0/subsystem", "bus/usb-serial");
    t.link("class/tty/ttyUSB0/device", "devices/usb1/1-2/1-2:1.0/ttyUSB0");

    SysfsPortBackend backend((t.root / "class/tty").string(), "/dev");
    auto ports = backend.comports();

    REQUIRE(ports.size() == 1);
    CHECK(ports[0].vid == uint16_t{0x10C4});
    CHECK(ports[0].pid == uint16_t{0xEA60});
    CHECK(ports[0].description == std::string("ttyUSB0"));
    CHECK(ports[0].hwid == std::string("USB VID:PID=10C4:EA60 LOCATION=1-2"));
}

TEST_CASE("sysfs backend fails typed when the class directory is missing") {
    SysfsPortBackend backend("/nonexistent/meshlink/class/tty", "/dev");
    CHECK_THROWS_AS(backend.comports(), MeshError);
}

TEST_CASE("sysfs backend reports a walk it cannot start as SerialBackendUnavailable") {
    TempTree t;
    t.write("class/tty", "not a directory");
    SysfsPortBackend backend((t.root / "class/tty").string(), "/dev");
    try {
        backend.comports();
        FAIL("expected SerialBackendUnavailable");
    } catch (const MeshError& e) {
        CHECK(e.code() == ErrorCode::SerialBackendUnavailable);
    }
}
