#include <doctest/doctest.h>
#include "meshlink/errors.hpp"
#include "meshlink/field_tree.hpp"
#include "meshlink/telemetry.hpp"

using namespace meshlink;
using json = nlohmann::json;

TEST_CASE("telemetry view omits absent and empty values") {
    NodeTelemetry t;
    t.my_node_id = "!a1b2c3d4";
    t.node_name = "";
    t.rssi = 0.0;
    json j = to_json(t);
    CHECK(j.size() == 2);
    CHECK(j["my_node_id"] == "!a1b2c3d4");
    CHECK(j["rssi"] == 0.0);
    CHECK_FALSE(j.contains("node_name"));
    CHECK_FALSE(j.contains("channels"));
}

TEST_CASE("usb view renders ids as lower-case hex") {
    UsbPortInfo p;
    p.device = "/dev/ttyACM0";
    p.vid = 0x1A86;
    p.pid = 0x55D4;
    json j = to_json(p);
    CHECK(j["vid"] == "0x1a86");
    CHECK(j["pid"] == "0x55d4");
    CHECK_FALSE(j.contains("serial_number"));
}

TEST_CASE("snapshot identity prefers the node id, then the transport address") {
    DeviceSnapshot s;
    s.spec = ConnectionSpec::serial();
    CHECK(s.identifier() == "unknown");
    CHECK(s.display_name() == "Meshtastic");

    s.transport = ResolvedTransport{ConnectionKind::Serial, "/dev/ttyACM0", "", 0};
    CHECK(s.identifier() == "serial:/dev/ttyACM0");
    CHECK(s.display_name() == "Serial /dev/ttyACM0");

    s.telemetry = NodeTelemetry{};
    s.telemetry->my_node_id = "!A1B2C3D4";
    s.telemetry->node_name = "Relay One";
    CHECK(s.identifier() == "!a1b2c3d4");
    CHECK(s.display_name() == "Relay One (!A1B2C3D4)");

    DeviceSnapshot tcp;
    tcp.spec = ConnectionSpec::tcp("10.0.0.5");
    CHECK(tcp.identifier() == "tcp:10.0.0.5:4403");
    CHECK(tcp.display_name() == "TCP 10.0.0.5:4403");
}

TEST_CASE("failed snapshot view carries the error and no node") {
    DeviceSnapshot s;
    s.spec = ConnectionSpec::tcp("10.0.0.5");
    s.error = "connection_failed:10.0.0.5:4403: timeout";
    json j = to_json(s);
    CHECK(j["connection_type"] == "tcp");
    CHECK(j["error"] == "connection_failed:10.0.0.5:4403: timeout");
    CHECK_FALSE(j.contains("node"));
}

TEST_CASE("error messages carry a stable code token") {
    MeshError e(ErrorCode::UnsupportedOperation, "reboot");
    CHECK(std::string(e.what()) == "unsupported_operation:reboot");
    CHECK(std::string(MeshError(ErrorCode::NoConnections).what()) == "no_connections");
    CHECK(std::string(error_code_name(ErrorCode::InvalidConnectionKind)) == "invalid_connection_type");
}

TEST_CASE("tree lookups tolerate missing blocks and wrong types") {
    const json doc = {{"a", {{"b", {{"c", 3.0}}}}}, {"s", ""}, {"n", "12"}};
    CHECK(tree::as_integer(tree::at_path(&doc, {"a", "b", "c"})) == int64_t{3});
    CHECK(tree::at_path(&doc, {"a", "x", "c"}) == nullptr);
    CHECK(tree::child(nullptr, "a") == nullptr);
    CHECK_FALSE(tree::as_string(tree::child(&doc, "s")).has_value());
    CHECK_FALSE(tree::as_number(tree::child(&doc, "n")).has_value());
    CHECK(tree::pick_string(&doc, tree::AliasList{"missing", "n"}) == std::string("12"));
}
