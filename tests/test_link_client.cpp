#include <doctest/doctest.h>
#include "link_io.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/link_client.hpp"
#include "slip.hpp"

#include <nlohmann/json.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace meshlink;
using json = nlohmann::json;

// ---------- SLIP framing ----------

namespace {

std::vector<uint8_t> bytes(std::initializer_list<int> v) {
    std::vector<uint8_t> out;
    for (int b : v) out.push_back(static_cast<uint8_t>(b));
    return out;
}

std::vector<std::vector<uint8_t>> decode_all(const std::vector<uint8_t>& wire) {
    slip::FrameReader reader;
    std::vector<std::vector<uint8_t>> frames;
    reader.push_all(wire.data(), wire.size(),
                    [&frames](std::vector<uint8_t> f) { frames.push_back(std::move(f)); });
    return frames;
}

} // namespace

TEST_CASE("slip escapes END and ESC inside the payload") {
    const auto payload = bytes({0x01, 0xC0, 0x02, 0xDB, 0x03});
    const auto wire = slip::framed(payload.data(), payload.size());
    CHECK(wire == bytes({0xC0, 0x01, 0xDB, 0xDC, 0x02, 0xDB, 0xDD, 0x03, 0xC0}));

    auto frames = decode_all(wire);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == payload);
}

TEST_CASE("slip decoder ignores noise, empty frames, and drops malformed escapes") {
    auto wire = bytes({'x', 'y',                    // noise before the first END
                       0xC0, 0xC0,                  // empty frame
                       0xC0, 'o', 'k', 0xC0,
                       0xC0, 'b', 0xDB, 'z', 0xC0,  // bad escape: dropped
                       0xC0, '!', 0xC0});
    auto frames = decode_all(wire);
    REQUIRE(frames.size() == 2);
    CHECK(frames[0] == bytes({'o', 'k'}));
    CHECK(frames[1] == bytes({'!'}));
}

TEST_CASE("slip reader hunts again after a malformed escape") {
    slip::FrameReader reader;
    CHECK(reader.state() == slip::FrameReader::State::Hunting);
    CHECK_FALSE(reader.push(0xC0).has_value());
    CHECK(reader.state() == slip::FrameReader::State::Body);
    CHECK_FALSE(reader.push(0xDB).has_value());
    CHECK(reader.state() == slip::FrameReader::State::Escaped);
    CHECK_FALSE(reader.push('q').has_value());
    CHECK(reader.state() == slip::FrameReader::State::Hunting);

    // bytes before the next END are noise, not a frame
    CHECK_FALSE(reader.push('a').has_value());
    CHECK_FALSE(reader.push(0xC0).has_value());
    CHECK_FALSE(reader.push('b').has_value());
    auto f = reader.push(0xC0);
    REQUIRE(f.has_value());
    CHECK(*f == bytes({'b'}));
}

// ---------- LinkRadioClient over a socketpair ----------

namespace {

/// Plays the bridge side: one handler call per request frame.
struct Bridge {
    int host_fd = -1;
    int bridge_fd = -1;
    std::thread th;
    std::vector<json> requests;

    explicit Bridge(std::function<std::vector<std::string>(const json&)> handler) {
        int sv[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
        host_fd = sv[0];
        bridge_fd = sv[1];
        th = std::thread([this, handler] {
            std::vector<uint8_t> frame;
            while (read_frame(bridge_fd, frame, 2000)) {
                json req = json::parse(frame.begin(), frame.end());
                requests.push_back(req);
                for (const auto& reply : handler(req))
                    write_frame(bridge_fd, std::vector<uint8_t>(reply.begin(), reply.end()), 1000);
            }
        });
    }

    /// Stop serving; after this, requests is safe to read.
    void stop() {
        ::shutdown(bridge_fd, SHUT_RDWR);
        if (th.joinable()) th.join();
    }

    ~Bridge() {
        stop();
        ::close(bridge_fd);
    }
};

json state_doc() {
    return {{"my_info", {{"my_node_id", "!a1b2c3d4"}}},
            {"radio_config", {{"preferences", {{"region", "EU_868"}}}}},
            {"nodes", {{"1", json::object()}}},
            {"channels", json::array({{{"name", "LongFast"}}})},
            {"last_received", nullptr},
            {"capabilities", {"send_text", "reboot"}}};
}

LinkOptions fast() {
    LinkOptions o;
    o.io_timeout_ms = 500;
    return o;
}

} // namespace

TEST_CASE("handshake caches the state document and capabilities") {
    Bridge bridge([](const json& req) -> std::vector<std::string> {
        if (req["op"] == "get_state") return {state_doc().dump()};
        return {json{{"status", "ok"}}.dump()};
    });
    LinkRadioClient client(bridge.host_fd, "test", fast());

    CHECK(client.my_info()["my_node_id"] == "!a1b2c3d4");
    CHECK(client.radio_config()["preferences"]["region"] == "EU_868");
    CHECK(client.channels().size() == 1);
    CHECK(client.last_received().is_null());
    CHECK(client.supports(Capability::SendText));
    CHECK(client.supports(Capability::Reboot));
    CHECK_FALSE(client.supports(Capability::SetPrimaryChannel));

    client.send_text("hello", std::string("!0badf00d"));
    client.send_text("all", std::nullopt);
    client.close();
    bridge.stop();

    const json expected = {{"op", "send_text"}, {"text", "hello"}, {"destination_id", "!0badf00d"}};
    REQUIRE(bridge.requests.size() == 3);
    CHECK(bridge.requests[1] == expected);
    CHECK_FALSE(bridge.requests[2].contains("destination_id"));
}

TEST_CASE("non-object frames are skipped while waiting for the reply") {
    Bridge bridge([](const json& req) -> std::vector<std::string> {
        if (req["op"] == "get_state") return {"booting...", "[1,2]", state_doc().dump()};
        return {json{{"status", "ok"}}.dump()};
    });
    LinkRadioClient client(bridge.host_fd, "test", fast());
    CHECK(client.my_info()["my_node_id"] == "!a1b2c3d4");
    client.close();
}

TEST_CASE("error replies become ConnectionFailed with the bridge's reason") {
    Bridge bridge([](const json& req) -> std::vector<std::string> {
        if (req["op"] == "get_state") return {state_doc().dump()};
        return {json{{"status", "error"}, {"reason", "no_such_channel"}}.dump()};
    });
    LinkRadioClient client(bridge.host_fd, "radio", fast());
    try {
        client.set_primary_channel("ops");
        FAIL("expected ConnectionFailed");
    } catch (const MeshError& e) {
        CHECK(e.code() == ErrorCode::ConnectionFailed);
        CHECK(e.detail() == "radio: no_such_channel");
    }
    client.close();
}

TEST_CASE("a silent peer times out during the handshake") {
    Bridge bridge([](const json&) { return std::vector<std::string>{}; });
    try {
        LinkRadioClient client(bridge.host_fd, "mute", fast());
        FAIL("expected timeout");
    } catch (const MeshError& e) {
        CHECK(e.code() == ErrorCode::ConnectionFailed);
        CHECK(e.detail() == "mute: timeout");
    }
}

TEST_CASE("device library maps open failures to ConnectionFailed") {
    LinkDeviceLibrary lib(fast());
    CHECK_THROWS_AS(lib.open_serial("/nonexistent/ttyACM0"), MeshError);
    CHECK(std::string(lib.name()) == "slip-json-link");
}
