#include <doctest/doctest.h>
#include "fakes.hpp"
#include "commands.hpp"

using namespace meshlink;
using namespace meshlink::testing;

namespace {

struct Rig {
    std::shared_ptr<FakeDeviceLibrary> lib = std::make_shared<FakeDeviceLibrary>();
    Connector connector{PortEnumerator(two_radio_backend()), lib};
    ConnectionSpec spec = ConnectionSpec::serial();
};

template <typename Fn>
MeshError catch_mesh(Fn fn) {
    try {
        fn();
    } catch (const MeshError& e) {
        return e;
    }
    FAIL("expected MeshError");
    return MeshError(ErrorCode::ConnectionFailed);
}

} // namespace

TEST_CASE("send_message passes text and target to the radio") {
    Rig r;
    send_message(r.connector, r.spec, "hello mesh", std::string("!a1b2c3d4"));
    send_message(r.connector, r.spec, "to everyone");

    REQUIRE(r.lib->ledger->sent.size() == 2);
    CHECK(r.lib->ledger->sent[0].first == "hello mesh");
    CHECK(r.lib->ledger->sent[0].second == std::string("!a1b2c3d4"));
    CHECK(r.lib->ledger->sent[1].first == "to everyone");
    CHECK_FALSE(r.lib->ledger->sent[1].second.has_value());
    CHECK(r.lib->ledger->closed.load() == 2);
}

TEST_CASE("a blank target broadcasts") {
    Rig r;
    send_message(r.connector, r.spec, "hi", std::string("  "));
    CHECK_FALSE(r.lib->ledger->sent.at(0).second.has_value());
}

TEST_CASE("empty or whitespace text is rejected before any open") {
    Rig r;
    for (const char* text : {"", "   ", "\t\n "}) {
        CAPTURE(text);
        CHECK(catch_mesh([&] { send_message(r.connector, r.spec, text); }).code()
              == ErrorCode::InvalidArgument);
    }
    CHECK(catch_mesh([&] { set_channel(r.connector, r.spec, " "); }).code()
          == ErrorCode::InvalidArgument);
    CHECK(r.lib->ledger->opened.load() == 0);
}

TEST_CASE("text that is not valid UTF-8 is rejected before any open") {
    Rig r;
    const std::string bad = "caf\xC3";   // truncated two-byte sequence
    MeshError e = catch_mesh([&] { send_message(r.connector, r.spec, bad); });
    CHECK(e.code() == ErrorCode::InvalidArgument);
    CHECK(e.detail().find("message") != std::string::npos);

    CHECK(catch_mesh([&] { send_message(r.connector, r.spec, "ok", std::string("!\xFF")); }).code()
          == ErrorCode::InvalidArgument);
    CHECK(catch_mesh([&] { set_channel(r.connector, r.spec, "ch\x80"); }).code()
          == ErrorCode::InvalidArgument);
    CHECK(r.lib->ledger->opened.load() == 0);

    send_message(r.connector, r.spec, "caf\xC3\xA9");
    REQUIRE(r.lib->ledger->sent.size() == 1);
    CHECK(r.lib->ledger->sent[0].first == "caf\xC3\xA9");
}

TEST_CASE("missing capabilities fail with the capability name and still close") {
    Rig r;
    r.lib->state.can_send = false;
    r.lib->state.can_reboot = false;
    r.lib->state.can_set_channel = false;

    MeshError e1 = catch_mesh([&] { send_message(r.connector, r.spec, "hi"); });
    CHECK(e1.code() == ErrorCode::UnsupportedOperation);
    CHECK(e1.detail() == "send_text");

    MeshError e2 = catch_mesh([&] { reboot(r.connector, r.spec); });
    CHECK(e2.detail() == "reboot");

    MeshError e3 = catch_mesh([&] { set_channel(r.connector, r.spec, "ops"); });
    CHECK(e3.detail() == "set_primary_channel");

    CHECK(r.lib->ledger->opened.load() == 3);
    CHECK(r.lib->ledger->closed.load() == 3);
    CHECK(r.lib->ledger->sent.empty());
}

TEST_CASE("reboot and set_channel reach the radio") {
    Rig r;
    reboot(r.connector, r.spec);
    set_channel(r.connector, r.spec, "ops");
    CHECK(r.lib->ledger->reboots == 1);
    CHECK(r.lib->ledger->channel_names == std::vector<std::string>{"ops"});
}

TEST_CASE("open failures propagate from commands") {
    Rig r;
    CHECK(catch_mesh([&] { reboot(r.connector, ConnectionSpec::serial("/dev/nope")); }).code()
          == ErrorCode::SerialPortNotFound);
}
