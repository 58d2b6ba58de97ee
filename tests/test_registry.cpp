#include <doctest/doctest.h>
#include "fakes.hpp"
#include "command_dispatch.hpp"
#include "meshlink/connector.hpp"
#include "meshlink/registry.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace meshlink;
using namespace meshlink::testing;
using json = nlohmann::json;

namespace {

struct Rig {
    std::shared_ptr<FakeDeviceLibrary> lib = std::make_shared<FakeDeviceLibrary>();
    Connector connector{PortEnumerator(two_radio_backend()), lib};
    ConnectionRegistry registry{connector};

    Rig() { lib->state.my_info = {{"my_node_id", "!a1b2c3d4"}}; }
};

ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const MeshError& e) {
        return e.code();
    }
    FAIL("expected MeshError");
    return ErrorCode::ConnectionFailed;
}

} // namespace

TEST_CASE("selector resolution") {
    Rig r;
    CHECK(code_of([&] { r.registry.resolve(std::nullopt); }) == ErrorCode::NoConnections);

    r.registry.setup("shack", ConnectionSpec::serial("/dev/ttyUSB0"), 10);
    CHECK(r.registry.resolve(std::nullopt)->id == "shack");
    CHECK(r.registry.resolve(std::string("shack"))->id == "shack");
    CHECK(code_of([&] { r.registry.resolve(std::string("roof")); }) == ErrorCode::UnknownConnection);

    r.registry.setup("roof", ConnectionSpec::tcp("10.0.0.5"), 10);
    CHECK(code_of([&] { r.registry.resolve(std::nullopt); }) == ErrorCode::AmbiguousConnection);
    CHECK(r.registry.resolve(std::string("roof"))->spec.tcp_host == "10.0.0.5");

    CHECK(r.registry.teardown("roof"));
    CHECK_FALSE(r.registry.teardown("roof"));
    CHECK(r.registry.resolve(std::nullopt)->id == "shack");
}

TEST_CASE("setup failure is NotReady and registers nothing") {
    Rig r;
    CHECK(code_of([&] { r.registry.setup("ghost", ConnectionSpec::serial("/dev/ttyACM9"), 10); })
          == ErrorCode::NotReady);
    CHECK(r.registry.ids().empty());
    CHECK_FALSE(r.registry.services_registered());
}

TEST_CASE("duplicate ids and bad intervals are rejected") {
    Rig r;
    r.registry.setup("shack", ConnectionSpec::serial(), 10);
    CHECK(code_of([&] { r.registry.setup("shack", ConnectionSpec::serial(), 10); })
          == ErrorCode::InvalidArgument);
    CHECK(code_of([&] { r.registry.setup("other", ConnectionSpec::serial(), 4000); })
          == ErrorCode::InvalidArgument);
}

TEST_CASE("services are installed once, on the first setup") {
    Rig r;
    CHECK_FALSE(r.registry.services_registered());
    CHECK(code_of([&] { r.registry.call("reboot", json::object()); }) == ErrorCode::InvalidArgument);

    r.registry.setup("a", ConnectionSpec::serial("/dev/ttyUSB0"), 10);
    CHECK(r.registry.services_registered());
    r.registry.setup("b", ConnectionSpec::serial("/dev/ttyACM0"), 10);
    CHECK(r.registry.services_registered());
}

TEST_CASE("services are callable as soon as a connection is visible") {
    Rig r;
    std::atomic<bool> saw_connection{false};
    std::atomic<bool> services_ready{false};
    std::thread observer([&] {
        const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < until) {
            if (!r.registry.ids().empty()) {
                saw_connection = true;
                services_ready = r.registry.services_registered();
                return;
            }
            std::this_thread::yield();
        }
    });
    r.registry.setup("a", ConnectionSpec::serial("/dev/ttyUSB0"), 10);
    observer.join();
    CHECK(saw_connection.load());
    CHECK(services_ready.load());
    CHECK(r.registry.call("refresh", json::object())["entry_id"] == "a");
}

TEST_CASE("send_message service routes to the selected connection") {
    Rig r;
    r.registry.setup("shack", ConnectionSpec::serial("/dev/ttyUSB0"), 10);
    r.registry.setup("roof", ConnectionSpec::tcp("10.0.0.5"), 10);

    json res = r.registry.call("send_message",
                               {{"message", "hello"}, {"target", "!0badf00d"}, {"entry_id", "roof"}});
    CHECK(res["status"] == "ok");
    CHECK(r.lib->opened_targets.back() == "tcp:10.0.0.5:4403");
    REQUIRE(r.lib->ledger->sent.size() == 1);
    CHECK(r.lib->ledger->sent[0].second == std::string("!0badf00d"));

    CHECK(code_of([&] { r.registry.call("send_message", {{"message", "hello"}}); })
          == ErrorCode::AmbiguousConnection);
}

TEST_CASE("service argument validation") {
    Rig r;
    r.registry.setup("shack", ConnectionSpec::serial(), 10);

    CHECK(code_of([&] { r.registry.call("send_message", json::object()); }) == ErrorCode::InvalidArgument);
    CHECK(code_of([&] { r.registry.call("send_message", {{"message", 5}}); }) == ErrorCode::InvalidArgument);
    CHECK(code_of([&] { r.registry.call("send_message", {{"message", "   "}}); }) == ErrorCode::InvalidArgument);
    CHECK(code_of([&] { r.registry.call("set_channel", json::object()); }) == ErrorCode::InvalidArgument);
    CHECK(code_of([&] { r.registry.call("reboot", json::array()); }) == ErrorCode::InvalidArgument);
    CHECK(code_of([&] { r.registry.call("self_destruct", json::object()); }) == ErrorCode::InvalidArgument);
}

TEST_CASE("command failures propagate through services") {
    Rig r;
    r.registry.setup("shack", ConnectionSpec::serial(), 10);
    r.lib->state.can_reboot = false;
    CHECK(code_of([&] { r.registry.call("reboot", nullptr); }) == ErrorCode::UnsupportedOperation);

    r.lib->state.can_reboot = true;
    r.registry.call("set_channel", {{"channel_name", "ops"}});
    CHECK(r.lib->ledger->channel_names == std::vector<std::string>{"ops"});
}

TEST_CASE("refresh service forces a new poll") {
    Rig r;
    r.registry.setup("shack", ConnectionSpec::serial(), 10);
    auto conn = r.registry.resolve(std::nullopt);

    json res = r.registry.call("refresh", json::object());
    CHECK(res["entry_id"] == "shack");
    CHECK(conn->scheduler->wait_for_generation(res["generation"].get<uint64_t>(),
                                               std::chrono::seconds(5)));
    CHECK(conn->scheduler->latest()->ok());
}

TEST_CASE("service names round trip through the dispatcher table") {
    for (ServiceKind k : {ServiceKind::SendMessage, ServiceKind::Reboot,
                          ServiceKind::SetChannel, ServiceKind::Refresh}) {
        ServiceKind back;
        REQUIRE(name_to_kind(service_name(k), back));
        CHECK(back == k);
    }
    ServiceKind unused;
    CHECK_FALSE(name_to_kind("ping", unused));
}

TEST_CASE("a connection that is not ready is parked and comes up on retry") {
    Rig r;
    r.registry.setup("a", ConnectionSpec::serial("/dev/ttyUSB0"), 10);

    r.lib->typed_open_error = MeshError(ErrorCode::ConnectionFailed, "port busy");
    CHECK(r.registry.setup_or_defer("b", ConnectionSpec::serial("/dev/ttyACM0"), 10) == nullptr);
    CHECK(r.registry.pending_ids() == std::vector<std::string>{"b"});
    CHECK(r.registry.ids() == std::vector<std::string>{"a"});
    CHECK(r.registry.resolve(std::string("a"))->scheduler->state() != PollState::Stopped);

    // still failing: stays parked
    CHECK(r.registry.retry_pending().empty());
    CHECK(r.registry.pending_ids() == std::vector<std::string>{"b"});

    r.lib->typed_open_error.reset();
    auto up = r.registry.retry_pending();
    REQUIRE(up.size() == 1);
    CHECK(up[0].first == "b");
    CHECK(up[0].second->ok());
    CHECK(r.registry.pending_ids().empty());
    CHECK(r.registry.ids() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("setup_or_defer only parks NotReady") {
    Rig r;
    CHECK(code_of([&] { r.registry.setup_or_defer("c", ConnectionSpec::serial(), 4000); })
          == ErrorCode::InvalidArgument);
    CHECK(r.registry.pending_ids().empty());

    CHECK(r.registry.setup_or_defer("ghost", ConnectionSpec::serial("/dev/ttyACM9"), 10) == nullptr);
    CHECK(code_of([&] { r.registry.setup_or_defer("ghost", ConnectionSpec::serial(), 10); })
          == ErrorCode::InvalidArgument);
    CHECK(r.registry.teardown("ghost"));
    CHECK(r.registry.pending_ids().empty());
    CHECK(r.registry.retry_pending().empty());
}
