#include <doctest/doctest.h>
#include "fakes.hpp"
#include "net_discovery.hpp"

#include <mutex>
#include <set>

using namespace meshlink;
using namespace meshlink::testing;

TEST_CASE("explicit subnets enumerate usable hosts") {
    auto hosts = discovery_hosts(std::string("192.168.7.0/30"), "");
    CHECK(hosts == std::vector<std::string>{"192.168.7.1", "192.168.7.2"});

    CHECK(discovery_hosts(std::string("10.1.2.3/32"), "") == std::vector<std::string>{"10.1.2.3"});
    CHECK(discovery_hosts(std::string("10.1.2.3"), "") == std::vector<std::string>{"10.1.2.3"});
    CHECK(discovery_hosts(std::string("10.1.2.0/24"), "").size() == 254);
}

TEST_CASE("host bits in the subnet are ignored") {
    CHECK(discovery_hosts(std::string("192.168.7.9/30"), "").front() == "192.168.7.9");
    CHECK(discovery_hosts(std::string("192.168.7.9/30"), "").size() == 2);
}

TEST_CASE("invalid or oversized subnets yield nothing") {
    CHECK(discovery_hosts(std::string("not-a-subnet"), "").empty());
    CHECK(discovery_hosts(std::string("10.0.0.0/33"), "").empty());
    CHECK(discovery_hosts(std::string("10.0.0.0/"), "").empty());
    CHECK(discovery_hosts(std::string("10.0.0.0/8"), "").empty());
    // bytes with the high bit set in the prefix length
    CHECK(discovery_hosts(std::string("10.0.0.0/\xC3\xA9"), "").empty());
    CHECK(discovery_hosts(std::string("10.0.0.0/2\xB2"), "").empty());
}

TEST_CASE("without a subnet the local /24 is scanned") {
    auto hosts = discovery_hosts(std::nullopt, "192.168.1.77");
    REQUIRE(hosts.size() == 254);
    CHECK(hosts.front() == "192.168.1.1");
    CHECK(hosts.back() == "192.168.1.254");
}

TEST_CASE("loopback and all-zero addresses are never probed") {
    CHECK(discovery_hosts(std::nullopt, "127.0.0.1").empty());
    CHECK(discovery_hosts(std::string("0.0.0.0/32"), "").empty());
}

TEST_CASE("local address lookup always returns something parseable") {
    const std::string ip = local_ipv4();
    CHECK_FALSE(ip.empty());
    CHECK(discovery_hosts(std::string(ip + "/32"), "").size() <= 1);
}

namespace {

struct Rig {
    std::shared_ptr<FakeDeviceLibrary> lib = std::make_shared<FakeDeviceLibrary>();
    Connector connector{PortEnumerator(std::make_shared<FakePortBackend>()), lib};
    std::set<std::string> open_hosts;
    std::mutex mu;
    std::vector<std::string> probed;

    TcpProbe probe() {
        return [this](const std::string& host, uint16_t, int) {
            std::lock_guard<std::mutex> lk(mu);
            probed.push_back(host);
            return open_hosts.count(host) > 0;
        };
    }
};

} // namespace

TEST_CASE("hosts with an open port and a readable radio become candidates") {
    Rig r;
    r.open_hosts = {"10.9.0.2", "10.9.0.5"};
    r.lib->state.my_info = {{"node_info", {{"user", {{"long_name", "Roof"}}}}}};

    NetworkDiscoverer d(r.connector, r.probe());
    auto found = d.discover(4403, 100, std::string("10.9.0.0/29"));

    REQUIRE(found.size() == 2);
    CHECK(found[0].host == "10.9.0.2");
    CHECK(found[1].host == "10.9.0.5");
    CHECK(found[0].port == 4403);
    CHECK(found[0].title() == "Roof (10.9.0.2:4403)");
    CHECK(r.probed.size() == 6);
    CHECK(r.lib->ledger->closed.load() == 2);
}

TEST_CASE("typed and untyped read failures skip the host without aborting") {
    Rig r;
    r.open_hosts = {"10.9.0.1", "10.9.0.2"};
    r.lib->typed_open_error = MeshError(ErrorCode::ConnectionFailed, "handshake");
    NetworkDiscoverer d(r.connector, r.probe());
    CHECK(d.discover(4403, 100, std::string("10.9.0.0/29")).empty());

    r.lib->typed_open_error.reset();
    r.lib->untyped_open_error = std::string("weird");
    CHECK(d.discover(4403, 100, std::string("10.9.0.0/29")).empty());
    CHECK(r.probed.size() == 12);
}

TEST_CASE("parallel scans keep host order") {
    Rig r;
    std::vector<std::string> hosts;
    for (int i = 1; i <= 20; ++i) {
        hosts.push_back("10.9.1." + std::to_string(i));
        if (i % 3 == 0) r.open_hosts.insert(hosts.back());
    }
    NetworkDiscoverer d(r.connector, r.probe());
    auto found = d.scan_hosts(hosts, 4403, 100, 4);

    REQUIRE(found.size() == 6);
    for (std::size_t i = 0; i < found.size(); ++i)
        CHECK(found[i].host == "10.9.1." + std::to_string(3 * (i + 1)));
    CHECK(r.probed.size() == 20);
}
