/**
 * Unit tests for the mock network and the routing client
 *
 * Tests:
 * - Endpoint queues, detaching and drop accounting
 * - XOR-closest node lookup
 * - Client bootstrap through a proxy, rejection and termination
 * - Request expiry on the virtual clock
 */

#include "common/logging.h"
#include "mock_network/network.h"
#include "routing/client.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

using namespace vaultsim;
using namespace vaultsim::mock_network;
using namespace vaultsim::routing;

// ============================================================================
// Network
// ============================================================================

class NetworkTest : public ::testing::Test {
protected:
    NetworkTest()
        : network_(test::harness_config().min_section_size, test::harness_config().seed) {}

    Network network_;
};

TEST_F(NetworkTest, DeliversInOrderPerEndpoint) {
    auto a = network_.new_service_handle();
    auto b = network_.new_service_handle();

    EXPECT_TRUE(a->send(b->endpoint(), packet::Disconnect{"first"}));
    EXPECT_TRUE(a->send(b->endpoint(), packet::Disconnect{"second"}));
    EXPECT_EQ(network_.pending_packets(), 2u);

    auto first = b->receive();
    auto second = b->receive();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->from, a->endpoint());
    EXPECT_EQ(std::get<packet::Disconnect>(first->packet).reason, "first");
    EXPECT_EQ(std::get<packet::Disconnect>(second->packet).reason, "second");
    EXPECT_FALSE(b->receive().has_value());
    EXPECT_EQ(network_.packets_sent(), 2u);
}

TEST_F(NetworkTest, DetachedEndpointDropsPackets) {
    auto a = network_.new_service_handle();
    auto b = network_.new_service_handle();
    Endpoint gone = b->endpoint();

    EXPECT_TRUE(a->send(gone, packet::Disconnect{"queued"}));
    b.reset();

    EXPECT_FALSE(network_.is_connected(gone));
    EXPECT_FALSE(a->send(gone, packet::Disconnect{"late"}));
    EXPECT_EQ(network_.packets_dropped(), 2u);
    EXPECT_EQ(network_.pending_packets(), 0u);
}

TEST_F(NetworkTest, ClosestNodeFollowsXorMetric) {
    auto rng = network_.new_rng();
    std::vector<std::unique_ptr<ServiceHandle>> handles;
    std::vector<XorName> names;
    for (int i = 0; i < 6; ++i) {
        handles.push_back(network_.new_service_handle());
        names.push_back(rng.gen_name());
        network_.register_node(handles.back()->endpoint(), names.back());
    }

    XorName target = rng.gen_name();
    auto expected = *std::min_element(names.begin(), names.end(),
                                      [&](const XorName& lhs, const XorName& rhs) {
                                          return closer_to(target, lhs, rhs);
                                      });

    EXPECT_EQ(network_.node_count(), 6u);
    EXPECT_EQ(network_.closest_node(target), expected);
    EXPECT_EQ(network_.closest_node(names[2]), names[2]);
    EXPECT_EQ(network_.endpoint_of(names[2]), handles[2]->endpoint());
    EXPECT_EQ(network_.default_bootstrap_contact(), handles[0]->endpoint());

    handles[2].reset();
    EXPECT_EQ(network_.node_count(), 5u);
    EXPECT_FALSE(network_.endpoint_of(names[2]).has_value());
}

TEST_F(NetworkTest, ClockOnlyMovesWhenAdvanced) {
    EXPECT_EQ(network_.now_ms(), 0u);
    network_.advance_clock(250);
    EXPECT_EQ(network_.now_ms(), 250u);
    EXPECT_EQ(common::Logger::instance().sim_time(), 250u);
}

// ============================================================================
// Routing client
// ============================================================================

class RoutingClientTest : public test::SimulationTest {
protected:
    std::unique_ptr<RoutingClient> make_client(
        std::optional<BootstrapConfig> bootstrap,
        std::chrono::seconds expiry = std::chrono::seconds(90)) {
        auto rng = network_->new_rng();
        return std::make_unique<RoutingClient>(*network_, std::move(bootstrap),
                                               crypto::SecretKeys::generate(rng), expiry);
    }

    /// Poll nodes and one routing client until nothing moves
    void settle(RoutingClient& client) {
        bool progress = true;
        while (progress) {
            progress = client.poll();
            for (auto& node : nodes_) {
                progress = node.poll() || progress;
            }
            network_->advance_clock(config_.round_duration_ms);
        }
    }
};

TEST_F(RoutingClientTest, BootstrapsThroughFirstLiveContact) {
    auto client = make_client(harness::bootstrap_config(nodes_));
    common::SeededRng rng(1);

    EXPECT_TRUE(client->send_get_account_info(Authority::client_manager(XorName{}),
                                              MessageId::random(rng))
                    .is_err());

    settle(*client);

    ASSERT_TRUE(client->is_connected());
    EXPECT_EQ(client->proxy_name(), nodes_.front().name());
    EXPECT_EQ(nodes_.front().vault().client_count(), 1u);

    auto next = client->try_next_event();
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(std::holds_alternative<event::Connected>(*next));
    EXPECT_FALSE(client->try_next_event().has_value());
}

TEST_F(RoutingClientTest, DefaultContactWithoutConfig) {
    auto client = make_client(std::nullopt);

    settle(*client);

    ASSERT_TRUE(client->is_connected());
    EXPECT_TRUE(client->proxy_name().has_value());
}

TEST_F(RoutingClientTest, NoContactTerminates) {
    auto client = make_client(BootstrapConfig{});

    settle(*client);

    EXPECT_TRUE(client->is_terminated());
    auto next = client->try_next_event();
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(std::holds_alternative<event::Terminated>(*next));
    EXPECT_FALSE(client->poll());

    common::SeededRng rng(1);
    EXPECT_TRUE(client->send_get_account_info(Authority::client_manager(XorName{}),
                                              MessageId::random(rng))
                    .is_err());
}

TEST_F(RoutingClientTest, IncompleteSectionRejectsClients) {
    common::HarnessConfig small = config_;
    small.min_section_size = 4;
    small.node_count = 3;
    start(small);

    auto client = make_client(harness::bootstrap_config(nodes_));
    settle(*client);

    EXPECT_TRUE(client->is_terminated());
    EXPECT_EQ(nodes_.front().vault().client_count(), 0u);
    auto next = client->try_next_event();
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(std::holds_alternative<event::Terminated>(*next));
}

TEST_F(RoutingClientTest, FullSectionAcceptsClients) {
    common::HarnessConfig exact = config_;
    exact.min_section_size = 3;
    exact.node_count = 3;
    start(exact);

    auto client = make_client(harness::bootstrap_config(nodes_));
    settle(*client);

    EXPECT_TRUE(client->is_connected());
}

TEST_F(RoutingClientTest, ResponsesArriveAsEvents) {
    auto client = make_client(harness::bootstrap_config(nodes_));
    settle(*client);
    ASSERT_TRUE(client->try_next_event().has_value());

    common::SeededRng rng(2);
    XorName missing = rng.gen_name();
    MessageId msg_id = MessageId::random(rng);
    ASSERT_TRUE(client->send_get_idata(Authority::nae_manager(missing), missing, msg_id)
                    .is_ok());
    EXPECT_EQ(client->pending_requests(), 1u);

    settle(*client);

    auto next = client->try_next_event();
    ASSERT_TRUE(next.has_value());
    auto* received = std::get_if<event::Response>(&*next);
    ASSERT_NE(received, nullptr);
    EXPECT_EQ(response_msg_id(received->response), msg_id);
    EXPECT_EQ(received->src, Authority::nae_manager(missing));

    const auto& reply = std::get<response::GetIData>(received->response);
    ASSERT_TRUE(reply.res.is_err());
    EXPECT_EQ(reply.res.error().kind, ClientError::Kind::NoSuchData);
    EXPECT_EQ(client->pending_requests(), 0u);
}

TEST_F(RoutingClientTest, ExpiredResponsesAreDropped) {
    auto client = make_client(harness::bootstrap_config(nodes_), std::chrono::seconds(0));
    settle(*client);
    ASSERT_TRUE(client->try_next_event().has_value());

    common::SeededRng rng(3);
    XorName name = rng.gen_name();
    ASSERT_TRUE(
        client->send_get_idata(Authority::nae_manager(name), name, MessageId::random(rng))
            .is_ok());

    settle(*client);

    EXPECT_FALSE(client->try_next_event().has_value());
    EXPECT_EQ(client->pending_requests(), 0u);
}

int main(int argc, char** argv) {
    return test::run_all_tests(argc, argv);
}
