#include "test_common.hh"

/* Feed what a sender wrote to a receiving binder and pull "frames" frames.
 * Return the configuration sets the receiving decoder was created with */
static std::vector<nalstream::unit::configuration_set> receive_stream(const std::vector<uint8_t>& stream,
    size_t frames)
{
    auto transport = std::make_shared<mock_transport>();
    auto decoder   = std::make_shared<mock_decoder>();
    nalstream::binder receiver(NCE_RECEIVER, transport, decoder);

    EXPECT_EQ(NLS_OK, receiver.init());

    transport->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    transport->deliver(TEST_PEER, stream);

    for (size_t i = 0; i < frames; ++i) {
        nalstream::unit::decoded_frame *frame = receiver.pull_frame((size_t)1000);

        EXPECT_NE(nullptr, frame);
        if (frame)
            EXPECT_EQ(NLS_OK, nalstream::unit::dealloc_frame(frame));
    }

    EXPECT_EQ(0u, receiver.get_stats().units_dropped_not_ready);
    EXPECT_EQ(0, decoder->misuse());

    return decoder->configs();
}

class sender_fixture : public ::testing::Test
{
protected:
    void SetUp()
    {
        transport_ = std::make_shared<mock_transport>();
        binder_ = std::unique_ptr<nalstream::binder>(new nalstream::binder(NCE_SENDER, transport_, nullptr));

        ASSERT_EQ(NLS_OK, binder_->init());
        ASSERT_TRUE(transport_->has_handlers());
    }

    void TearDown()
    {
        binder_ = nullptr;
        EXPECT_FALSE(transport_->has_handlers());
    }

    nls_error_t push(const std::vector<uint8_t>& payload)
    {
        return binder_->push_unit(payload.data(), payload.size());
    }

    std::vector<std::vector<uint8_t>> wait_payloads(const std::string& peer,
        const std::vector<std::vector<uint8_t>>& expected)
    {
        EXPECT_TRUE(transport_->wait_written(peer, make_stream(expected).size()));
        return parse_stream(transport_->written(peer));
    }

    std::shared_ptr<mock_transport> transport_;
    std::unique_ptr<nalstream::binder> binder_;
};

class receiver_binder_fixture : public ::testing::Test
{
protected:
    void SetUp()
    {
        transport_ = std::make_shared<mock_transport>();
        decoder_   = std::make_shared<mock_decoder>();
        binder_    = std::unique_ptr<nalstream::binder>(
            new nalstream::binder(NCE_RECEIVER, transport_, decoder_)
        );

        ASSERT_EQ(NLS_OK, binder_->init());
    }

    std::shared_ptr<mock_transport> transport_;
    std::shared_ptr<mock_decoder> decoder_;
    std::unique_ptr<nalstream::binder> binder_;
};

TEST_F(sender_fixture, configuration_precedes_frames)
{
    std::vector<uint8_t> sps = make_sps(1);
    std::vector<uint8_t> pps = make_pps(1);
    std::vector<uint8_t> f1  = make_frame(0x65, 100, 1);

    /* cached while no peer is bound */
    EXPECT_EQ(NLS_OK, push(sps));
    EXPECT_EQ(NLS_OK, push(pps));
    EXPECT_EQ(NLS_NOT_READY, push(f1));
    EXPECT_EQ(1u, binder_->get_stats().frames_dropped_no_peer);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    EXPECT_EQ(TEST_PEER, binder_->active_peer());

    EXPECT_EQ(NLS_OK, push(f1));
    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps, pps, f1 }), wait_payloads(TEST_PEER, { sps, pps, f1 }));

    ASSERT_TRUE(wait_until([this] { return binder_->get_stats().units_sent == 3; }));
    EXPECT_EQ(make_stream({ sps, pps, f1 }).size(), binder_->get_stats().bytes_sent);
}

TEST_F(sender_fixture, configuration_is_resent_after_reconnect)
{
    std::vector<uint8_t> sps = make_sps(1);
    std::vector<uint8_t> pps = make_pps(1);
    std::vector<uint8_t> f1  = make_frame(0x65, 50, 1);
    std::vector<uint8_t> f2  = make_frame(0x41, 50, 2);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_OK, push(sps));
    EXPECT_EQ(NLS_OK, push(pps));
    EXPECT_EQ(NLS_OK, push(f1));
    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps, pps, f1 }), wait_payloads(TEST_PEER, { sps, pps, f1 }));

    transport_->set_state(TEST_PEER, NLS_PEER_DISCONNECTED);
    EXPECT_TRUE(transport_->wait_closed(TEST_PEER));
    EXPECT_EQ("", binder_->active_peer());

    transport_->clear_written(TEST_PEER);
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_OK, push(f2));
    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps, pps, f2 }), wait_payloads(TEST_PEER, { sps, pps, f2 }));
    EXPECT_EQ(2u, transport_->opened_count());
    EXPECT_EQ(2u, binder_->get_stats().peers_bound);
}

TEST_F(sender_fixture, frames_without_configuration_are_dropped)
{
    std::vector<uint8_t> sps = make_sps(3);
    std::vector<uint8_t> pps = make_pps(3);
    std::vector<uint8_t> f1  = make_frame(0x65, 20, 1);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_NOT_READY, push(make_frame(0x65, 20, 9)));
    EXPECT_EQ(1u, binder_->get_stats().frames_dropped_no_config);

    /* a lone primary does not complete anything */
    EXPECT_EQ(NLS_OK, push(sps));
    EXPECT_EQ(NLS_NOT_READY, push(make_frame(0x41, 20, 9)));
    EXPECT_EQ(2u, binder_->get_stats().frames_dropped_no_config);

    EXPECT_EQ(NLS_OK, push(pps));
    EXPECT_EQ(NLS_OK, push(f1));

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps, pps, f1 }), wait_payloads(TEST_PEER, { sps, pps, f1 }));
}

TEST_F(sender_fixture, partial_and_empty_writes_are_retried)
{
    std::vector<std::vector<uint8_t>> payloads = {
        make_sps(1), make_pps(1), make_frame(0x65, 300, 1), make_frame(0x41, 7, 2), make_frame(0x41, 1, 3)
    };

    transport_->script_writes({ 1, 0, 2, 3, 0, 0, 1, 5, 100, 0, 1, 1, 1, 17, 2 });
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    for (auto& payload : payloads)
        EXPECT_EQ(NLS_OK, push(payload));

    EXPECT_EQ(payloads, wait_payloads(TEST_PEER, payloads));
    EXPECT_EQ(0u, binder_->get_stats().write_faults);
}

TEST_F(sender_fixture, write_error_tears_binding_down)
{
    std::vector<uint8_t> sps = make_sps(1);
    std::vector<uint8_t> pps = make_pps(1);

    EXPECT_EQ(NLS_OK, push(sps));
    EXPECT_EQ(NLS_OK, push(pps));

    transport_->script_writes({ -1 });
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_TRUE(transport_->wait_closed(TEST_PEER));
    ASSERT_TRUE(wait_until([this] { return binder_->active_peer().empty(); }));
    EXPECT_EQ(1u, binder_->get_stats().write_faults);

    EXPECT_EQ(NLS_NOT_READY, push(make_frame(0x65, 10, 1)));
    EXPECT_EQ(1u, binder_->get_stats().frames_dropped_no_peer);

    /* the transport reporting the disconnect afterwards is harmless */
    EXPECT_EQ(NLS_NOT_FOUND, binder_->peer_state_changed(TEST_PEER, NLS_PEER_DISCONNECTED));

    /* the peer can be bound again and gets the configuration first */
    transport_->clear_written(TEST_PEER);
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    std::vector<uint8_t> f1 = make_frame(0x65, 10, 1);
    EXPECT_EQ(NLS_OK, push(f1));
    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps, pps, f1 }), wait_payloads(TEST_PEER, { sps, pps, f1 }));
}

TEST_F(sender_fixture, stalled_stream_times_out)
{
    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_WRITE_TIMEOUT_MS, 30));

    transport_->script_writes(std::vector<ssize_t>(5000, 0));
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_OK, push(make_sps(1)));

    EXPECT_TRUE(transport_->wait_closed(TEST_PEER));
    EXPECT_TRUE(wait_until([this] { return binder_->active_peer().empty(); }));
    EXPECT_EQ(1u, binder_->get_stats().write_faults);
}

TEST_F(sender_fixture, full_queue_gives_frames_up_for_configuration)
{
    std::vector<uint8_t> sps1 = make_sps(1);
    std::vector<uint8_t> pps1 = make_pps(1);
    std::vector<uint8_t> sps2 = make_sps(2);
    std::vector<uint8_t> pps2 = make_pps(2);

    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_SEND_QUEUE_SIZE, 3));
    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_CONFIG_ENQUEUE_TIMEOUT_MS, 0));
    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_WRITE_TIMEOUT_MS, 5000));

    EXPECT_EQ(NLS_OK, push(sps1));
    EXPECT_EQ(NLS_OK, push(pps1));

    /* writer is stuck on the first packet for a while, pps1 waits behind it */
    transport_->script_writes(std::vector<ssize_t>(250, 0));
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    ASSERT_TRUE(wait_until([this] { return transport_->write_calls() > 0; }));

    EXPECT_EQ(NLS_OK, push(make_frame(0x65, 10, 1)));
    EXPECT_EQ(NLS_OK, push(make_frame(0x41, 10, 2)));
    EXPECT_EQ(NLS_NOT_READY, push(make_frame(0x41, 10, 3)));
    EXPECT_EQ(1u, binder_->get_stats().frames_dropped_saturated);

    /* the new set takes the place of the two queued frames */
    EXPECT_EQ(NLS_OK, push(sps2));
    EXPECT_EQ(NLS_OK, push(pps2));
    EXPECT_EQ(3u, binder_->get_stats().frames_dropped_saturated);
    EXPECT_EQ(0u, binder_->get_stats().config_enqueue_timeouts);

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps1, pps1, sps2, pps2 }),
        wait_payloads(TEST_PEER, { sps1, pps1, sps2, pps2 }));
    EXPECT_EQ(0u, binder_->get_stats().write_faults);
}

TEST_F(sender_fixture, configuration_waits_behind_configuration)
{
    std::vector<uint8_t> sps1 = make_sps(1);
    std::vector<uint8_t> pps1 = make_pps(1);
    std::vector<uint8_t> sps2 = make_sps(2);
    std::vector<uint8_t> pps2 = make_pps(2);

    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_SEND_QUEUE_SIZE, 1));
    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_CONFIG_ENQUEUE_TIMEOUT_MS, 2000));

    EXPECT_EQ(NLS_OK, push(sps1));
    EXPECT_EQ(NLS_OK, push(pps1));

    /* a slow but healthy stream */
    transport_->script_writes(std::vector<ssize_t>(20, 0));
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    ASSERT_TRUE(wait_until([this] { return transport_->write_calls() > 0; }));

    /* nothing can be given up, both units wait for the writer */
    EXPECT_EQ(NLS_OK, push(sps2));
    EXPECT_EQ(NLS_OK, push(pps2));

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps1, pps1, sps2, pps2 }),
        wait_payloads(TEST_PEER, { sps1, pps1, sps2, pps2 }));
    EXPECT_EQ(0u, binder_->get_stats().config_enqueue_timeouts);
    EXPECT_EQ(0u, binder_->get_stats().frames_dropped_saturated);
}

TEST_F(sender_fixture, primary_without_peer_is_sent_on_connect)
{
    std::vector<uint8_t> sps1 = make_sps(1);
    std::vector<uint8_t> pps1 = make_pps(1);
    std::vector<uint8_t> sps2 = make_sps(2);
    std::vector<uint8_t> pps2 = make_pps(2);
    std::vector<uint8_t> f1   = make_frame(0x65, 30, 1);

    /* the encoder renegotiates while nobody is bound and finishes after the connect */
    EXPECT_EQ(NLS_OK, push(sps1));
    EXPECT_EQ(NLS_OK, push(pps1));
    EXPECT_EQ(NLS_OK, push(sps2));

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_OK, push(pps2));
    EXPECT_EQ(NLS_OK, push(f1));

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps1, pps1, sps2, pps2, f1 }),
        wait_payloads(TEST_PEER, { sps1, pps1, sps2, pps2, f1 }));

    auto configs = receive_stream(transport_->written(TEST_PEER), 1);

    ASSERT_EQ(2u, configs.size());
    EXPECT_EQ(sps2, configs[1].primary);
    EXPECT_EQ(pps2, configs[1].secondary);
}

TEST_F(sender_fixture, lone_primary_is_sent_on_connect)
{
    std::vector<uint8_t> sps = make_sps(1);
    std::vector<uint8_t> pps = make_pps(1);
    std::vector<uint8_t> f1  = make_frame(0x65, 30, 1);

    EXPECT_EQ(NLS_OK, push(sps));

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_OK, push(pps));
    EXPECT_EQ(NLS_OK, push(f1));

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps, pps, f1 }), wait_payloads(TEST_PEER, { sps, pps, f1 }));
}

TEST_F(sender_fixture, configuration_changes_mid_stream)
{
    std::vector<uint8_t> sps1 = make_sps(1);
    std::vector<uint8_t> pps1 = make_pps(1);
    std::vector<uint8_t> sps2 = make_sps(2);
    std::vector<uint8_t> pps2 = make_pps(2);
    std::vector<uint8_t> f1   = make_frame(0x65, 30, 1);
    std::vector<uint8_t> f2   = make_frame(0x65, 30, 2);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    for (auto& unit : { sps1, pps1, f1, sps2, pps2, f2 })
        EXPECT_EQ(NLS_OK, push(unit));

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps1, pps1, f1, sps2, pps2, f2 }),
        wait_payloads(TEST_PEER, { sps1, pps1, f1, sps2, pps2, f2 }));

    auto configs = receive_stream(transport_->written(TEST_PEER), 2);

    ASSERT_EQ(2u, configs.size());
    EXPECT_EQ(sps1, configs[0].primary);
    EXPECT_EQ(pps1, configs[0].secondary);
    EXPECT_EQ(sps2, configs[1].primary);
    EXPECT_EQ(pps2, configs[1].secondary);
}

TEST_F(sender_fixture, reconnect_between_primary_and_secondary)
{
    std::vector<uint8_t> sps1 = make_sps(1);
    std::vector<uint8_t> pps1 = make_pps(1);
    std::vector<uint8_t> sps2 = make_sps(2);
    std::vector<uint8_t> pps2 = make_pps(2);
    std::vector<uint8_t> f1   = make_frame(0x65, 30, 1);
    std::vector<uint8_t> f2   = make_frame(0x65, 30, 2);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    for (auto& unit : { sps1, pps1, f1, sps2 })
        EXPECT_EQ(NLS_OK, push(unit));

    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps1, pps1, f1, sps2 }),
        wait_payloads(TEST_PEER, { sps1, pps1, f1, sps2 }));

    transport_->set_state(TEST_PEER, NLS_PEER_DISCONNECTED);
    EXPECT_TRUE(transport_->wait_closed(TEST_PEER));

    transport_->clear_written(TEST_PEER);
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(NLS_OK, push(pps2));
    EXPECT_EQ(NLS_OK, push(f2));

    /* the last complete set, then the new one in full */
    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ sps1, pps1, sps2, pps2, f2 }),
        wait_payloads(TEST_PEER, { sps1, pps1, sps2, pps2, f2 }));

    auto configs = receive_stream(transport_->written(TEST_PEER), 1);

    ASSERT_EQ(2u, configs.size());
    EXPECT_EQ(sps2, configs[1].primary);
    EXPECT_EQ(pps2, configs[1].secondary);
}

TEST_F(sender_fixture, binding_is_published_before_first_write)
{
    std::atomic<int> unbound_writes(0);

    transport_->on_write([this, &unbound_writes](const std::string& peer) {
        if (binder_->active_peer() != peer)
            ++unbound_writes;
    });

    EXPECT_EQ(NLS_OK, push(make_sps(1)));
    EXPECT_EQ(NLS_OK, push(make_pps(1)));

    transport_->script_writes({ -1 });
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    /* the fault on the very first write still closes the stream */
    EXPECT_TRUE(transport_->wait_closed(TEST_PEER));
    ASSERT_TRUE(wait_until([this] { return binder_->active_peer().empty(); }));
    EXPECT_EQ(1u, binder_->get_stats().write_faults);
    EXPECT_EQ(0, unbound_writes.load());

    transport_->on_write(nullptr);
}

TEST_F(sender_fixture, second_peer_is_rejected)
{
    EXPECT_EQ(NLS_OK, binder_->peer_state_changed(TEST_PEER, NLS_PEER_CONNECTED));
    EXPECT_EQ(NLS_OK, binder_->peer_state_changed(TEST_PEER, NLS_PEER_CONNECTED));
    EXPECT_EQ(NLS_PEER_REJECTED, binder_->peer_state_changed(OTHER_PEER, NLS_PEER_CONNECTED));

    EXPECT_EQ(TEST_PEER, binder_->active_peer());
    EXPECT_EQ(1u, binder_->get_stats().peers_rejected);
    EXPECT_EQ(1u, transport_->opened_count());

    EXPECT_EQ(NLS_NOT_FOUND, binder_->peer_state_changed(OTHER_PEER, NLS_PEER_DISCONNECTED));
    EXPECT_EQ(TEST_PEER, binder_->active_peer());

    EXPECT_EQ(NLS_OK, binder_->peer_state_changed(TEST_PEER, NLS_PEER_DISCONNECTED));
    EXPECT_EQ(NLS_OK, binder_->peer_state_changed(OTHER_PEER, NLS_PEER_CONNECTED));
    EXPECT_EQ(OTHER_PEER, binder_->active_peer());
}

TEST_F(sender_fixture, connecting_peer_is_not_bound)
{
    EXPECT_EQ(NLS_OK, binder_->peer_state_changed(TEST_PEER, NLS_PEER_CONNECTING));
    EXPECT_EQ("", binder_->active_peer());
    EXPECT_EQ(0u, transport_->opened_count());
}

TEST_F(sender_fixture, inbound_bytes_are_ignored)
{
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    std::vector<uint8_t> bytes = make_stream({ make_sps(1) });
    EXPECT_EQ(NLS_OK, binder_->bytes_received(TEST_PEER, bytes.data(), bytes.size()));
    EXPECT_EQ(0u, binder_->get_stats().bytes_received);
}

TEST_F(sender_fixture, frames_cannot_be_pulled)
{
    EXPECT_EQ(nullptr, binder_->pull_frame(10));
    EXPECT_EQ(NLS_NOT_INITIALIZED, nls_errno);
}

TEST_F(receiver_binder_fixture, decoded_frames_are_pulled)
{
    std::vector<uint8_t> f1 = make_frame(0x65, 40, 1);
    std::vector<uint8_t> f2 = make_frame(0x41, 40, 2);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    transport_->deliver(TEST_PEER, make_stream({ make_sps(1), make_pps(1), f1, f2 }));

    nalstream::unit::decoded_frame *frame = binder_->pull_frame((size_t)1000);
    ASSERT_NE(nullptr, frame);
    EXPECT_EQ(f1, frame->data);
    EXPECT_EQ(640u, frame->width);
    EXPECT_EQ(NLS_OK, nalstream::unit::dealloc_frame(frame));

    frame = binder_->pull_frame();
    ASSERT_NE(nullptr, frame);
    EXPECT_EQ(f2, frame->data);
    EXPECT_EQ(NLS_OK, nalstream::unit::dealloc_frame(frame));

    nalstream::stats stats = binder_->get_stats();
    EXPECT_EQ(4u, stats.units_received);
    EXPECT_EQ(2u, stats.frames_decoded);
    EXPECT_EQ(1u, stats.sessions_created);
    EXPECT_EQ(decoder_->configs()[0].fingerprint, stats.config_fingerprint);
    EXPECT_NE(0u, stats.config_fingerprint);
}

TEST_F(receiver_binder_fixture, bytes_from_other_peers_are_dropped)
{
    std::vector<uint8_t> bytes = make_stream({ make_sps(1), make_pps(1), make_frame(0x65, 10, 1) });

    EXPECT_EQ(NLS_NOT_FOUND, binder_->bytes_received(TEST_PEER, bytes.data(), bytes.size()));

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    transport_->set_state(OTHER_PEER, NLS_PEER_CONNECTED);
    transport_->deliver(OTHER_PEER, bytes);

    EXPECT_EQ(2 * bytes.size(), binder_->get_stats().bytes_from_unbound_peer);
    EXPECT_EQ(0u, decoder_->count("create"));
    EXPECT_EQ(1u, binder_->get_stats().peers_rejected);
}

TEST_F(receiver_binder_fixture, disconnect_invalidates_session_once)
{
    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    transport_->deliver(TEST_PEER, make_stream({ make_sps(1), make_pps(1), make_frame(0x65, 10, 1) }));

    transport_->set_state(TEST_PEER, NLS_PEER_DISCONNECTED);
    transport_->set_state(TEST_PEER, NLS_PEER_DISCONNECTED);
    transport_->deliver(TEST_PEER, make_stream({ make_frame(0x41, 10, 2) }));

    EXPECT_EQ(std::vector<std::string>({ "create:1", "decode:1", "invalidate:1" }), decoder_->calls());
    EXPECT_EQ(0, decoder_->misuse());
    EXPECT_EQ(1u, binder_->get_stats().sessions_invalidated);
    EXPECT_EQ(0u, binder_->get_stats().config_fingerprint);
}

TEST_F(receiver_binder_fixture, reconnected_peer_bootstraps_again)
{
    std::vector<uint8_t> half = make_stream({ make_frame(0x41, 10, 2) });
    half.resize(half.size() / 2);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    transport_->deliver(TEST_PEER, make_stream({ make_sps(1), make_pps(1), make_frame(0x65, 10, 1) }));

    /* the half packet of the old connection is discarded with the binding */
    transport_->deliver(TEST_PEER, half);
    transport_->set_state(TEST_PEER, NLS_PEER_DISCONNECTED);

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
    transport_->deliver(TEST_PEER, make_stream({ make_frame(0x41, 10, 3) }));
    EXPECT_EQ(1u, binder_->get_stats().units_dropped_not_ready);

    transport_->deliver(TEST_PEER, make_stream({ make_sps(1), make_pps(1), make_frame(0x65, 10, 4) }));

    EXPECT_EQ(std::vector<std::string>({ "create:1", "decode:1", "invalidate:1", "create:2", "decode:2" }),
        decoder_->calls());
    EXPECT_EQ(0, decoder_->misuse());
}

TEST_F(receiver_binder_fixture, pull_frame_times_out)
{
    auto start = std::chrono::steady_clock::now();

    EXPECT_EQ(nullptr, binder_->pull_frame((size_t)50));
    EXPECT_EQ(NLS_TIMEOUT, nls_errno);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    EXPECT_EQ(nullptr, binder_->pull_frame((size_t)20));
    EXPECT_EQ(NLS_TIMEOUT, nls_errno);
}

TEST_F(receiver_binder_fixture, pending_pull_waits_for_next_peer)
{
    std::vector<uint8_t> f1 = make_frame(0x65, 10, 1);

    std::thread peer([this, &f1] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);
        transport_->set_state(TEST_PEER, NLS_PEER_DISCONNECTED);
        transport_->set_state(OTHER_PEER, NLS_PEER_CONNECTED);
        transport_->deliver(OTHER_PEER, make_stream({ make_sps(1), make_pps(1), f1 }));
    });

    nalstream::unit::decoded_frame *frame = binder_->pull_frame((size_t)2000);
    peer.join();

    ASSERT_NE(nullptr, frame);
    EXPECT_EQ(f1, frame->data);
    EXPECT_EQ(NLS_OK, nalstream::unit::dealloc_frame(frame));
}

TEST(BinderTests, init_validates_role_and_dependencies)
{
    auto transport = std::make_shared<mock_transport>();
    auto decoder   = std::make_shared<mock_decoder>();

    EXPECT_EQ(NLS_INVALID_VALUE, nalstream::binder(NCE_NO_FLAGS, transport, decoder).init());
    EXPECT_EQ(NLS_INVALID_VALUE, nalstream::binder(NCE_SENDER | NCE_RECEIVER, transport, decoder).init());
    EXPECT_EQ(NLS_INVALID_VALUE, nalstream::binder(NCE_SENDER, nullptr, nullptr).init());
    EXPECT_EQ(NLS_INVALID_VALUE, nalstream::binder(NCE_RECEIVER, transport, nullptr).init());
    EXPECT_FALSE(transport->has_handlers());

    nalstream::binder sender(NCE_SENDER, transport, nullptr);
    uint8_t byte = 0x65;

    EXPECT_EQ(NLS_NOT_INITIALIZED, sender.push_unit(&byte, 1));
    EXPECT_EQ(NLS_NOT_INITIALIZED, sender.peer_state_changed(TEST_PEER, NLS_PEER_CONNECTED));
    EXPECT_EQ(NLS_OK, sender.init());
    EXPECT_EQ(NLS_INITIALIZED, sender.init());
    EXPECT_EQ(NLS_INVALID_VALUE, sender.push_unit(nullptr, 1));
    EXPECT_EQ(NLS_INVALID_VALUE, sender.push_unit(&byte, 0));
    EXPECT_EQ(NLS_INVALID_VALUE, sender.push_unit(nalstream::unit::encoded_unit()));
}

TEST(BinderTests, receiver_does_not_accept_units)
{
    auto transport = std::make_shared<mock_transport>();
    nalstream::binder receiver(NCE_RECEIVER, transport, std::make_shared<mock_decoder>());
    uint8_t byte = 0x65;

    ASSERT_EQ(NLS_OK, receiver.init());
    EXPECT_EQ(NLS_NOT_INITIALIZED, receiver.push_unit(&byte, 1));
}

TEST(BinderTests, configuration_values_are_validated)
{
    nalstream::binder binder(NCE_SENDER, std::make_shared<mock_transport>(), nullptr);

    EXPECT_EQ(64, binder.get_configuration_value(NCC_SEND_QUEUE_SIZE));
    EXPECT_EQ(200, binder.get_configuration_value(NCC_CONFIG_ENQUEUE_TIMEOUT_MS));
    EXPECT_EQ(1000, binder.get_configuration_value(NCC_WRITE_TIMEOUT_MS));
    EXPECT_EQ(8 * 1024 * 1024, binder.get_configuration_value(NCC_MAX_UNIT_SIZE));
    EXPECT_EQ(64, binder.get_configuration_value(NCC_MAX_PENDING_FRAMES));
    EXPECT_EQ(-1, binder.get_configuration_value(NCC_READ_BUFFER_SIZE));

    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_SEND_QUEUE_SIZE, 0));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_CONFIG_ENQUEUE_TIMEOUT_MS, -1));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_WRITE_TIMEOUT_MS, 0));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_MAX_UNIT_SIZE, 0));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_MAX_UNIT_SIZE, (ssize_t)UINT32_MAX + 1));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_MAX_PENDING_FRAMES, -5));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_READ_BUFFER_SIZE, 4096));
    EXPECT_EQ(NLS_INVALID_VALUE, binder.configure_ctx(NCC_LAST, 1));

    EXPECT_EQ(NLS_OK, binder.configure_ctx(NCC_SEND_QUEUE_SIZE, 8));
    EXPECT_EQ(NLS_OK, binder.configure_ctx(NCC_CONFIG_ENQUEUE_TIMEOUT_MS, 0));
    EXPECT_EQ(NLS_OK, binder.configure_ctx(NCC_MAX_UNIT_SIZE, 1024));

    EXPECT_EQ(8, binder.get_configuration_value(NCC_SEND_QUEUE_SIZE));
    EXPECT_EQ(0, binder.get_configuration_value(NCC_CONFIG_ENQUEUE_TIMEOUT_MS));
    EXPECT_EQ(1024, binder.get_configuration_value(NCC_MAX_UNIT_SIZE));
}

TEST_F(receiver_binder_fixture, oversized_unit_is_a_protocol_violation)
{
    ASSERT_EQ(NLS_OK, binder_->configure_ctx(NCC_MAX_UNIT_SIZE, 32));

    transport_->set_state(TEST_PEER, NLS_PEER_CONNECTED);

    std::vector<uint8_t> bytes = make_stream({ make_sps(1), make_pps(1), make_frame(0x65, 64, 1), make_frame(0x41, 16, 2) });
    EXPECT_EQ(NLS_PROTOCOL_ERROR, binder_->bytes_received(TEST_PEER, bytes.data(), bytes.size()));

    EXPECT_EQ(1u, binder_->get_stats().protocol_violations);
    EXPECT_EQ(std::vector<std::vector<uint8_t>>({ make_frame(0x41, 16, 2) }), decoder_->decoded());
}
