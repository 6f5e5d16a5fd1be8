#include <nalstream/lib.hh>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <thread>
#include <vector>

/* This example streams an H.264 elementary stream to one receiver. The sender
 * listens for a connection, the first peer that connects receives the stream.
 * Run h264_receiver at the same time to see the whole demo.
 *
 * Usage: h264_sender [file.h264]
 *
 * Without a file, a synthetic stream with one configuration pair and dummy
 * frames is sent. */

constexpr uint16_t LOCAL_PORT = 8890;

constexpr int    FRAME_RATE = 25;
constexpr int    AMOUNT_OF_TEST_FRAMES = 100;
constexpr size_t PAYLOAD_LEN = 1000;
constexpr auto   PEER_WAIT = std::chrono::seconds(30);
constexpr auto   END_WAIT = std::chrono::seconds(2);

static std::vector<uint8_t> read_file(const char *path)
{
    std::ifstream file(path, std::ios::binary);

    if (!file)
        return std::vector<uint8_t>();

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

static std::vector<nalstream::unit::encoded_unit> synthetic_stream()
{
    std::vector<nalstream::unit::encoded_unit> units;

    nalstream::unit::encoded_unit sps;
    sps.kind = NLS_UNIT_CONFIG_PRIMARY;
    sps.data = { 0x67, 0x42, 0xc0, 0x1e, 0xda, 0x02, 0x80, 0xbf, 0xe5 };
    units.push_back(sps);

    nalstream::unit::encoded_unit pps;
    pps.kind = NLS_UNIT_CONFIG_SECONDARY;
    pps.data = { 0x68, 0xce, 0x3c, 0x80 };
    units.push_back(pps);

    for (int i = 0; i < AMOUNT_OF_TEST_FRAMES; ++i) {
        nalstream::unit::encoded_unit frame;

        frame.kind = NLS_UNIT_FRAME;
        frame.data.resize(PAYLOAD_LEN, 'a');
        frame.data[0] = (i % FRAME_RATE == 0) ? 0x65 : 0x41; // IDR once a second, otherwise non-IDR slice
        units.push_back(frame);
    }

    return units;
}

int main(int argc, char **argv)
{
    std::cout << "Starting nalstream H.264 sending example" << std::endl;

    std::vector<nalstream::unit::encoded_unit> units;

    if (argc > 1) {
        std::vector<uint8_t> stream = read_file(argv[1]);

        if (stream.empty()) {
            std::cerr << "Failed to read " << argv[1] << std::endl;
            return EXIT_FAILURE;
        }

        units = nalstream::unit::split_annexb(stream.data(), stream.size());
    } else {
        units = synthetic_stream();
    }

    std::cout << "Stream has " << units.size() << " units" << std::endl;

    auto transport = std::make_shared<nalstream::tcp_transport>();
    nalstream::binder sender(NCE_SENDER, transport, nullptr);

    if (sender.init() != NLS_OK || transport->listen("", LOCAL_PORT) != NLS_OK) {
        std::cerr << "Failed to set up the sender" << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Waiting for a receiver on port " << LOCAL_PORT << std::endl;

    auto wait_start = std::chrono::steady_clock::now();

    while (sender.active_peer().empty()) {
        if (std::chrono::steady_clock::now() - wait_start > PEER_WAIT) {
            std::cerr << "No receiver connected" << std::endl;
            return EXIT_FAILURE;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::cout << "Streaming to " << sender.active_peer() << std::endl;

    auto frame_interval = std::chrono::microseconds(1000000 / FRAME_RATE);
    auto next_frame = std::chrono::steady_clock::now();
    int sent = 0;

    for (auto& unit : units) {
        bool is_frame = unit.kind == NLS_UNIT_FRAME;
        nls_error_t ret = sender.push_unit(std::move(unit));

        if (ret != NLS_OK)
            std::cout << "Unit was not queued: " << ret << std::endl;

        /* configuration units go out right away, frames are paced */
        if (is_frame) {
            if ((++sent % FRAME_RATE) == 0)
                std::cout << "Pushed " << sent << " frames" << std::endl;

            next_frame += frame_interval;
            std::this_thread::sleep_until(next_frame);
        }
    }

    std::this_thread::sleep_for(END_WAIT);

    nalstream::stats stats = sender.get_stats();

    std::cout << "Sending finished: " << stats.units_sent << " units, "
              << stats.bytes_sent << " bytes, "
              << stats.frames_dropped_saturated << " frames dropped" << std::endl;

    return EXIT_SUCCESS;
}
