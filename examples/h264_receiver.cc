#include <nalstream/lib.hh>

#include <cstdlib>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>

/* This example receives an H.264 stream from h264_sender and writes it back to
 * an Annex-B file. The decoder only prepends start codes, a real application would
 * create its codec session in create() and decode the frames in decode().
 *
 * Usage: h264_receiver [output.h264] */

constexpr char REMOTE_ADDRESS[] = "127.0.0.1";
constexpr uint16_t REMOTE_PORT = 8890;

constexpr int FRAME_TIMEOUT_MS = 5000;

class annexb_decoder : public nalstream::decoder {
    public:
        nls_error_t create(const nalstream::unit::configuration_set& config,
            nalstream::session_handle& session)
        {
            std::lock_guard<std::mutex> lg(mtx_);

            config_ = config;
            session = ++next_session_;

            std::cout << "Decoder session " << session << " created, configuration "
                      << std::hex << config.fingerprint << std::dec << std::endl;
            return NLS_OK;
        }

        nls_error_t decode(nalstream::session_handle session,
            const nalstream::unit::encoded_unit& unit,
            std::future<nalstream::unit::decoded_frame>& frame)
        {
            std::promise<nalstream::unit::decoded_frame> promise;
            nalstream::unit::decoded_frame decoded;

            std::lock_guard<std::mutex> lg(mtx_);

            /* repeat the configuration in front of every IDR so the output can be cut anywhere */
            if ((unit.data[0] & 0x1f) == 5) {
                nalstream::unit::encoded_unit primary, secondary;

                primary.data   = config_.primary;
                secondary.data = config_.secondary;

                nalstream::unit::append_annexb(decoded.data, primary);
                nalstream::unit::append_annexb(decoded.data, secondary);
            }

            nalstream::unit::append_annexb(decoded.data, unit);

            promise.set_value(std::move(decoded));
            frame = promise.get_future();

            (void)session;
            return NLS_OK;
        }

        void invalidate(nalstream::session_handle session)
        {
            std::cout << "Decoder session " << session << " invalidated" << std::endl;
        }

    private:
        std::mutex mtx_;
        nalstream::unit::configuration_set config_;
        nalstream::session_handle next_session_ = 0;
};

int main(int argc, char **argv)
{
    std::cout << "Starting nalstream H.264 receiving example" << std::endl;

    const char *out_path = (argc > 1) ? argv[1] : "received.h264";
    std::ofstream out(out_path, std::ios::binary);

    if (!out) {
        std::cerr << "Failed to open " << out_path << std::endl;
        return EXIT_FAILURE;
    }

    auto transport = std::make_shared<nalstream::tcp_transport>();
    nalstream::binder receiver(NCE_RECEIVER, transport, std::make_shared<annexb_decoder>());

    if (receiver.init() != NLS_OK) {
        std::cerr << "Failed to set up the receiver" << std::endl;
        return EXIT_FAILURE;
    }

    if (transport->connect(REMOTE_ADDRESS, REMOTE_PORT) != NLS_OK) {
        std::cerr << "Failed to connect to " << REMOTE_ADDRESS << ":" << REMOTE_PORT << std::endl;
        return EXIT_FAILURE;
    }

    size_t frames = 0;
    nalstream::unit::decoded_frame *frame = nullptr;

    while ((frame = receiver.pull_frame(FRAME_TIMEOUT_MS)) != nullptr) {
        out.write((const char *)frame->data.data(), frame->data.size());

        if ((++frames % 25) == 0)
            std::cout << "Received " << frames << " frames" << std::endl;

        (void)nalstream::unit::dealloc_frame(frame);
    }

    nalstream::stats stats = receiver.get_stats();

    std::cout << "Receiving finished: " << stats.frames_decoded << " frames, "
              << stats.units_dropped_not_ready << " units dropped before bootstrap, "
              << stats.protocol_violations << " protocol violations" << std::endl;

    return EXIT_SUCCESS;
}
