/**
 * Funnel relay - entry point
 *
 * Loads .env and funnel.toml, then serves the recording stream and finalize
 * routes, relaying audio to Deepgram's live transcription API.
 */

#include "common/config.hpp"
#include "common/errors.hpp"
#include "relay/deepgram_backend.hpp"
#include "relay/relay_server.hpp"

#include <iostream>

int main(int argc, char** argv) {
    std::string toml_path = argc > 1 ? argv[1] : "funnel.toml";

    funnel::RelayConfig cfg;
    try {
        cfg = funnel::load_relay_config(toml_path);
    } catch (const funnel::FunnelError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    auto connector = std::make_shared<funnel::relay::DeepgramConnector>(cfg);
    funnel::relay::RelayServer server(cfg, connector, toml_path);
    server.run();
    return 0;
}
