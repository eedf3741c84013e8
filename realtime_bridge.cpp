/*
Telephony media stream <-> OpenAI realtime bridge.

Twilio (or any carrier speaking the media-stream JSON protocol) connects to
ws://<BRIDGE_HOST>:<BRIDGE_PORT>/audio; every stream gets its own realtime
session. Configuration comes from the environment and an optional .env file,
see bridge_config.h.

$export OPENAI_API_KEY="sk-..."
$./realtime_bridge
Then press key 'q' or 'e' (or Ctrl-C) to exit the program.
*/

#include "audio_codec.h"
#include "audio_monitor.h"
#include "bridge_config.h"
#include "bridge_errors.h"
#include "log.h"
#include "media_endpoint.h"
#include "session_registry.h"
#include "telephony_server.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <termios.h>
#include <thread>
#include <unistd.h>

using namespace rtbridge;

// Function to read a character without waiting for Enter
static char getch()
{
    char buf = 0;
    struct termios old = {};
    if (tcgetattr(0, &old) < 0) perror("tcgetattr()");
    old.c_lflag &= ~ICANON; // Disable buffered i/o
    old.c_lflag &= ~ECHO;   // Disable echo (don't show key on screen)
    old.c_cc[VMIN] = 1;
    old.c_cc[VTIME] = 0;
    if (tcsetattr(0, TCSANOW, &old) < 0) perror("tcsetattr ICANON");
    if (read(0, &buf, 1) <= 0) buf = 0;
    old.c_lflag |= ICANON;
    old.c_lflag |= ECHO;
    if (tcsetattr(0, TCSADRAIN, &old) < 0) perror("tcsetattr ~ICANON");
    return buf;
}

int main()
{
    try {
        const char* envFile = std::getenv("BRIDGE_ENV_FILE");
        loadEnvFile(envFile ? envFile : ".env");

        BridgeConfig config = configFromEnvironment();
        config.validate();
        logging::debugEnabled = config.debug;
        logging::traceEnabled = config.trace;

        if (config.apiKey.empty())
            logging::warn("Bridge", "OPENAI_API_KEY is not set, every call will be rejected");

        MediaEndpoint media(MODEL_RATE, config.localPlayback);
        std::unique_ptr<AudioMonitor> monitor;
        if (media.hasPlayback())
            monitor.reset(new AudioMonitor(media, MODEL_RATE));

        SessionRegistry registry;
        TelephonyServer server(config, registry, realtimeClientFactory(), monitor.get());
        server.start();

        boost::asio::io_context signals_ioc;
        boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int sig) {
            if (!ec)
                logging::info("Bridge", "signal " + std::to_string(sig) + ", exiting...");
        });

        if (isatty(0)) {
            std::cout << "Press 'q' or 'e' to exit" << std::endl;
            std::thread([]() {
                while (true) {
                    char c = getch();
                    if (c == 'q' || c == 'e' || c == 0) {
                        std::cout << "\nDetected '" << c << "'. Exiting..." << std::endl;
                        std::raise(SIGTERM);
                        return;
                    }
                    std::cout << "You pressed: " << c << " (Still looping...)" << std::endl;
                }
            }).detach();
        }

        // Keep main thread alive
        signals_ioc.run();

        server.stop();
        monitor.reset();
    }
    catch (ConfigError const& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }
    catch (pj::Error& err)
    {
        std::cerr << "Media error: " << err.info() << std::endl;
        return 1;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
