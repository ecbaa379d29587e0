#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <pigpio.h>
#include <sys/syslog.h>
#include <unistd.h>

#include "common/Config.hpp"
#include "ADS1115/ads1115.hpp"
#include "Buzzer/buzzer.hpp"
#include "playback/MelodyPlayer.hpp"
#include "threads/PosixTimerTicker.hpp"
#include "threads/SensorToneLoop.hpp"
#include "tone/ToneMapping.hpp"

#define TIMER_SIGNAL SIGRTMIN

// Global termination flag for signal handling
std::atomic<bool> running{true};
static std::atomic<MelodyPlayer*> activePlayer{nullptr};

void signalHandler(int signum) {
    if (signum == SIGINT || signum == SIGTERM || signum == SIGALRM) {
        running = false;
        if (MelodyPlayer* player = activePlayer.load()) {
            player->cancel();
        }
    }
}

int main(int argc, char* argv[]) {
    int runtime_seconds = 0;  // 0 runs until a signal
    bool play_song = false;

    if (argc > 1) {
        runtime_seconds = std::atoi(argv[1]);
        if (runtime_seconds < 0) {
            std::fprintf(stderr, "Invalid runtime. Running until interrupted.\n");
            runtime_seconds = 0;
        }
    }
    if (argc > 2 && std::strcmp(argv[2], "song") == 0) {
        play_song = true;
    }

    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGALRM, &sa, nullptr);

    openlog("light_orchestra", LOG_PID | LOG_CONS, LOG_USER);
    syslog(LOG_INFO, "Starting light orchestra");

    // Blocks the tick signal before pigpio spawns its threads so they inherit the mask
    PosixTimerTicker ticker(kSamplePeriodMs, TIMER_SIGNAL);

    gpioCfgSetInternals(gpioCfgGetInternals() | PI_CFG_NOSIGHANDLER);
    if (gpioInitialise() < 0) {
        std::cerr << "pigpio initialization failed!" << std::endl;
        syslog(LOG_ERR, "pigpio initialization failed");
        closelog();
        return 1;
    }

    if (!initADS1115(kI2cDevice, kAds1115Address)) {
        std::cerr << "[ADS1115] init failed\n";
        gpioTerminate();
        closelog();
        return 1;
    }

    int16_t probe = 0;
    if (readADS1115Raw(kLightChannel, probe)) {
        std::cout << "[ADS1115] Ready, A" << kLightChannel << " = "
                  << convertToVoltage(probe, kAdsFullScaleV) << " V\n";
    } else {
        syslog(LOG_WARNING, "ADS1115 probe conversion failed");
    }

    int exit_code = 0;
    {
        Ads1115Input light(kLightChannel);
        PwmBuzzer buzzer(kBuzzerGpio);

        if (play_song) {
            MelodyPlayer player(buzzer);
            activePlayer = &player;
            if (running) {
                player.playMelody(kTwinkleSong);
            }
            activePlayer = nullptr;
        }

        std::printf("Light Orchestra\n");
        std::printf("Sample period: %d ms, buzzer GPIO %u, ADS1115 A%d\n",
                    kSamplePeriodMs, kBuzzerGpio, kLightChannel);
        if (runtime_seconds > 0) {
            std::printf("Runtime: %d seconds (or press Ctrl+C to terminate)\n", runtime_seconds);
            alarm(runtime_seconds);
        } else {
            std::printf("Press Ctrl+C to terminate\n");
        }
        std::printf("----------------------------------------\n\n");

        SensorToneLoop loop(light, buzzer, ToneMapping{kDefaultCalibration}, kDefaultDuty);
        if (running) {
            if (ticker.start()) {
                loop.run(ticker, running);
            } else {
                std::cerr << "[Loop] Timer setup failed\n";
                exit_code = 1;
            }
        }
    }

    closeADS1115();
    gpioTerminate();

    std::printf("\nLight orchestra stopped.\n");
    syslog(LOG_INFO, "Light orchestra stopped");
    closelog();

    return exit_code;
}
