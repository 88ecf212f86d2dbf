#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>

#include "ecs/Events/ecs_event_processor.hpp"
#include "game/EventHandlers.hpp"
#include "game/GameManager.hpp"
#include "game/Leaderboard.hpp"
#include "Utils/Input.hpp"
#include "Utils/Random.hpp"

#include "Utils/Debug/Debug.hpp"

namespace {

constexpr float FRAME_MS = 1000.0f / 60.0f;

void PrintHelp() {
    std::cout << "Usage:\n"
        << "  --difficulty <level>       easy, normal, hard or insane (default: normal).\n"
        << "  --seed <n>                 Seed for the random source (default: random).\n"
        << "  --ticks <n>                Number of 60 Hz frames to simulate (default: 3600).\n"
        << "  --autopilot                Turn and fire continuously instead of idling.\n"
        << "  --verbose                  Echo info messages to the console, not only warnings.\n"
        << "  --mute <channel>           Drop log messages from this channel (repeatable).\n"
        << "  --leaderboard <path>       Load the leaderboard from and save it to this file.\n"
        << "  --help                     Show this help message.\n"
        << "\nExamples:\n"
        << "  One minute of play on hard:\n"
        << "    ./starfall --difficulty hard --autopilot\n\n"
        << "  Reproducible run with a saved leaderboard:\n"
        << "    ./starfall --seed 42 --ticks 18000 --autopilot --leaderboard scores.tsv\n";
}

// Spins in place and keeps the trigger held, tapping the missile and shield keys now and then
void DriveAutopilot(Input& input, int frame) {
    input.SetKey(KeyCode(GameKey::TurnLeft), true);
    input.SetKey(KeyCode(GameKey::Fire), true);
    input.SetKey(KeyCode(GameKey::Thrust), (frame / 90) % 4 == 0);
    input.SetKey(KeyCode(GameKey::Missile), frame % 120 == 0);
    input.SetKey(KeyCode(GameKey::Shield), frame % 1800 == 0);
}

const char* StateName(GameState state) {
    return state == GameState::Playing ? "playing" : "game over";
}

}

int main(int argc, char** argv) {

    DifficultyLevel difficulty = DifficultyLevel::Normal;
    uint32_t seed = 0;
    bool hasSeed = false;
    int ticks = 3600;
    bool autopilot = false;
    bool verbose = false;
    std::string leaderboardPath;
    std::vector<std::string> mutedChannels;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help") {
            PrintHelp();
            return 0;
        }
        if (a == "--difficulty" && i + 1 < argc) {
            std::string name = argv[++i];
            auto parsed = DifficultyManager::ParseLevel(name);
            if (!parsed) {
                std::cerr << "Error: unknown difficulty '" << name << "'\n";
                std::cerr << "Use --help to see usage.\n";
                return 1;
            }
            difficulty = *parsed;
        }
        else if (a == "--seed" && i + 1 < argc) {
            seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            hasSeed = true;
        }
        else if (a == "--ticks" && i + 1 < argc) ticks = std::atoi(argv[++i]);
        else if (a == "--autopilot") autopilot = true;
        else if (a == "--verbose") verbose = true;
        else if (a == "--mute" && i + 1 < argc) mutedChannels.push_back(argv[++i]);
        else if (a == "--leaderboard" && i + 1 < argc) leaderboardPath = argv[++i];
        else {
            std::cerr << "Error: unknown argument '" << a << "'\n";
            std::cerr << "Use --help to see usage.\n";
            return 1;
        }
    }

    if (ticks <= 0) {
        std::cerr << "Error: --ticks must be positive\n";
        return 1;
    }

    LogSettings logSettings;
    logSettings.productName = "Starfall";
    logSettings.consoleLevel = verbose ? LogLevel::Info : LogLevel::Warning;
    for (const std::string& channel : mutedChannels) {
        Debug::SetChannelEnabled(channel, false);
    }
    Debug::Initialize(logSettings);

    Random random = hasSeed ? Random(seed) : Random();
    GameConfig config(800.0f, 600.0f, difficulty);
    GameManager game(config, random);

    Leaderboard leaderboard;
    if (!leaderboardPath.empty()) {
        leaderboard.Load(leaderboardPath);
    }
    game.SetScoreRecorder(&leaderboard);

    EventProcessor processor;
    RegisterLoggingHandlers(processor);

    Debug::Info("Starfall") << "Running " << ticks << " frames, seed " << random.GetSeed() << "\n";

    Input input;
    game.StartNewGame();
    int frame = 0;
    for (; frame < ticks && game.GetState() == GameState::Playing; ++frame) {
        if (autopilot) {
            DriveAutopilot(input, frame);
        }
        game.Update(FRAME_MS, input);
        processor.ProcessEvents(game.DrainEvents());
        input.Update();
    }

    if (!leaderboardPath.empty() && !leaderboard.Save(leaderboardPath)) {
        std::cerr << "Warning: could not save the leaderboard to " << leaderboardPath << "\n";
    }

    GameSnapshot snapshot = game.GetSnapshot();
    std::cout << "Frames:  " << frame << "\n"
              << "Score:   " << snapshot.score << "\n"
              << "Wave:    " << snapshot.wave << "\n"
              << "Level:   " << snapshot.level << "\n"
              << "Lives:   " << snapshot.lives << "\n"
              << "State:   " << StateName(snapshot.state) << "\n";
    if (leaderboard.GetHighScore() > 0) {
        std::cout << "Best:    " << leaderboard.GetHighScore() << "\n";
    }

    Debug::Shutdown();
    return 0;
}
