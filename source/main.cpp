/********************************************************
 *  description:    the kinderdrome, kinder roam the room,
 *  :               collect blocks, snatch them from each
 *  :               other and take naps
 *  build/run:      cmake --build build && ./build/kinderdrome
 ***********************************************************/

#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "SimulationSettings.h"
#include "KinderdromeSimulation.h"
#include "UIManager.h"

static const char *DEFAULT_SETTINGS_FILE = "kinderdrome_settings.txt";

struct CommandLine
{
    std::string configFile;
    std::string saveConfigFile;
    bool hasSeed = false;
    std::uint64_t seed = 0;
    long headlessTicks = -1; // < 0 = open a window
};

static void printUsage(const char *program)
{
    std::cout << "Usage: " << program
              << " [--config FILE] [--seed N] [--headless TICKS] [--save-config FILE]" << std::endl;
}

// returns false when the arguments cannot be used
static bool parseCommandLine(int argc, char **argv, CommandLine &cmd)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        try
        {
            if (arg == "--config" && hasValue)
                cmd.configFile = argv[++i];
            else if (arg == "--save-config" && hasValue)
                cmd.saveConfigFile = argv[++i];
            else if (arg == "--seed" && hasValue)
            {
                cmd.seed = std::stoull(argv[++i]);
                cmd.hasSeed = true;
            }
            else if (arg == "--headless" && hasValue)
                cmd.headlessTicks = std::stol(argv[++i]);
            else
            {
                std::cerr << "Error: Unknown or incomplete argument '" << arg << "'" << std::endl;
                return false;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: Bad value for '" << arg << "': " << e.what() << std::endl;
            return false;
        }
    }
    return true;
}

static void printSummary(const KinderdromeSimulation &simulation)
{
    const auto &kinder = simulation.getKinder();
    int minScore = 0;
    int maxScore = 0;
    int asleep = 0;
    if (!kinder.empty())
    {
        auto [lo, hi] = std::minmax_element(kinder.begin(), kinder.end(),
                                            [](const Kinder &a, const Kinder &b)
                                            { return a.getScore() < b.getScore(); });
        minScore = lo->getScore();
        maxScore = hi->getScore();
        asleep = static_cast<int>(std::count_if(kinder.begin(), kinder.end(),
                                                [](const Kinder &k)
                                                { return k.isAsleep(); }));
    }

    const AuditCounters &audit = simulation.getCumulativeAudit();
    std::cout << "=== Kinderdrome Summary ===" << std::endl;
    std::cout << "Ticks: " << simulation.getTickCount() << std::endl;
    std::cout << "Mode: " << modeName(simulation.getMode()) << std::endl;
    std::cout << "Blocks on field: " << simulation.getRemainingBlocks() << " / " << simulation.getTotalBlocks() << std::endl;
    std::cout << "Scores: min " << minScore << ", max " << maxScore << std::endl;
    std::cout << "Asleep: " << asleep << " / " << kinder.size() << std::endl;
    std::cout << "Blocks collected: " << audit.blocksCollected << std::endl;
    std::cout << "Contests: " << audit.contestsStarted << ", snatches: " << audit.snatches
              << ", blocks transferred: " << audit.blocksTransferred << std::endl;
    std::cout << "Beds claimed: " << audit.bedsClaimed << std::endl;
}

static int runHeadless(KinderdromeSimulation &simulation, long ticks)
{
    for (long t = 0; t < ticks; ++t)
    {
        simulation.step();
    }
    printSummary(simulation);
    simulation.getGrid().printStatistics();
    return EXIT_SUCCESS;
}

static int runWindowed(std::unique_ptr<KinderdromeSimulation> &simulation, SimulationSettings &settings)
{
    sf::RenderWindow window(sf::VideoMode({static_cast<unsigned int>(settings.width),
                                           static_cast<unsigned int>(settings.height)}),
                            "The Kinderdrome", sf::Style::Titlebar | sf::Style::Close);
    window.setFramerateLimit(static_cast<unsigned int>(settings.targetFps));

    // initialize font
    sf::Font font;
    const sf::Font *hudFont = &font;
    if (!font.openFromFile("DejaVuSans.ttf") &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text will not display" << std::endl;
        hudFont = nullptr;
    }

    UIManager ui(hudFont);
    ui.onTogglePause = [&]()
    { simulation->togglePause(); };
    ui.onToggleNapTime = [&]()
    { simulation->toggleNapTime(); };
    ui.onReset = [&]()
    { simulation->reset(); };
    ui.onStepsPerFrameChange = [&](int delta)
    {
        simulation->setStepsPerFrame(simulation->getSettings().stepsPerFrame + delta);
        settings.stepsPerFrame = simulation->getSettings().stepsPerFrame;
    };
    ui.onSaveSettings = [&]()
    {
        if (settings.saveToFile(DEFAULT_SETTINGS_FILE))
            std::cout << "Settings saved to " << DEFAULT_SETTINGS_FILE << std::endl;
    };
    ui.onLoadSettings = [&]()
    {
        SimulationSettings loaded = settings;
        if (!loaded.loadFromFile(DEFAULT_SETTINGS_FILE))
            return;
        try
        {
            auto replacement = std::make_unique<KinderdromeSimulation>(loaded);
            simulation = std::move(replacement);
            settings = loaded;
            std::cout << "Settings loaded from " << DEFAULT_SETTINGS_FILE << std::endl;
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "Error: Loaded settings are invalid, keeping the current run: " << e.what() << std::endl;
        }
    };
    ui.onQuit = [&]()
    { window.close(); };

    sf::Clock clock;

    while (window.isOpen())
    {
        sf::Time deltaTime = clock.restart();

        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }
            ui.handleInput(event->getIf<sf::Event::KeyPressed>());
        }

        simulation->tick(deltaTime.asSeconds());

        window.clear(sf::Color(244, 235, 208)); // off white
        ui.drawArena(window, *simulation);
        ui.drawHUD(window, *simulation);
        window.display();
    }

    printSummary(*simulation);
    return EXIT_SUCCESS;
}

int main(int argc, char **argv)
{
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd))
    {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    SimulationSettings settings;
    if (!cmd.configFile.empty() && !settings.loadFromFile(cmd.configFile))
    {
        return EXIT_FAILURE;
    }
    if (cmd.hasSeed)
    {
        settings.seed = cmd.seed;
    }
    if (!cmd.saveConfigFile.empty() && !settings.saveToFile(cmd.saveConfigFile))
    {
        return EXIT_FAILURE;
    }

    try
    {
        auto simulation = std::make_unique<KinderdromeSimulation>(settings);

        if (cmd.headlessTicks >= 0)
        {
            return runHeadless(*simulation, cmd.headlessTicks);
        }
        return runWindowed(simulation, settings);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const GridInvariantError &e)
    {
        std::cerr << "Simulation invariant violated: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
