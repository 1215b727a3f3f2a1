#include "UIManager.h"
#include "KinderdromeSimulation.h"
#include "Steering.h"
#include <iomanip>
#include <sstream>

UIManager::UIManager(const sf::Font *font) : font_(font) {}

void UIManager::handleInput(const sf::Event::KeyPressed *keyEvent)
{
    if (!keyEvent)
        return;

    switch (keyEvent->code)
    {
    case sf::Keyboard::Key::Space:
        if (onTogglePause)
            onTogglePause();
        break;
    case sf::Keyboard::Key::N:
        if (onToggleNapTime)
            onToggleNapTime();
        break;
    case sf::Keyboard::Key::R:
        if (onReset)
            onReset();
        break;
    case sf::Keyboard::Key::Up:
        if (onStepsPerFrameChange)
            onStepsPerFrameChange(1);
        break;
    case sf::Keyboard::Key::Down:
        if (onStepsPerFrameChange)
            onStepsPerFrameChange(-1);
        break;
    case sf::Keyboard::Key::S:
        if (onSaveSettings)
            onSaveSettings();
        break;
    case sf::Keyboard::Key::L:
        if (onLoadSettings)
            onLoadSettings();
        break;
    case sf::Keyboard::Key::D:
        toggleScores();
        break;
    case sf::Keyboard::Key::H:
        toggleHelp();
        break;
    case sf::Keyboard::Key::Escape:
        if (onQuit)
            onQuit();
        break;
    default:
        break;
    }
}

void UIManager::drawArena(sf::RenderWindow &window, const KinderdromeSimulation &simulation)
{
    const SimulationSettings &settings = simulation.getSettings();

    // beds under everything else
    for (const auto &bed : simulation.getBeds())
    {
        sf::FloatRect box = steering::boxAround(bed.position, settings.bedHalfExtent);
        sf::RectangleShape shape(box.size);
        shape.setPosition(box.position);
        shape.setFillColor(bed.occupied ? bedColor_ : sf::Color::Transparent);
        shape.setOutlineColor(bedColor_);
        shape.setOutlineThickness(2.0f);
        window.draw(shape);
    }

    for (const auto &block : simulation.getBlocks())
    {
        if (!block.isOnField())
            continue;
        sf::FloatRect box = steering::boxAround(block.position, settings.blockHalfExtent);
        sf::RectangleShape shape(box.size);
        shape.setPosition(box.position);
        shape.setFillColor(blockColor_);
        window.draw(shape);
    }

    sf::CircleShape body(settings.kinderHalfExtent);
    body.setOrigin({settings.kinderHalfExtent, settings.kinderHalfExtent});
    sf::RectangleShape nose({settings.kinderHalfExtent, 3.0f});
    nose.setOrigin({0.0f, 1.5f});
    nose.setFillColor(sf::Color::Black);

    for (const auto &kinder : simulation.getKinder())
    {
        if (kinder.isAsleep())
            body.setFillColor(asleepColor_);
        else if (kinder.inContest())
            body.setFillColor(contestColor_);
        else
            body.setFillColor(roamingColor_);
        body.setPosition(kinder.getPosition());
        window.draw(body);

        nose.setPosition(kinder.getPosition());
        nose.setRotation(sf::degrees(kinder.getHeading()));
        window.draw(nose);

        if (showScores_)
            drawScore(window, kinder.getScore(), kinder.getPosition());
    }
}

void UIManager::drawScore(sf::RenderWindow &window, int score, sf::Vector2f position)
{
    if (!font_)
        return;

    sf::Text text(*font_, std::to_string(score), 14);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.0f);
    sf::FloatRect bounds = text.getLocalBounds();
    text.setOrigin({bounds.position.x + bounds.size.x * 0.5f, bounds.position.y + bounds.size.y * 0.5f});
    text.setPosition(position);
    window.draw(text);
}

void UIManager::drawHUD(sf::RenderWindow &window, const KinderdromeSimulation &simulation)
{
    if (!font_)
        return;

    const AuditCounters &audit = simulation.getCumulativeAudit();

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "=== The Kinderdrome ===" << "\n";
    oss << "Mode: " << modeName(simulation.getMode())
        << (simulation.isPaused() ? "  [PAUSED]" : "") << "\n";
    oss << "Tick: " << simulation.getTickCount()
        << " | Update: " << simulation.getLastUpdateTime() << "ms"
        << " | Steps/frame: " << simulation.getSettings().stepsPerFrame << "\n";
    oss << "Blocks on field: " << simulation.getRemainingBlocks() << " / " << simulation.getTotalBlocks() << "\n";
    if (simulation.getMode() == Mode::NapTime)
    {
        oss << "Beds free: " << simulation.getAvailableBedCount() << " / " << simulation.getBeds().size() << "\n";
    }
    oss << "Contests: " << audit.contestsStarted << " | Snatched: " << audit.blocksTransferred << "\n";
    oss << "[H] Help" << "\n";

    sf::Text text(*font_, oss.str(), 14);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);
    text.setPosition({10.0f, 10.0f});

    sf::FloatRect textBounds = text.getLocalBounds();
    drawBackground(window, sf::FloatRect({5, 5}, {textBounds.size.x + 10, textBounds.size.y + 10}));

    window.draw(text);

    if (showHelp_)
        drawHelpText(window);
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(bounds.size);
    background.setPosition(bounds.position);
    background.setFillColor(hudBackgroundColor_);
    window.draw(background);
}

void UIManager::drawHelpText(sf::RenderWindow &window)
{
    std::string help =
        "=== Controls ===\n"
        "[Space] Pause / Resume\n"
        "[N] Toggle Nap Time\n"
        "[R] Reset\n"
        "[Up/Down] Steps per frame\n"
        "[D] Show scores\n"
        "[S] Save | [L] Load Settings\n"
        "[Esc] Quit";

    sf::Text text(*font_, help, 14);
    text.setFillColor(hudTextColor_);

    sf::Vector2f windowSize = static_cast<sf::Vector2f>(window.getSize());
    sf::FloatRect textBounds = text.getLocalBounds();
    sf::Vector2f pos(windowSize.x - textBounds.size.x - 20.0f, 10.0f);
    text.setPosition(pos);

    drawBackground(window, sf::FloatRect({pos.x - 5, 5}, {textBounds.size.x + 10, textBounds.size.y + 10}));
    window.draw(text);
}
