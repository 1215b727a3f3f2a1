#pragma once
#include <SFML/Graphics.hpp>
#include <functional>

class KinderdromeSimulation;

// draws the arena and HUD, turns key presses into simulation commands
class UIManager
{
public:
    // font may be null, text is then skipped
    explicit UIManager(const sf::Font *font);

    // event handling
    void handleInput(const sf::Event::KeyPressed *keyEvent);

    // rendering
    void drawArena(sf::RenderWindow &window, const KinderdromeSimulation &simulation);
    void drawHUD(sf::RenderWindow &window, const KinderdromeSimulation &simulation);

    // ui state
    void toggleHelp() { showHelp_ = !showHelp_; }
    void toggleScores() { showScores_ = !showScores_; }

    // callbacks for simulation control
    std::function<void()> onTogglePause;
    std::function<void()> onToggleNapTime;
    std::function<void()> onReset;
    std::function<void(int)> onStepsPerFrameChange;
    std::function<void()> onSaveSettings;
    std::function<void()> onLoadSettings;
    std::function<void()> onQuit;

private:
    const sf::Font *font_;
    bool showHelp_ = false;
    bool showScores_ = true;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 150);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color blockColor_ = sf::Color(214, 92, 62);
    sf::Color bedColor_ = sf::Color(120, 150, 200);
    sf::Color roamingColor_ = sf::Color(70, 140, 90);
    sf::Color contestColor_ = sf::Color(200, 60, 60);
    sf::Color asleepColor_ = sf::Color(90, 90, 160);

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawHelpText(sf::RenderWindow &window);
    void drawScore(sf::RenderWindow &window, int score, sf::Vector2f position);
};
