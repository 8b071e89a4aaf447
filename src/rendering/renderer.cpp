#include "tiltball/rendering/renderer.hpp"
#include "tiltball/core/constants.hpp"

#include <cmath>

namespace {

sf::Color holeColor(const HoleState& hole) {
    using Components::HoleKind;
    switch (hole.kind) {
        case HoleKind::Goal:     return sf::Color(255, 215, 0);
        case HoleKind::PowerUp:  return hole.saucer ? sf::Color(120, 255, 120) : sf::Color(0, 200, 90);
        case HoleKind::Moving:   return sf::Color(255, 120, 40);
        case HoleKind::Animated: return sf::Color(182, 0, 249);
        case HoleKind::Standard:
        default:                 return sf::Color(60, 60, 70);
    }
}

} // namespace

Renderer::Renderer(int screenWidth, int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(static_cast<unsigned int>(screenWidth),
                                static_cast<unsigned int>(screenHeight)),
                  "Tiltball");
    if (!window.isOpen()) {
        return false;
    }
    window.setFramerateLimit(60);
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(10, 10, 24));
}

void Renderer::present() {
    window.display();
}

void Renderer::drawBar(const TiltingBar& bar) {
    BarEndpoints const ends = bar.getEndpoints();
    Vector const along = ends.end - ends.start;
    auto const length = static_cast<float>(along.length());
    auto const thickness = static_cast<float>(bar.thickness());

    sf::RectangleShape shape(sf::Vector2f(length, thickness));
    shape.setOrigin(length / 2.0f, thickness / 2.0f);
    shape.setPosition(static_cast<float>((ends.start.x + ends.end.x) / 2.0),
                      static_cast<float>((ends.start.y + ends.end.y) / 2.0));
    shape.setRotation(static_cast<float>(std::atan2(along.y, along.x) * 180.0 / TiltConstants::Pi));
    shape.setFillColor(sf::Color(0, 240, 255));
    window.draw(shape);
}

void Renderer::drawHoles(const std::vector<HoleState>& holes) {
    for (const auto& hole : holes) {
        double scale = 1.0;
        if (hole.animated) {
            scale = hole.animated->currentScale;
        }
        if (scale <= 0.0) {
            continue;
        }

        auto const radius = static_cast<float>(hole.radius * scale);
        sf::CircleShape circle(radius);
        circle.setOrigin(radius, radius);
        circle.setPosition(static_cast<float>(hole.position.x), static_cast<float>(hole.position.y));

        sf::Color fill = holeColor(hole);
        if (!hole.isActive) {
            fill.a = 110;
        }
        circle.setFillColor(fill);
        circle.setOutlineThickness(2.0f);
        circle.setOutlineColor(sf::Color(20, 20, 20));
        window.draw(circle);
    }
}

void Renderer::drawBall(const PhysicsBody& ball, double sinkDepth) {
    auto const radius = static_cast<float>(ball.radius * (1.0 - 0.4 * clampValue(sinkDepth, 0.0, 1.0)));
    sf::CircleShape circle(radius);
    circle.setOrigin(radius, radius);
    circle.setPosition(static_cast<float>(ball.position.x), static_cast<float>(ball.position.y));
    circle.setFillColor(ball.isRollingOnBar ? sf::Color(220, 220, 255) : sf::Color::White);
    window.draw(circle);
}

void Renderer::drawTiltIndicator(double tiltPercentage) {
    auto const width = static_cast<float>(screenWidth);
    sf::RectangleShape track(sf::Vector2f(width, 4.0f));
    track.setFillColor(sf::Color(40, 40, 60));
    window.draw(track);

    auto const marker = static_cast<float>((clampValue(tiltPercentage, -1.0, 1.0) + 1.0) / 2.0) * width;
    sf::RectangleShape knob(sf::Vector2f(6.0f, 4.0f));
    knob.setOrigin(3.0f, 0.0f);
    knob.setPosition(marker, 0.0f);
    knob.setFillColor(sf::Color(0, 240, 255));
    window.draw(knob);
}
