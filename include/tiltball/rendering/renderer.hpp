/**
 * @file renderer.hpp
 * @brief Debug drawing of the playfield using SFML
 *
 * This system handles:
 * - Window management
 * - Bar, ball and hole drawing from read-only snapshots
 *
 * Holes are tinted by kind. Animated holes are scaled by their current scale
 * and a captured ball is shrunk by the saucer's sink depth.
 */

#pragma once

#include <vector>
#include <SFML/Graphics.hpp>

#include "tiltball/core/physics_body.hpp"
#include "tiltball/geometry/tilting_bar.hpp"
#include "tiltball/holes/hole_field.hpp"

class Renderer {
public:
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Opens the window
     * @return false if the window could not be created
     */
    bool init();

    void clear();
    void present();

    void drawBar(const TiltingBar& bar);
    void drawHoles(const std::vector<HoleState>& holes);

    /**
     * @param sinkDepth 0 draws the ball at full size, 1 at its smallest
     */
    void drawBall(const PhysicsBody& ball, double sinkDepth);

    /**
     * @brief Strip along the top showing the bar tilt in [-1,1]
     */
    void drawTiltIndicator(double tiltPercentage);

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    int screenWidth;
    int screenHeight;
};
