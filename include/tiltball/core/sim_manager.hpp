/**
 * @file sim_manager.hpp
 * @brief Viewer main loop: input, fixed-timestep stepping, level events, drawing
 */

#pragma once

#include <string>

#include "tiltball/core/physics_world.hpp"
#include "tiltball/geometry/tilting_bar.hpp"
#include "tiltball/level/level_director.hpp"
#include "tiltball/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Owns the world, the bar, the level director and the renderer.
 */
class SimManager {
public:
    SimManager();

    /**
     * @brief Opens the window and loads the first layout
     * @return false if the renderer could not start
     */
    bool init();

    /**
     * @brief Runs until the window closes
     */
    void run();

    /**
     * @brief Processes window events for the current frame
     * @return false if the application should quit
     */
    bool handleEvents();

    /**
     * @brief Feeds one frame of real time into the fixed-step accumulator
     */
    void tick(double frameMs);

    void render();

    void selectLayout(int layoutId);
    void resetLevel();

    /**
     * @brief Puts the ball at rest just above the bar's right end
     */
    void placeBall();

private:
    Renderer renderer;
    PhysicsWorld world;
    TiltingBar bar;
    LevelDirector director;

    int currentLayoutId;
    double accumulatorMs;
    bool running;

    void applyInput(double dtSeconds);
    void handleLevelEvent(const LevelEvent& event);
};
