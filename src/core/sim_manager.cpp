#include "tiltball/core/sim_manager.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <SFML/Graphics.hpp>

#include "tiltball/core/constants.hpp"
#include "tiltball/core/debug.hpp"
#include "tiltball/core/profile.hpp"
#include "tiltball/level/level_layout.hpp"

namespace {

const char* const BallId = "ball";

// Real time fed into the accumulator per frame is capped so a stall does not
// turn into a burst of catch-up steps.
constexpr int MaxStepsPerFrame = 5;

const char* collisionTypeName(CollisionType type) {
    return type == CollisionType::Bounce ? "bounce" : "impact";
}

} // namespace

SimManager::SimManager()
    : renderer(static_cast<int>(TiltConstants::PlayfieldWidth), static_cast<int>(TiltConstants::PlayfieldHeight))
    , currentLayoutId(1)
    , accumulatorMs(0.0)
    , running(false)
{
    world.setSurfaceActuator(&bar);
    world.setPossessionOracle(&director);

    world.setCollisionAudioHook([](double speed, CollisionType type) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Audio] " << collisionTypeName(type) << " speed=" << speed << "\n");
    });
    director.holes().setSoundEffectHook([](HoleSoundEffect effect, const std::string& holeId) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Audio] hole '" << holeId << "' "
                  << (effect == HoleSoundEffect::Appear ? "appear" : "disappear") << "\n");
    });

    world.addBody(PhysicsWorld::createBody(BallId,
                                           Position(TiltConstants::PlayfieldWidth / 2.0, TiltConstants::PlayfieldHeight / 2.0),
                                           TiltConstants::BallRadius,
                                           TiltConstants::BallMass,
                                           TiltConstants::BallRestitution,
                                           TiltConstants::BallFriction));
}

bool SimManager::init() {
    if (!renderer.init()) {
        std::cerr << "Failed to initialise renderer" << std::endl;
        return false;
    }
    selectLayout(currentLayoutId);
    running = true;
    return true;
}

void SimManager::run() {
    if (!init()) {
        return;
    }

    sf::Clock clock;
    while (running) {
        double const frameMs = clock.restart().asSeconds() * 1000.0;
        running = handleEvents();
        tick(frameMs);
        render();
    }
    renderer.getWindow().close();
}

bool SimManager::handleEvents() {
    PROFILE_SCOPE("SimManager::handleEvents");

    sf::RenderWindow& window = renderer.getWindow();
    sf::Event event;
    while (window.pollEvent(event)) {
        if (event.type == sf::Event::Closed) {
            return false;
        }
        if (event.type == sf::Event::KeyPressed) {
            switch (event.key.code) {
                case sf::Keyboard::Escape:
                    return false;
                case sf::Keyboard::R:
                    resetLevel();
                    break;
                case sf::Keyboard::Space:
                    placeBall();
                    break;
                case sf::Keyboard::Num1:
                    selectLayout(1);
                    break;
                case sf::Keyboard::Num2:
                    selectLayout(2);
                    break;
                case sf::Keyboard::Num3:
                    selectLayout(3);
                    break;
                default:
                    break;
            }
        }
    }
    return true;
}

void SimManager::applyInput(double dtSeconds) {
    double left = 0.0;
    double right = 0.0;
    if (sf::Keyboard::isKeyPressed(sf::Keyboard::A)) left += 1.0;
    if (sf::Keyboard::isKeyPressed(sf::Keyboard::Z)) left -= 1.0;
    if (sf::Keyboard::isKeyPressed(sf::Keyboard::Up)) right += 1.0;
    if (sf::Keyboard::isKeyPressed(sf::Keyboard::Down)) right -= 1.0;

    if (left != 0.0) {
        bar.moveLeftSide(left, dtSeconds);
    }
    if (right != 0.0) {
        bar.moveRightSide(right, dtSeconds);
    }
}

void SimManager::tick(double frameMs) {
    PROFILE_SCOPE("SimManager::tick");

    double const stepMs = TiltConstants::StepMilliseconds;
    accumulatorMs = std::min(accumulatorMs + frameMs, stepMs * MaxStepsPerFrame);

    while (accumulatorMs >= stepMs) {
        applyInput(stepMs / 1000.0);
        world.step(stepMs);

        LevelEvent const event = director.update(world.elapsedMilliseconds(), world, BallId, TiltConstants::BallRadius);
        handleLevelEvent(event);

        accumulatorMs -= stepMs;
    }
}

void SimManager::handleLevelEvent(const LevelEvent& event) {
    switch (event.kind) {
        case LevelEvent::Kind::FellInHole:
        case LevelEvent::Kind::FellOffBoard:
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Sim] ball lost" << (event.holeId.empty() ? "" : " in ")
                      << event.holeId << "\n");
            bar.reset();
            placeBall();
            break;
        case LevelEvent::Kind::LevelComplete: {
            std::vector<int> const ids = LevelLayouts::builtinIds();
            auto it = std::find(ids.begin(), ids.end(), currentLayoutId);
            int const next = (it == ids.end() || std::next(it) == ids.end()) ? ids.front() : *std::next(it);
            std::cout << "Level " << currentLayoutId << " complete" << std::endl;
            selectLayout(next);
            break;
        }
        case LevelEvent::Kind::GoalReached:
        case LevelEvent::Kind::SaucerCaptured:
        case LevelEvent::Kind::SaucerEjected:
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Sim] level event on '" << event.holeId << "'\n");
            break;
        case LevelEvent::Kind::None:
        default:
            break;
    }
}

void SimManager::selectLayout(int layoutId) {
    auto layout = LevelLayouts::builtin(layoutId);
    if (!layout) {
        std::cerr << "Unknown layout " << layoutId << std::endl;
        return;
    }
    currentLayoutId = layoutId;
    director.loadLayout(*layout, world.elapsedMilliseconds());
    bar.reset();
    world.resetBody(BallId, layout->ballStart);
}

void SimManager::resetLevel() {
    director.reset();
    bar.reset();
    placeBall();
}

void SimManager::placeBall() {
    BarEndpoints const ends = bar.getEndpoints();
    double const x = ends.end.x - TiltConstants::BallRadius * 2.0;
    double const y = ends.end.y - bar.thickness() / 2.0 - TiltConstants::BallRadius - 2.0;
    world.resetBody(BallId, Position(x, y));
}

void SimManager::render() {
    PROFILE_SCOPE("SimManager::render");

    renderer.clear();
    renderer.drawHoles(director.holes().getHoles());
    renderer.drawBar(bar);

    if (auto ball = world.getBody(BallId)) {
        double sinkDepth = 0.0;
        if (auto holeId = director.holes().saucerHoleForBall(BallId)) {
            if (auto hole = director.holes().findHole(*holeId); hole && hole->saucer) {
                sinkDepth = hole->saucer->sinkDepth;
            }
        }
        renderer.drawBall(*ball, sinkDepth);
    }

    renderer.drawTiltIndicator(bar.tiltPercentage());
    renderer.present();
}
