#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "tiltball/core/random_source.hpp"

/**
 * @brief Replays a fixed list of values, cycling when it runs out
 */
class ScriptedRandomSource : public IRandomSource {
public:
    using IRandomSource::uniform;

    explicit ScriptedRandomSource(std::vector<double> values = {0.5})
        : values(std::move(values)) {}

    double uniform() override {
        if (values.empty()) {
            return 0.5;
        }
        double const value = values[next % values.size()];
        ++next;
        return value;
    }

    static std::unique_ptr<IRandomSource> make(std::vector<double> values = {0.5}) {
        return std::make_unique<ScriptedRandomSource>(std::move(values));
    }

private:
    std::vector<double> values;
    size_t next = 0;
};
