/**
 * @file profile.cpp
 * @brief Scope timing collector
 */

#include "tiltball/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];
    section.start_time = Clock::now();

    if (instance.scope_stack.empty()) {
        section.profile_data.parent_name.clear();
        instance.scope_stack.push(name);
        return;
    }

    const std::string parentName = instance.scope_stack.top();
    auto& data = section.profile_data;

    // A scope reached from a different caller moves under its new parent
    if (!data.parent_name.empty() && data.parent_name != parentName) {
        auto& oldSiblings = instance.sections[data.parent_name].profile_data.children;
        oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                          oldSiblings.end());
    }
    data.parent_name = parentName;

    auto& siblings = instance.sections[parentName].profile_data.children;
    if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
        siblings.push_back(name);
    }

    instance.scope_stack.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty() || instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] endSection(\"" << name << "\") does not match the open scope\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const elapsed = Clock::now() - instance.sections[name].start_time;

    data.total_time += elapsed;
    data.self_time  += elapsed;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, elapsed);
    data.max_time = std::max(data.max_time, elapsed);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= elapsed;
    }

    instance.scope_stack.pop();
}

void Profiler::printStats() {
    printStats(std::cout);
}

void Profiler::printStats(std::ostream& out) {
    auto& instance = getInstance();
    out << "\nTick profile:\n";

    std::vector<std::string> roots;
    Duration totalTime{0};
    for (auto& [name, section] : instance.sections) {
        if (section.profile_data.parent_name.empty()) {
            roots.push_back(name);
            totalTime += section.profile_data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(out, roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(std::ostream& out,
                         const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }
    double const avgUs = pd.call_count > 0
        ? static_cast<double>(pd.total_time.count()) / 1000.0 / static_cast<double>(pd.call_count)
        : 0.0;

    out << prefix << (isLast ? "└── " : "├── ")
        << name << " [" << pd.call_count << " calls, avg "
        << std::fixed << std::setprecision(1) << avgUs << "us] "
        << std::setprecision(2) << totalPercent << "% total, "
        << selfPercent << "% self\n";

    std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
    for (size_t i = 0; i < pd.children.size(); ++i) {
        printNode(out, pd.children[i], childPrefix, i == pd.children.size() - 1, totalProgramTime);
    }
}

uint64_t Profiler::callCount(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    return it == sections.end() ? 0 : it->second.profile_data.call_count;
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack = std::stack<std::string>();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
