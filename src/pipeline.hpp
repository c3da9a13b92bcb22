#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>
#include <utility>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * Pre-Update: event flush, clock advance, inbound message pump.
 * Logic:      motion tick, scripted agent.
 * Render:     viewer only; headless runs never call render().
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Executes the standard update flow.
     */
    void update(World& world, float dt) {
        // 1. Inbound messages / pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Motion logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes before rendering
        world.deferred().flush(world);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
