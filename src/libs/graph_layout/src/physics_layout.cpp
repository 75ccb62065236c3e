#include <graph_layout/force_directed_layout.hpp>
#include <graph_layout/components.hpp>
#include <graph_layout/layout_constants.hpp>
#include <graph_layout/node_sizing.hpp>
#include <clipper_log/log.hpp>
#include <box2d/box2d.h>
#include <algorithm>
#include <cmath>
#include <mutex>

namespace graph_layout {

namespace {

using namespace layout;

constexpr float kTimeStep = 1.0f / 60.0f;
constexpr int kSubSteps = 4;
constexpr int kSettleSteps = 60;
constexpr float kMaxLinearSpeed = 100000.0f;
constexpr double kMinDistance = 0.01;
constexpr double kSeparationEpsilon = 1e-3;

// b2CreateWorld/b2DestroyWorld share Box2D's global world table.
std::mutex& world_table_mutex() {
    static std::mutex m;
    return m;
}

// One rigid box per node, sized node + spacing. Units are px.
class PhysicsWorld {
public:
    PhysicsWorld(const std::vector<Rect>& rects, double spacing) {
        b2WorldDef world_def = b2DefaultWorldDef();
        world_def.gravity = b2Vec2{0.0f, 0.0f};
        world_def.maxContactPushSpeed = 200.0f;
        world_def.contactHertz = 120.0f;
        world_def.contactDampingRatio = 5.0f;
        world_def.maximumLinearSpeed = kMaxLinearSpeed;
        world_def.enableSleep = false;
        {
            std::lock_guard<std::mutex> lock(world_table_mutex());
            world_id_ = b2CreateWorld(&world_def);
        }

        bodies_.reserve(rects.size());
        for (const auto& r : rects) {
            b2BodyDef body_def = b2DefaultBodyDef();
            body_def.type = b2_dynamicBody;
            body_def.position = b2Vec2{ static_cast<float>(r.cx()), static_cast<float>(r.cy()) };
            body_def.fixedRotation = true;
            b2BodyId body_id = b2CreateBody(world_id_, &body_def);

            b2ShapeDef shape_def = b2DefaultShapeDef();
            shape_def.density = 1.0f;
            shape_def.material.friction = 0.0f;

            const float hx = static_cast<float>(r.width * 0.5 + spacing * 0.25);
            const float hy = static_cast<float>(r.height * 0.5 + spacing * 0.25);
            b2Polygon poly = b2MakeBox(hx, hy);
            b2CreatePolygonShape(body_id, &shape_def, &poly);
            bodies_.push_back(body_id);
        }
    }

    ~PhysicsWorld() {
        if (b2World_IsValid(world_id_)) {
            std::lock_guard<std::mutex> lock(world_table_mutex());
            b2DestroyWorld(world_id_);
        }
    }

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    Point position(std::size_t i) const {
        const b2Vec2 p = b2Body_GetPosition(bodies_[i]);
        return { static_cast<double>(p.x), static_cast<double>(p.y) };
    }

    void set_velocity(std::size_t i, Point v) {
        b2Body_SetLinearVelocity(bodies_[i], b2Vec2{ static_cast<float>(v.x), static_cast<float>(v.y) });
    }

    void step() {
        b2World_Step(world_id_, kTimeStep, kSubSteps);
    }

    // Contacts only: velocities are cleared before every step.
    void warmup_settle(int steps) {
        for (int s = 0; s < steps; ++s) {
            for (std::size_t i = 0; i < bodies_.size(); ++i) set_velocity(i, {});
            b2World_Step(world_id_, 1.0f / 90.0f, 8);
        }
    }

private:
    b2WorldId world_id_ = b2_nullWorldId;
    std::vector<b2BodyId> bodies_;
};

class ForceSimulation {
public:
    ForceSimulation(const graph_model::Graph& graph,
        const Component& component,
        std::vector<Rect>& rects,
        const graph_model::Style& style)
        : component_(component)
        , rects_(rects)
        , style_(style)
    {
        for (std::size_t local = 0; local < component.nodes.size(); ++local)
            local_of_.emplace_back(component.nodes[local], local);
        std::sort(local_of_.begin(), local_of_.end());

        for (std::size_t ei : component.edges) {
            const auto& e = graph.edges()[ei];
            const std::size_t s = local(*graph.index_of(e.source_node_id));
            const std::size_t t = local(*graph.index_of(e.target_node_id));
            if (s != t) springs_.emplace_back(s, t);
        }

        double size_sum = 0.0;
        for (std::size_t ni : component.nodes)
            size_sum += std::sqrt(rects[ni].width * rects[ni].height);
        ideal_ = size_sum / static_cast<double>(component.nodes.size()) + style.node_spacing;
    }

    void seed_positions(std::uint64_t seed) {
        SplitMix64 rng(seed);
        const double side = ideal_ * std::ceil(std::sqrt(static_cast<double>(component_.nodes.size())));
        for (std::size_t ni : component_.nodes) {
            const double cx = rng.next_unit() * side;
            const double cy = rng.next_unit() * side;
            rects_[ni].x = cx - rects_[ni].width * 0.5;
            rects_[ni].y = cy - rects_[ni].height * 0.5;
        }
        initial_temperature_ = std::max(side * 0.1, ideal_ * 0.5);
    }

    void run(const LayoutContext& context, std::int64_t& iterations_used) {
        const std::size_t m = component_.nodes.size();
        std::vector<Rect> bodies;
        bodies.reserve(m);
        for (std::size_t ni : component_.nodes) bodies.push_back(rects_[ni]);
        PhysicsWorld world(bodies, style_.node_spacing);

        const int iterations = style_.force_iterations;
        std::vector<Point> pos(m);
        std::vector<Point> disp(m);
        const double k2 = ideal_ * ideal_;

        for (int it = 0; it < iterations; ++it) {
            if (context.stop.stop_requested()) {
                throw LayoutTimeoutError("force-directed layout cancelled");
            }
            if (LayoutContext::Clock::now() >= context.deadline) {
                throw LayoutTimeoutError("force-directed layout deadline exceeded");
            }
            if (++iterations_used > context.iteration_budget) {
                throw LayoutTimeoutError("force-directed layout iteration budget exhausted");
            }

            for (std::size_t i = 0; i < m; ++i) {
                pos[i] = world.position(i);
                disp[i] = {};
            }

            // Repulsion between all pairs.
            for (std::size_t i = 0; i < m; ++i) {
                for (std::size_t j = i + 1; j < m; ++j) {
                    double dx = pos[i].x - pos[j].x;
                    double dy = pos[i].y - pos[j].y;
                    double dist = std::hypot(dx, dy);
                    if (dist < kMinDistance) {
                        // Coincident: separate along a direction fixed by the pair's indices.
                        const double angle = static_cast<double>(i * 31 + j) * 0.61803398875;
                        dx = std::cos(angle) * kMinDistance;
                        dy = std::sin(angle) * kMinDistance;
                        dist = kMinDistance;
                    }
                    const double f = k2 / dist;
                    disp[i].x += dx / dist * f;
                    disp[i].y += dy / dist * f;
                    disp[j].x -= dx / dist * f;
                    disp[j].y -= dy / dist * f;
                }
            }

            // Attraction along edges.
            for (const auto& [s, t] : springs_) {
                const double dx = pos[s].x - pos[t].x;
                const double dy = pos[s].y - pos[t].y;
                const double dist = std::max(std::hypot(dx, dy), kMinDistance);
                const double f = dist * dist / ideal_;
                disp[s].x -= dx / dist * f;
                disp[s].y -= dy / dist * f;
                disp[t].x += dx / dist * f;
                disp[t].y += dy / dist * f;
            }

            // Linear cooling caps the displacement per iteration.
            const double temperature = initial_temperature_
                * (1.0 - static_cast<double>(it) / static_cast<double>(iterations));
            for (std::size_t i = 0; i < m; ++i) {
                const double len = std::hypot(disp[i].x, disp[i].y);
                Point v{};
                if (len > 0.0) {
                    const double capped = std::min(len, temperature);
                    v = { disp[i].x / len * capped / kTimeStep, disp[i].y / len * capped / kTimeStep };
                }
                world.set_velocity(i, v);
            }
            world.step();
        }

        world.warmup_settle(kSettleSteps);

        for (std::size_t i = 0; i < m; ++i) {
            const Point c = world.position(i);
            Rect& r = rects_[component_.nodes[i]];
            r.x = c.x - r.width * 0.5;
            r.y = c.y - r.height * 0.5;
        }
    }

    // Final deterministic pass. Falls back to a grid if separation does not converge.
    void resolve_overlaps() {
        std::vector<Rect> local;
        local.reserve(component_.nodes.size());
        for (std::size_t ni : component_.nodes) local.push_back(rects_[ni]);

        const double gap = style_.node_spacing * 0.5;
        if (!separate_overlaps(local, gap, separation_rounds)) {
            clipper_log::logger()->warn(
                "force_layout_separation_fallback nodes={} rounds={}", local.size(), separation_rounds);
            grid_fallback(local);
        }
        for (std::size_t i = 0; i < local.size(); ++i) rects_[component_.nodes[i]] = local[i];
    }

private:
    std::size_t local(std::size_t node_index) const {
        const auto it = std::lower_bound(local_of_.begin(), local_of_.end(),
            std::make_pair(node_index, std::size_t{0}));
        return it->second;
    }

    void grid_fallback(std::vector<Rect>& local) const {
        const auto columns = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(local.size()))));
        double cell_w = 0.0;
        double cell_h = 0.0;
        for (const auto& r : local) {
            cell_w = std::max(cell_w, r.width);
            cell_h = std::max(cell_h, r.height);
        }
        cell_w += style_.node_spacing;
        cell_h += style_.node_spacing;
        for (std::size_t i = 0; i < local.size(); ++i) {
            local[i].x = static_cast<double>(i % columns) * cell_w;
            local[i].y = static_cast<double>(i / columns) * cell_h;
        }
    }

    const Component& component_;
    std::vector<Rect>& rects_;
    const graph_model::Style& style_;
    std::vector<std::pair<std::size_t, std::size_t>> local_of_;
    std::vector<std::pair<std::size_t, std::size_t>> springs_;
    double ideal_ = 1.0;
    double initial_temperature_ = 1.0;
};

} // namespace

bool separate_overlaps(std::vector<Rect>& rects, double gap, int rounds) {
    for (int round = 0; round < rounds; ++round) {
        bool moved = false;
        for (std::size_t i = 0; i < rects.size(); ++i) {
            for (std::size_t j = i + 1; j < rects.size(); ++j) {
                Rect& a = rects[i];
                Rect& b = rects[j];
                const double ox = std::min(a.right(), b.right()) + gap - std::max(a.x, b.x);
                const double oy = std::min(a.bottom(), b.bottom()) + gap - std::max(a.y, b.y);
                if (ox <= 0.0 || oy <= 0.0) continue;

                if (ox < oy) {
                    const double sign = (b.cx() >= a.cx()) ? 1.0 : -1.0;
                    const double push = ox * 0.5 + kSeparationEpsilon;
                    a.x -= sign * push;
                    b.x += sign * push;
                } else {
                    const double sign = (b.cy() >= a.cy()) ? 1.0 : -1.0;
                    const double push = oy * 0.5 + kSeparationEpsilon;
                    a.y -= sign * push;
                    b.y += sign * push;
                }
                moved = true;
            }
        }
        if (!moved) return true;
    }
    return find_overlaps(rects).empty();
}

Layout ForceDirectedLayout::compute(const graph_model::Graph& graph,
    const graph_model::Style& style,
    const LayoutContext& context) const
{
    const auto components = connected_components(graph);
    std::vector<Rect> rects = node_sizes(graph, style);
    std::int64_t iterations_used = 0;

    for (std::size_t ci = 0; ci < components.size(); ++ci) {
        const auto& component = components[ci];
        if (component.nodes.size() == 1) continue;

        ForceSimulation sim(graph, component, rects, style);
        sim.seed_positions(context.seed ^ (0x9e3779b97f4a7c15ull * (ci + 1)));
        sim.run(context, iterations_used);
        sim.resolve_overlaps();
    }

    clipper_log::logger()->debug("force_layout_done nodes={} components={} iterations={}",
        graph.node_count(), components.size(), iterations_used);

    pack_in_place(components, rects, style.node_spacing);
    return assemble_layout(graph, style, rects, {}, {}, false);
}

} // namespace graph_layout
