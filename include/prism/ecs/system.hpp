#pragma once

/// @file system.hpp
/// @brief System definition and scheduling for prism_ecs
///
/// Systems are functions that run queries against the world. Each system
/// declares the access of its queries up front; the scheduler groups
/// systems whose declared access is compatible into parallel batches and
/// gives every system the change window since its own previous run.

#include "fwd.hpp"
#include "access.hpp"
#include "query.hpp"
#include "world.hpp"
#include <prism/core/log.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace prism_ecs {

// =============================================================================
// SystemId
// =============================================================================

/// Unique identifier for a system
struct SystemId {
    std::size_t id;

    constexpr explicit SystemId(std::size_t i = 0) noexcept : id(i) {}

    /// Create from string (hash-based)
    [[nodiscard]] static SystemId from_name(const std::string& name) {
        return SystemId{std::hash<std::string>{}(name)};
    }

    [[nodiscard]] constexpr bool operator==(const SystemId& other) const noexcept {
        return id == other.id;
    }
    [[nodiscard]] constexpr bool operator!=(const SystemId& other) const noexcept {
        return id != other.id;
    }
};

} // namespace prism_ecs

template<>
struct std::hash<prism_ecs::SystemId> {
    [[nodiscard]] std::size_t operator()(const prism_ecs::SystemId& s) const noexcept {
        return s.id;
    }
};

namespace prism_ecs {

// =============================================================================
// SystemStage
// =============================================================================

/// Execution stage for systems
enum class SystemStage : std::uint8_t {
    First = 0,
    PreUpdate,
    Update,          // Default
    PostUpdate,
    Last,

    COUNT
};

/// Number of system stages
constexpr std::size_t SYSTEM_STAGE_COUNT = static_cast<std::size_t>(SystemStage::COUNT);

// =============================================================================
// SystemDescriptor
// =============================================================================

/// Metadata for a system
///
/// Conflicts are decided purely by the declared query access: two systems
/// conflict when one writes a component the other reads or writes, unless
/// their with/without filters keep them on disjoint archetypes.
class SystemDescriptor {
public:
    std::string name;
    SystemStage stage{SystemStage::Update};
    std::vector<FilteredAccess> queries;
    std::vector<SystemId> run_after;
    std::vector<SystemId> run_before;
    bool exclusive{false};  // Can't run in parallel

    // =========================================================================
    // Builder Methods
    // =========================================================================

    SystemDescriptor() = default;

    explicit SystemDescriptor(std::string n) : name(std::move(n)) {}

    SystemDescriptor& set_stage(SystemStage s) {
        stage = s;
        return *this;
    }

    /// Declare the access of query <D, F>, registering its components
    template<typename D, typename F = Filters<>>
    SystemDescriptor& add_query(World& world) {
        queries.push_back(query_access<D, F>(world));
        return *this;
    }

    /// Declare an access computed elsewhere, e.g. QueryState::component_access()
    SystemDescriptor& add_access(FilteredAccess access) {
        queries.push_back(std::move(access));
        return *this;
    }

    SystemDescriptor& after(SystemId system) {
        run_after.push_back(system);
        return *this;
    }

    SystemDescriptor& before(SystemId system) {
        run_before.push_back(system);
        return *this;
    }

    /// Mark as exclusive (can't run in parallel)
    SystemDescriptor& set_exclusive() {
        exclusive = true;
        return *this;
    }

    // =========================================================================
    // Conflict Detection
    // =========================================================================

    /// Check if this system conflicts with another
    [[nodiscard]] bool conflicts_with(const SystemDescriptor& other) const {
        if (exclusive || other.exclusive) {
            return true;
        }

        for (const auto& query : queries) {
            for (const auto& other_query : other.queries) {
                if (!query.is_compatible(other_query)) {
                    return true;
                }
            }
        }

        return false;
    }

    [[nodiscard]] SystemId id() const {
        return SystemId::from_name(name);
    }

    /// Must run after other
    [[nodiscard]] bool runs_after(const SystemDescriptor& other) const {
        SystemId other_id = other.id();
        SystemId own_id = id();
        for (const auto& sys : run_after) {
            if (sys == other_id) return true;
        }
        for (const auto& sys : other.run_before) {
            if (sys == own_id) return true;
        }
        return false;
    }

    /// An ordering constraint links the two systems
    [[nodiscard]] bool ordered_with(const SystemDescriptor& other) const {
        return runs_after(other) || other.runs_after(*this);
    }
};

// =============================================================================
// System Interface
// =============================================================================

/// Change window of one system run
struct SystemTicks {
    Tick last_run;
    Tick this_run;
};

/// Base interface for systems
class System {
private:
    Tick last_run_{0};

public:
    virtual ~System() = default;

    [[nodiscard]] virtual const SystemDescriptor& descriptor() const = 0;

    /// Run the system with its change window
    virtual void run(World& world, const SystemTicks& ticks) = 0;

    /// Tick of the previous run; changes after it are visible to the next run
    [[nodiscard]] Tick last_run() const noexcept { return last_run_; }

    void set_last_run(Tick tick) noexcept { last_run_ = tick; }

    /// Clamp last_run so it never falls more than MAX_CHANGE_AGE behind
    void check_change_tick(Tick change_tick) noexcept {
        if (last_run_.check_tick(change_tick)) {
            prism_core::schedule_logger()->warn(
                "System '{}' has not run for a long time; its change window was clamped",
                descriptor().name);
        }
    }
};

// =============================================================================
// FunctionSystem
// =============================================================================

/// System implemented as a function/lambda
///
/// The function takes either (World&) or (World&, const SystemTicks&).
template<typename F>
class FunctionSystem : public System {
private:
    SystemDescriptor descriptor_;
    F func_;

public:
    FunctionSystem(SystemDescriptor desc, F func)
        : descriptor_(std::move(desc))
        , func_(std::move(func)) {}

    [[nodiscard]] const SystemDescriptor& descriptor() const override {
        return descriptor_;
    }

    void run(World& world, const SystemTicks& ticks) override {
        if constexpr (std::is_invocable_v<F&, World&, const SystemTicks&>) {
            func_(world, ticks);
        } else {
            static_assert(std::is_invocable_v<F&, World&>,
                "system functions take (World&) or (World&, const SystemTicks&)");
            func_(world);
        }
    }
};

/// Create a function system
template<typename F>
[[nodiscard]] std::unique_ptr<System> make_system(SystemDescriptor desc, F&& func) {
    return std::make_unique<FunctionSystem<std::decay_t<F>>>(
        std::move(desc), std::forward<F>(func));
}

/// Create a simple system with just a name and function
template<typename F>
[[nodiscard]] std::unique_ptr<System> make_system(const std::string& name, F&& func) {
    return make_system(SystemDescriptor(name), std::forward<F>(func));
}

// =============================================================================
// SystemBatch
// =============================================================================

/// Batch of systems that can run in parallel
struct SystemBatch {
    std::vector<std::size_t> system_indices;

    SystemBatch() = default;

    void add(std::size_t index) {
        system_indices.push_back(index);
    }

    [[nodiscard]] const std::vector<std::size_t>& systems() const noexcept {
        return system_indices;
    }

    [[nodiscard]] bool empty() const noexcept {
        return system_indices.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return system_indices.size();
    }
};

// =============================================================================
// SystemScheduler
// =============================================================================

/// Manages system execution order
class SystemScheduler {
public:
    using size_type = std::size_t;

private:
    std::array<std::vector<std::unique_ptr<System>>, SYSTEM_STAGE_COUNT> stages_;

public:
    // =========================================================================
    // System Management
    // =========================================================================

    void add_system(std::unique_ptr<System> system) {
        const auto& desc = system->descriptor();
        prism_core::schedule_logger()->debug("Added system '{}' to stage {}",
            desc.name, static_cast<int>(desc.stage));
        auto stage = static_cast<std::size_t>(desc.stage);
        stages_[stage].push_back(std::move(system));
        sort_stage(stage);
    }

    template<typename F>
    void add_system(SystemDescriptor desc, F&& func) {
        add_system(make_system(std::move(desc), std::forward<F>(func)));
    }

    template<typename F>
    void add_system(const std::string& name, F&& func) {
        add_system(make_system(name, std::forward<F>(func)));
    }

    // =========================================================================
    // Execution
    // =========================================================================

    /// Run all stages in order
    void run(World& world) {
        for (size_type i = 0; i < SYSTEM_STAGE_COUNT; ++i) {
            run_stage(world, static_cast<SystemStage>(i));
        }
    }

    /// Run the systems of one stage
    ///
    /// Each run takes the world's current tick as this_run and advances the
    /// clock, so writes made by one system are newer than the last_run of
    /// every system that runs after it.
    void run_stage(World& world, SystemStage stage) {
        for (auto& system : stages_[static_cast<std::size_t>(stage)]) {
            SystemTicks ticks{system->last_run(), world.increment_change_tick()};
            prism_core::schedule_logger()->trace("Running system '{}' (window {}..{})",
                system->descriptor().name, ticks.last_run.get(), ticks.this_run.get());
            system->run(world, ticks);
            system->set_last_run(ticks.this_run);
        }

        if (world.maybe_check_change_ticks()) {
            Tick change_tick = world.change_tick();
            for (auto& stage_systems : stages_) {
                for (auto& system : stage_systems) {
                    system->check_change_tick(change_tick);
                }
            }
        }
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] const std::vector<std::unique_ptr<System>>& systems_in_stage(
            SystemStage stage) const {
        return stages_[static_cast<std::size_t>(stage)];
    }

    /// Total number of systems
    [[nodiscard]] size_type size() const noexcept {
        size_type total = 0;
        for (const auto& stage : stages_) {
            total += stage.size();
        }
        return total;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size() == 0;
    }

    // =========================================================================
    // Parallel Batching
    // =========================================================================

    /// Create batches of non-conflicting systems for parallel execution
    [[nodiscard]] std::vector<SystemBatch> create_parallel_batches(
            SystemStage stage) const {
        std::vector<SystemBatch> batches;
        const auto& systems = stages_[static_cast<std::size_t>(stage)];

        if (systems.empty()) {
            return batches;
        }

        std::vector<bool> scheduled(systems.size(), false);

        while (true) {
            SystemBatch batch;
            std::vector<size_type> deferred;

            for (size_type i = 0; i < systems.size(); ++i) {
                if (scheduled[i]) continue;

                const auto& desc = systems[i]->descriptor();
                bool conflicts = false;

                for (size_type j : batch.system_indices) {
                    const auto& other = systems[j]->descriptor();
                    if (desc.conflicts_with(other) || desc.ordered_with(other)) {
                        conflicts = true;
                        break;
                    }
                }

                // A system never moves ahead of one it must follow
                for (size_type j : deferred) {
                    if (conflicts) break;
                    conflicts = desc.runs_after(systems[j]->descriptor());
                }

                if (conflicts) {
                    deferred.push_back(i);
                } else {
                    batch.add(i);
                    scheduled[i] = true;
                }
            }

            if (batch.empty()) {
                break;
            }

            batches.push_back(std::move(batch));
        }

        prism_core::schedule_logger()->debug("Stage {}: {} systems in {} batches",
            static_cast<int>(stage), systems.size(), batches.size());
        return batches;
    }

private:
    /// Reorder a stage so after/before constraints hold, otherwise keeping
    /// insertion order. Systems caught in a cycle keep their relative order.
    void sort_stage(size_type stage) {
        auto& systems = stages_[stage];
        const size_type n = systems.size();

        std::vector<std::unique_ptr<System>> sorted;
        sorted.reserve(n);
        std::vector<bool> placed(n, false);

        while (sorted.size() < n) {
            bool progressed = false;
            for (size_type i = 0; i < n; ++i) {
                if (placed[i]) continue;

                bool ready = true;
                for (size_type j = 0; j < n && ready; ++j) {
                    if (!placed[j] && j != i
                            && systems[i]->descriptor().runs_after(systems[j]->descriptor())) {
                        ready = false;
                    }
                }

                if (ready) {
                    placed[i] = true;
                    sorted.push_back(std::move(systems[i]));
                    progressed = true;
                    break;
                }
            }

            if (!progressed) {
                prism_core::schedule_logger()->warn(
                    "Ordering cycle in stage {}; remaining systems keep insertion order",
                    static_cast<int>(stage));
                for (size_type i = 0; i < n; ++i) {
                    if (!placed[i]) {
                        placed[i] = true;
                        sorted.push_back(std::move(systems[i]));
                    }
                }
            }
        }

        systems = std::move(sorted);
    }
};

} // namespace prism_ecs
