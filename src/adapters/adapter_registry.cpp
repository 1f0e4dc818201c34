/**
 * @file adapter_registry.cpp
 * @brief Implementation of the priority-ordered adapter table
 *
 * @date 2025
 */

#include "crucible/adapters/adapter_registry.hpp"
#include "crucible/adapters/builtin_adapters.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace crucible {
namespace adapters {

// ============================================================================
// FACTORIES
// ============================================================================

std::shared_ptr<AdapterRegistry> AdapterRegistry::CreateDefault() {
    auto registry = std::make_shared<AdapterRegistry>();

    registry->Register(std::make_unique<MillAdapter>());
    registry->Register(std::make_unique<SbtAdapter>());
    registry->Register(std::make_unique<MavenAdapter>());
    registry->Register(std::make_unique<GradleAdapter>());
    registry->Register(std::make_unique<CargoAdapter>());
    registry->Register(std::make_unique<GoAdapter>());
    registry->Register(std::make_unique<DotnetAdapter>());
    registry->Register(std::make_unique<VitestAdapter>());
    registry->Register(std::make_unique<JestAdapter>());
    registry->Register(std::make_unique<MochaAdapter>());
    registry->Register(std::make_unique<PytestAdapter>());
    registry->Register(std::make_unique<NpmAdapter>());
    registry->Register(std::make_unique<MakeAdapter>());

    return registry;
}

std::shared_ptr<AdapterRegistry> AdapterRegistry::CreateFromSettings(
    const core::DetectionSettings& settings) {

    auto registry = CreateDefault();

    for (const auto& name : settings.disabled_adapters) {
        if (!registry->Disable(name)) {
            throw core::ConfigError("detection.disabled_adapters: unknown adapter '" + name + "'");
        }
        spdlog::debug("Adapter disabled: {}", name);
    }

    for (const auto& [name, priority] : settings.priority_overrides) {
        if (!registry->SetPriority(name, priority)) {
            throw core::ConfigError("detection.priority_overrides: unknown adapter '" + name + "'");
        }
        spdlog::debug("Adapter priority override: {} = {}", name, priority);
    }

    return registry;
}

// ============================================================================
// REGISTRATION
// ============================================================================

void AdapterRegistry::Register(std::unique_ptr<TestFrameworkAdapter> adapter,
                               std::optional<int> priority) {
    if (!adapter) {
        throw std::invalid_argument("Cannot register a null adapter");
    }

    std::string name = adapter->GetName();
    if (Find(name)) {
        throw std::invalid_argument("Adapter already registered: " + name);
    }

    Entry entry;
    entry.priority = priority.value_or(adapter->GetPriority());
    entry.order = entries_.size();
    entry.adapter = std::move(adapter);
    entries_.push_back(std::move(entry));
}

bool AdapterRegistry::SetPriority(const std::string& name, int priority) {
    Entry* entry = Find(name);
    if (!entry) {
        return false;
    }
    entry->priority = priority;
    return true;
}

bool AdapterRegistry::Disable(const std::string& name) {
    Entry* entry = Find(name);
    if (!entry) {
        return false;
    }
    entry->enabled = false;
    return true;
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<const TestFrameworkAdapter*> AdapterRegistry::Ordered() const {
    std::vector<const Entry*> enabled;
    for (const auto& entry : entries_) {
        if (entry.enabled) {
            enabled.push_back(&entry);
        }
    }

    std::sort(enabled.begin(), enabled.end(), [](const Entry* a, const Entry* b) {
        if (a->priority != b->priority) {
            return a->priority > b->priority;
        }
        return a->order < b->order;
    });

    std::vector<const TestFrameworkAdapter*> ordered;
    ordered.reserve(enabled.size());
    for (const Entry* entry : enabled) {
        ordered.push_back(entry->adapter.get());
    }
    return ordered;
}

const TestFrameworkAdapter* AdapterRegistry::FindByName(const std::string& name) const {
    const Entry* entry = Find(name);
    return entry ? entry->adapter.get() : nullptr;
}

const TestFrameworkAdapter* AdapterRegistry::FindByFramework(core::Framework framework) const {
    for (const auto& entry : entries_) {
        if (entry.adapter->GetFramework() == framework) {
            return entry.adapter.get();
        }
    }
    return nullptr;
}

std::optional<int> AdapterRegistry::PriorityOf(const std::string& name) const {
    const Entry* entry = Find(name);
    if (!entry) {
        return std::nullopt;
    }
    return entry->priority;
}

AdapterRegistry::Entry* AdapterRegistry::Find(const std::string& name) {
    for (auto& entry : entries_) {
        if (entry.adapter->GetName() == name) {
            return &entry;
        }
    }
    return nullptr;
}

const AdapterRegistry::Entry* AdapterRegistry::Find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.adapter->GetName() == name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace adapters
} // namespace crucible
