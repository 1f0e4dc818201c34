/**
 * @file adapter_registry.hpp
 * @brief Priority-ordered table of test framework adapters
 *
 * @date 2025
 */

#pragma once

#include "crucible/adapters/test_framework_adapter.hpp"
#include "crucible/core/engine_config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace adapters {

/**
 * @class AdapterRegistry
 * @brief Owns adapters and orders them for detection
 *
 * Ordering is by effective priority (override or adapter default),
 * descending; ties keep registration order, so detection is stable for a
 * given registry.
 *
 * **Usage Example**:
 * @code
 * auto registry = AdapterRegistry::CreateDefault();
 * registry->SetPriority("jest", 70);
 * registry->Disable("make");
 *
 * for (const auto* adapter : registry->Ordered()) {
 *     if (adapter->FingerprintMatch(tree)) { ... }
 * }
 * @endcode
 *
 * **Thread Safety**: Configure before sharing; const methods are safe for
 * concurrent use afterwards.
 */
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    /**
     * @brief Registry with every built-in adapter at its default priority
     */
    static std::shared_ptr<AdapterRegistry> CreateDefault();

    /**
     * @brief Built-in registry adjusted by detection settings
     * @param settings Disabled adapters and priority overrides
     * @throws core::ConfigError if a setting names an unknown adapter
     */
    static std::shared_ptr<AdapterRegistry> CreateFromSettings(const core::DetectionSettings& settings);

    /**
     * @brief Add an adapter
     * @param adapter Adapter instance
     * @param priority Priority override, adapter default if absent
     * @throws std::invalid_argument if an adapter with the same name exists
     */
    void Register(std::unique_ptr<TestFrameworkAdapter> adapter,
                  std::optional<int> priority = std::nullopt);

    /// Change the effective priority; false if the adapter is unknown
    bool SetPriority(const std::string& name, int priority);

    /// Exclude an adapter from detection; false if unknown
    bool Disable(const std::string& name);

    /// Enabled adapters, highest priority first
    std::vector<const TestFrameworkAdapter*> Ordered() const;

    /// Lookup by name (disabled adapters included, for parsing old records)
    const TestFrameworkAdapter* FindByName(const std::string& name) const;

    /// First registered adapter with this framework tag
    const TestFrameworkAdapter* FindByFramework(core::Framework framework) const;

    /// Effective priority, nullopt if unknown
    std::optional<int> PriorityOf(const std::string& name) const;

    std::size_t Size() const { return entries_.size(); }

private:
    struct Entry {
        std::unique_ptr<TestFrameworkAdapter> adapter;  ///< Owned adapter
        int priority{0};                                ///< Effective priority
        bool enabled{true};                             ///< Participates in detection
        std::size_t order{0};                           ///< Registration order
    };

    std::vector<Entry> entries_;

    Entry* Find(const std::string& name);
    const Entry* Find(const std::string& name) const;
};

} // namespace adapters
} // namespace crucible
