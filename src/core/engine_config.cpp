/**
 * @file engine_config.cpp
 * @brief JSON loading, validation and builder for EngineConfig
 *
 * Numeric fields are read as signed integers and range-checked before being
 * narrowed, so a negative value in the file is reported instead of wrapping
 * into a huge unsigned limit.
 *
 * @date 2025
 */

#include "crucible/core/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace crucible {
namespace core {

using json = nlohmann::json;

namespace {

const json& Section(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) {
        return empty;
    }
    const json& section = root.at(name);
    if (!section.is_object()) {
        throw ConfigError(std::string("'") + name + "' must be an object");
    }
    return section;
}

long long ReadInteger(const json& section, const char* key, long long fallback,
                      const char* section_name) {
    if (!section.contains(key)) {
        return fallback;
    }
    const json& value = section.at(key);
    if (!value.is_number_integer()) {
        throw ConfigError(std::string(section_name) + "." + key + " must be an integer");
    }
    return value.get<long long>();
}

double ReadNumber(const json& section, const char* key, double fallback,
                  const char* section_name) {
    if (!section.contains(key)) {
        return fallback;
    }
    const json& value = section.at(key);
    if (!value.is_number()) {
        throw ConfigError(std::string(section_name) + "." + key + " must be a number");
    }
    return value.get<double>();
}

std::size_t ReadSize(const json& section, const char* key, std::size_t fallback,
                     const char* section_name) {
    long long value = ReadInteger(section, key, static_cast<long long>(fallback), section_name);
    if (value < 0) {
        throw ConfigError(std::string(section_name) + "." + key + " must not be negative");
    }
    return static_cast<std::size_t>(value);
}

std::chrono::seconds ReadSeconds(const json& section, const char* key,
                                 std::chrono::seconds fallback, const char* section_name) {
    return std::chrono::seconds(ReadInteger(section, key, fallback.count(), section_name));
}

bool IsKnownLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "warning" || level == "error" || level == "critical" || level == "off";
}

} // anonymous namespace

// ============================================================================
// JSON LOADING
// ============================================================================

EngineConfig EngineConfig::FromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    EngineConfig config;

    try {
        const json& sandbox = Section(j, "sandbox");
        config.sandbox.runtime = sandbox.value("runtime", config.sandbox.runtime);
        config.sandbox.image = sandbox.value("image", config.sandbox.image);
        config.sandbox.memory_mb = ReadSize(sandbox, "memory_mb", config.sandbox.memory_mb, "sandbox");
        config.sandbox.cpus = ReadNumber(sandbox, "cpus", config.sandbox.cpus, "sandbox");
        config.sandbox.pids_limit = static_cast<int>(
            ReadInteger(sandbox, "pids_limit", config.sandbox.pids_limit, "sandbox"));
        config.sandbox.disk_mb = ReadSize(sandbox, "disk_mb", config.sandbox.disk_mb, "sandbox");
        config.sandbox.allow_install_network =
            sandbox.value("allow_install_network", config.sandbox.allow_install_network);
        config.sandbox.allow_test_network =
            sandbox.value("allow_test_network", config.sandbox.allow_test_network);
        config.sandbox.install_network =
            sandbox.value("install_network", config.sandbox.install_network);
        config.sandbox.workspace_root =
            sandbox.value("workspace_root", config.sandbox.workspace_root.string());

        const json& timeouts = Section(j, "timeouts");
        config.timeouts.install = ReadSeconds(timeouts, "install_seconds", config.timeouts.install, "timeouts");
        config.timeouts.execute = ReadSeconds(timeouts, "execute_seconds", config.timeouts.execute, "timeouts");
        config.timeouts.total = ReadSeconds(timeouts, "total_seconds", config.timeouts.total, "timeouts");
        config.timeouts.commit_lookup =
            ReadSeconds(timeouts, "commit_lookup_seconds", config.timeouts.commit_lookup, "timeouts");

        const json& capture = Section(j, "capture");
        config.capture.max_output_bytes =
            ReadSize(capture, "max_output_bytes", config.capture.max_output_bytes, "capture");
        config.capture.max_integration_test_bytes =
            ReadSize(capture, "max_integration_test_bytes", config.capture.max_integration_test_bytes, "capture");

        const json& workers = Section(j, "workers");
        config.workers.parallel = ReadSize(workers, "parallel", config.workers.parallel, "workers");
        config.workers.max_sandboxes =
            ReadSize(workers, "max_sandboxes", config.workers.max_sandboxes, "workers");

        const json& detection = Section(j, "detection");
        if (detection.contains("disabled_adapters")) {
            config.detection.disabled_adapters =
                detection.at("disabled_adapters").get<std::vector<std::string>>();
        }
        if (detection.contains("priority_overrides")) {
            config.detection.priority_overrides =
                detection.at("priority_overrides").get<std::map<std::string, int>>();
        }
        config.detection.max_depth = static_cast<int>(
            ReadInteger(detection, "max_depth", config.detection.max_depth, "detection"));
        config.detection.max_entries =
            ReadSize(detection, "max_entries", config.detection.max_entries, "detection");

        const json& logging = Section(j, "logging");
        config.logging.level = logging.value("level", config.logging.level);
        config.logging.pattern = logging.value("pattern", config.logging.pattern);

    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    config.Validate();
    return config;
}

EngineConfig EngineConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("malformed configuration file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return FromJson(j);
}

json EngineConfig::ToJson() const {
    json j;
    j["sandbox"] = {
        {"runtime", sandbox.runtime},
        {"image", sandbox.image},
        {"memory_mb", sandbox.memory_mb},
        {"cpus", sandbox.cpus},
        {"pids_limit", sandbox.pids_limit},
        {"disk_mb", sandbox.disk_mb},
        {"allow_install_network", sandbox.allow_install_network},
        {"allow_test_network", sandbox.allow_test_network},
        {"install_network", sandbox.install_network},
        {"workspace_root", sandbox.workspace_root.string()}
    };
    j["timeouts"] = {
        {"install_seconds", timeouts.install.count()},
        {"execute_seconds", timeouts.execute.count()},
        {"total_seconds", timeouts.total.count()},
        {"commit_lookup_seconds", timeouts.commit_lookup.count()}
    };
    j["capture"] = {
        {"max_output_bytes", capture.max_output_bytes},
        {"max_integration_test_bytes", capture.max_integration_test_bytes}
    };
    j["workers"] = {
        {"parallel", workers.parallel},
        {"max_sandboxes", workers.max_sandboxes}
    };
    j["detection"] = {
        {"disabled_adapters", detection.disabled_adapters},
        {"priority_overrides", detection.priority_overrides},
        {"max_depth", detection.max_depth},
        {"max_entries", detection.max_entries}
    };
    j["logging"] = {
        {"level", logging.level},
        {"pattern", logging.pattern}
    };
    return j;
}

// ============================================================================
// VALIDATION
// ============================================================================

void EngineConfig::Validate() const {
    if (sandbox.runtime != "docker" && sandbox.runtime != "local") {
        throw ConfigError("sandbox.runtime must be 'docker' or 'local', got '" + sandbox.runtime + "'");
    }
    if (sandbox.runtime == "docker" && sandbox.image.empty()) {
        throw ConfigError("sandbox.image must not be empty for the docker runtime");
    }
    if (sandbox.memory_mb < 128) {
        throw ConfigError("sandbox.memory_mb must be at least 128");
    }
    if (sandbox.cpus <= 0.0) {
        throw ConfigError("sandbox.cpus must be positive");
    }
    if (sandbox.pids_limit < 0) {
        throw ConfigError("sandbox.pids_limit must not be negative");
    }
    if (sandbox.workspace_root.empty()) {
        throw ConfigError("sandbox.workspace_root must not be empty");
    }
    if (timeouts.install.count() <= 0) {
        throw ConfigError("timeouts.install_seconds must be positive");
    }
    if (timeouts.execute.count() <= 0) {
        throw ConfigError("timeouts.execute_seconds must be positive");
    }
    if (timeouts.total.count() <= 0) {
        throw ConfigError("timeouts.total_seconds must be positive");
    }
    if (timeouts.commit_lookup.count() <= 0) {
        throw ConfigError("timeouts.commit_lookup_seconds must be positive");
    }
    if (capture.max_output_bytes == 0) {
        throw ConfigError("capture.max_output_bytes must be positive");
    }
    if (workers.parallel == 0) {
        throw ConfigError("workers.parallel must be at least 1");
    }
    if (workers.max_sandboxes == 0) {
        throw ConfigError("workers.max_sandboxes must be at least 1");
    }
    if (detection.max_depth < 0) {
        throw ConfigError("detection.max_depth must not be negative");
    }
    if (detection.max_entries == 0) {
        throw ConfigError("detection.max_entries must be positive");
    }
    if (!IsKnownLevel(logging.level)) {
        throw ConfigError("logging.level '" + logging.level + "' is not a spdlog level");
    }
}

// ============================================================================
// BUILDER
// ============================================================================

EngineConfigBuilder& EngineConfigBuilder::WithRuntime(const std::string& runtime) {
    config_.sandbox.runtime = runtime;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithImage(const std::string& image) {
    config_.sandbox.image = image;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithMemoryLimit(std::size_t mb) {
    config_.sandbox.memory_mb = mb;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithCPULimit(double cpus) {
    config_.sandbox.cpus = cpus;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithPidsLimit(int pids) {
    config_.sandbox.pids_limit = pids;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithWorkspaceRoot(const std::filesystem::path& root) {
    config_.sandbox.workspace_root = root;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithInstallNetwork(bool allowed) {
    config_.sandbox.allow_install_network = allowed;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithTestNetwork(bool allowed) {
    config_.sandbox.allow_test_network = allowed;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithInstallTimeout(std::chrono::seconds timeout) {
    config_.timeouts.install = timeout;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithExecuteTimeout(std::chrono::seconds timeout) {
    config_.timeouts.execute = timeout;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithTotalTimeout(std::chrono::seconds timeout) {
    config_.timeouts.total = timeout;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithMaxOutputBytes(std::size_t bytes) {
    config_.capture.max_output_bytes = bytes;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithParallel(std::size_t workers) {
    config_.workers.parallel = workers;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithMaxSandboxes(std::size_t sandboxes) {
    config_.workers.max_sandboxes = sandboxes;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::DisableAdapter(const std::string& name) {
    config_.detection.disabled_adapters.push_back(name);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithAdapterPriority(const std::string& name, int priority) {
    config_.detection.priority_overrides[name] = priority;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithLogLevel(const std::string& level) {
    config_.logging.level = level;
    return *this;
}

EngineConfig EngineConfigBuilder::Build() const {
    config_.Validate();
    return config_;
}

} // namespace core
} // namespace crucible
