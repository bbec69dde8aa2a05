#pragma once

#include "core/command_runner.hpp"
#include "core/installer_config.hpp"
#include "core/variable_store.hpp"

#include <functional>
#include <string>
#include <vector>

enum class PreCheckStatus { Pending, Running, Success, Warning, Error };

const char* precheck_status_name(PreCheckStatus status);

struct PreCheckResult {
    std::string name;
    PreCheckStatus status = PreCheckStatus::Pending;
    std::string message;
    std::string output;
    std::string capture_as;  // empty when the check captures nothing
    std::string captured;    // trimmed output, set only on success
};

/// Runs the diagnostic battery before installation. Checks are sequential
/// and independent: a failing check does not stop the ones after it.
class PreCheckRunner {
public:
    /// Called when a check starts (status Running) and when it finishes
    using UpdateCallback = std::function<void(size_t index, const PreCheckResult& result)>;

    explicit PreCheckRunner(const CommandRunner& runner);

    PreCheckResult run_one(const PreCheck& check, const VariableStore& vars) const;

    /// Captures from earlier checks are visible to later ones
    std::vector<PreCheckResult> run_all(const std::vector<PreCheck>& checks,
                                        VariableStore vars,
                                        const UpdateCallback& on_update = nullptr) const;

    /// Proceed only when every check succeeded or merely warned
    static bool all_passed(const std::vector<PreCheckResult>& results);

private:
    const CommandRunner& runner_;
};
