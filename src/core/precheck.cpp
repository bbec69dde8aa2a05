#include "core/precheck.hpp"

#include <algorithm>

static std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const char* precheck_status_name(PreCheckStatus status) {
    switch (status) {
        case PreCheckStatus::Pending: return "pending";
        case PreCheckStatus::Running: return "running";
        case PreCheckStatus::Success: return "success";
        case PreCheckStatus::Warning: return "warning";
        case PreCheckStatus::Error: return "error";
    }
    return "pending";
}

PreCheckRunner::PreCheckRunner(const CommandRunner& runner) : runner_(runner) {}

PreCheckResult PreCheckRunner::run_one(const PreCheck& check, const VariableStore& vars) const {
    PreCheckResult result;
    result.name = check.name;
    result.capture_as = check.capture_as;

    PreCheckOutcome outcome = runner_.run_precheck(check, vars);
    result.output = outcome.output;

    if (!outcome.success) {
        result.status = PreCheckStatus::Error;
        result.message = check.error_message.empty() ? "Check failed" : check.error_message;
        if (!outcome.error.empty() && outcome.error != result.message) {
            result.message += " (" + outcome.error + ")";
        }
        return result;
    }

    if (!outcome.warning.empty()) {
        result.status = PreCheckStatus::Warning;
        result.message = outcome.warning;
    } else {
        result.status = PreCheckStatus::Success;
        result.message = "Check passed";
    }

    if (!check.capture_as.empty()) {
        result.captured = trim_copy(outcome.output);
    }
    return result;
}

std::vector<PreCheckResult> PreCheckRunner::run_all(const std::vector<PreCheck>& checks,
                                                    VariableStore vars,
                                                    const UpdateCallback& on_update) const {
    std::vector<PreCheckResult> results;
    results.reserve(checks.size());

    for (size_t i = 0; i < checks.size(); ++i) {
        if (on_update) {
            PreCheckResult running;
            running.name = checks[i].name;
            running.status = PreCheckStatus::Running;
            on_update(i, running);
        }

        PreCheckResult r = run_one(checks[i], vars);
        if (!r.capture_as.empty() && r.status != PreCheckStatus::Error) {
            vars.set(r.capture_as, r.captured);
        }
        if (on_update) on_update(i, r);
        results.push_back(std::move(r));
    }
    return results;
}

bool PreCheckRunner::all_passed(const std::vector<PreCheckResult>& results) {
    return std::all_of(results.begin(), results.end(), [](const PreCheckResult& r) {
        return r.status == PreCheckStatus::Success || r.status == PreCheckStatus::Warning;
    });
}
