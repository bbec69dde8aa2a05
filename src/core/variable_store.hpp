#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

/// Named values available to templates and conditions during one run.
/// Values are JSON scalars or string arrays; later writes overwrite earlier ones.
class VariableStore {
public:
    VariableStore() = default;

    void set(const std::string& key, nlohmann::json value);

    /// Merge every member of a JSON object into the store
    void merge(const nlohmann::json& values);

    bool contains(const std::string& key) const;

    /// Returns nullptr when the key was never written
    const nlohmann::json* find(const std::string& key) const;

    /// Value for key, or null json when absent
    nlohmann::json get(const std::string& key) const;

    /// Keys in first-insertion order (for human-readable output only)
    const std::vector<std::string>& keys() const { return order_; }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    /// Mark a key whose value must never appear in logs
    void mark_sensitive(const std::string& key);

    /// True if marked, or if the key name looks like a credential
    bool is_sensitive(const std::string& key) const;

    /// Non-empty string forms of all sensitive values
    std::vector<std::string> sensitive_values() const;

    /// Snapshot as a JSON object
    const nlohmann::json& to_json() const { return values_; }

    static bool looks_like_secret_name(const std::string& key);

    /// JavaScript-like truthiness: null, false, 0, "" and [] are false
    static bool is_truthy(const nlohmann::json& value);

private:
    nlohmann::json values_ = nlohmann::json::object();
    std::vector<std::string> order_;
    std::set<std::string> sensitive_keys_;
};
