#include "core/variable_store.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

void VariableStore::set(const std::string& key, json value) {
    if (!values_.contains(key)) {
        order_.push_back(key);
    }
    values_[key] = std::move(value);
}

void VariableStore::merge(const json& values) {
    if (!values.is_object()) return;
    for (auto it = values.begin(); it != values.end(); ++it) {
        set(it.key(), it.value());
    }
}

bool VariableStore::contains(const std::string& key) const {
    return values_.contains(key);
}

const json* VariableStore::find(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return nullptr;
    return &(*it);
}

json VariableStore::get(const std::string& key) const {
    const json* v = find(key);
    return v ? *v : json();
}

void VariableStore::mark_sensitive(const std::string& key) {
    sensitive_keys_.insert(key);
}

bool VariableStore::looks_like_secret_name(const std::string& key) {
    std::string lower;
    lower.reserve(key.size());
    for (char c : key) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    static const char* markers[] = {"password", "passphrase", "secret", "token", "apikey", "api_key"};
    for (const char* m : markers) {
        if (lower.find(m) != std::string::npos) return true;
    }
    return false;
}

bool VariableStore::is_sensitive(const std::string& key) const {
    return sensitive_keys_.count(key) > 0 || looks_like_secret_name(key);
}

std::vector<std::string> VariableStore::sensitive_values() const {
    std::vector<std::string> out;
    for (const auto& key : order_) {
        if (!is_sensitive(key)) continue;
        const json& v = values_.at(key);
        if (v.is_string()) {
            if (!v.get<std::string>().empty()) out.push_back(v.get<std::string>());
        } else if (v.is_array()) {
            for (const auto& e : v) {
                if (e.is_string() && !e.get<std::string>().empty()) {
                    out.push_back(e.get<std::string>());
                }
            }
        } else if (v.is_number()) {
            out.push_back(v.dump());
        }
    }
    // Longest first so that a secret containing another is masked whole
    std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
    return out;
}

bool VariableStore::is_truthy(const json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>() != 0;
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get<std::string>().empty();
    if (value.is_array() || value.is_object()) return !value.empty();
    return false;
}
