#include "core/template.hpp"

#include <cmath>
#include <sstream>

using json = nlohmann::json;

static std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string format_number(const json& value) {
    if (value.is_number_integer()) {
        return value.dump();
    }
    double d = value.get<double>();
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<int64_t>(d));
    }
    std::ostringstream oss;
    oss.precision(15);
    oss << d;
    return oss.str();
}

std::string format_value(const json& value, TemplateMode mode) {
    const std::string missing = (mode == TemplateMode::Display) ? "<not set>" : "";

    if (value.is_null()) return missing;

    if (value.is_boolean()) {
        bool b = value.get<bool>();
        if (mode == TemplateMode::Display) return b ? "Yes" : "No";
        return b ? "true" : "false";
    }

    if (value.is_number()) return format_number(value);

    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        return s.empty() ? missing : s;
    }

    if (value.is_array()) {
        if (value.empty()) return missing;
        const char* sep = (mode == TemplateMode::Display) ? ", " : ",";
        std::string out;
        bool first = true;
        for (const auto& e : value) {
            if (!first) out += sep;
            first = false;
            out += e.is_string() ? e.get<std::string>() : format_value(e, TemplateMode::Command);
        }
        return out;
    }

    return value.dump();
}

std::string resolve_template(const std::string& input,
                             const VariableStore& vars,
                             TemplateMode mode) {
    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size()) {
        size_t open = input.find("{{", pos);
        if (open == std::string::npos) {
            out.append(input, pos, std::string::npos);
            break;
        }
        size_t close = input.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(input, pos, std::string::npos);
            break;
        }

        out.append(input, pos, open - pos);
        std::string key = trim_copy(input.substr(open + 2, close - open - 2));
        const json* value = vars.find(key);
        out += format_value(value ? *value : json(), mode);
        pos = close + 2;
    }
    return out;
}
