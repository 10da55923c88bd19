#include <astkg/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace astkg::config {

namespace {

std::string strip_inline_comment(std::string v) {
    // '#' inside a quoted value is kept
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
    return v;
}

} // namespace

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        if (k.empty()) {
            continue;
        }
        // Arrays keep their brackets; parse_string_list unquotes the elements
        if (!v.empty() && v.front() != '[') {
            v = unquote(v);
        }
        out[currentSection.empty() ? k : currentSection + "." + k] = v;
    }
    return out;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(',', start);
        std::string token = pos == std::string::npos ? s.substr(start) : s.substr(start, pos - start);
        token = unquote(token);
        if (!token.empty()) {
            out.push_back(std::move(token));
        }
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    if (tmp.empty())
        return std::nullopt;
    char* end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size())
        return std::nullopt;
    return v;
}

std::optional<long long> parse_integer(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    long long v = 0;
    auto [ptr, ec] = std::from_chars(tmp.data(), tmp.data() + tmp.size(), v);
    if (ec != std::errc{} || ptr != tmp.data() + tmp.size() || tmp.empty())
        return std::nullopt;
    return v;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    std::transform(tmp.begin(), tmp.end(), tmp.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (tmp == "true" || tmp == "1" || tmp == "yes" || tmp == "on")
        return true;
    if (tmp == "false" || tmp == "0" || tmp == "no" || tmp == "off")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto v = parse_integer(s);
    if (!v || *v < 0)
        return std::nullopt;
    return std::chrono::milliseconds(*v);
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("ASTKG_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "astkg" / "config.toml";
    }

    return configHome / "astkg" / "config.toml";
}

} // namespace astkg::config
