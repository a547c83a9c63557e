#include <hostkit/host_config.hpp>
#include <hostkit/logger.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hostkit
{

namespace
{

// Keys and accessors for every persisted field, in serialization order.
struct DoubleField
{
    const char* key;
    double HostConfig::*member;
};

struct BoolField
{
    const char* key;
    bool HostConfig::*member;
};

constexpr DoubleField kDoubleFields[] = {
    {"event_logic_period_s", &HostConfig::event_logic_period_s},
    {"client_painting_delay_s", &HostConfig::client_painting_delay_s},
    {"host_bounds_check_delay_s", &HostConfig::host_bounds_check_delay_s},
    {"state_stability_delay_s", &HostConfig::state_stability_delay_s},
    {"hidden_stability_delay_s", &HostConfig::hidden_stability_delay_s},
    {"anti_flicker_delay_s", &HostConfig::anti_flicker_delay_s},
    {"drag_move_blocking_delay_s", &HostConfig::drag_move_blocking_delay_s},
};

constexpr BoolField kBoolFields[] = {
    {"paint_during_move", &HostConfig::paint_during_move},
    {"paint_during_resize", &HostConfig::paint_during_resize},
    {"make_all_dirty_each_paint", &HostConfig::make_all_dirty_each_paint},
    {"deiconify_on_show", &HostConfig::deiconify_on_show},
    {"request_focus_on_show", &HostConfig::request_focus_on_show},
    {"request_focus_on_deiconified", &HostConfig::request_focus_on_deiconified},
    {"request_focus_on_deiconify", &HostConfig::request_focus_on_deiconify},
    {"request_focus_on_maximize", &HostConfig::request_focus_on_maximize},
    {"request_focus_on_demaximize", &HostConfig::request_focus_on_demaximize},
    {"restore_maximized_across_iconify", &HostConfig::restore_maximized_across_iconify},
    {"fix_bounds_during_drag", &HostConfig::fix_bounds_during_drag},
    {"restore_bounds_on_demaximize", &HostConfig::restore_bounds_on_demaximize},
    {"enforce_bounds_on_maximize", &HostConfig::enforce_bounds_on_maximize},
    {"set_demax_bounds_while_hidden_or_iconified",
     &HostConfig::set_demax_bounds_while_hidden_or_iconified},
    {"use_exception_handler_for_client", &HostConfig::use_exception_handler_for_client},
};

// Position just past the ':' following "key", or npos.
size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return pos + 1;
}

bool read_json_double(const std::string& json, const std::string& key, double& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return false;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    if (end == begin)
        return false;
    out = v;
    return true;
}

bool read_json_bool(const std::string& json, const std::string& key, bool& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return false;
    auto   rest  = json.substr(pos, 10);
    size_t start = rest.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return false;
    if (rest.compare(start, 4, "true") == 0)
    {
        out = true;
        return true;
    }
    if (rest.compare(start, 5, "false") == 0)
    {
        out = false;
        return true;
    }
    return false;
}

}   // namespace

void HostConfig::validate() const
{
    for (const auto& f : kDoubleFields)
    {
        const double v = this->*f.member;
        if (!std::isfinite(v) || v < 0.0)
        {
            throw std::invalid_argument(std::string("HostConfig: ") + f.key
                                        + " must be finite and >= 0, got "
                                        + std::to_string(v));
        }
    }
    if (event_logic_period_s <= 0.0)
    {
        throw std::invalid_argument("HostConfig: event_logic_period_s must be > 0");
    }
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string HostConfig::serialize() const
{
    std::ostringstream os;
    os.precision(17);
    os << "{\n";
    os << "  \"version\": 1";
    for (const auto& f : kDoubleFields)
    {
        os << ",\n  \"" << f.key << "\": " << this->*f.member;
    }
    for (const auto& f : kBoolFields)
    {
        os << ",\n  \"" << f.key << "\": " << (this->*f.member ? "true" : "false");
    }
    os << "\n}\n";
    return os.str();
}

bool HostConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    double version = 1.0;
    if (read_json_double(json, "version", version) && version > 1.0)
    {
        HOSTKIT_LOG_WARN("config", "Unsupported config version {}", version);
        return false;
    }

    for (const auto& f : kDoubleFields)
    {
        double v;
        if (read_json_double(json, f.key, v))
            this->*f.member = v;
    }
    for (const auto& f : kBoolFields)
    {
        bool v;
        if (read_json_bool(json, f.key, v))
            this->*f.member = v;
    }
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool HostConfig::save(const std::string& path) const
{
    auto            dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            HOSTKIT_LOG_WARN("config", "Cannot create {}: {}", dir.string(), ec.message());
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        HOSTKIT_LOG_ERROR("config", "Cannot open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool HostConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        HOSTKIT_LOG_WARN("config", "Ignoring unreadable config {}", path);
        return false;
    }
    HOSTKIT_LOG_INFO("config", "Loaded host config from {}", path);
    return true;
}

std::string HostConfig::default_path()
{
    if (const char* env = std::getenv("HOSTKIT_CONFIG"))
        return env;

    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "host.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "hostkit";
    return (dir / "host.json").string();
}

}   // namespace hostkit
