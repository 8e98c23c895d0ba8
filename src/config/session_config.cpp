#include <eoslink/config.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <system_error>

namespace eoslink
{

osc::TransportConfig SessionConfig::transport() const
{
    osc::TransportConfig tc;
    tc.host    = host;
    tc.port    = port;
    tc.rx_port = rx_port;
    tc.framing = framing;
    return tc;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

namespace
{

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

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

std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find('"', pos);
    if (pos == std::string::npos)
        return std::nullopt;

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return out;
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            switch (e)
            {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += e;
                    break;
            }
            continue;
        }
        out += c;
    }
    return std::nullopt;
}

std::optional<long> read_json_int(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])))
        ++pos;
    char* end   = nullptr;
    long  value = std::strtol(json.c_str() + pos, &end, 10);
    if (end == json.c_str() + pos)
        return std::nullopt;
    return value;
}

}   // namespace

std::string SessionConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CURRENT_VERSION << ",\n";
    os << "  \"host\": \"" << escape_json(host) << "\",\n";
    os << "  \"port\": " << port << ",\n";
    os << "  \"rx_port\": " << rx_port << ",\n";
    os << "  \"framing\": \"" << osc::framing_name(framing) << "\",\n";
    os << "  \"timeout_ms\": " << timeout_ms << ",\n";
    os << "  \"poll_interval_ms\": " << poll_interval_ms << ",\n";
    os << "  \"client_name\": \"" << escape_json(client_name) << "\",\n";
    std::string level = Logger::level_to_string(log_level);
    for (auto& c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    os << "  \"log_level\": \"" << level << "\"\n";
    os << "}\n";
    return os.str();
}

bool SessionConfig::deserialize(const std::string& json)
{
    if (json.empty() || json.find('{') == std::string::npos)
        return false;

    if (auto ver = read_json_int(json, "version"); ver && *ver > CURRENT_VERSION)
        return false;

    SessionConfig next = *this;

    if (auto v = read_json_string(json, "host"))
        next.host = *v;
    if (auto v = read_json_string(json, "client_name"))
        next.client_name = *v;

    auto read_port = [&](const char* key, uint16_t& out)
    {
        auto v = read_json_int(json, key);
        if (!v)
            return true;
        if (*v <= 0 || *v > std::numeric_limits<uint16_t>::max())
            return false;
        out = static_cast<uint16_t>(*v);
        return true;
    };
    auto read_ms = [&](const char* key, int& out)
    {
        auto v = read_json_int(json, key);
        if (!v)
            return true;
        if (*v <= 0 || *v > std::numeric_limits<int>::max())
            return false;
        out = static_cast<int>(*v);
        return true;
    };
    if (!read_port("port", next.port) || !read_port("rx_port", next.rx_port)
        || !read_ms("timeout_ms", next.timeout_ms)
        || !read_ms("poll_interval_ms", next.poll_interval_ms))
    {
        return false;
    }

    if (auto v = read_json_string(json, "framing"))
    {
        auto mode = osc::parse_framing(*v);
        if (!mode)
            return false;
        next.framing = *mode;
    }
    if (auto v = read_json_string(json, "log_level"))
    {
        auto level = Logger::parse_level(*v);
        if (!level)
            return false;
        next.log_level = *level;
    }

    *this = std::move(next);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool SessionConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            EOSLINK_LOG_ERROR("config", "cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

bool SessionConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        EOSLINK_LOG_WARN("config", "ignoring invalid session config {}", path);
        return false;
    }
    return true;
}

std::string SessionConfig::default_path()
{
    std::filesystem::path dir;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    {
        dir = std::filesystem::path(xdg) / "eoslink";
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (!home)
            return "session.json";
        dir = std::filesystem::path(home) / ".config" / "eoslink";
    }
    return (dir / "session.json").string();
}

}   // namespace eoslink
