// SolX Trading SDK - Configuration Implementation

#include <solx/trading/config.hpp>
#include <solx/trading/errors.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace solx::trading {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string quote(const std::string& s) {
    return "\"" + s + "\"";
}

class LineError {
public:
    explicit LineError(int line) : line_(line) {}

    [[noreturn]] void fail(const std::string& msg) const {
        throw ValidationError("config line " + std::to_string(line_) + ": " + msg);
    }

    uint64_t u64(std::string value) const {
        value.erase(std::remove(value.begin(), value.end(), '_'), value.end());
        if (value.empty() || value[0] == '-') fail("expected a non-negative integer, got '" + value + "'");
        try {
            size_t used = 0;
            uint64_t out = std::stoull(value, &used);
            if (used != value.size()) fail("trailing characters in '" + value + "'");
            return out;
        } catch (const std::logic_error&) {
            fail("invalid integer '" + value + "'");
        }
    }

    int i32(const std::string& value) const {
        uint64_t v = u64(value);
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) fail("value " + value + " out of range");
        return static_cast<int>(v);
    }

    uint32_t u32(const std::string& value) const {
        uint64_t v = u64(value);
        if (v > UINT32_MAX) fail("value " + value + " out of range");
        return static_cast<uint32_t>(v);
    }

    double real(const std::string& value) const {
        try {
            return std::stod(value);
        } catch (const std::logic_error&) {
            fail("invalid number '" + value + "'");
        }
    }

    Pubkey pubkey(const std::string& value) const {
        auto key = Pubkey::parse(value);
        if (!key) fail("invalid public key '" + value + "'");
        return *key;
    }

    // [1, 2, 3]
    std::vector<uint64_t> u64_array(const std::string& value) const {
        if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
            fail("expected an array, got '" + value + "'");
        }
        std::vector<uint64_t> out;
        std::istringstream items{value.substr(1, value.size() - 2)};
        std::string item;
        while (std::getline(items, item, ',')) {
            item = trim(item);
            if (!item.empty()) out.push_back(u64(item));
        }
        return out;
    }

private:
    int line_;
};

RelayConfig& relay_named(std::vector<RelayConfig>& relays, const std::string& name) {
    auto it = std::find_if(relays.begin(), relays.end(),
                           [&](const RelayConfig& r) { return r.name == name; });
    if (it != relays.end()) return *it;
    RelayConfig relay;
    relay.name = name;
    relays.push_back(std::move(relay));
    return relays.back();
}

}  // namespace

Config Config::baseline() {
    Config config;
    config.general.rpc_url = "https://api.mainnet-beta.solana.com";

    RelayConfig rpc;
    rpc.name = "rpc";
    rpc.kind = RelayKind::Rpc;
    rpc.url = config.general.rpc_url;
    rpc.timeout_ms = config.general.timeout_ms;
    config.relays.push_back(std::move(rpc));
    return config;
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ValidationError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                std::string section = line.substr(1, end - 1);

                // Check for subsection [section.name]
                auto dot = section.find('.');
                if (dot != std::string::npos) {
                    current_section = section.substr(0, dot);
                    current_subsection = section.substr(dot + 1);
                } else {
                    current_section = section;
                    current_subsection.clear();
                }
                if (current_section == "relay" && !current_subsection.empty()) {
                    relay_named(config.relays, current_subsection);
                }
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        LineError at(line_no);

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "rpc_url") config.general.rpc_url = value;
            else if (key == "commitment") {
                auto c = commitment_from_string(value);
                if (!c) at.fail("unknown commitment '" + value + "'");
                config.general.commitment = *c;
            }
            else if (key == "timeout_ms") config.general.timeout_ms = at.i32(value);
            else if (key == "lookup_table") config.general.lookup_table = at.pubkey(value);
        }
        else if (current_section == "priority_fee") {
            auto& fee = config.priority_fee;
            if (key == "compute_unit_limit") fee.compute_unit_limit = at.u32(value);
            else if (key == "compute_unit_price") fee.compute_unit_price = at.u64(value);
            else if (key == "loaded_accounts_data_size_limit") fee.loaded_accounts_data_size_limit = at.u32(value);
            else if (key == "tip_lamports") fee.tip_lamports = at.u64_array(value);
        }
        else if (current_section == "stream") {
            auto& s = config.stream;
            if (key == "geyser_url") s.geyser_url = value;
            else if (key == "geyser_token") s.geyser_token = value;
            else if (key == "shredstream_url") s.shredstream_url = value;
            else if (key == "ws_url") s.ws_url = value;
            else if (key == "reconnect_base_ms") s.reconnect_base_ms = at.i32(value);
            else if (key == "reconnect_max_ms") s.reconnect_max_ms = at.i32(value);
            else if (key == "reconnect_multiplier") s.reconnect_multiplier = at.real(value);
            else if (key == "max_reconnect_attempts") s.max_reconnect_attempts = at.i32(value);
        }
        else if (current_section == "relay" && !current_subsection.empty()) {
            auto& relay = relay_named(config.relays, current_subsection);
            if (key == "kind") {
                auto kind = relay_kind_from_string(value);
                if (!kind) at.fail("unknown relay kind '" + value + "'");
                relay.kind = *kind;
            }
            else if (key == "url") relay.url = value;
            else if (key == "region") relay.region = value;
            else if (key == "auth_token") relay.auth_token = value;
            else if (key == "timeout_ms") relay.timeout_ms = at.i32(value);
            else if (key == "tip_account") relay.tip_account = at.pubkey(value);
        }
    }

    if (config.relays.empty() && !config.general.rpc_url.empty()) {
        RelayConfig rpc;
        rpc.name = "rpc";
        rpc.url = config.general.rpc_url;
        rpc.timeout_ms = config.general.timeout_ms;
        config.relays.push_back(std::move(rpc));
    }

    return config;
}

std::string Config::to_toml() const {
    std::ostringstream out;

    out << "[general]\n";
    out << "log_level = " << quote(general.log_level) << "\n";
    out << "rpc_url = " << quote(general.rpc_url) << "\n";
    out << "commitment = " << quote(to_string(general.commitment)) << "\n";
    out << "timeout_ms = " << general.timeout_ms << "\n";
    if (general.lookup_table) out << "lookup_table = " << quote(general.lookup_table->to_base58()) << "\n";

    out << "\n[priority_fee]\n";
    out << "compute_unit_limit = " << priority_fee.compute_unit_limit << "\n";
    out << "compute_unit_price = " << priority_fee.compute_unit_price << "\n";
    if (priority_fee.loaded_accounts_data_size_limit) {
        out << "loaded_accounts_data_size_limit = " << *priority_fee.loaded_accounts_data_size_limit << "\n";
    }
    out << "tip_lamports = [";
    for (size_t i = 0; i < priority_fee.tip_lamports.size(); ++i) {
        if (i > 0) out << ", ";
        out << priority_fee.tip_lamports[i];
    }
    out << "]\n";

    out << "\n[stream]\n";
    out << "geyser_url = " << quote(stream.geyser_url) << "\n";
    if (stream.geyser_token) out << "geyser_token = " << quote(*stream.geyser_token) << "\n";
    out << "shredstream_url = " << quote(stream.shredstream_url) << "\n";
    out << "ws_url = " << quote(stream.ws_url) << "\n";
    out << "reconnect_base_ms = " << stream.reconnect_base_ms << "\n";
    out << "reconnect_max_ms = " << stream.reconnect_max_ms << "\n";
    out << "reconnect_multiplier = " << stream.reconnect_multiplier << "\n";
    out << "max_reconnect_attempts = " << stream.max_reconnect_attempts << "\n";

    for (const auto& relay : relays) {
        out << "\n[relay." << relay.name << "]\n";
        out << "kind = " << quote(to_string(relay.kind)) << "\n";
        out << "url = " << quote(relay.url) << "\n";
        if (!relay.region.empty()) out << "region = " << quote(relay.region) << "\n";
        if (relay.auth_token) out << "auth_token = " << quote(*relay.auth_token) << "\n";
        out << "timeout_ms = " << relay.timeout_ms << "\n";
        if (relay.tip_account) out << "tip_account = " << quote(relay.tip_account->to_base58()) << "\n";
    }

    return out.str();
}

void Config::validate() const {
    if (general.rpc_url.empty()) {
        throw ValidationError("general.rpc_url is required");
    }
    if (general.timeout_ms <= 0) {
        throw ValidationError("general.timeout_ms must be positive");
    }
    if (priority_fee.compute_unit_limit == 0) {
        throw ValidationError("priority_fee.compute_unit_limit must be positive");
    }
    if (relays.empty()) {
        throw ValidationError("at least one relay is required");
    }

    std::size_t tip_relays = 0;
    for (const auto& relay : relays) {
        if (relay.name.empty()) throw ValidationError("relay without a name");
        if (relay.url.empty()) throw ValidationError("relay " + relay.name + " has no url");
        if (relay.timeout_ms <= 0) throw ValidationError("relay " + relay.name + " timeout must be positive");
        if (relay.kind != RelayKind::Rpc) ++tip_relays;
    }

    if (!priority_fee.tip_lamports.empty() && priority_fee.tip_lamports.size() != tip_relays) {
        throw ValidationError(std::to_string(priority_fee.tip_lamports.size()) + " tips configured for " +
                              std::to_string(tip_relays) + " tip-taking relays");
    }
    if (stream.reconnect_base_ms <= 0 || stream.reconnect_max_ms < stream.reconnect_base_ms) {
        throw ValidationError("stream reconnect delays must satisfy 0 < base <= max");
    }
    if (stream.reconnect_multiplier < 1.0) {
        throw ValidationError("stream.reconnect_multiplier must be at least 1");
    }
}

void setup_logging(const GeneralConfig& general) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("solx", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(general.log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
}

}  // namespace solx::trading
