#include "tiercache/config.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tiercache {

// Minimal JSON value extraction; enough for the flat config layout below

namespace {

class SimpleJson {
public:
    explicit SimpleJson(std::string json) : json_(std::move(json)) {}

    bool has(const std::string& key) const {
        return find_value(key) != std::string::npos;
    }

    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto pos = find_value(key);
        if (pos == std::string::npos || json_[pos] != '"') return def;

        auto end = json_.find('"', pos + 1);
        if (end == std::string::npos) return def;

        return json_.substr(pos + 1, end - pos - 1);
    }

    int64_t get_int(const std::string& key, int64_t def = 0) const {
        auto pos = find_value(key);
        if (pos == std::string::npos) return def;

        auto end = pos;
        while (end < json_.size() &&
               (std::isdigit(static_cast<unsigned char>(json_[end])) || json_[end] == '-')) ++end;

        if (end == pos) return def;
        return std::stoll(json_.substr(pos, end - pos));
    }

    std::vector<std::string> get_string_array(const std::string& key) const {
        std::vector<std::string> result;
        auto pos = find_value(key);
        if (pos == std::string::npos || json_[pos] != '[') return result;

        auto end = json_.find(']', pos);
        if (end == std::string::npos) return result;

        std::string arr = json_.substr(pos + 1, end - pos - 1);
        size_t start = 0;
        while ((start = arr.find('"', start)) != std::string::npos) {
            auto str_end = arr.find('"', start + 1);
            if (str_end == std::string::npos) break;
            result.push_back(arr.substr(start + 1, str_end - start - 1));
            start = str_end + 1;
        }

        return result;
    }

    SimpleJson get_object(const std::string& key) const {
        auto pos = find_value(key);
        if (pos == std::string::npos || json_[pos] != '{') return SimpleJson("{}");

        int depth = 1;
        size_t end = pos + 1;
        while (end < json_.size() && depth > 0) {
            if (json_[end] == '{') ++depth;
            else if (json_[end] == '}') --depth;
            ++end;
        }

        return SimpleJson(json_.substr(pos, end - pos));
    }

private:
    std::string json_;

    // Position of the first non-space character after "key":
    // Quoted strings that are not followed by ':' (array items, values) are skipped.
    size_t find_value(const std::string& key) const {
        const std::string quoted = "\"" + key + "\"";
        size_t pos = 0;
        while ((pos = json_.find(quoted, pos)) != std::string::npos) {
            pos += quoted.size();
            while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
            if (pos < json_.size() && json_[pos] == ':') {
                ++pos;
                while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
                return pos < json_.size() ? pos : std::string::npos;
            }
        }
        return std::string::npos;
    }
};

}  // namespace

const char* cache_model_name(CacheModel model) noexcept {
    return model == CacheModel::Exclusive ? "exclusive" : "inclusive";
}

std::optional<CacheModel> parse_cache_model(std::string_view name) {
    if (name == "inclusive") return CacheModel::Inclusive;
    if (name == "exclusive") return CacheModel::Exclusive;
    return std::nullopt;
}

std::optional<LevelSpec> LevelSpec::parse(std::string_view spec) {
    LevelSpec level;
    if (spec == "local") {
        return level;
    }

    constexpr std::string_view prefix = "distributed";
    if (spec.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }

    level.kind = Kind::Distributed;
    auto rest = spec.substr(prefix.size());
    if (rest.empty()) {
        return level;
    }
    if (rest.front() != ':' || rest.size() < 2) {
        return std::nullopt;
    }

    size_t nodes = 0;
    for (char c : rest.substr(1)) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        nodes = nodes * 10 + static_cast<size_t>(c - '0');
        if (nodes > MAX_LEVEL_NODES) return std::nullopt;
    }
    level.nodes = nodes;
    return level;
}

std::string LevelSpec::to_string() const {
    if (kind == Kind::Local) return "local";
    return "distributed:" + std::to_string(nodes);
}

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    config.multilevel.name = j.get_string("name", config.multilevel.name);

    auto model_name = j.get_string("model", cache_model_name(config.multilevel.model));
    auto model = parse_cache_model(model_name);
    if (!model) {
        throw std::runtime_error("Unknown cache model: " + model_name);
    }
    config.multilevel.model = *model;

    for (const auto& spec : j.get_string_array("levels")) {
        auto level = LevelSpec::parse(spec);
        if (!level) {
            throw std::runtime_error("Invalid level spec: " + spec);
        }
        config.levels.push_back(*level);
    }

    auto fallback = j.get_string("fallback", "");
    if (!fallback.empty()) {
        auto named = NamedFallback::parse(fallback);
        if (!named) {
            throw std::runtime_error("Invalid fallback reference: " + fallback);
        }
        config.multilevel.fallback = *named;
    }

    // Transaction config
    auto txn = j.get_object("transaction");
    config.transaction.lock_timeout = std::chrono::milliseconds(
        txn.get_int("lock_timeout_ms", config.transaction.lock_timeout.count()));
    config.transaction.poll_interval = std::chrono::milliseconds(
        txn.get_int("poll_interval_ms", config.transaction.poll_interval.count()));
    if (txn.has("retries")) {
        auto retries = txn.get_int("retries", 1);
        config.transaction.retries = retries < 0 ? 0 : static_cast<size_t>(retries);
    }

    // Local level config
    auto local = j.get_object("local");
    if (local.has("default_ttl_ms")) {
        config.local.default_ttl = std::chrono::milliseconds(local.get_int("default_ttl_ms", 0));
    }

    // Distributed level config
    auto dist = j.get_object("distributed");
    auto virtual_nodes = dist.get_int("virtual_nodes",
                                      static_cast<int64_t>(config.distributed.virtual_nodes));
    if (virtual_nodes < 0) {
        throw std::runtime_error("virtual_nodes must not be negative: " + std::to_string(virtual_nodes));
    }
    config.distributed.virtual_nodes = static_cast<size_t>(virtual_nodes);

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"name\": \"" << multilevel.name << "\",\n";
    oss << "  \"model\": \"" << cache_model_name(multilevel.model) << "\",\n";

    oss << "  \"levels\": [";
    for (size_t i = 0; i < levels.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << levels[i].to_string() << "\"";
    }
    oss << "],\n";

    if (auto* named = std::get_if<NamedFallback>(&multilevel.fallback)) {
        oss << "  \"fallback\": \"" << named->to_string() << "\",\n";
    }

    // Transaction
    oss << "  \"transaction\": {\n";
    oss << "    \"lock_timeout_ms\": " << transaction.lock_timeout.count() << ",\n";
    if (!transaction.unbounded_retries()) {
        oss << "    \"retries\": " << transaction.retries << ",\n";
    }
    oss << "    \"poll_interval_ms\": " << transaction.poll_interval.count() << "\n";
    oss << "  },\n";

    // Local
    oss << "  \"local\": {";
    if (local.default_ttl) {
        oss << "\n    \"default_ttl_ms\": " << local.default_ttl->count() << "\n  ";
    }
    oss << "},\n";

    // Distributed
    oss << "  \"distributed\": {\n";
    oss << "    \"virtual_nodes\": " << distributed.virtual_nodes << "\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status Config::validate() const {
    if (multilevel.name.empty()) {
        return Status::error(ErrorCode::ConfigError, "Cache name must not be empty");
    }

    if (levels.empty()) {
        return Status::error(ErrorCode::ConfigError,
                             "levels configuration must have at least one level");
    }

    for (const auto& level : levels) {
        if (level.kind == LevelSpec::Kind::Distributed && level.nodes == 0) {
            return Status::error(ErrorCode::ConfigError,
                                 "Distributed level must have at least one node");
        }
        if (level.nodes > MAX_LEVEL_NODES) {
            return Status::error(ErrorCode::ConfigError,
                                 "Distributed level exceeds " + std::to_string(MAX_LEVEL_NODES) + " nodes");
        }
    }

    if (transaction.lock_timeout.count() <= 0) {
        return Status::error(ErrorCode::ConfigError, "Lock timeout must be positive");
    }

    if (transaction.poll_interval.count() <= 0) {
        return Status::error(ErrorCode::ConfigError, "Lock poll interval must be positive");
    }

    if (transaction.retries == 0) {
        return Status::error(ErrorCode::ConfigError, "Transaction retries must be at least 1");
    }

    if (local.default_ttl && local.default_ttl->count() <= 0) {
        return Status::error(ErrorCode::ConfigError, "Default TTL must be positive");
    }

    if (distributed.virtual_nodes == 0) {
        return Status::error(ErrorCode::ConfigError, "Virtual nodes must be at least 1");
    }
    if (distributed.virtual_nodes > MAX_VIRTUAL_NODES) {
        return Status::error(ErrorCode::ConfigError,
                             "Virtual nodes exceed " + std::to_string(MAX_VIRTUAL_NODES));
    }

    return Status::make_ok();
}

}  // namespace tiercache
