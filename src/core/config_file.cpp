#include "config_file.hpp"

#include <cstdint>
#include <limits>
#include <optional>

using json = nlohmann::json;

namespace config_file {

namespace {

// Field reader for one document; the first failure is kept in `error`.
struct Reader {
    const json& doc;
    const std::string& source;
    std::optional<ConfigError> error;

    // Looks up `key` or its alias. Returns nullptr when absent or null.
    const json* find(const char* key, const char* alias) {
        const json* found = nullptr;
        const char* found_key = key;
        if (auto it = doc.find(key); it != doc.end() && !it->is_null()) found = &*it;
        if (alias) {
            if (auto it = doc.find(alias); it != doc.end() && !it->is_null()) {
                if (found) {
                    fail(key, std::string("conflicts with alias '") + alias + "'");
                    return nullptr;
                }
                found = &*it;
                found_key = alias;
            }
        }
        current_key = found_key;
        return found;
    }

    void fail(const char* key, std::string detail) {
        if (!error) error = ConfigError::invalid_format(source, std::move(detail), key);
    }

    void read_string(std::optional<std::string>& out, const char* key, const char* alias = nullptr) {
        const json* v = find(key, alias);
        if (!v) return;
        if (!v->is_string()) {
            fail(current_key, std::string("expected a string, got ") + v->type_name());
            return;
        }
        out = v->get<std::string>();
    }

    void read_double(std::optional<double>& out, const char* key, const char* alias = nullptr) {
        const json* v = find(key, alias);
        if (!v) return;
        if (!v->is_number()) {
            fail(current_key, std::string("expected a number, got ") + v->type_name());
            return;
        }
        out = v->get<double>();
    }

    void read_int(std::optional<int>& out, const char* key) {
        const json* v = find(key, nullptr);
        if (!v) return;
        if (!v->is_number_integer()) {
            fail(current_key, std::string("expected an integer, got ") + v->type_name());
            return;
        }
        if (v->is_number_unsigned()) {
            auto u = v->get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                fail(current_key, "integer does not fit");
                return;
            }
            out = static_cast<int>(u);
            return;
        }
        auto i = v->get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
            fail(current_key, "integer does not fit");
            return;
        }
        out = static_cast<int>(i);
    }

    const char* current_key = nullptr;
};

} // namespace

std::expected<PartialConfig, ConfigError> parse(const std::string& text, const std::string& source) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        return std::unexpected(ConfigError::invalid_format(
            source, std::string("not a JSON document (expected an object such as "
                                "{\"model\": \"gpt-4\"}): ") + e.what()));
    }

    if (!doc.is_object()) {
        return std::unexpected(ConfigError::invalid_format(
            source, std::string("expected a JSON object at top level, got ") + doc.type_name()));
    }

    PartialConfig p;
    Reader r{.doc = doc, .source = source, .error = std::nullopt};

    r.read_string(p.api_key, "api_key", "openai_api_key");
    r.read_string(p.endpoint, "endpoint", "api_endpoint");
    r.read_string(p.model, "model");
    r.read_int(p.max_tokens, "max_tokens");
    r.read_double(p.temperature, "temperature");
    r.read_double(p.top_p, "top_p");
    r.read_double(p.frequency_penalty, "frequency_penalty");
    r.read_double(p.presence_penalty, "presence_penalty");
    r.read_string(p.stop_sequence, "stop_sequence", "stop");
    r.read_double(p.timeout_seconds, "timeout");
    r.read_string(p.organization, "organization", "openai_org_id");

    if (r.error) return std::unexpected(std::move(*r.error));
    return p;
}

json to_json(const ConfigRecord& record) {
    json j = {
        {"api_key", record.api_key},
        {"endpoint", record.endpoint},
        {"model", record.model},
        {"max_tokens", record.max_tokens},
        {"temperature", record.temperature},
        {"top_p", record.top_p},
        {"frequency_penalty", record.frequency_penalty},
        {"presence_penalty", record.presence_penalty},
        {"timeout", record.timeout_seconds},
    };
    if (record.stop_sequence) j["stop_sequence"] = *record.stop_sequence;
    if (record.organization) j["organization"] = *record.organization;
    return j;
}

std::expected<std::string, ConfigError> serialize(const ConfigRecord& record) {
    json j = to_json(record);
    try {
        return j.dump(4) + "\n";
    } catch (const json::type_error& e) {
        for (const auto& item : j.items()) {
            try {
                (void)item.value().dump();
            } catch (const json::type_error&) {
                return std::unexpected(ConfigError::invalid_value(item.key(), "not valid UTF-8"));
            }
        }
        return std::unexpected(ConfigError::invalid_value("", e.what()));
    }
}

} // namespace config_file
