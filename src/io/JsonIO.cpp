#include "io/JsonIO.hpp"
#include "verify/Errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using verify::InvalidInputError;

static json parse_or_throw(const std::string& text, const std::string& where) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw InvalidInputError(where + ": failed to parse JSON: " + e.what());
    }
}

static std::string read_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw InvalidInputError(where + " must be an object");
    }
}

// missing -> "", present but not a string -> error
static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw InvalidInputError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

verify::ReferenceRecord parseReferenceRecord(const std::string& json_text, const std::string& where) {
    const json j = parse_or_throw(json_text, where);
    require_object(j, where);

    verify::ReferenceRecord r;
    r.name = optional_string(j, "name", where);
    r.dob  = optional_string(j, "dob", where);

    for (const char* key : {"id_number", "idNumber", "aadhaar"}) {
        r.id_number = optional_string(j, key, where);
        if (!r.id_number.empty()) break;
    }
    return r;
}

verify::ReferenceRecord loadReferenceRecord(const std::string& path) {
    return parseReferenceRecord(read_file(path, "reference"), path);
}

verify::VerifyConfig parseVerifyConfig(const std::string& json_text,
                                       const verify::VerifyConfig& base,
                                       const std::string& where) {
    const json j = parse_or_throw(json_text, where);
    require_object(j, where);

    verify::VerifyConfig cfg = base;

    if (j.contains("name_threshold")) {
        if (!j["name_threshold"].is_number()) throw InvalidInputError(where + ".name_threshold must be a number");
        cfg.name_threshold = j["name_threshold"].get<double>();
    }
    if (j.contains("teen_policy")) {
        if (!j["teen_policy"].is_string()) throw InvalidInputError(where + ".teen_policy must be a string");
        cfg.teen_policy = verify::parse_teen_policy(j["teen_policy"].get<std::string>());
    }
    if (j.contains("strict_id_format")) {
        if (!j["strict_id_format"].is_boolean()) throw InvalidInputError(where + ".strict_id_format must be a boolean");
        cfg.strict_id_format = j["strict_id_format"].get<bool>();
    }
    if (j.contains("max_name_length")) {
        if (!j["max_name_length"].is_number_unsigned()) {
            throw InvalidInputError(where + ".max_name_length must be a non-negative integer");
        }
        cfg.max_name_length = j["max_name_length"].get<size_t>();
    }

    verify::validate_config(cfg);
    return cfg;
}

verify::VerifyConfig loadVerifyConfig(const std::string& path, const verify::VerifyConfig& base) {
    return parseVerifyConfig(read_file(path, "config"), base, path);
}
