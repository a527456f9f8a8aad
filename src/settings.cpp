#include "ocrscore/settings.h"

#include <pugixml.hpp>

#include <stdexcept>

namespace ocrscore {

std::string ScoreSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

int ScoreSettings::get_int(const std::string& key, int fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(it->second, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != it->second.size()) {
        throw std::invalid_argument("Option --" + key + " expects an integer, got '" + it->second + "'");
    }
    return value;
}

bool ScoreSettings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    if (val == "1" || val == "true" || val == "TRUE" || val == "True" || val == "yes") {
        return true;
    }
    if (val == "0" || val == "false" || val == "FALSE" || val == "False" || val == "no") {
        return false;
    }
    throw std::invalid_argument("Option --" + key + " expects a boolean, got '" + val + "'");
}

NormalizationConfig ScoreSettings::to_normalization_config() const {
    NormalizationConfig config;
    config.case_sensitive = get_bool("case_sensitive", false);
    config.ignore_punctuation = get_bool("ignore_punctuation", true);
    if (has("punctuation")) {
        config.punctuation_chars = get("punctuation");
    }
    return config;
}

std::size_t ScoreSettings::threshold() const {
    const std::string key = has("threshold") ? "threshold" : "edit_distance_threshold";
    int value = get_int(key, 1);
    if (value < 0) {
        throw std::invalid_argument("Edit distance threshold must be non-negative, got " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

std::size_t ScoreSettings::max_file_bytes() const {
    int mb = get_int("max_file_mb", 10);
    if (mb <= 0) {
        throw std::invalid_argument("--max_file_mb must be positive");
    }
    return static_cast<std::size_t>(mb) * 1024 * 1024;
}

namespace {

void push_option(ScoreSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    if (key == "pid") {
        settings.pid = value;
    } else if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "gt") {
        settings.gt_file = value;
    } else if (key == "ocr") {
        settings.ocr_files.push_back(value);
    } else if (key == "input") {
        settings.input_dir = value;
    } else if (key == "request") {
        settings.request_file = value;
    } else if (key == "outfile") {
        settings.outfile = value;
    } else if (key == "verbose") {
        settings.verbose = settings.get_bool("verbose", true);
    } else if (key == "debug") {
        settings.debug = settings.get_bool("debug", true);
    }
}

} // namespace

ScoreSettings parse_arguments(int argc, char** argv) {
    ScoreSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::string key = arg.substr(2);
            push_option(settings, key, "1");
        } else {
            std::string key = arg.substr(2, eq - 2);
            std::string value = arg.substr(eq + 1);
            push_option(settings, key, value);
        }
    }
    return settings;
}

ScoreSettings load_settings(const ScoreSettings& base) {
    ScoreSettings combined = base;
    std::string settings_path = base.settings_file.empty() ? "./ocrscore.xml" : base.settings_file;

    pugi::xml_document doc;
    if (!doc.load_file(settings_path.c_str())) {
        throw std::runtime_error("Failed to load settings file: " + settings_path);
    }

    pugi::xpath_node_set parameter_nodes = doc.select_nodes("//ocrscore/parameters/item");
    pugi::xml_node selected;

    for (const auto& node : parameter_nodes) {
        pugi::xml_node param = node.node();
        if (!base.pid.empty()) {
            if (std::string(param.attribute("pid").value()) == base.pid) {
                selected = param;
                break;
            }
        } else {
            selected = param;
            break;
        }
    }

    if (!selected) {
        throw std::runtime_error(base.pid.empty()
            ? "No parameter set found in " + settings_path
            : "No parameter set with pid '" + base.pid + "' in " + settings_path);
    }

    // Command line wins over the item, the item over its <parameters> defaults
    for (const auto& attr : selected.attributes()) {
        if (combined.has(attr.name())) {
            continue;
        }
        push_option(combined, attr.name(), attr.value());
    }
    pugi::xml_node parent = selected.parent();
    if (parent) {
        for (const auto& attr : parent.attributes()) {
            if (combined.has(attr.name())) {
                continue;
            }
            push_option(combined, attr.name(), attr.value());
        }
    }

    return combined;
}

} // namespace ocrscore
