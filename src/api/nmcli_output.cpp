// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nmcli_output.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tether::nmcli {

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            char next = line[i + 1];
            if (next == ':' || next == '\\') {
                current += next;
                ++i;
            } else {
                // Other escape - keep as-is
                current += line[i];
            }
        } else if (line[i] == ':') {
            fields.push_back(current);
            current.clear();
        } else {
            current += line[i];
        }
    }

    fields.push_back(current);
    return fields;
}

std::string unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size() &&
            (value[i + 1] == ':' || value[i + 1] == '\\')) {
            out += value[i + 1];
            ++i;
        } else {
            out += value[i];
        }
    }
    return out;
}

std::string escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ':' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    key = line.substr(0, colon);
    value = line.substr(colon + 1);
    return true;
}

WiFiSecurity parse_security(const std::string& security) {
    if (security.find("WPA3") != std::string::npos) {
        return WiFiSecurity::WPA3;
    }
    if (security.find("WPA2") != std::string::npos) {
        return WiFiSecurity::WPA2;
    }
    if (security.find("WPA") != std::string::npos) {
        return WiFiSecurity::WPA;
    }
    if (security.find("WEP") != std::string::npos) {
        return WiFiSecurity::WEP;
    }
    if (security.empty() || security == "--") {
        return WiFiSecurity::OPEN;
    }
    return WiFiSecurity::UNKNOWN;
}

int parse_leading_int(const std::string& text, int fallback) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    size_t start = i;
    int value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        if (value > 100000000) {
            return fallback;
        }
        value = value * 10 + (text[i] - '0');
        ++i;
    }
    return i == start ? fallback : value;
}

std::vector<WiFiNetwork> parse_scan_output(const std::string& output) {
    std::vector<WiFiNetwork> networks;

    for (const auto& line : split_lines(output)) {
        if (line.empty()) {
            continue;
        }

        // SSID:SIGNAL:SECURITY:FREQ
        auto fields = split_fields(line);
        if (fields.size() < 4) {
            spdlog::trace("[NetworkScanner] Skipping malformed scan line ({} fields): {}",
                          fields.size(), line);
            continue;
        }

        const std::string& ssid = fields[0];
        if (ssid.empty()) {
            continue;
        }

        int signal = std::max(0, std::min(100, parse_leading_int(fields[1])));
        int frequency = parse_leading_int(fields[3]);

        networks.emplace_back(ssid, signal, parse_security(fields[2]), frequency);
    }

    return networks;
}

bool validate_input(const std::string& input, const char* field_name) {
    if (input.empty()) {
        spdlog::error("[Nmcli] Empty {}", field_name);
        return false;
    }

    if (input.length() > 255) {
        spdlog::error("[Nmcli] {} too long ({} chars)", field_name, input.length());
        return false;
    }

    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(ch);
        // Reject control chars (0x00-0x1F) and DEL (0x7F)
        if (c < 32 || c == 127) {
            spdlog::error("[Nmcli] Invalid character in {}: ASCII {}", field_name,
                          static_cast<int>(c));
            return false;
        }
    }

    return true;
}

bool parse_yes_no(const std::string& value) {
    return value == "yes";
}

} // namespace tether::nmcli
