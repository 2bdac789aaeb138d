// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "app_constants.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace tether {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (str[0] == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Accepts "--opt value" and "--opt=value"; returns nullptr (and reports) when missing
static const char* option_value(int argc, char** argv, int& i, const char* long_name,
                                const char* short_name) {
    size_t long_len = strlen(long_name);
    if (strncmp(argv[i], long_name, long_len) == 0 && argv[i][long_len] == '=') {
        return argv[i] + long_len + 1;
    }
    if (i + 1 >= argc) {
        if (short_name) {
            printf("Error: %s/%s requires an argument\n", short_name, long_name);
        } else {
            printf("Error: %s requires an argument\n", long_name);
        }
        return nullptr;
    }
    return argv[++i];
}

static bool matches(const char* arg, const char* long_name, const char* short_name = nullptr) {
    if (short_name && strcmp(arg, short_name) == 0) {
        return true;
    }
    size_t long_len = strlen(long_name);
    return strncmp(arg, long_name, long_len) == 0 &&
           (arg[long_len] == '\0' || arg[long_len] == '=');
}

void print_usage(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>     Config file (default: %s)\n",
           AppConstants::Paths::DEFAULT_CONFIG);
    printf("  -i, --interface <name>  Wireless interface (default: from config, else %s)\n",
           AppConstants::WiFi::DEFAULT_INTERFACE);
    printf("  --mock                  Use a simulated NetworkManager (no nmcli needed)\n");
    printf("  --clients <n>           Start with n dashboard clients attached (0-1000)\n");
    printf("  -v, --verbose           Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>       Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>       Log file path (when --log-dest=file)\n");
    printf("  -h, --help              Show this help message\n");
    printf("\nExamples:\n");
    printf("  %s --mock -vv                 # Bench run against the simulator\n", program_name);
    printf("  %s --mock --clients 1 -vv     # Simulate a dashboard client (hotspot seeking)\n",
           program_name);
    printf("  %s -i wlan1 --log-dest file   # Second adapter, log to file\n", program_name);
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (matches(argv[i], "--config", "-c")) {
            const char* value = option_value(argc, argv, i, "--config", "-c");
            if (!value)
                return false;
            args.config_path = value;
        } else if (matches(argv[i], "--interface", "-i")) {
            const char* value = option_value(argc, argv, i, "--interface", "-i");
            if (!value)
                return false;
            if (value[0] == '\0') {
                printf("Error: --interface must not be empty\n");
                return false;
            }
            args.interface = value;
        } else if (strcmp(argv[i], "--mock") == 0) {
            args.mock = true;
        } else if (matches(argv[i], "--clients")) {
            const char* value = option_value(argc, argv, i, "--clients", nullptr);
            if (!value || !parse_int(value, 0, 1000, args.clients, "--clients"))
                return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest", nullptr);
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file", nullptr);
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.help = true;
            print_usage(argv[0]);
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }
    return true;
}

} // namespace tether
