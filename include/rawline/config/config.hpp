/*
 * Configuration - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <istream>
#include <ostream>

namespace rawline {

struct EditorConfig {
    std::string prompt = "> ";
    bool quit_on_q = true;     // 'q' terminates like Ctrl-C
    bool echo = true;          // print processed line after commit
    bool continuation = false; // trailing '\' keeps the line open
    bool debug = false;
    std::string config_path;   // file the values were read from (empty if none)
};

struct CommandLine {
    EditorConfig config;
    bool show_help = false;
    std::vector<std::string> errors;
};

// key=value lines; '#' comments and blank lines skipped, unknown keys traced when debug.
void parse_config(std::istream& in, EditorConfig& cfg, std::ostream* trace = nullptr);

// $RAWLINE_CONFIG, else $HOME/.rawlinerc, else empty.
std::string default_config_path();

// Missing file is not an error; returns false only when the file exists but cannot be read.
bool load_config(const std::string& path, EditorConfig& cfg, std::ostream* trace = nullptr);

// Reads the rc file (default or --config) and applies command line overrides on top.
CommandLine parse_command_line(int argc, char* argv[], std::ostream* trace = nullptr);

void print_usage(std::ostream& os, const char* argv0);

} // namespace rawline
