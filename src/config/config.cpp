/*
 * Configuration implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/config/config.hpp>
#include <fstream>
#include <cstdlib>
#include <cctype>
#include <sys/stat.h>

namespace rawline {

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static bool is_true(const std::string& v){ return v=="1"||v=="true"||v=="on"; }

void parse_config(std::istream& in, EditorConfig& cfg, std::ostream* trace) {
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0]=='#') continue;
        auto eq = line.find('='); if (eq==std::string::npos) {
            if (trace) *trace << "[rawline] config line " << lineno << ": missing '='\n";
            continue;
        }
        auto key = trim(line.substr(0,eq));
        auto val = line.substr(eq+1); // prompt keeps its spaces
        if (key=="prompt") cfg.prompt = val;
        else if (key=="quit_on_q") cfg.quit_on_q = is_true(trim(val));
        else if (key=="echo") cfg.echo = is_true(trim(val));
        else if (key=="continuation") cfg.continuation = is_true(trim(val));
        else if (key=="debug") cfg.debug = is_true(trim(val));
        else if (trace) *trace << "[rawline] config line " << lineno << ": unknown key '" << key << "'\n";
    }
}

std::string default_config_path() {
    std::string p = getenv_or("RAWLINE_CONFIG");
    if (!p.empty()) return p;
    std::string home = getenv_or("HOME");
    if (home.empty()) return "";
    return home + "/.rawlinerc";
}

bool load_config(const std::string& path, EditorConfig& cfg, std::ostream* trace) {
    if (path.empty()) return true;
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return true; // no rc file
    std::ifstream in(path);
    if (!in) return false;
    parse_config(in, cfg, trace);
    cfg.config_path = path;
    if (trace) *trace << "[rawline] loaded config " << path << "\n";
    return true;
}

CommandLine parse_command_line(int argc, char* argv[], std::ostream* trace) {
    CommandLine cl;
    std::string path = default_config_path();
    bool debug_flag = false;
    // --config and --debug must be known before the file is read
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="--config" && i+1<argc) path = argv[++i];
        else if (a=="--prompt") ++i; // its value is never an option
        else if (a=="--debug"||a=="-d") debug_flag = true;
    }
    if (!load_config(path, cl.config, debug_flag ? trace : nullptr))
        cl.errors.push_back("cannot read config file " + path);
    if (debug_flag) cl.config.debug = true;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="--help"||a=="-h") cl.show_help = true;
        else if (a=="--debug"||a=="-d") cl.config.debug = true;
        else if (a=="--no-quit-q") cl.config.quit_on_q = false;
        else if (a=="--no-echo") cl.config.echo = false;
        else if (a=="--continuation") cl.config.continuation = true;
        else if (a=="--prompt"||a=="--config") {
            if (i+1>=argc) { cl.errors.push_back(a + " requires a value"); continue; }
            std::string v = argv[++i];
            if (a=="--prompt") cl.config.prompt = v;
        }
        else cl.errors.push_back("unknown option: " + a);
    }
    return cl;
}

void print_usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [options]\n"
       << "  --prompt <text>   prompt shown before each line (default \"> \")\n"
       << "  --no-quit-q       do not treat 'q' as quit (Ctrl-C still quits)\n"
       << "  --no-echo         do not print the processed line after Enter\n"
       << "  --continuation    a line ending in '\\' continues on Enter\n"
       << "  --config <path>   rc file (default $RAWLINE_CONFIG or ~/.rawlinerc)\n"
       << "  -d, --debug       trace dropped input and terminal mode on stderr\n"
       << "  -h, --help        show this help\n";
}

} // namespace rawline
