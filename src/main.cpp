// RawLine demo front end: edits lines in raw mode and echoes each committed line back.
#include <rawline/config/config.hpp>
#include <rawline/line/editor.hpp>
#include <rawline/line/processor.hpp>
#include <rawline/term/io.hpp>
#include <rawline/term/raw_mode.hpp>

#include <iostream>
#include <string>
#include <unistd.h>

using namespace rawline;

int main(int argc, char* argv[]) {
    CommandLine cl = parse_command_line(argc, argv, &std::cerr);
    if (!cl.errors.empty()) {
        for (auto &e : cl.errors) std::cerr << "rawline: " << e << '\n';
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    if (cl.show_help) { print_usage(std::cout, argv[0]); return 0; }
    const EditorConfig& cfg = cl.config;

    bool tty = isatty(STDIN_FILENO);
    if (tty) {
        std::cout << "RawLine - arrows edit/recall, Enter commits, Ctrl-C"
                  << (cfg.quit_on_q ? " or 'q'" : "") << " quits.\n";
        std::cout.flush();
    }

    FdOutput out(STDOUT_FILENO);
    FdInput term_in(STDIN_FILENO);
    StreamInput piped_in(std::cin);
    PosixRawMode raw(STDIN_FILENO, cfg.debug ? &std::cerr : nullptr);
    NoTerminalMode no_mode;
    InputSource& in = tty ? static_cast<InputSource&>(term_in) : piped_in;
    TerminalMode& mode = tty ? static_cast<TerminalMode&>(raw) : no_mode;

    EchoProcessor echo;
    ContinuationPredicate continuation;
    EditorOptions opts;
    opts.prompt = cfg.prompt;
    opts.quit_on_q = cfg.quit_on_q;
    opts.echo = cfg.echo;
    opts.debug = cfg.debug;
    opts.diag = &std::cerr;

    Editor editor(in, out, mode, opts, &echo, cfg.continuation ? &continuation : nullptr);
    if (auto err = editor.run()) {
        std::cerr << "rawline: " << to_string(*err) << std::endl;
        return 1;
    }
    return 0;
}
