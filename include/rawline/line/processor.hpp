/*
 * Line consumers plugged into the editor - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace rawline {

struct ProcessResult {
    bool ok = true;
    std::string output; // printed after the committed line when ok
    std::string error;  // reason when !ok
};

// Receives every committed line.
class LineProcessor {
public:
    virtual ~LineProcessor() = default;
    virtual ProcessResult process(const std::string& line) = 0;
};

// Decides whether Enter commits the line or inserts a newline into it.
class CompletenessPredicate {
public:
    virtual ~CompletenessPredicate() = default;
    virtual bool is_complete(const std::string& line) = 0;
};

class EchoProcessor : public LineProcessor {
public:
    ProcessResult process(const std::string& line) override { return ProcessResult{true, line, ""}; }
};

// A trailing backslash asks for more input.
class ContinuationPredicate : public CompletenessPredicate {
public:
    bool is_complete(const std::string& line) override { return line.empty() || line.back() != '\\'; }
};

} // namespace rawline
