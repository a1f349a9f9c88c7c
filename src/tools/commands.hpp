#pragma once

#include "cmd_args.hpp"
#include <iosfwd>
#include <string>

namespace ancryptor::tools {

std::string readFile(const std::string& path);

void writeFile(const std::string& path, const std::string& content);

void printUsage(std::ostream& err);

/// Resolve the text to operate on: option value, first positional, --in file, then in
/// @throws std::runtime_error if --in cannot be read
std::string resolveInput(const cmd_args& args, const std::string& command, std::istream& in);

/// Run --encode; returns the process exit code
int encodeCommand(const cmd_args& args, std::istream& in, std::ostream& out, std::ostream& err);

/// Run --decode; returns the process exit code (1 only for --strict failures)
int decodeCommand(const cmd_args& args, std::istream& in, std::ostream& out, std::ostream& err);

/// Parse and dispatch; all exceptions are reported on err
int run(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err);

}
