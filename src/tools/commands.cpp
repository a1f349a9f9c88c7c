#include "commands.hpp"
#include "ancryptor/ancryptor.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ancryptor::tools {

namespace {

using json = nlohmann::json;

std::string renderJson(const cmd_args& args, const json& doc) {
    int indent = args.flag("compact") ? -1 : 2;
    // Payloads are arbitrary bytes: replace invalid UTF-8 instead of throwing
    return doc.dump(indent, ' ', false, json::error_handler_t::replace);
}

void emit(const cmd_args& args, const std::string& text, std::ostream& out, std::ostream& err) {
    auto out_opt = args.get("out");
    if (!out_opt) {
        out << text << "\n";
    } else {
        writeFile(*out_opt, text + "\n");
        err << "Output written to: " << *out_opt << "\n";
    }
}

}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

void printUsage(std::ostream& err) {
    err << R"(ancryptor - Base64 text codec

Usage: ancryptor [command] [options] [--] [text]

Commands:
    --encode [text]       Encode UTF-8 text as standard padded Base64
    --decode [text]       Decode Base64 back to UTF-8 text

Input (first match wins):
    option value, positional text, --in <file>, standard input

Options:
    --version, -v         Show version
    --help, -h            Show this help
    --in <file>           Read input from file
    --out <file>          Output file (default: stdout)
    --strict              Fail with exit code 1 when decoding fails
    --json                Print the result as a JSON object
    --compact             Compact JSON output (with --json)

Examples:
    # Encode text
    ancryptor --encode hello_world_from_rust

    # Decode text, reporting malformed input
    ancryptor --decode aGVsbG9fd29ybGRfZnJvbV9ydXN0 --strict

    # Encode text that starts with a dash
    ancryptor --encode -- "-x"

    # Decode a file to JSON
    ancryptor --decode --in payload.b64 --json
)";
}

std::string resolveInput(const cmd_args& args, const std::string& command, std::istream& in) {
    if (auto value = args.get(command); value && *value != "true") {
        // --encode <text> syntax
        return *value;
    }
    if (!args.positional.empty()) {
        return args.positional[0];
    }
    if (auto path = args.get("in")) {
        return readFile(*path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int encodeCommand(const cmd_args& args, std::istream& in, std::ostream& out, std::ostream& err) {
    std::string input = resolveInput(args, "encode", in);
    std::string output = ancryptor::encode(input);

    if (args.flag("json")) {
        json doc;
        doc["operation"] = "encode";
        doc["input"] = input;
        doc["output"] = output;
        doc["ok"] = true;
        emit(args, renderJson(args, doc), out, err);
    } else {
        emit(args, output, out, err);
    }
    return 0;
}

int decodeCommand(const cmd_args& args, std::istream& in, std::ostream& out, std::ostream& err) {
    // Base64 never carries whitespace; tolerate a trailing newline from files and pipes
    std::string input = trim(resolveInput(args, "decode", in));
    auto result = ancryptor::tryDecode(input);
    bool strict = args.flag("strict");

    if (args.flag("json")) {
        json doc;
        doc["operation"] = "decode";
        doc["input"] = input;
        doc["output"] = result.text;
        doc["ok"] = result.ok;
        if (!result) {
            doc["error"] = toString(*result.error);
            doc["message"] = result.message.value_or("");
        }
        emit(args, renderJson(args, doc), out, err);
    } else if (result || !strict) {
        emit(args, result.valueOr(""), out, err);
    }

    if (!result && strict) {
        err << "Error: " << toString(*result.error) << ": "
            << result.message.value_or("decode failed") << "\n";
        return 1;
    }
    return 0;
}

int run(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        auto args = cmd_args::parse(argc, argv);

        if (args.has("version", "v")) {
            out << "ancryptor version " << ancryptor::VERSION << "\n";
            return 0;
        }

        if (args.has("help", "h") || argc == 1) {
            printUsage(err);
            return 0;
        }

        bool is_encode = args.has("encode");
        bool is_decode = args.has("decode");
        if (is_encode && is_decode) {
            throw std::runtime_error("Specify only one of --encode or --decode");
        }

        // Dispatch commands
        if (is_encode) {
            return encodeCommand(args, in, out, err);
        } else if (is_decode) {
            return decodeCommand(args, in, out, err);
        }

        err << "No command specified. Use --help for usage.\n";
        return 1;

    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

}
