/**
 * Scripted stand-in for the guest runner.
 *
 * Reads a script from stdin, one call per line, and answers with protocol
 * frames the way the real runner would. Recognised calls:
 *
 *   print("text")          stdout frame "text\n"
 *   stderr("text")         stderr frame
 *   result("repr")         result frame
 *   1/0                    ZeroDivisionError exception frame
 *   plt.show()             image frame with a small PNG
 *   sleep(seconds)         pause
 *   spam(count, size)      count stdout frames of size bytes each
 *   write("file", "text")  create a file in the working directory
 *   read("file")           stdout frame with the file's content
 *   garbage()              a line that is not JSON
 *   unknown_frame()        a frame with an unknown type
 *   partial()              half a frame, then exit
 *   exit()                 exit without an end frame
 *   hang()                 never finish
 */

#include "encoding.h"
#include <json/json.h>
#include <unistd.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

void emit(const std::string& type, const std::string& data, bool with_data = true) {
    Json::Value frame;
    frame["type"] = type;
    if (with_data) {
        frame["data"] = data;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::cout << Json::writeString(builder, frame) << "\n" << std::flush;
}

std::string unescape(const std::string& text) {
    std::string out;
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            char next = text[++i];
            out += next == 'n' ? '\n' : next == 't' ? '\t' : next;
        } else {
            out += text[i];
        }
    }
    return out;
}

// name("a", 2) -> name, ["a", "2"]
bool parse_call(const std::string& line, std::string& name, std::vector<std::string>& args) {
    size_t open = line.find('(');
    size_t close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return false;
    }
    name = line.substr(0, open);

    std::string current;
    bool quoted = false;
    bool has_arg = false;
    for (size_t i = open + 1; i < close; i++) {
        char c = line[i];
        if (c == '\\' && quoted && i + 1 < close) {
            current += c;
            current += line[++i];
        } else if (c == '"') {
            quoted = !quoted;
            has_arg = true;
        } else if (c == ',' && !quoted) {
            args.push_back(unescape(current));
            current.clear();
            has_arg = false;
        } else if (quoted || (c != ' ' && c != '\t')) {
            current += c;
            has_arg = true;
        }
    }
    if (has_arg || !current.empty()) {
        args.push_back(unescape(current));
    }
    return true;
}

const unsigned char TINY_PNG[] = {
    0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n',
    0x00, 0x00, 0x00, 0x0d, 'I', 'H', 'D', 'R',
    0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
    0x08, 0x06, 0x00, 0x00, 0x00
};

} // namespace

int main() {
    std::stringstream script;
    script << std::cin.rdbuf();

    std::string line;
    while (std::getline(script, line)) {
        if (line.empty()) {
            continue;
        }
        if (line == "1/0") {
            emit("exception",
                 "Traceback (most recent call last):\n"
                 "  File \"<cell>\", line 1, in <module>\n"
                 "ZeroDivisionError: division by zero\n");
            continue;
        }
        if (line == "plt.show()") {
            emit("image", pyexec::Encoding::base64_encode(TINY_PNG, sizeof(TINY_PNG)));
            continue;
        }

        std::string name;
        std::vector<std::string> args;
        if (!parse_call(line, name, args)) {
            emit("exception", "SyntaxError: invalid syntax\n");
            continue;
        }

        if (name == "print") {
            emit("stdout", (args.empty() ? "" : args[0]) + "\n");
        } else if (name == "stderr" && !args.empty()) {
            emit("stderr", args[0]);
        } else if (name == "result" && !args.empty()) {
            emit("result", args[0]);
        } else if (name == "sleep" && !args.empty()) {
            std::this_thread::sleep_for(std::chrono::duration<double>(std::stod(args[0])));
        } else if (name == "spam" && args.size() == 2) {
            int count = std::stoi(args[0]);
            std::string chunk(static_cast<size_t>(std::stoul(args[1])), 'x');
            for (int i = 0; i < count; i++) {
                emit("stdout", chunk);
            }
        } else if (name == "write" && args.size() == 2) {
            std::ofstream out(args[0]);
            out << args[1];
        } else if (name == "read" && !args.empty()) {
            std::ifstream in(args[0]);
            if (!in) {
                emit("exception", "FileNotFoundError: " + args[0] + "\n");
            } else {
                std::stringstream content;
                content << in.rdbuf();
                emit("stdout", content.str());
            }
        } else if (name == "garbage") {
            std::cout << "this is not a frame\n" << std::flush;
        } else if (name == "unknown_frame") {
            emit("telemetry", "cpu=1");
        } else if (name == "partial") {
            std::cout << "{\"type\":\"stdout\",\"da" << std::flush;
            return 0;
        } else if (name == "exit") {
            return 0;
        } else if (name == "hang") {
            while (true) {
                pause();
            }
        } else {
            emit("exception", "NameError: name '" + name + "' is not defined\n");
        }
    }

    emit("end", "", false);
    return 0;
}
