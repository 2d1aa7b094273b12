#include <ort/cli_args.h>
#include <ort/io.h>
#include <ort/json.h>
#include <ort/ort.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string shorten(const std::string& s, size_t n = 40) {
    if (s.size() <= n) return s;
    return s.substr(0, n - 3) + "...";
}

std::string preview(const ort::Value& v) {
    std::ostringstream ss;
    if (v.isObject()) {
        const auto& items = v.items();
        ss << "{object, " << items.size() << " keys}";
        for (size_t i = 0; i < items.size() and i < 3; ++i)
            ss << (i == 0 ? " " : ", ") << items[i].first << "=" << shorten(ort::dump_json(items[i].second));
        if (items.size() > 3) ss << ", ...";
        return ss.str();
    }
    if (v.isArray()) {
        const auto& arr = v.elements();
        ss << "[array, " << arr.size() << " items]";
        for (size_t i = 0; i < arr.size() and i < 3; ++i)
            ss << (i == 0 ? " " : ", ") << shorten(ort::dump_json(arr[i]));
        if (arr.size() > 3) ss << ", ...";
        return ss.str();
    }
    return ort::dump_json(v);
}

int run(const ort::CliArgs& args) {
    std::string content;
    try {
        content = ort::read_file(args.getFilePath());
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    std::string output;
    try {
        switch (args.getAction()) {
            case ort::CliArgs::Action::CHECK: {
                auto v = ort::parse(content, args.verbose());
                std::cout << "OK: parsed ORT; value: " << shorten(ort::dump_json(v), 200) << "\n";
                std::cout << "Preview: " << preview(v) << "\n";
                return 0;
            }
            case ort::CliArgs::Action::TO_JSON:
                output = ort::dump_json(ort::parse(content, args.verbose()), 2) + "\n";
                break;
            case ort::CliArgs::Action::FROM_JSON:
                output = ort::generate(ort::parse_json(content));
                if (output.empty() or output.back() != '\n') output.push_back('\n');
                break;
            case ort::CliArgs::Action::HELP:
                std::cout << ort::CliArgs::usage();
                return 0;
        }
    } catch (const ort::ParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
        return 1;
    }

    if (args.toStdout()) {
        std::cout << output;
        return 0;
    }
    try {
        std::string out_path = args.outputPath();
        ort::write_file(out_path, output);
        if (args.verbose()) std::cerr << "ort: wrote " << out_path << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

}  // namespace

int main(int argc, const char* argv[]) {
    try {
        ort::CliArgs args(argc, argv);
        if (argc < 2) {
            std::cerr << ort::CliArgs::usage();
            return 2;
        }
        if (args.getAction() == ort::CliArgs::Action::HELP) {
            std::cout << ort::CliArgs::usage();
            return 0;
        }
        return run(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n\n" << ort::CliArgs::usage();
        return 2;
    }
}
