#include <mathpad/parser.hpp>
#include <mathpad/solve.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void usage() {
    std::cerr << "usage: mathpad_solve [options] FILE|-\n"
                 "  --places N        decimal places (default 4)\n"
                 "  --no-strip        keep trailing zeros\n"
                 "  --group           group thousands\n"
                 "  --sci | --eng     scientific / engineering notation\n"
                 "  --degrees         trig functions work in degrees\n"
                 "  --no-shadow       local declarations may not reuse constant names\n"
                 "  --references      append the reference section\n"
                 "  --constants FILE  shared constants\n"
                 "  --functions FILE  shared function definitions\n";
}

int main(int argc, char** argv) {
    mathpad::Config cfg;
    std::string constants_path;
    std::string functions_path;
    std::string input_path;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::runtime_error(arg + " expects a value");
                return argv[++i];
            };
            if (arg == "--places") cfg.places = std::stoi(value());
            else if (arg == "--no-strip") cfg.strip_zeros = false;
            else if (arg == "--group") cfg.group_digits = true;
            else if (arg == "--sci") cfg.notation = mathpad::Notation::Sci;
            else if (arg == "--eng") cfg.notation = mathpad::Notation::Eng;
            else if (arg == "--degrees") cfg.degrees_mode = true;
            else if (arg == "--no-shadow") cfg.shadow_constants = false;
            else if (arg == "--references") cfg.append_references = true;
            else if (arg == "--constants") constants_path = value();
            else if (arg == "--functions") functions_path = value();
            else if (arg == "-h" || arg == "--help") {
                usage();
                return 0;
            } else if (input_path.empty()) input_path = arg;
            else throw std::runtime_error("Unexpected argument: " + arg);
        }
        if (input_path.empty()) {
            usage();
            return 2;
        }

        std::string text;
        if (input_path == "-") {
            std::ostringstream ss;
            ss << std::cin.rdbuf();
            text = ss.str();
        } else {
            text = read_file(input_path);
        }
        const std::string constants = constants_path.empty() ? std::string() : read_file(constants_path);
        const std::string functions = functions_path.empty() ? std::string() : read_file(functions_path);

        const mathpad::EvalContext ctx = mathpad::create_context(constants, functions, cfg);
        const mathpad::SolveResult result = mathpad::solve(text, ctx, cfg);

        std::cout << result.text;
        if (result.text.empty() || result.text.back() != '\n') std::cout << "\n";
        for (const auto& e : result.errors) std::cerr << e << "\n";
        if (result.solved > 0) std::cerr << "Solved " << result.solved << " equation(s)\n";
        else std::cerr << "Nothing to solve\n";
        return result.errors.empty() ? 0 : 1;
    } catch (const mathpad::ParseError& e) {
        std::cerr << "line " << e.line << ", col " << e.col << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
}
