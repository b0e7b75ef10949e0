#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "scheep/error.hpp"
#include "scheep/eval.hpp"
#include "scheep/logging.hpp"
#include "scheep/printer.hpp"

namespace {

constexpr std::string_view primary_prompt = "scheep> ";
constexpr std::string_view continuation_prompt = "......> ";

bool is_quit_command(const std::string& line) {
    return line == ":q" || line == ":quit" || line == ":exit";
}

void report(std::string_view category, const scheep::lisp_error& e) {
    scheep::log_message(scheep::log_level::error, std::string(category), e.what());
}

// Evaluates a whole file, printing each top-level value. The first error
// stops the script.
int run_script(const std::string& path, scheep::env_ptr global) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "scheep: cannot open " << path << '\n';
        return 1;
    }
    const std::string source((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        scheep::eval_source(source, global, [](scheep::value result) {
            std::cout << scheep::print_value(result) << '\n';
        });
    } catch (const scheep::lisp_error& e) {
        report("script", e);
        return 1;
    }
    return 0;
}

// Lines accumulate until they form complete expressions. An error is
// reported, the pending input is dropped, and the session carries on with the
// global environment as the failed form left it.
class repl_session {
public:
    explicit repl_session(scheep::env_ptr global) : global_(global) {}

    void run() {
        std::string line;
        while (true) {
            std::cout << (pending_.empty() ? primary_prompt : continuation_prompt) << std::flush;
            if (!std::getline(std::cin, line)) {
                std::cout << '\n';
                return;
            }
            if (pending_.empty() && is_quit_command(line)) {
                return;
            }
            pending_ += line;
            pending_.push_back('\n');
            submit();
        }
    }

private:
    void submit() {
        try {
            scheep::eval_source(pending_, global_, [](scheep::value result) {
                std::cout << ";= " << scheep::print_value(result) << '\n';
            });
        } catch (const scheep::parse_error& e) {
            if (e.incomplete()) {
                return;
            }
            report("repl", e);
        } catch (const scheep::lisp_error& e) {
            report("repl", e);
        }
        pending_.clear();
    }

    scheep::env_ptr global_;
    std::string pending_;
};

}  // namespace

int main(int argc, char** argv) {
    scheep::set_log_sink(std::make_shared<scheep::stream_log_sink>(std::cerr, scheep::log_level::warn));

    scheep::runtime_config config;
    config.seal_special_forms = true;
    try {
        scheep::env_ptr global = scheep::create_global_env(config);
        if (argc > 1) {
            return run_script(argv[1], global);
        }
        repl_session(global).run();
    } catch (const std::exception& e) {
        std::cerr << "scheep: fatal: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
