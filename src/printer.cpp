#include "scheep/printer.hpp"

#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>

#include "scheep/error.hpp"

namespace scheep {
namespace {

enum class print_mode { write, display };

class printer {
public:
    explicit printer(print_mode mode) : mode_(mode) {}

    std::string run(value v) {
        emit(v);
        return std::move(out_);
    }

private:
    void emit(value v) {
        switch (type_of(v)) {
            case value_type::nil:
                out_ += "()";
                return;
            case value_type::boolean:
                out_ += boolean_value(v) ? "#t" : "#f";
                return;
            case value_type::integer:
                out_ += std::to_string(integer_value(v));
                return;
            case value_type::floating:
                emit_float(float_value(v));
                return;
            case value_type::symbol:
                out_ += symbol_name(v);
                return;
            case value_type::string:
                emit_string(string_value(v));
                return;
            case value_type::cons:
                emit_list(v);
                return;
            case value_type::primitive_fn:
                out_ += "<primitive:" + primitive_of(v).name + ">";
                return;
            case value_type::closure:
                out_ += "<compound-procedure:" + std::to_string(compound_of(v).params.size()) + ">";
                return;
        }
    }

    // Shortest text that reads back as the same double, always with a
    // fraction or exponent so it does not read back as an integer.
    void emit_float(double d) {
        char buffer[64];
        const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), d);
        if (ec != std::errc{}) {
            throw lisp_error("print_value: cannot format float");
        }
        const std::string_view text(buffer, static_cast<std::size_t>(end - buffer));
        out_ += text;
        if (text.find_first_of(".eEn") == std::string_view::npos) {
            out_ += ".0";
        }
    }

    void emit_string(const std::string& text) {
        if (mode_ == print_mode::display) {
            out_ += text;
            return;
        }
        out_.push_back('"');
        for (char c : text) {
            if (c == '"' || c == '\\') {
                out_.push_back('\\');
                out_.push_back(c);
            } else if (c == '\n') {
                out_ += "\\n";
            } else {
                out_.push_back(c);
            }
        }
        out_.push_back('"');
    }

    void emit_list(value list) {
        out_.push_back('(');
        value cell = list;
        for (bool first = true; is_cons(cell); cell = cdr(cell), first = false) {
            if (!first) {
                out_.push_back(' ');
            }
            emit(car(cell));
        }
        // Only host code can build an improper list; the reader rejects them.
        if (!is_nil(cell)) {
            out_ += " . ";
            emit(cell);
        }
        out_.push_back(')');
    }

    print_mode mode_;
    std::string out_;
};

}  // namespace

std::string print_value(value v) {
    return printer(print_mode::write).run(v);
}

std::string display_value(value v) {
    return printer(print_mode::display).run(v);
}

}  // namespace scheep
